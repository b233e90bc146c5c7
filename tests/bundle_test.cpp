/**
 * Unit tests for bundle dumping and splitting
 */

#include "test_support.h"

using namespace Capture;
using TestSupport::TempDir;

void test_fence_language() {
    std::cout << "Running fence language tests..." << std::endl;

    assert(std::string(fence_language_for("Dockerfile")) == "dockerfile");
    assert(std::string(fence_language_for("sub/CMakeLists.txt")) == "cmake");
    assert(std::string(fence_language_for("a/b.PY")) == "python");
    assert(std::string(fence_language_for("run.sh")) == "bash");
    assert(std::string(fence_language_for("notes.md")) == "markdown");
    assert(std::string(fence_language_for("data.unknown")) == "text");
    assert(std::string(fence_language_for("noext")) == "text");

    std::cout << "Fence language tests passed!" << std::endl;
}

void test_gitignore() {
    std::cout << "Running gitignore matching tests..." << std::endl;

    std::vector<std::string> patterns = {"build/", "*.log", "/top.txt", "docs/gen", "!keep.log"};

    assert(gitignore_match("build", true, patterns));
    assert(!gitignore_match("build", false, patterns));
    assert(gitignore_match("src/build", true, patterns));
    assert(gitignore_match("a/b/c.log", false, patterns));
    assert(gitignore_match("top.txt", false, patterns));
    assert(!gitignore_match("sub/top.txt", false, patterns));
    assert(gitignore_match("docs/gen", true, patterns));
    assert(!gitignore_match("x/docs/gen", true, patterns));
    assert(!gitignore_match("src/app.py", false, patterns));

    assert(gitignore_match(".git", true, {}));
    assert(gitignore_match(".git/config", false, {}));
    assert(!gitignore_match("keep.txt", false, {"!keep.txt"}));

    TempDir dir("gitignore");
    TestSupport::write_file(dir / ".gitignore", "# comment\n\n  *.tmp  \nnode_modules/\n");
    auto read = read_gitignore_patterns(dir / ".gitignore");
    assert(read == std::vector<std::string>({"*.tmp", "node_modules/"}));
    assert(read_gitignore_patterns(dir / "missing").empty());

    std::cout << "Gitignore matching tests passed!" << std::endl;
}

void test_end_markers() {
    std::cout << "Running END marker tests..." << std::endl;

    assert(end_marker_filename("FILE a.py") == std::optional<std::string>("a.py"));
    assert(end_marker_filename("FILE `src/a.py`") == std::optional<std::string>("src/a.py"));
    assert(end_marker_filename("`b.py`") == std::optional<std::string>("b.py"));
    assert(end_marker_filename("@@FILENAME@@ c.py") == std::optional<std::string>("c.py"));
    assert(!end_marker_filename("FILE ").has_value());
    assert(!end_marker_filename("``").has_value());
    assert(!end_marker_filename("something else").has_value());

    std::cout << "END marker tests passed!" << std::endl;
}

void test_dump_tree() {
    std::cout << "Running dump tests..." << std::endl;

    TempDir dir("dump");
    TestSupport::write_file(dir / ".gitignore", "build/\n");
    TestSupport::write_file(dir / "a.py", "print(1)");
    TestSupport::write_file(dir / "sub/b.txt", "hi\n");
    TestSupport::write_file(dir / "build/out.txt", "generated\n");
    TestSupport::write_file(dir / ".git/config", "[core]\n");
    TestSupport::write_file(dir / "bin.dat", std::string("ab\0cd", 5));
    TestSupport::write_file(dir / kDefaultBundleFile, "old bundle\n");

    DumpOptions options;
    options.exclude = dir / kDefaultBundleFile;
    std::ostringstream out;
    BundleStats stats = dump_tree(dir.path(), out, options);
    assert(stats.files == 3);
    assert(stats.skipped == 2);

    const std::string expected =
        "--- START OF FILE .gitignore ---\n"
        "```text\n"
        "build/\n"
        "```\n"
        "--- END OF FILE .gitignore ---\n"
        "\n"
        "--- START OF FILE a.py ---\n"
        "```python\n"
        "print(1)\n"
        "```\n"
        "--- END OF FILE a.py ---\n"
        "\n"
        "--- START OF FILE sub/b.txt ---\n"
        "```text\n"
        "hi\n"
        "```\n"
        "--- END OF FILE sub/b.txt ---\n";
    assert(out.str() == expected);

    // Without .gitignore the build output is included
    options.use_gitignore = false;
    std::ostringstream all;
    stats = dump_tree(dir.path(), all, options);
    assert(stats.files == 4);
    assert(stats.skipped == 1);
    assert(all.str().find("--- START OF FILE build/out.txt ---") != std::string::npos);
    assert(all.str().find(".git/config") == std::string::npos);

    // The dumped bundle splits back into the same files
    TempDir restored("restored");
    std::istringstream in(out.str());
    stats = split_bundle(in, restored.path());
    assert(stats.files == 3);
    assert(TestSupport::read_file(restored / "a.py") == "print(1)\n");
    assert(TestSupport::read_file(restored / "sub/b.txt") == "hi\n");

    bool threw = false;
    try {
        std::ostringstream sink;
        dump_tree(dir / "missing", sink);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << "Dump tests passed!" << std::endl;
}

void test_split_bundle() {
    std::cout << "Running split tests..." << std::endl;

    TempDir dir("split");
    const std::string bundle =
        "Here are the files:\n"
        "--- START OF FILE src/app.py ---\n"
        "```python\n"
        "print(1)\n"
        "```\n"
        "--- END OF FILE src/app.py ---\n"
        "\n"
        "--- START OF FILE `notes.md` ---\n"
        "# Title\n"
        "```bash\n"
        "echo x\n"
        "```\n"
        "--- END OF `notes.md` ---\n"
        "--- START OF FILE ../escape.txt ---\n"
        "data\n"
        "# @@FILENAME@@ escape.txt\n"
        "--- END OF @@FILENAME@@ ../escape.txt ---\n"
        "--- START OF FILE first.txt ---\n"
        "one\n"
        "--- END OF FILE second.txt ---\n"
        "--- START OF FILE  ---\n"
        "--- START OF FILE tail.txt ---\n"
        "last line\n"
        "```";

    auto outdir = dir / "out";
    std::istringstream in(bundle);
    BundleStats stats = split_bundle(in, outdir);

    assert(TestSupport::read_file(outdir / "src/app.py") == "print(1)\n");
    // Only the leading fence is dropped, inner fences stay
    assert(TestSupport::read_file(outdir / "notes.md") == "# Title\n```bash\necho x\n");
    // Parent references are stripped, trailing marker lines trimmed
    assert(TestSupport::read_file(outdir / "escape.txt") == "data\n");
    assert(!std::filesystem::exists(dir / "escape.txt"));
    // Mismatched END still closes the open block
    assert(TestSupport::read_file(outdir / "first.txt") == "one\n");
    // Missing END at end of input
    assert(TestSupport::read_file(outdir / "tail.txt") == "last line\n");

    assert(stats.files == 5);
    assert(stats.skipped == 1);

    // Symlinked directory inside outdir cannot be used to escape it
    TempDir outside("outside");
    std::filesystem::create_directory_symlink(outside.path(), outdir / "link");
    std::istringstream evil("--- START OF FILE link/evil.txt ---\nx\n--- END OF FILE link/evil.txt ---\n");
    stats = split_bundle(evil, outdir);
    assert(stats.files == 0);
    assert(stats.skipped == 1);
    assert(!std::filesystem::exists(outside / "evil.txt"));

    TestSupport::write_file(dir / "blocker", "file");
    std::istringstream any("");
    bool threw = false;
    try {
        split_bundle(any, dir / "blocker/out");
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << "Split tests passed!" << std::endl;
}

int main() {
    std::cout << "Starting bundle tests..." << std::endl;
    set_quiet(true);

    test_fence_language();
    test_gitignore();
    test_end_markers();
    test_dump_tree();
    test_split_bundle();

    std::cout << "All tests passed successfully!" << std::endl;
    return 0;
}
