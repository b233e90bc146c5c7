/**
 * End-to-end tests for the submission pipeline: marker, resolution,
 * write/commit and optional execution
 */

#include "test_support.h"

using namespace Capture;
using TestSupport::TempDir;

PipelineSettings settings_for(const std::filesystem::path& root, bool is_repo) {
    PipelineSettings s;
    s.working_root = root;
    s.quarantine_root = root / "received_codes";
    s.is_repo = is_repo;
    s.sandbox.log_dir = root / "logs";
    return s;
}

std::string today() {
    return format_local_time("%Y%m%d");
}

void test_tracked_submission() {
    std::cout << "Running tracked submission tests..." << std::endl;

    TempDir root("pipeline");
    TestSupport::init_git_repo(root.path());
    TestSupport::write_file(root / "src/app.py", "print(0)\n");
    TestSupport::git_commit_all(root.path(), "seed");

    PipelineSettings s = settings_for(root.path(), true);
    s.marker_token = "@@MARK@@";
    CapturePipeline pipeline(s);

    Disposition d = pipeline.process("@@MARK@@ src/app.py\nprint(1)\n", 1);
    assert(d.status == SubmissionStatus::Completed);
    assert(d.request_id == 1);
    assert(d.decision && std::holds_alternative<Tracked>(*d.decision));
    assert(std::get<Tracked>(*d.decision).relative_path == "src/app.py");
    assert(d.marker_filename == std::optional<std::string>("src/app.py"));
    assert(d.path == "src/app.py");
    assert(d.saved_path == (root / "src/app.py").string());
    assert(d.language == "Python");
    assert(d.write.status == WriteStatus::Written);
    assert(d.commit.status == CommitStatus::Committed);
    assert(d.commit.message.find("src/app.py") != std::string::npos);
    assert(d.execution.status == ExecStatus::NotExecuted);
    assert(TestSupport::read_file(root / "src/app.py") == "print(1)\n");
    assert(TestSupport::commit_count(root.path()) == 2);

    // Same content again: idempotent
    d = pipeline.process("@@MARK@@ src/app.py\nprint(1)", 2);
    assert(d.status == SubmissionStatus::Completed);
    assert(d.write.status == WriteStatus::Unchanged);
    assert(d.commit.status == CommitStatus::SkippedIdentical);
    assert(TestSupport::commit_count(root.path()) == 2);

    // Bare basename finds the unique tracked file
    d = pipeline.process("@@MARK@@ app.py\nprint(3)\n", 3);
    assert(std::holds_alternative<Tracked>(*d.decision));
    assert(d.path == "src/app.py");
    assert(d.commit.status == CommitStatus::Committed);
    assert(TestSupport::read_file(root / "src/app.py") == "print(3)\n");

    // Untracked path lands in the quarantine root, no commit
    d = pipeline.process("@@MARK@@ tools/new.sh\necho x\n", 4);
    assert(std::holds_alternative<Fallback>(*d.decision));
    assert(d.saved_path == (root / "received_codes/tools/new.sh").string());
    assert(d.commit.status == CommitStatus::NotApplicable);
    assert(TestSupport::read_file(root / "received_codes/tools/new.sh") == "echo x\n");
    assert(TestSupport::commit_count(root.path()) == 3);

    // Naming a tracked directory keeps the content in quarantine
    d = pipeline.process("@@MARK@@ src\nprint(9)\n", 5);
    assert(d.status == SubmissionStatus::Completed);
    assert(std::holds_alternative<Fallback>(*d.decision));
    assert(d.saved_path == (root / "received_codes/src").string());
    assert(TestSupport::read_file(root / "received_codes/src") == "print(9)\n");
    assert(TestSupport::commit_count(root.path()) == 3);

    std::cout << "Tracked submission tests passed!" << std::endl;
}

void test_fallback_without_vcs() {
    std::cout << "Running no-VCS fallback tests..." << std::endl;

    TempDir root("novcs");
    CapturePipeline pipeline(settings_for(root.path(), false));

    Disposition d = pipeline.process("print(2)", 7);
    assert(d.status == SubmissionStatus::Completed);
    assert(d.decision && std::holds_alternative<Fallback>(*d.decision));
    assert(!d.marker_filename.has_value());
    assert(d.commit.status == CommitStatus::NotApplicable);
    assert(d.language == "Python");

    std::filesystem::path saved = d.saved_path;
    assert(saved.parent_path() == root / "received_codes");
    assert(saved.filename().string() == "python_" + today() + "_001.py");
    assert(TestSupport::read_file(saved) == "print(2)\n");

    // A marker in a non-repository directory still writes below the quarantine root
    d = pipeline.process("@@FILENAME@@ ../../etc/app.conf\nkey=value\n", 8);
    assert(std::holds_alternative<Fallback>(*d.decision));
    assert(d.sanitized_path == "etc/app.conf");
    assert(d.saved_path == (root / "received_codes/etc/app.conf").string());
    assert(d.commit.status == CommitStatus::NotApplicable);

    std::cout << "No-VCS fallback tests passed!" << std::endl;
}

void test_rejected_names() {
    std::cout << "Running rejected filename tests..." << std::endl;

    TempDir root("rejected");
    TempDir outside("elsewhere");
    std::filesystem::create_directories(root / "received_codes");
    std::filesystem::create_directory_symlink(outside.path(), root / "received_codes/out");
    CapturePipeline pipeline(settings_for(root.path(), false));

    // Nothing usable in the name: content is kept under a generated name
    Disposition d = pipeline.process("@@FILENAME@@ $$$\nprint(4)\n", 1);
    assert(d.status == SubmissionStatus::Completed);
    assert(std::holds_alternative<Rejected>(*d.decision));
    assert(d.sanitized_path.empty());
    std::filesystem::path saved = d.saved_path;
    assert(saved.parent_path() == root / "received_codes");
    assert(saved.filename().string() == "python_" + today() + "_001.py");

    // Name escaping through a symlink keeps its stem and extension
    d = pipeline.process("@@FILENAME@@ out/evil.py\nprint(5)\n", 2);
    assert(std::holds_alternative<Rejected>(*d.decision));
    assert(std::get<Rejected>(*d.decision).reason == "escapes quarantine root");
    saved = d.saved_path;
    assert(saved.parent_path() == root / "received_codes");
    assert(saved.filename().string() == "evil_" + today() + "_001.py");
    assert(!std::filesystem::exists(outside / "evil.py"));

    auto json = parse_json_object(disposition_to_json(d));
    assert(json.at("resolution").text == "rejected");
    assert(json.at("reason").text == "escapes quarantine root");

    std::cout << "Rejected filename tests passed!" << std::endl;
}

void test_write_failure() {
    std::cout << "Running write failure tests..." << std::endl;

    TempDir root("writefail");
    TestSupport::write_file(root / "received_codes", "not a directory");
    CapturePipeline pipeline(settings_for(root.path(), false));

    Disposition d = pipeline.process("print(6)\n", 1);
    assert(d.status == SubmissionStatus::WriteFailed);
    assert(d.write.status == WriteStatus::Failed);
    assert(d.message.rfind("Failed to save file:", 0) == 0);
    assert(d.execution.status == ExecStatus::NotExecuted);

    auto json = parse_json_object(disposition_to_json(d));
    assert(json.at("status").text == "error");

    std::cout << "Write failure tests passed!" << std::endl;
}

void test_auto_run() {
    std::cout << "Running auto-run tests..." << std::endl;

    TempDir root("autorun");
    CapturePipeline pipeline(settings_for(root.path(), false));

    Disposition d = pipeline.process("@@FILENAME@@ run.sh\necho ran\n", 1);
    assert(d.execution.status == ExecStatus::NotExecuted);

    pipeline.set_auto_run(false, true);
    assert(pipeline.settings().sandbox.run_shell);

    d = pipeline.process("@@FILENAME@@ run.sh\necho ran again\n", 2);
    assert(d.status == SubmissionStatus::Completed);
    assert(d.execution.status == ExecStatus::Ok);
    assert(d.execution.out == "ran again\n");
    assert(d.message.find("execution ok") != std::string::npos);

    auto json = parse_json_object(disposition_to_json(d));
    assert(json.at("status").text == "success");
    assert(json.at("resolution").text == "fallback");
    assert(json.at("execution").kind == JsonValue::Kind::Other);
    assert(json.at("marker_filename").text == "run.sh");

    std::cout << "Auto-run tests passed!" << std::endl;
}

int main() {
    std::cout << "Starting pipeline tests..." << std::endl;
    set_quiet(true);

    if (TestSupport::tool_available("git")) test_tracked_submission();
    test_fallback_without_vcs();
    test_rejected_names();
    test_write_failure();
    if (TestSupport::tool_available("sh")) test_auto_run();

    std::cout << "All tests passed successfully!" << std::endl;
    return 0;
}
