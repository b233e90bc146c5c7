/**
 * Unit tests for filename directive extraction and filename sanitizing
 */

#include "test_support.h"

using namespace Capture;

void test_marker_basic() {
    std::cout << "Running marker extraction tests..." << std::endl;

    std::string payload = "@@FILENAME@@ src/app.py\nprint(1)\n";
    auto m = extract_marker(payload);
    assert(m.has_value());
    assert(m->filename == "src/app.py");
    assert(marker_body(payload, m) == "print(1)\n");

    // Blank lines before the directive, lowercase token, CRLF line ending
    payload = "\n  \n  @@filename@@   app.py  \r\nx = 1\r\n";
    m = extract_marker(payload);
    assert(m.has_value());
    assert(m->filename == "app.py");
    assert(marker_body(payload, m) == "x = 1\r\n");

    // Comment leaders used inside scripts
    m = extract_marker("# @@FILENAME@@ run.sh\necho hi\n");
    assert(m.has_value() && m->filename == "run.sh");
    m = extract_marker("//@@FILENAME@@ web/a.js\n");
    assert(m.has_value() && m->filename == "web/a.js");

    // Directive on the last line without newline leaves an empty body
    payload = "@@FILENAME@@ only.py";
    m = extract_marker(payload);
    assert(m.has_value());
    assert(m->filename == "only.py");
    assert(marker_body(payload, m).empty());

    std::cout << "Marker extraction tests passed!" << std::endl;
}

void test_marker_absent() {
    std::cout << "Running missing marker tests..." << std::endl;

    // Only the first non-empty line counts
    assert(!extract_marker("print(1)\n@@FILENAME@@ late.py\n").has_value());
    // Token must be followed by whitespace and a name
    assert(!extract_marker("@@FILENAME@@\nfoo\n").has_value());
    assert(!extract_marker("@@FILENAME@@app.py\n").has_value());
    assert(!extract_marker("@@FILENAME@@    \nfoo\n").has_value());
    assert(!extract_marker("").has_value());
    assert(!extract_marker("\n\n   \n").has_value());
    assert(!extract_marker("@@FILENAME@@ a.py", "").has_value());

    std::string payload = "no directive here\n";
    assert(marker_body(payload, std::nullopt) == payload);

    std::cout << "Missing marker tests passed!" << std::endl;
}

void test_marker_custom_token() {
    std::cout << "Running custom token tests..." << std::endl;

    std::string payload = "@@MARK@@ src/app.py\nprint(1)\n";
    auto m = extract_marker(payload, "@@MARK@@");
    assert(m.has_value());
    assert(m->filename == "src/app.py");
    assert(marker_body(payload, m) == "print(1)\n");

    // The default token is not recognized when another one is configured
    assert(!extract_marker("@@FILENAME@@ a.py\n", "@@MARK@@").has_value());

    std::cout << "Custom token tests passed!" << std::endl;
}

void test_sanitizer() {
    std::cout << "Running sanitizer tests..." << std::endl;

    assert(sanitize_filename("src/app.py") == "src/app.py");
    assert(sanitize_filename("  src/app.py\t") == "src/app.py");
    assert(sanitize_filename("../../etc/passwd") == "etc/passwd");
    assert(sanitize_filename("a\\b\\c.txt") == "a/b/c.txt");
    assert(sanitize_filename("my file (1).py") == "myfile1.py");
    assert(sanitize_filename("/abs/path.py") == "abs/path.py");
    assert(sanitize_filename("./x/./y//z.py") == "x/y/z.py");
    assert(sanitize_filename("dir/../file.py") == "dir/file.py");
    assert(sanitize_filename("$$$").empty());
    assert(sanitize_filename("..").empty());
    assert(sanitize_filename(".").empty());
    assert(sanitize_filename("").empty());

    // Sanitizing twice changes nothing
    for (const char* raw : {"../a b/c.py", "x\\..\\y.sh", "  ///z//  "}) {
        std::string once = sanitize_filename(raw);
        assert(sanitize_filename(once) == once);
    }

    std::cout << "Sanitizer tests passed!" << std::endl;
}

void test_sanitizer_length() {
    std::cout << "Running sanitizer length tests..." << std::endl;

    std::string long_name = std::string(300, 'a') + ".py";
    std::string s = sanitize_filename(long_name);
    assert(s.size() == kMaxSanitizedLength);
    assert(s == std::string(kMaxSanitizedLength, 'a'));

    // Truncation must not leave a trailing separator
    std::string nested = std::string(199, 'b') + "/cc";
    s = sanitize_filename(nested);
    assert(s == std::string(199, 'b'));
    assert(s.back() != '/');

    std::cout << "Sanitizer length tests passed!" << std::endl;
}

void test_bare_basename() {
    std::cout << "Running basename tests..." << std::endl;

    assert(is_bare_basename("x.py"));
    assert(!is_bare_basename("a/x.py"));
    assert(!is_bare_basename(""));

    std::cout << "Basename tests passed!" << std::endl;
}

int main() {
    std::cout << "Starting marker/sanitizer tests..." << std::endl;
    set_quiet(true);

    test_marker_basic();
    test_marker_absent();
    test_marker_custom_token();
    test_sanitizer();
    test_sanitizer_length();
    test_bare_basename();

    std::cout << "All tests passed successfully!" << std::endl;
    return 0;
}
