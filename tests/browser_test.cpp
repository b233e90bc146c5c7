/**
 * Tests for the capture browser's listing and cursor logic (no terminal needed)
 */

#include "test_support.h"
#include "capture_browser.h"

using namespace Capture;
using TestSupport::TempDir;

void touch_at(const std::filesystem::path& path, int seconds_ago) {
    TestSupport::write_file(path, path.filename().string() + "\n");
    auto when = std::filesystem::file_time_type::clock::now() - std::chrono::seconds(seconds_ago);
    std::filesystem::last_write_time(path, when);
}

void test_list_recent_files() {
    std::cout << "Running recent file listing tests..." << std::endl;

    TempDir dir("browser");
    touch_at(dir / "a.py", 30);
    touch_at(dir / "b.sh", 10);
    touch_at(dir / "c.txt", 20);
    std::filesystem::create_directories(dir / "subdir");

    auto files = list_recent_files(dir.path());
    assert(files.size() == 3);
    assert(files[0].filename() == "b.sh");
    assert(files[1].filename() == "c.txt");
    assert(files[2].filename() == "a.py");

    files = list_recent_files(dir.path(), 2);
    assert(files.size() == 2);
    assert(files[1].filename() == "c.txt");

    assert(list_recent_files(dir / "missing").empty());

    std::cout << "Recent file listing tests passed!" << std::endl;
}

void test_list_cursor() {
    std::cout << "Running list cursor tests..." << std::endl;

    ListCursor c;
    c.reset(10);
    assert(c.count == 10 && c.selected == 0 && c.top == 0);

    c.up();
    assert(c.selected == 0);
    for (int i = 0; i < 4; ++i) c.down();
    c.keep_visible(4);
    assert(c.selected == 4);
    assert(c.top == 1);

    c.page_down(4);
    assert(c.selected == 8);
    assert(c.top == 5);

    c.end();
    c.keep_visible(4);
    assert(c.selected == 9);
    assert(c.top == 6);
    c.down();
    assert(c.selected == 9);

    c.page_up(4);
    assert(c.selected == 5);
    assert(c.top == 2);

    c.home();
    assert(c.selected == 0 && c.top == 0);

    // Shrinking the list clamps the selection
    c.end();
    c.reset(3);
    assert(c.selected == 2);
    assert(c.top <= c.selected);

    c.reset(0);
    assert(c.selected == 0 && c.top == 0);
    c.down();
    c.page_down(4);
    assert(c.selected == 0);

    std::cout << "List cursor tests passed!" << std::endl;
}

int main() {
    std::cout << "Starting browser tests..." << std::endl;
    set_quiet(true);

    test_list_recent_files();
    test_list_cursor();

    std::cout << "All tests passed successfully!" << std::endl;
    return 0;
}
