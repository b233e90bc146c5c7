#ifndef _CodeCapture_capture_browser_h_
#define _CodeCapture_capture_browser_h_

namespace Capture {

constexpr size_t kBrowserMaxFiles = 40;

// Regular files of dir, newest modification first, at most max entries.
// Missing or unreadable directories yield an empty list.
std::vector<std::filesystem::path> list_recent_files(const std::filesystem::path& dir,
                                                     size_t max = kBrowserMaxFiles);

// Selection and scroll position of a list shown page_height rows at a time.
struct ListCursor {
    int count = 0;
    int selected = 0;
    int top = 0;

    void up();
    void down();
    void page_up(int page_height);
    void page_down(int page_height);
    void home();
    void end();
    void reset(int new_count);
    void keep_visible(int page_height);
};

// Interactive list of recent captures; Enter opens the file in less.
class CaptureBrowser {
public:
    explicit CaptureBrowser(std::filesystem::path dir, std::string viewer = "less");

    // Returns the process exit code.
    int run();

private:
    void reload();
    void draw();
    void view_selected();
    void show_message(const std::string& text);

    std::filesystem::path dir_;
    std::string viewer_;
    std::vector<std::filesystem::path> files_;
    ListCursor cursor_;
};

}

#endif
