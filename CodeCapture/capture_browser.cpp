#include "CodeCapture.h"
#include "capture_browser.h"
#include "ui_backend.h"

namespace Capture {

std::vector<std::filesystem::path> list_recent_files(const std::filesystem::path& dir, size_t max) {
    std::vector<std::pair<std::filesystem::file_time_type, std::filesystem::path>> entries;
    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
        std::error_code entry_ec;
        if (!entry.is_regular_file(entry_ec)) continue;
        auto mtime = entry.last_write_time(entry_ec);
        if (entry_ec) continue;
        entries.emplace_back(mtime, entry.path());
    }
    if (ec) log_warn("Browser", "cannot list " + dir.string() + ": " + ec.message());

    std::sort(entries.begin(), entries.end(), [](const auto& a, const auto& b) {
        if (a.first != b.first) return a.first > b.first;
        return a.second.filename() < b.second.filename();
    });

    std::vector<std::filesystem::path> files;
    for (size_t i = 0; i < entries.size() && i < max; ++i) files.push_back(entries[i].second);
    return files;
}

// ============================================================================
// ListCursor
// ============================================================================

void ListCursor::up() {
    if (selected > 0) selected--;
}

void ListCursor::down() {
    if (selected < count - 1) selected++;
}

void ListCursor::page_up(int page_height) {
    selected = std::max(0, selected - page_height);
    top = std::max(0, top - page_height);
}

void ListCursor::page_down(int page_height) {
    if (count == 0) return;
    selected = std::min(count - 1, selected + page_height);
    top = std::max(0, std::min(count - page_height, top + page_height));
}

void ListCursor::home() {
    selected = 0;
    top = 0;
}

void ListCursor::end() {
    selected = std::max(0, count - 1);
}

void ListCursor::reset(int new_count) {
    count = std::max(0, new_count);
    selected = std::min(selected, std::max(0, count - 1));
    top = std::min(top, selected);
}

void ListCursor::keep_visible(int page_height) {
    if (page_height <= 0) return;
    if (selected < top) top = selected;
    else if (selected >= top + page_height) top = selected - page_height + 1;
    if (top < 0) top = 0;
}

// ============================================================================
// CaptureBrowser
// ============================================================================

CaptureBrowser::CaptureBrowser(std::filesystem::path dir, std::string viewer)
    : dir_(std::move(dir)), viewer_(std::move(viewer)) {}

void CaptureBrowser::reload() {
    files_ = list_recent_files(dir_);
    cursor_.reset(static_cast<int>(files_.size()));
}

int CaptureBrowser::run() {
    std::error_code ec;
    if (!std::filesystem::is_directory(dir_, ec)) {
        std::cerr << "Error: directory '" << dir_.string() << "' not found." << std::endl;
        return 1;
    }
    if (!has_cmd(viewer_))
        std::cerr << "Warning: '" << viewer_ << "' not found. Viewing files might fail." << std::endl;

    reload();
    ui_init();

    if (files_.empty()) {
        show_message("No files found in directory.");
        ui_getch();
        ui_end();
        return 0;
    }

    bool browsing = true;
    while (browsing) {
        draw();
        ui_refresh();

        int list_h = ui_rows() - 2;
        int ch = ui_getch();
        switch (ch) {
            case KEY_UP:
            case 'k':
                cursor_.up();
                break;
            case KEY_DOWN:
            case 'j':
                cursor_.down();
                break;
            case KEY_PPAGE:
                cursor_.page_up(std::max(1, list_h));
                break;
            case KEY_NPAGE:
                cursor_.page_down(std::max(1, list_h));
                break;
            case 'g':
            case KEY_HOME:
                cursor_.home();
                break;
            case 'G':
            case KEY_END:
                cursor_.end();
                break;
            case '\n':
            case '\r':
            case KEY_ENTER:
                view_selected();
                break;
            case 'q':
            case 'Q':
            case UI_KEY_ESC:
                browsing = false;
                break;
            default:
                break;
        }
    }

    ui_end();
    return 0;
}

void CaptureBrowser::draw() {
    ui_clear();
    int h = ui_rows();
    int w = ui_cols();
    if (w <= 1) return;

    auto fit = [w](const std::string& s) { return s.substr(0, static_cast<size_t>(w - 1)); };

    ui_print_at(0, 0, fit("Select File to View (Use Arrows, PgUp/Dn, g/G, Enter, q/ESC)").c_str());
    ui_print_at(h - 1, 0, fit("Enter=View, q/ESC=Quit  [" + dir_.string() + "]").c_str());

    int list_h = h - 2;
    if (list_h <= 0) {
        ui_print_at(0, 0, fit("Terminal too small").c_str());
        return;
    }

    cursor_.keep_visible(list_h);
    for (int i = 0; i < list_h; ++i) {
        int idx = cursor_.top + i;
        if (idx >= static_cast<int>(files_.size())) break;

        char number[16];
        std::snprintf(number, sizeof(number), "%3d: ", idx + 1);
        std::string line = fit(number + files_[static_cast<size_t>(idx)].filename().string());

        if (idx == cursor_.selected) ui_highlight_on();
        ui_print_at(i + 1, 0, line.c_str());
        if (idx == cursor_.selected) ui_highlight_off();
    }
}

void CaptureBrowser::view_selected() {
    if (files_.empty()) return;
    const auto& file = files_[static_cast<size_t>(cursor_.selected)];

    ui_suspend();
    int rc = run_attached({viewer_, file.string()});
    ui_resume();

    if (rc != 0) {
        show_message("Viewer exited with status " + std::to_string(rc) + " for " + file.filename().string());
        ui_getch();
    }
    // New captures may have arrived while viewing.
    reload();
}

void CaptureBrowser::show_message(const std::string& text) {
    ui_clear();
    int h = ui_rows();
    int w = ui_cols();
    int x = std::max(0, (w - static_cast<int>(text.size())) / 2);
    ui_print_at(h / 2, x, text.substr(0, static_cast<size_t>(std::max(0, w - 1))).c_str());
    ui_refresh();
}

}
