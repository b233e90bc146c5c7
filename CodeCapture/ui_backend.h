#ifndef _CodeCapture_ui_backend_h_
#define _CodeCapture_ui_backend_h_

// UI backend for the terminal tools. Only the browser translation unit
// includes this header; the ncurses function-like macros are disabled so
// names such as clear() and move() do not leak into C++ code.

#ifndef NCURSES_NOMACROS
#define NCURSES_NOMACROS
#endif
#include <ncurses.h>

#define UI_KEY_ESC 27

inline void ui_init() {
    initscr();
    cbreak();
    noecho();
    keypad(stdscr, TRUE);
    curs_set(0);
    if (has_colors()) {
        start_color();
        use_default_colors();
        init_pair(1, COLOR_BLACK, COLOR_WHITE);
    }
}

inline void ui_end() {
    endwin();
}

// Hands the terminal to a child program and takes it back afterwards.
inline void ui_suspend() {
    def_prog_mode();
    endwin();
}

inline void ui_resume() {
    reset_prog_mode();
    curs_set(0);
    refresh();
}

inline void ui_refresh() {
    refresh();
}

inline int ui_getch() {
    return getch();
}

inline void ui_clear() {
    erase();
}

inline void ui_print_at(int y, int x, const char* text) {
    mvaddstr(y, x, text);
}

inline void ui_highlight_on() {
    if (has_colors()) attron(COLOR_PAIR(1));
    else attron(A_REVERSE);
}

inline void ui_highlight_off() {
    if (has_colors()) attroff(COLOR_PAIR(1));
    else attroff(A_REVERSE);
}

inline int ui_rows() {
    int rows __attribute__((unused)), cols __attribute__((unused));
    getmaxyx(stdscr, rows, cols);
    return rows;
}

inline int ui_cols() {
    int rows __attribute__((unused)), cols __attribute__((unused));
    getmaxyx(stdscr, rows, cols);
    return cols;
}

#endif // _CodeCapture_ui_backend_h_
