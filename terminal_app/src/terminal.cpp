#include "terminal.h"

#include <cstdio>
#include <stdexcept>
#include <vector>

#include <ncurses.h>

struct Terminal::Impl
{
    SCREEN* screen;
    bool colors;

    Impl()
      : screen(newterm(nullptr, stdout, stdin))
      , colors(false)
    {
        if (screen == nullptr) {
            throw std::runtime_error("Could not initialize the terminal.");
        }
        set_term(screen);
        cbreak();
        noecho();
        keypad(stdscr, TRUE);
        // Let ESC sequences of the arrow keys arrive without a noticeable delay.
        set_escdelay(25);

        if (has_colors()) {
            start_color();
            use_default_colors();
            init_pair(Terminal::Error, COLOR_RED, -1);
            init_pair(Terminal::Search, COLOR_CYAN, -1);
            colors = true;
        }
    }

    ~Impl()
    {
        endwin();
        delscreen(screen);
    }
};

Terminal::Terminal()
  : pimpl{ std::make_unique<Impl>() }
{}

Terminal::~Terminal() = default;

bool
Terminal::hasColors() const noexcept
{
    return pimpl->colors;
}

int
Terminal::rows() const
{
    return getmaxy(stdscr);
}

int
Terminal::cols() const
{
    return getmaxx(stdscr);
}

int
Terminal::readKey(int timeoutMs)
{
    timeout(timeoutMs);
    const int key = getch();
    timeout(-1);
    return key;
}

std::string
Terminal::readLine(int y, const std::string& prompt, int maxLen)
{
    move(y, 0);
    clrtoeol();
    addstr(prompt.c_str());
    refresh();

    std::vector<char> buffer(static_cast<size_t>(maxLen) + 1, '\0');
    echo();
    curs_set(1);
    getnstr(buffer.data(), maxLen);
    noecho();

    move(y, 0);
    clrtoeol();
    return std::string(buffer.data());
}
