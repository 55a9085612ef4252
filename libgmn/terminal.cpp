/* term.c
 */
/* This software is copyrighted as detailed in the LICENSE file. */

#include "gmn/terminal.h"

#include "util/env.h"

#include <sys/ioctl.h>
#include <termios.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <string>

enum
{
    DEFAULT_ROWS = 24,
    DEFAULT_COLS = 80
};

static termios s_tty;
static termios s_oldtty;
static int     s_tty_ch{-1};
static bool    s_bizarre{}; /* do we need to restore terminal? */
static bool    s_alternate{};
static bool    s_resume_alternate{};

static const char ALT_SCREEN_ON[] = "\033[?1049h";
static const char ALT_SCREEN_OFF[] = "\033[?1049l";

/* terminal mode diddling routines */

static void savetty()
{
    if (tcgetattr(s_tty_ch, &s_oldtty) == 0)
    {
        s_tty = s_oldtty;
    }
    else
    {
        s_tty_ch = -1;
    }
}

static void crmode()
{
    s_bizarre = true;
    s_tty.c_lflag &= ~ICANON;
    s_tty.c_cc[VMIN] = 1;
    s_tty.c_cc[VTIME] = 0;
}

static void nocrmode()
{
    s_bizarre = true;
    s_tty.c_lflag |= ICANON;
}

static void echo()
{
    s_tty.c_lflag |= ECHO;
}

static void noecho()
{
    s_tty.c_lflag &= ~ECHO;
}

static void settty()
{
    if (s_tty_ch >= 0)
    {
        tcsetattr(s_tty_ch, TCSAFLUSH, &s_tty);
    }
}

// Restores the terminal exactly as we found it; safe to call from a
// signal handler.
void termlib_reset()
{
    if (s_alternate)
    {
        s_alternate = false;
        // nothing more can be done if the terminal has gone away
        const ssize_t len = ::write(STDOUT_FILENO, ALT_SCREEN_OFF, sizeof ALT_SCREEN_OFF - 1);
        (void) len;
    }
    if (s_bizarre && s_tty_ch >= 0)
    {
        s_bizarre = false;
        tcsetattr(s_tty_ch, TCSAFLUSH, &s_oldtty);
    }
}

// For job control: put the terminal back the way we found it, then
// pick up where we left off when continued.
bool termlib_suspend()
{
    const bool active = s_bizarre || s_alternate;
    s_resume_alternate = s_alternate;
    termlib_reset();
    return active;
}

void termlib_resume()
{
    if (s_resume_alternate)
    {
        s_alternate = true;
        const ssize_t len = ::write(STDOUT_FILENO, ALT_SCREEN_ON, sizeof ALT_SCREEN_ON - 1);
        (void) len;
    }
    s_bizarre = true;
    settty();
}

TtyTerminal::TtyTerminal(int fd) :
    m_fd(fd)
{
    s_tty_ch = isatty(fd) ? fd : -1;
    if (s_tty_ch >= 0)
    {
        savetty();
    }
}

TtyTerminal::~TtyTerminal()
{
    restore_mode();
}

int TtyTerminal::read_byte()
{
    unsigned char ch;
    while (true)
    {
        const ssize_t len = ::read(m_fd, &ch, 1);
        if (len == 1)
        {
            return ch;
        }
        if (len < 0 && errno == EINTR)
        {
            continue;
        }
        return -1;
    }
}

// Switches to line-buffered input for one line; the pager puts the
// terminal back into raw mode the next time it starts.
std::string TtyTerminal::read_line(bool echoing)
{
    nocrmode();
    if (echoing)
    {
        echo();
    }
    else
    {
        noecho();
    }
    settty();
    flush();

    std::string line;
    int         ch;
    while ((ch = read_byte()) >= 0 && ch != '\n')
    {
        line += static_cast<char>(ch);
    }
    if (!line.empty() && line.back() == '\r')
    {
        line.pop_back();
    }
    if (!echoing)
    {
        write("\n");
    }
    return line;
}

void TtyTerminal::write(const std::string &text)
{
    std::fwrite(text.data(), 1, text.size(), stdout);
}

void TtyTerminal::flush()
{
    std::fflush(stdout);
}

bool TtyTerminal::window_size(int &rows, int &cols) const
{
    winsize ws{};
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) >= 0 && ws.ws_row > 0 && ws.ws_col > 0)
    {
        rows = ws.ws_row;
        cols = ws.ws_col;
        return true;
    }
    return false;
}

int TtyTerminal::rows()
{
    int rows;
    int cols;
    if (window_size(rows, cols))
    {
        return rows;
    }
    const int lines = std::atoi(get_val_const("LINES", "0"));
    return lines > 0 ? lines : DEFAULT_ROWS;
}

int TtyTerminal::cols()
{
    int rows;
    int cols;
    if (window_size(rows, cols))
    {
        return cols;
    }
    const int columns = std::atoi(get_val_const("COLUMNS", "0"));
    return columns > 0 ? columns : DEFAULT_COLS;
}

void TtyTerminal::enter_raw_mode()
{
    if (!s_alternate)
    {
        s_alternate = true;
        write(ALT_SCREEN_ON);
    }
    crmode();
    noecho();
    settty();
}

void TtyTerminal::restore_mode()
{
    flush();
    termlib_reset();
}
