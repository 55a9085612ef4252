/* gmn/terminal.h
 */
/* This software is copyrighted as detailed in the LICENSE file. */
#ifndef GMN_TERMINAL_H
#define GMN_TERMINAL_H

#include <string>

struct ITerminal
{
    virtual ~ITerminal() = default;

    virtual int         read_byte() = 0; // -1 at end of input
    virtual std::string read_line(bool echo) = 0;
    virtual void        write(const std::string &text) = 0;
    virtual void        flush() = 0;
    virtual int         rows() = 0;
    virtual int         cols() = 0;
    virtual void        enter_raw_mode() = 0;
    virtual void        restore_mode() = 0;
};

// The controlling terminal, driven through termios.
class TtyTerminal : public ITerminal
{
public:
    explicit TtyTerminal(int fd);
    ~TtyTerminal() override;

    int         read_byte() override;
    std::string read_line(bool echo) override;
    void        write(const std::string &text) override;
    void        flush() override;
    int         rows() override;
    int         cols() override;
    void        enter_raw_mode() override;
    void        restore_mode() override;

private:
    bool window_size(int &rows, int &cols) const;

    int m_fd;
};

void termlib_reset();
bool termlib_suspend();
void termlib_resume();

/* screen control */

inline void clear_screen(ITerminal &terminal)
{
    terminal.write("\033[H\033[2J");
}

inline void goto_line(ITerminal &terminal, int row)
{
    terminal.write("\033[" + std::to_string(row) + ";1H\033[K");
}

#endif
