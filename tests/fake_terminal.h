#ifndef GMN_FAKE_TERMINAL_H
#define GMN_FAKE_TERMINAL_H

#include <gmn/terminal.h>

#include <deque>
#include <string>
#include <utility>

namespace gmn
{
namespace testing
{

// Keystrokes and prompt answers come from a script; output is collected.
class FakeTerminal : public ITerminal
{
public:
    FakeTerminal(std::string keys = {}, std::deque<std::string> lines = {}) :
        m_keys(std::move(keys)),
        m_lines(std::move(lines))
    {
    }
    ~FakeTerminal() override = default;

    int read_byte() override
    {
        if (m_key_pos >= m_keys.size())
        {
            return -1;
        }
        return static_cast<unsigned char>(m_keys[m_key_pos++]);
    }
    std::string read_line(bool echo) override
    {
        m_last_echo = echo;
        if (m_lines.empty())
        {
            return {};
        }
        std::string line = m_lines.front();
        m_lines.pop_front();
        return line;
    }
    void write(const std::string &text) override
    {
        m_output += text;
    }
    void flush() override
    {
    }
    int rows() override
    {
        return m_rows;
    }
    int cols() override
    {
        return m_cols;
    }
    void enter_raw_mode() override
    {
        m_raw = true;
    }
    void restore_mode() override
    {
        m_raw = false;
    }

    std::string             m_keys;
    std::string::size_type  m_key_pos{};
    std::deque<std::string> m_lines;
    std::string             m_output;
    int                     m_rows{24};
    int                     m_cols{80};
    bool                    m_raw{};
    bool                    m_last_echo{true};
};

} // namespace testing
} // namespace gmn

#endif
