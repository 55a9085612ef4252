/* render.c
 */
// This software is copyrighted as detailed in the LICENSE file.

#include "gmn/render.h"

#include "gmn/string-algos.h"

#include <algorithm>
#include <string>
#include <vector>

static bool starts_with(const std::string &line, const char *prefix)
{
    return line.compare(0, std::char_traits<char>::length(prefix), prefix) == 0;
}

// First match wins.
LineType classify_line(const std::string &line)
{
    if (starts_with(line, "```"))
    {
        return LT_PREFORMAT_TOGGLE;
    }
    if (starts_with(line, "### "))
    {
        return LT_HEADER3;
    }
    if (starts_with(line, "## "))
    {
        return LT_HEADER2;
    }
    if (starts_with(line, "# "))
    {
        return LT_HEADER1;
    }
    if (starts_with(line, "> "))
    {
        return LT_QUOTE;
    }
    if (starts_with(line, "=>"))
    {
        return LT_LINK;
    }
    if (starts_with(line, "* "))
    {
        return LT_LIST;
    }
    return LT_TEXT;
}

// "=>[<whitespace>]<target>[<whitespace><label>]"
bool parse_link_line(const std::string &line, std::string &target, std::string &label)
{
    const char *s = skip_hor_space(line.c_str() + 2);
    const char *end = skip_non_space(s);
    target.assign(s, end);
    label = trim(end);
    if (label.empty())
    {
        label = target;
    }
    return !target.empty();
}

static bool is_continuation_byte(char c)
{
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

// Columns taken by UTF-8 text, one per code point.
int display_width(const std::string &text)
{
    return static_cast<int>(std::count_if(text.begin(), text.end(), [](char c) { return !is_continuation_byte(c); }));
}

// Byte length of the first 'columns' code points of text.
static std::string::size_type column_prefix(const std::string &text, int columns)
{
    std::string::size_type pos = 0;
    while (pos < text.size() && columns > 0)
    {
        ++pos;
        while (pos < text.size() && is_continuation_byte(text[pos]))
        {
            ++pos;
        }
        --columns;
    }
    return pos;
}

// Breaks at spaces; a word wider than the line is split.
// Always yields at least one (possibly empty) line.
std::vector<std::string> wrap_text(const std::string &text, int width)
{
    width = std::max(width, 1);

    std::vector<std::string> lines;
    std::string              line;
    int                      line_width = 0;
    std::string::size_type   pos = 0;
    while (pos < text.size())
    {
        if (text[pos] == ' ')
        {
            ++pos;
            continue;
        }
        std::string::size_type end = text.find(' ', pos);
        if (end == std::string::npos)
        {
            end = text.size();
        }
        std::string word = text.substr(pos, end - pos);
        pos = end;

        int word_width = display_width(word);
        if (line_width > 0 && line_width + 1 + word_width <= width)
        {
            line += ' ' + word;
            line_width += 1 + word_width;
            continue;
        }
        if (line_width > 0)
        {
            lines.push_back(line);
            line.clear();
            line_width = 0;
        }
        while (word_width > width)
        {
            const std::string::size_type split = column_prefix(word, width);
            lines.push_back(word.substr(0, split));
            word.erase(0, split);
            word_width -= width;
        }
        line = word;
        line_width = word_width;
    }
    if (line_width > 0 || lines.empty())
    {
        lines.push_back(line);
    }
    return lines;
}

namespace {

struct Renderer
{
    Renderer(const Config &config, int cols) :
        m_config(config),
        m_margin(std::max(config.margin, 0), ' '),
        m_width(std::max(cols - 2 * std::max(config.margin, 0), 1))
    {
    }

    void text(const std::string &text);
    void styled(StyleCategory category, const std::string &text);
    void bulleted(StyleCategory bullet_style, const std::string &bullet, StyleCategory text_style,
                  const std::string &text);
    void preformatted(const std::string &line);

    const Config &m_config;
    std::string   m_margin;
    int           m_width;
    Page          m_page;
};

void Renderer::text(const std::string &text)
{
    for (const std::string &line : wrap_text(text, m_width))
    {
        m_page.lines.push_back(m_margin + line);
    }
}

void Renderer::styled(StyleCategory category, const std::string &text)
{
    const std::string on = style_on(m_config, category);
    const std::string off = style_off(m_config, category);
    for (const std::string &line : wrap_text(text, m_width))
    {
        m_page.lines.push_back(m_margin + on + line + off);
    }
}

// The bullet is on the first line only; later lines are indented past it.
void Renderer::bulleted(StyleCategory bullet_style, const std::string &bullet, StyleCategory text_style,
                        const std::string &text)
{
    const int         bullet_width = display_width(bullet) + 1;
    const std::string indent(bullet_width, ' ');
    const std::string on = style_on(m_config, text_style);
    const std::string off = style_off(m_config, text_style);
    bool              first = true;
    for (const std::string &line : wrap_text(text, m_width - bullet_width))
    {
        std::string prefix = indent;
        if (first)
        {
            prefix = style_on(m_config, bullet_style) + bullet + style_off(m_config, bullet_style) + ' ';
            first = false;
        }
        m_page.lines.push_back(m_margin + prefix + on + line + off);
    }
}

void Renderer::preformatted(const std::string &line)
{
    m_page.lines.push_back(m_margin + line);
}

} // namespace

Page render_gemtext(const std::string &body, int cols, const Config &config)
{
    Renderer renderer(config, cols);
    bool     preformat = false;
    int      link_count = 0;

    std::string::size_type start = 0;
    while (start < body.size())
    {
        std::string::size_type end = body.find('\n', start);
        if (end == std::string::npos)
        {
            end = body.size();
        }
        std::string line = body.substr(start, end - start);
        start = end + 1;
        if (!line.empty() && line.back() == '\r')
        {
            line.pop_back();
        }

        const LineType type = classify_line(line);
        if (type == LT_PREFORMAT_TOGGLE)
        {
            preformat = !preformat;
            continue;
        }
        if (preformat)
        {
            renderer.preformatted(line);
            continue;
        }

        switch (type)
        {
        case LT_HEADER1:
        case LT_HEADER2:
        case LT_HEADER3:
        {
            const std::string heading = trim(line.substr(type - LT_HEADER1 + 2));
            if (renderer.m_page.title.empty())
            {
                renderer.m_page.title = heading;
            }
            renderer.styled(static_cast<StyleCategory>(STYLE_HEADER1 + (type - LT_HEADER1)), heading);
            break;
        }

        case LT_QUOTE:
            renderer.styled(STYLE_QUOTE, "> " + trim(line.substr(2)));
            break;

        case LT_LINK:
        {
            std::string target;
            std::string label;
            if (!parse_link_line(line, target, label))
            {
                renderer.text(line);
                break;
            }
            ++link_count;
            renderer.m_page.links.push_back(Link{link_count, target, label});
            renderer.bulleted(STYLE_LINK_BULLET, '[' + std::to_string(link_count) + ']', STYLE_LINK_TEXT, label);
            break;
        }

        case LT_LIST:
            renderer.bulleted(STYLE_LIST_BULLET, "*", STYLE_LIST_TEXT, trim(line.substr(2)));
            break;

        default:
            renderer.text(line);
            break;
        }
    }
    return renderer.m_page;
}

static std::vector<std::string> split_lines(const std::string &body)
{
    std::vector<std::string> lines;
    std::string::size_type   start = 0;
    while (start < body.size())
    {
        std::string::size_type end = body.find('\n', start);
        if (end == std::string::npos)
        {
            end = body.size();
        }
        std::string line = body.substr(start, end - start);
        if (!line.empty() && line.back() == '\r')
        {
            line.pop_back();
        }
        lines.push_back(std::move(line));
        start = end + 1;
    }
    return lines;
}

// Anything that is not gemtext is shown as it came.
Page render_plain(const std::string &body, int margin)
{
    const std::string pad(std::max(margin, 0), ' ');
    Page              page;
    for (std::string &line : split_lines(body))
    {
        page.lines.push_back(pad + line);
    }
    return page;
}

Page render_message(const std::string &message, int cols, int margin)
{
    margin = std::max(margin, 0);
    const std::string pad(margin, ' ');
    Page              page;
    for (const std::string &text : split_lines(message))
    {
        for (const std::string &line : wrap_text(text, cols - 2 * margin))
        {
            page.lines.push_back(pad + line);
        }
    }
    return page;
}
