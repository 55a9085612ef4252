/* pager.c
 */
// This software is copyrighted as detailed in the LICENSE file.

#include "config/common.h"
#include "gmn/pager.h"

#include "gmn/keys.h"
#include "gmn/render.h"
#include "gmn/session.h"
#include "gmn/string-algos.h"
#include "gmn/terminal.h"
#include "gmn/url.h"

#include <algorithm>
#include <cstdlib>
#include <string>
#include <vector>

PagerView make_view(int rows, int line_count)
{
    return PagerView{0, std::max(rows - 1, 1), line_count};
}

int bottom_line(const PagerView &view)
{
    return std::min(view.top_line + view.height, view.line_count);
}

// Scrolling past either end leaves the view alone and returns false.
bool scroll_view(PagerView &view, int delta)
{
    if (delta < 0)
    {
        if (view.top_line == 0)
        {
            return false;
        }
        --view.top_line;
        return true;
    }
    if (delta > 0)
    {
        if (view.top_line + view.height >= view.line_count)
        {
            return false;
        }
        ++view.top_line;
        return true;
    }
    return false;
}

// Escape sequences take no columns; a cut line gets its style reset.
static std::string truncate_columns(const std::string &text, int columns)
{
    std::string result;
    int         width = 0;
    bool        styled = false;
    for (std::string::size_type i = 0; i < text.size(); i++)
    {
        const char c = text[i];
        if (c == '\033')
        {
            const std::string::size_type end = text.find('m', i);
            if (end == std::string::npos)
            {
                break;
            }
            result.append(text, i, end - i + 1);
            styled = true;
            i = end;
            continue;
        }
        const bool starts_char = (static_cast<unsigned char>(c) & 0xC0) != 0x80;
        if (starts_char && ++width > columns)
        {
            if (styled)
            {
                result += "\033[0m";
            }
            break;
        }
        result += c;
    }
    return result;
}

static void draw_status(Session &session, const PagerView &view)
{
    ITerminal        &terminal = session.terminal;
    const std::string location = current_location(session);

    std::string status = ' ' + session.page.title;
    if (!location.empty() && location != session.page.title)
    {
        status += " | " + location;
    }
    if (session.has_current)
    {
        status += std::string{" | "} + charset_name(session.charset);
    }
    if (view.line_count > 0)
    {
        status += " | " + std::to_string(view.top_line + 1) + '-' + std::to_string(bottom_line(view)) + '/'
            + std::to_string(view.line_count);
    }

    goto_line(terminal, view.height + 1);
    terminal.write("\033[7m" + truncate_columns(status, terminal.cols()) + "\033[0m");
}

static void draw_page(Session &session, const PagerView &view)
{
    ITerminal &terminal = session.terminal;
    clear_screen(terminal);
    for (int i = view.top_line; i < bottom_line(view); i++)
    {
        terminal.write(truncate_columns(session.page.lines[i], terminal.cols()) + '\n');
    }
    draw_status(session, view);
    terminal.flush();
}

std::string prompt_line(ITerminal &terminal, const std::string &prompt, bool echo)
{
    goto_line(terminal, terminal.rows());
    terminal.write(prompt);
    terminal.flush();
    return terminal.read_line(echo);
}

void show_message(ITerminal &terminal, const std::string &message)
{
    goto_line(terminal, terminal.rows());
    terminal.write(message);
    terminal.flush();
}

// Returns false when there is no more input.
bool wait_for_key(ITerminal &terminal, const std::string &prompt, char *key)
{
    terminal.enter_raw_mode();
    show_message(terminal, prompt);
    const InputEvent event = read_input_event(terminal);
    if (key)
    {
        *key = event.kind == IE_PLAIN_KEY ? event.key : '\0';
    }
    return event.kind != IE_END;
}

static bool parse_index(const std::string &text, int &index)
{
    const std::string number = trim(text);
    if (!all_digits(number) || number.size() > 9)
    {
        return false;
    }
    index = std::atoi(number.c_str());
    return true;
}

static Navigation goto_url(Session &session)
{
    std::string url = trim(prompt_line(session.terminal, "Go to URL: ", true));
    if (url.empty())
    {
        return {NAV_REDISPLAY, {}};
    }
    if (url.find("://") == std::string::npos)
    {
        url = GEMINI_SCHEME_PREFIX + url;
    }
    return {NAV_GOTO, url};
}

// An unknown link number gives an empty target, which resolves to nothing.
static Navigation goto_link(Session &session)
{
    int index;
    if (parse_index(prompt_line(session.terminal, "Link number: ", true), index))
    {
        for (const Link &link : session.page.links)
        {
            if (link.index == index)
            {
                return {NAV_GOTO, link.target};
            }
        }
    }
    return {NAV_GOTO, {}};
}

static Navigation go_up(Session &session)
{
    if (!session.has_current)
    {
        return {NAV_REDISPLAY, {}};
    }
    Url up = session.current_url;
    up.path = parent_path(up.path);
    up.query.clear();
    return {NAV_GOTO, url_request(up)};
}

static Navigation set_bookmark(Session &session)
{
    const std::string location = current_location(session);
    if (location.empty())
    {
        return {NAV_REDISPLAY, {}};
    }
    const std::string description = prompt_line(session.terminal, "Description (optional): ", true);
    if (!session.bookmarks.add(location, description))
    {
        wait_for_key(session.terminal, "Could not write " + session.bookmarks.filename() + " -- press any key");
    }
    return {NAV_REDISPLAY, {}};
}

static Navigation goto_bookmark(Session &session)
{
    ITerminal                   &terminal = session.terminal;
    const std::vector<Bookmark> &bookmarks = session.bookmarks.bookmarks();

    clear_screen(terminal);
    if (bookmarks.empty())
    {
        terminal.write("No bookmarks.\n");
    }
    for (std::size_t i = 0; i < bookmarks.size(); i++)
    {
        terminal.write(std::to_string(i + 1) + ". " + format_bookmark(bookmarks[i]) + '\n');
    }

    int index;
    if (parse_index(prompt_line(terminal, "Bookmark number: ", true), index) && index >= 1
        && index <= static_cast<int>(bookmarks.size()))
    {
        return {NAV_GOTO, bookmarks[index - 1].url};
    }
    return {NAV_GOTO, {}};
}

static Navigation delete_bookmark(Session &session)
{
    if (session.bookmarks.remove_matching(current_location(session)) < 0)
    {
        wait_for_key(session.terminal, "Could not write " + session.bookmarks.filename() + " -- press any key");
    }
    return {NAV_REDISPLAY, {}};
}

// Reads keys until one of them names a command; scrolling stays here.
Navigation run_pager(Session &session)
{
    ITerminal   &terminal = session.terminal;
    const KeyMap keymap = build_keymap(session.config);
    PagerView    view = make_view(terminal.rows(), static_cast<int>(session.page.lines.size()));

    draw_page(session, view);
    while (true)
    {
        const InputEvent event = read_input_event(terminal);
        if (event.kind == IE_END)
        {
            return {NAV_QUIT, {}};
        }
        if (event.kind == IE_ESCAPE_SEQUENCE)
        {
            if (scroll_view(view, scroll_delta(event)))
            {
                draw_page(session, view);
            }
            continue;
        }

        switch (lookup_command(keymap, event.key))
        {
        case CMD_QUIT:
            return {NAV_QUIT, {}};
        case CMD_OPEN:
            return goto_url(session);
        case CMD_LINK:
            return goto_link(session);
        case CMD_REFRESH:
            return {NAV_REFRESH, {}};
        case CMD_BACK:
            return {NAV_BACK, {}};
        case CMD_HOME:
            return {NAV_GOTO, session.config.homepage};
        case CMD_UP:
            return go_up(session);
        case CMD_SET_BOOKMARK:
            return set_bookmark(session);
        case CMD_GOTO_BOOKMARK:
            return goto_bookmark(session);
        case CMD_DELETE_BOOKMARK:
            return delete_bookmark(session);
        default:
            break;
        }
    }
}
