/* gmn/pager.h
 */
// This software is copyrighted as detailed in the LICENSE file.
#ifndef GMN_PAGER_H
#define GMN_PAGER_H

#include <string>

struct Session;
struct ITerminal;

enum NavigationKind
{
    NAV_QUIT = 0,
    NAV_GOTO,     // resolve target and fetch it
    NAV_REFRESH,  // fetch the current URL again
    NAV_BACK,     // one page back through the history
    NAV_REDISPLAY // show the current page again, no fetch
};

struct Navigation
{
    NavigationKind kind;
    std::string    target;
};

struct PagerView
{
    int top_line;   // first line on screen
    int height;     // rows - 1; the last row holds status and prompts
    int line_count;
};

PagerView   make_view(int rows, int line_count);
bool        scroll_view(PagerView &view, int delta);
int         bottom_line(const PagerView &view);
Navigation  run_pager(Session &session);
std::string prompt_line(ITerminal &terminal, const std::string &prompt, bool echo);
void        show_message(ITerminal &terminal, const std::string &message);
bool        wait_for_key(ITerminal &terminal, const std::string &prompt, char *key = nullptr);

#endif
