/* gmn/session.h
 */
// This software is copyrighted as detailed in the LICENSE file.
#ifndef GMN_SESSION_H
#define GMN_SESSION_H

#include "gmn/bookmark.h"
#include "gmn/cert.h"
#include "gmn/fetch.h"
#include "gmn/history.h"
#include "gmn/opt.h"
#include "gmn/render.h"
#include "gmn/terminal.h"
#include "gmn/url.h"
#include "util/env.h"

#include <cstddef>
#include <string>

enum BrowseState
{
    BS_RESOLVING = 0, // pending raw URL -> target
    BS_FETCHING,      // target -> outcome
    BS_INPUT_PROMPT,  // status 1x: ask, then fetch again
    BS_RENDERING,     // body -> page
    BS_PAGING,        // show page, wait for a command
    BS_DONE
};

// Everything one browsing run needs, passed to each step.
struct Session
{
    Session(const Config &config, const Environment &env, ITerminal &terminal);

    const Config &config;
    Environment   env;
    ITerminal    &terminal;

    HistoryStack        history;
    BookmarkStore       bookmarks;
    CertificateRegistry certs;

    BrowseContext context;         // updated only after a successful fetch
    bool          has_context{};
    Url           current_url;     // the page on display
    bool          has_current{};
    Page          page;
    bool          has_page{};
    Charset       charset{CHARSET_UTF8};

    std::string  pending;          // raw URL waiting to be resolved
    Url          target;
    FetchOutcome outcome;
    int          redirect_count{};
    std::size_t  nav_depth{};      // history depth before this navigation's first push
    BrowseState  state{BS_RESOLVING};
    int          exit_status{};
};

void        start_url(Session &session, const std::string &raw);
void        start_document(Session &session, const std::string &body, const std::string &title);
BrowseState browse_step(Session &session);
int         browse(Session &session);
std::string current_location(const Session &session);

#endif
