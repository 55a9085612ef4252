/* session.c
 */
// This software is copyrighted as detailed in the LICENSE file.

#include "config/common.h"
#include "gmn/session.h"

#include "gmn/pager.h"

#include <string>

Session::Session(const Config &config, const Environment &env, ITerminal &terminal) :
    config(config),
    env(env),
    terminal(terminal),
    bookmarks(env.bookmark_file),
    certs(env.cert_dir)
{
}

std::string current_location(const Session &session)
{
    return session.has_current ? url_request(session.current_url) : std::string{};
}

void start_url(Session &session, const std::string &raw)
{
    session.pending = raw;
    session.state = BS_RESOLVING;
}

// A local document goes straight to the pager: no fetch, no history.
void start_document(Session &session, const std::string &body, const std::string &title)
{
    session.page = render_gemtext(body, session.terminal.cols(), session.config);
    if (session.page.title.empty())
    {
        session.page.title = title;
    }
    session.has_page = true;
    session.state = BS_PAGING;
}

static BrowseState navigate_to(Session &session, const Url &url)
{
    session.target = url;
    session.redirect_count = 0;
    session.nav_depth = session.history.depth();
    return BS_FETCHING;
}

static void show_error_page(Session &session, const std::string &message)
{
    session.page = render_message(message, session.terminal.cols(), session.config.margin);
    session.page.title = "Error";
    session.has_page = true;
}

// Redirect hops and answered prompts of the failed navigation are dropped,
// leaving its first attempt on top; then the two-pop contract of the back
// command applies.
static BrowseState fall_back(Session &session, const std::string &message)
{
    session.history.truncate(session.nav_depth + 1);
    HistoryEntry previous;
    if (session.history.back(previous))
    {
        return navigate_to(session, entry_url(previous));
    }
    if (!session.has_page)
    {
        show_error_page(session, message);
    }
    return BS_PAGING;
}

static BrowseState do_resolve(Session &session)
{
    Url                 url;
    const ResolveResult result =
        resolve_url(session.pending, session.has_context ? &session.context : nullptr, url);
    const std::string raw = session.pending;
    session.pending.clear();

    switch (result)
    {
    case RESOLVE_OK:
        return navigate_to(session, url);

    case RESOLVE_EMPTY:
        if (!session.has_page)
        {
            show_error_page(session, "Nothing to show.");
        }
        return BS_PAGING;

    default:
        if (session.has_page)
        {
            return wait_for_key(session.terminal, "Invalid URL: " + raw + " -- press any key") ? BS_PAGING : BS_DONE;
        }
        show_error_page(session, "Invalid URL: " + raw);
        return BS_PAGING;
    }
}

static BrowseState fetch_failed(Session &session)
{
    const std::string message = outcome_message(session.outcome);
    session.redirect_count = 0;
    if (!wait_for_key(session.terminal, message + " -- press any key"))
    {
        return BS_DONE;
    }
    return fall_back(session, message);
}

static BrowseState certificate_required(Session &session)
{
    ITerminal         &terminal = session.terminal;
    const std::string &host = session.outcome.host;
    const std::string  message = outcome_message(session.outcome);

    clear_screen(terminal);
    terminal.write(message + "\n\n");
    terminal.write("The server at " + host + " wants a client certificate.\n");
    terminal.write("To create one for this host, run:\n\n");
    terminal.write("    " + session.certs.generate_command(host) + "\n\n");
    terminal.write("It is presented automatically once both files exist.\n");

    char key;
    if (!wait_for_key(terminal, "Press r to retry, any other key to go back", &key))
    {
        return BS_DONE;
    }
    if (key == 'r')
    {
        session.history.truncate(session.nav_depth);
        return navigate_to(session, session.target);
    }
    return fall_back(session, message);
}

static BrowseState do_fetch(Session &session)
{
    show_message(session.terminal, "Fetching " + url_request(session.target) + "...");
    session.outcome = gemini_fetch(session.target, session.history, session.certs);

    switch (session.outcome.kind)
    {
    case FETCH_RENDERED:
        return BS_RENDERING;

    case FETCH_INPUT:
        return BS_INPUT_PROMPT;

    case FETCH_REDIRECT:
        if (++session.redirect_count > GEMINI_MAX_REDIRECTS)
        {
            session.outcome.kind = FETCH_FAILURE;
            session.outcome.failure = FAIL_TOO_MANY_REDIRECTS;
            session.outcome.detail = "Too many redirects, last to " + url_request(session.outcome.redirect);
            return fetch_failed(session);
        }
        session.target = session.outcome.redirect;
        return BS_FETCHING;

    case FETCH_CERT_REQUIRED:
        return certificate_required(session);

    default:
        return fetch_failed(session);
    }
}

// An empty answer cancels the request. An answer continues the same
// navigation.
static BrowseState do_input_prompt(Session &session)
{
    const std::string prompt = session.outcome.meta.empty() ? std::string{"Input"} : session.outcome.meta;
    const std::string input = prompt_line(session.terminal, prompt + ": ", !session.outcome.sensitive);
    if (input.empty())
    {
        return fall_back(session, "No input given.");
    }

    session.target.query = percent_encode(input);
    session.redirect_count = 0;
    return BS_FETCHING;
}

static BrowseState do_render(Session &session)
{
    const FetchOutcome &outcome = session.outcome;
    if (outcome.gemtext)
    {
        session.page = render_gemtext(outcome.body, session.terminal.cols(), session.config);
    }
    else
    {
        session.page = render_plain(outcome.body, session.config.margin);
    }
    if (session.page.title.empty())
    {
        session.page.title = url_request(session.target);
    }
    session.has_page = true;
    session.current_url = session.target;
    session.has_current = true;
    session.context = url_context(session.target);
    session.has_context = true;
    session.charset = outcome.charset;
    session.outcome.body.clear();
    return BS_PAGING;
}

static BrowseState do_page(Session &session)
{
    session.terminal.enter_raw_mode();
    const Navigation navigation = run_pager(session);

    switch (navigation.kind)
    {
    case NAV_QUIT:
        return BS_DONE;

    case NAV_GOTO:
        session.pending = navigation.target;
        return BS_RESOLVING;

    case NAV_REFRESH:
        return session.has_current ? navigate_to(session, session.current_url) : BS_PAGING;

    case NAV_BACK:
    {
        HistoryEntry previous;
        if (session.history.back(previous))
        {
            return navigate_to(session, entry_url(previous));
        }
        return BS_PAGING;
    }

    default:
        return BS_PAGING;
    }
}

BrowseState browse_step(Session &session)
{
    switch (session.state)
    {
    case BS_RESOLVING:
        return do_resolve(session);
    case BS_FETCHING:
        return do_fetch(session);
    case BS_INPUT_PROMPT:
        return do_input_prompt(session);
    case BS_RENDERING:
        return do_render(session);
    case BS_PAGING:
        return do_page(session);
    default:
        return BS_DONE;
    }
}

int browse(Session &session)
{
    session.terminal.enter_raw_mode();
    while (session.state != BS_DONE)
    {
        session.state = browse_step(session);
    }
    return session.exit_status;
}
