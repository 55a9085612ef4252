#include <gmock/gmock.h>

#include "fake_terminal.h"

#include <gmn/bookmark.h>
#include <gmn/opt.h>
#include <gmn/pager.h>
#include <gmn/render.h>
#include <gmn/session.h>
#include <gmn/url.h>
#include <util/env.h>

#include <unistd.h>

#include <deque>
#include <filesystem>
#include <string>
#include <utility>

using namespace testing;
using namespace gmn::testing;

TEST(PagerViewTest, last_row_is_reserved)
{
    const PagerView view = make_view(24, 100);

    EXPECT_EQ(0, view.top_line);
    EXPECT_EQ(23, view.height);
    EXPECT_EQ(23, bottom_line(view));
}

TEST(PagerViewTest, short_page)
{
    const PagerView view = make_view(24, 5);

    EXPECT_EQ(5, bottom_line(view));
}

TEST(PagerViewTest, scroll_up_at_top_is_noop)
{
    PagerView view = make_view(10, 40);

    EXPECT_FALSE(scroll_view(view, -1));

    EXPECT_EQ(0, view.top_line);
}

TEST(PagerViewTest, scroll_down_at_bottom_is_noop)
{
    PagerView view = make_view(10, 40);
    view.top_line = 31;

    EXPECT_FALSE(scroll_view(view, 1));

    EXPECT_EQ(31, view.top_line);
}

TEST(PagerViewTest, scroll_one_line)
{
    PagerView view = make_view(10, 40);

    EXPECT_TRUE(scroll_view(view, 1));
    EXPECT_EQ(1, view.top_line);
    EXPECT_TRUE(scroll_view(view, -1));
    EXPECT_EQ(0, view.top_line);
}

TEST(PagerViewTest, page_shorter_than_screen_does_not_scroll)
{
    PagerView view = make_view(24, 5);

    EXPECT_FALSE(scroll_view(view, 1));
    EXPECT_EQ(0, view.top_line);
}

class PagerTest : public Test
{
public:
    ~PagerTest() override = default;

protected:
    void SetUp() override
    {
        m_dir = std::filesystem::temp_directory_path() / ("gmn-pager-" + std::to_string(::getpid()));
        std::filesystem::create_directories(m_dir);
        m_env.config_dir = m_dir.string();
        m_env.bookmark_file = (m_dir / "bookmarks").string();
        m_env.cert_dir = (m_dir / "certs").string();
        m_config.homepage = "gemini://home.page/";
    }
    void TearDown() override
    {
        std::error_code ec;
        std::filesystem::remove_all(m_dir, ec);
    }

    Navigation run(const std::string &keys, std::deque<std::string> lines = {})
    {
        m_terminal.m_keys = keys;
        m_terminal.m_key_pos = 0;
        m_terminal.m_lines = std::move(lines);
        Session session(m_config, m_env, m_terminal);
        session.page = render_gemtext("# Docs\n=> /a First\n=> other.gmi Second\n", m_terminal.cols(), m_config);
        session.has_page = true;
        session.current_url.host = "h";
        session.current_url.path = "docs/guide/page.gmi";
        session.has_current = true;
        EXPECT_TRUE(session.bookmarks.load());
        return run_pager(session);
    }

    std::filesystem::path m_dir;
    ::Environment         m_env;
    Config                m_config{default_config()};
    FakeTerminal          m_terminal;
};

TEST_F(PagerTest, quit)
{
    EXPECT_EQ(NAV_QUIT, run("q").kind);
}

TEST_F(PagerTest, end_of_input_quits)
{
    EXPECT_EQ(NAV_QUIT, run("").kind);
}

TEST_F(PagerTest, unbound_keys_and_scrolling_are_ignored)
{
    EXPECT_EQ(NAV_QUIT, run("zZ\033[A\033[B\033OBq").kind);
}

TEST_F(PagerTest, follow_link)
{
    const Navigation navigation = run("g", {"2"});

    EXPECT_EQ(NAV_GOTO, navigation.kind);
    EXPECT_EQ("other.gmi", navigation.target);
}

TEST_F(PagerTest, link_number_out_of_range)
{
    const Navigation navigation = run("g", {"3"});

    EXPECT_EQ(NAV_GOTO, navigation.kind);
    EXPECT_EQ("", navigation.target);
}

TEST_F(PagerTest, link_number_not_a_number)
{
    const Navigation navigation = run("g", {"first"});

    EXPECT_EQ(NAV_GOTO, navigation.kind);
    EXPECT_EQ("", navigation.target);
}

TEST_F(PagerTest, open_url_adds_scheme)
{
    const Navigation navigation = run("o", {"x.y/z"});

    EXPECT_EQ(NAV_GOTO, navigation.kind);
    EXPECT_EQ("gemini://x.y/z", navigation.target);
}

TEST_F(PagerTest, open_url_keeps_scheme)
{
    EXPECT_EQ("gemini://x.y/", run("o", {"gemini://x.y/"}).target);
}

TEST_F(PagerTest, open_nothing_redisplays)
{
    EXPECT_EQ(NAV_REDISPLAY, run("o", {""}).kind);
}

TEST_F(PagerTest, refresh_and_back)
{
    EXPECT_EQ(NAV_REFRESH, run("r").kind);
    EXPECT_EQ(NAV_BACK, run("b").kind);
}

TEST_F(PagerTest, home)
{
    const Navigation navigation = run("h");

    EXPECT_EQ(NAV_GOTO, navigation.kind);
    EXPECT_EQ("gemini://home.page/", navigation.target);
}

TEST_F(PagerTest, up)
{
    const Navigation navigation = run("u");

    EXPECT_EQ(NAV_GOTO, navigation.kind);
    EXPECT_EQ("gemini://h/docs/guide/", navigation.target);
}

TEST_F(PagerTest, configured_key)
{
    m_config.keys[CMD_BACK] = 'p';

    EXPECT_EQ(NAV_BACK, run("bp").kind);
}

TEST_F(PagerTest, status_line_shows_title_location_and_charset)
{
    run("q");

    EXPECT_THAT(m_terminal.m_output, HasSubstr(" Docs | gemini://h/docs/guide/page.gmi | utf8 | 1-3/3"));
}

TEST_F(PagerTest, wide_lines_are_cut_at_screen_width)
{
    m_terminal.m_keys = "q";
    m_terminal.m_cols = 20;
    Session session(m_config, m_env, m_terminal);
    session.page = render_gemtext("```\n" + std::string(30, 'x') + "\n```\n", m_terminal.cols(), m_config);
    session.has_page = true;

    EXPECT_EQ(NAV_QUIT, run_pager(session).kind);

    EXPECT_THAT(m_terminal.m_output, HasSubstr("  " + std::string(18, 'x') + '\n'));
    EXPECT_THAT(m_terminal.m_output, Not(HasSubstr(std::string(19, 'x'))));
}

TEST_F(PagerTest, set_bookmark)
{
    EXPECT_EQ(NAV_REDISPLAY, run("a", {"The guide"}).kind);

    BookmarkStore store(m_env.bookmark_file);
    ASSERT_TRUE(store.load());
    ASSERT_EQ(1U, store.bookmarks().size());
    EXPECT_EQ("gemini://h/docs/guide/page.gmi", store.bookmarks()[0].url);
    EXPECT_EQ("The guide", store.bookmarks()[0].description);
}

TEST_F(PagerTest, goto_bookmark)
{
    BookmarkStore store(m_env.bookmark_file);
    ASSERT_TRUE(store.add("gemini://one/", "One"));
    ASSERT_TRUE(store.add("gemini://two/", ""));

    const Navigation navigation = run("B", {"2"});

    EXPECT_EQ(NAV_GOTO, navigation.kind);
    EXPECT_EQ("gemini://two/", navigation.target);
    EXPECT_THAT(m_terminal.m_output, HasSubstr("1. gemini://one/ One\n2. gemini://two/\n"));
}

TEST_F(PagerTest, goto_bookmark_out_of_range)
{
    EXPECT_EQ("", run("B", {"1"}).target);
}

TEST_F(PagerTest, delete_bookmark)
{
    BookmarkStore store(m_env.bookmark_file);
    ASSERT_TRUE(store.add("gemini://h/docs/guide/page.gmi", "Guide"));
    ASSERT_TRUE(store.add("gemini://one/", "One"));

    EXPECT_EQ(NAV_REDISPLAY, run("d").kind);

    ASSERT_TRUE(store.load());
    ASSERT_EQ(1U, store.bookmarks().size());
    EXPECT_EQ("gemini://one/", store.bookmarks()[0].url);
}

TEST(WaitForKeyTest, key_is_returned)
{
    FakeTerminal terminal("x");
    char         key = '\0';

    EXPECT_TRUE(wait_for_key(terminal, "press a key", &key));

    EXPECT_EQ('x', key);
    EXPECT_TRUE(terminal.m_raw);
}

TEST(WaitForKeyTest, end_of_input)
{
    FakeTerminal terminal;

    EXPECT_FALSE(wait_for_key(terminal, "press a key"));
}

TEST(PromptLineTest, echo_is_passed_on)
{
    FakeTerminal terminal("", {"secret"});

    EXPECT_EQ("secret", prompt_line(terminal, "Password: ", false));

    EXPECT_FALSE(terminal.m_last_echo);
    EXPECT_THAT(terminal.m_output, HasSubstr("Password: "));
}
