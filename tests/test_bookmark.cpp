#include <gtest/gtest.h>

#include <gmn/bookmark.h>

#include <unistd.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

using namespace testing;

namespace
{

class BookmarkTest : public Test
{
public:
    ~BookmarkTest() override = default;

protected:
    void SetUp() override
    {
        std::error_code ec;
        std::filesystem::remove_all(m_dir, ec);
    }
    void TearDown() override
    {
        std::error_code ec;
        std::filesystem::remove_all(m_dir, ec);
    }

    std::string read_back() const
    {
        std::ifstream in(m_file);
        return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    }

    std::filesystem::path m_dir{std::filesystem::temp_directory_path()
                                / ("gmn-bookmarks-" + std::to_string(::getpid()))};
    std::string           m_file{(m_dir / "sub" / "bookmarks").string()};
};

} // namespace

TEST(ParseBookmarkTest, urlAndDescription)
{
    const Bookmark bookmark = parse_bookmark("  gemini://x.y/ Capsule  of x \n");

    EXPECT_EQ("gemini://x.y/", bookmark.url);
    EXPECT_EQ("Capsule  of x", bookmark.description);
}

TEST(ParseBookmarkTest, urlOnly)
{
    const Bookmark bookmark = parse_bookmark("gemini://x.y/");

    EXPECT_EQ("gemini://x.y/", bookmark.url);
    EXPECT_EQ("", bookmark.description);
}

TEST(FormatBookmarkTest, withAndWithoutDescription)
{
    EXPECT_EQ("gemini://x.y/ X", format_bookmark(Bookmark{"gemini://x.y/", "X"}));
    EXPECT_EQ("gemini://x.y/", format_bookmark(Bookmark{"gemini://x.y/", ""}));
}

TEST_F(BookmarkTest, missingFileIsEmpty)
{
    BookmarkStore store(m_file);

    ASSERT_TRUE(store.load());

    EXPECT_TRUE(store.bookmarks().empty());
}

TEST_F(BookmarkTest, loadSkipsBlankLines)
{
    std::filesystem::create_directories(m_dir / "sub");
    std::ofstream(m_file) << "gemini://a/ A\n\n   \ngemini://b/\r\n";
    BookmarkStore store(m_file);

    ASSERT_TRUE(store.load());

    ASSERT_EQ(2U, store.bookmarks().size());
    EXPECT_EQ("gemini://a/", store.bookmarks()[0].url);
    EXPECT_EQ("A", store.bookmarks()[0].description);
    EXPECT_EQ("gemini://b/", store.bookmarks()[1].url);
}

TEST_F(BookmarkTest, addAppendsAndCreatesDirectory)
{
    BookmarkStore store(m_file);

    ASSERT_TRUE(store.add("gemini://a/", "A"));
    ASSERT_TRUE(store.add("gemini://a/", ""));

    EXPECT_EQ(2U, store.bookmarks().size());
    EXPECT_EQ("gemini://a/ A\ngemini://a/\n", read_back());
}

TEST_F(BookmarkTest, addEmptyUrl)
{
    BookmarkStore store(m_file);

    EXPECT_FALSE(store.add("  ", "nothing"));
    EXPECT_TRUE(store.bookmarks().empty());
}

TEST_F(BookmarkTest, removeMatchingIgnoresCase)
{
    BookmarkStore store(m_file);
    ASSERT_TRUE(store.add("gemini://A.example/docs/intro", "Intro"));
    ASSERT_TRUE(store.add("gemini://b.example/", "B"));
    ASSERT_TRUE(store.add("gemini://a.example/docs/", "Docs"));

    EXPECT_EQ(2, store.remove_matching("gemini://a.example/docs/"));

    ASSERT_EQ(1U, store.bookmarks().size());
    EXPECT_EQ("gemini://b.example/ B\n", read_back());
}

TEST_F(BookmarkTest, removeNothing)
{
    BookmarkStore store(m_file);
    ASSERT_TRUE(store.add("gemini://b.example/", "B"));

    EXPECT_EQ(0, store.remove_matching("gemini://c.example/"));
    EXPECT_EQ(0, store.remove_matching(""));

    EXPECT_EQ(1U, store.bookmarks().size());
}
