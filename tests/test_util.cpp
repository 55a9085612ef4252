#include <gtest/gtest.h>

#include <gmn/util.h>

#include <unistd.h>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>

namespace
{

class UtilTest : public testing::Test
{
public:
    ~UtilTest() override = default;

protected:
    void TearDown() override
    {
        std::error_code ec;
        std::filesystem::remove_all(m_dir, ec);
    }

    std::filesystem::path m_dir{std::filesystem::temp_directory_path() / ("gmn-util-" + std::to_string(::getpid()))};
};

} // namespace

TEST_F(UtilTest, makeDirCreatesParents)
{
    const std::filesystem::path dir{m_dir / "a" / "b"};

    ASSERT_TRUE(make_dir(dir.string(), MD_DIR));

    EXPECT_TRUE(std::filesystem::is_directory(dir));
}

TEST_F(UtilTest, makeDirForFile)
{
    const std::filesystem::path file{m_dir / "c" / "file.txt"};

    ASSERT_TRUE(make_dir(file.string(), MD_FILE));

    EXPECT_TRUE(std::filesystem::is_directory(m_dir / "c"));
    EXPECT_FALSE(std::filesystem::exists(file));
}

TEST_F(UtilTest, makeDirExisting)
{
    ASSERT_TRUE(make_dir(m_dir.string(), MD_DIR));

    EXPECT_TRUE(make_dir(m_dir.string(), MD_DIR));
}

TEST_F(UtilTest, readFile)
{
    ASSERT_TRUE(make_dir(m_dir.string(), MD_DIR));
    const std::string file{(m_dir / "page.gmi").string()};
    std::ofstream(file, std::ios::binary) << "# Page\r\nbody";
    std::string contents;

    ASSERT_TRUE(read_file(file, contents));

    EXPECT_EQ("# Page\r\nbody", contents);
}

TEST_F(UtilTest, readMissingFile)
{
    std::string contents;

    EXPECT_FALSE(read_file((m_dir / "missing").string(), contents));
}

TEST_F(UtilTest, getALine)
{
    ASSERT_TRUE(make_dir(m_dir.string(), MD_DIR));
    const std::string file{(m_dir / "lines").string()};
    std::ofstream(file, std::ios::binary) << "first\r\n" << std::string(1500, 'x') << "\nlast";
    std::FILE *fp = std::fopen(file.c_str(), "r");
    ASSERT_NE(nullptr, fp);
    std::string line;

    EXPECT_TRUE(get_a_line(line, fp));
    EXPECT_EQ("first", line);
    EXPECT_TRUE(get_a_line(line, fp));
    EXPECT_EQ(std::string(1500, 'x'), line);
    EXPECT_TRUE(get_a_line(line, fp));
    EXPECT_EQ("last", line);
    EXPECT_FALSE(get_a_line(line, fp));
    std::fclose(fp);
}
