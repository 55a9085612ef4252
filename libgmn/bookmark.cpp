/* bookmark.c
 */
// This software is copyrighted as detailed in the LICENSE file.

#include "gmn/bookmark.h"

#include "gmn/string-algos.h"
#include "gmn/util.h"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <utility>

BookmarkStore::BookmarkStore(std::string filename) :
    m_filename(std::move(filename))
{
}

Bookmark parse_bookmark(const std::string &line)
{
    const std::string text = trim(line);
    const char *const start = text.c_str();
    const char *const end = skip_non_space(start);

    Bookmark bookmark;
    bookmark.url.assign(start, end);
    bookmark.description = trim(end);
    return bookmark;
}

std::string format_bookmark(const Bookmark &bookmark)
{
    if (bookmark.description.empty())
    {
        return bookmark.url;
    }
    return bookmark.url + ' ' + bookmark.description;
}

// A missing file is an empty list.
bool BookmarkStore::load()
{
    m_bookmarks.clear();
    std::FILE *fp = std::fopen(m_filename.c_str(), "r");
    if (fp == nullptr)
    {
        return errno == ENOENT;
    }
    std::string line;
    while (get_a_line(line, fp))
    {
        Bookmark bookmark = parse_bookmark(line);
        if (!bookmark.url.empty())
        {
            m_bookmarks.push_back(std::move(bookmark));
        }
    }
    std::fclose(fp);
    return true;
}

bool BookmarkStore::add(const std::string &url, const std::string &description)
{
    Bookmark bookmark{trim(url), trim(description)};
    if (bookmark.url.empty())
    {
        return false;
    }
    if (!make_dir(m_filename, MD_FILE))
    {
        return false;
    }
    std::FILE *fp = std::fopen(m_filename.c_str(), "a");
    if (fp == nullptr)
    {
        return false;
    }
    const bool written = std::fprintf(fp, "%s\n", format_bookmark(bookmark).c_str()) >= 0;
    if (std::fclose(fp) != 0 || !written)
    {
        return false;
    }
    m_bookmarks.push_back(std::move(bookmark));
    return true;
}

// Removes every bookmark whose URL starts with url, ignoring case.
// Returns the number removed, or -1 when the file could not be rewritten.
int BookmarkStore::remove_matching(const std::string &url)
{
    if (url.empty())
    {
        return 0;
    }
    const auto it = std::remove_if(m_bookmarks.begin(), m_bookmarks.end(),
                                   [&url](const Bookmark &bookmark)
                                   { return string_case_starts_with(bookmark.url, url); });
    const int removed = static_cast<int>(m_bookmarks.end() - it);
    if (removed == 0)
    {
        return 0;
    }
    m_bookmarks.erase(it, m_bookmarks.end());
    return save() ? removed : -1;
}

bool BookmarkStore::save() const
{
    std::FILE *fp = std::fopen(m_filename.c_str(), "w");
    if (fp == nullptr)
    {
        return false;
    }
    bool written = true;
    for (const Bookmark &bookmark : m_bookmarks)
    {
        if (std::fprintf(fp, "%s\n", format_bookmark(bookmark).c_str()) < 0)
        {
            written = false;
            break;
        }
    }
    return std::fclose(fp) == 0 && written;
}
