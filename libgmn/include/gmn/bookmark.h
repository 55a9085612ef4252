/* gmn/bookmark.h
 */
// This software is copyrighted as detailed in the LICENSE file.
#ifndef GMN_BOOKMARK_H
#define GMN_BOOKMARK_H

#include <string>
#include <vector>

struct Bookmark
{
    std::string url;
    std::string description;
};

// One "<url> <description>" per line; duplicates are allowed.
class BookmarkStore
{
public:
    explicit BookmarkStore(std::string filename);

    bool load();
    bool add(const std::string &url, const std::string &description);
    int  remove_matching(const std::string &url);

    const std::vector<Bookmark> &bookmarks() const
    {
        return m_bookmarks;
    }
    const std::string &filename() const
    {
        return m_filename;
    }

private:
    bool save() const;

    std::string           m_filename;
    std::vector<Bookmark> m_bookmarks;
};

Bookmark    parse_bookmark(const std::string &line);
std::string format_bookmark(const Bookmark &bookmark);

#endif
