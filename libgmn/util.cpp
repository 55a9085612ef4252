/* util.c
 */
/* This software is copyrighted as detailed in the LICENSE file. */

#include "gmn/util.h"

#include <cstdio>
#include <cstring>
#include <filesystem>
#include <system_error>

// Reads one line of any length, without its newline.
// Returns false at end of file when nothing was read.
bool get_a_line(std::string &line, std::FILE *fp)
{
    char buffer[512];
    bool got_any = false;

    line.clear();
    while (std::fgets(buffer, sizeof buffer, fp) != nullptr)
    {
        got_any = true;
        const std::size_t len = std::strlen(buffer);
        if (len && buffer[len - 1] == '\n')
        {
            line.append(buffer, len - 1);
            if (!line.empty() && line.back() == '\r')
            {
                line.pop_back();
            }
            return true;
        }
        line.append(buffer, len);
    }
    return got_any;
}

bool read_file(const std::string &filename, std::string &contents)
{
    std::FILE *fp = std::fopen(filename.c_str(), "rb");
    if (fp == nullptr)
    {
        return false;
    }
    contents.clear();
    char   buffer[4096];
    size_t len;
    while ((len = std::fread(buffer, 1, sizeof buffer, fp)) > 0)
    {
        contents.append(buffer, len);
    }
    const bool ok = !std::ferror(fp);
    std::fclose(fp);
    return ok;
}

/* make a directory, or the directory a file lives in */
bool make_dir(const std::string &dirname, MakeDirNameType nametype)
{
    std::filesystem::path dir{dirname};
    if (nametype == MD_FILE)
    {
        dir = dir.parent_path();
    }
    if (dir.empty())
    {
        return true;
    }
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    return !ec && std::filesystem::is_directory(dir, ec);
}
