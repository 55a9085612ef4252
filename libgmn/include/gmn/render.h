/* gmn/render.h
 */
// This software is copyrighted as detailed in the LICENSE file.
#ifndef GMN_RENDER_H
#define GMN_RENDER_H

#include "gmn/opt.h"

#include <string>
#include <vector>

struct Link
{
    int         index; // from 1, in document order
    std::string target;
    std::string label; // the target when the line has no label
};

using LinkTable = std::vector<Link>;

enum LineType
{
    LT_TEXT = 0,
    LT_HEADER1,
    LT_HEADER2,
    LT_HEADER3,
    LT_QUOTE,
    LT_LINK,
    LT_LIST,
    LT_PREFORMAT_TOGGLE
};

struct Page
{
    std::vector<std::string> lines;
    LinkTable                links;
    std::string              title;
};

LineType                 classify_line(const std::string &line);
bool                     parse_link_line(const std::string &line, std::string &target, std::string &label);
int                      display_width(const std::string &text);
std::vector<std::string> wrap_text(const std::string &text, int width);
Page                     render_gemtext(const std::string &body, int cols, const Config &config);
Page                     render_plain(const std::string &body, int margin);
Page                     render_message(const std::string &message, int cols, int margin);

#endif
