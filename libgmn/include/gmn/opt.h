/* gmn/opt.h
 */
// This software is copyrighted as detailed in the LICENSE file.
#ifndef GMN_OPT_H
#define GMN_OPT_H

#include <string>

enum PagerCommand
{
    CMD_NONE = 0,
    CMD_QUIT,
    CMD_OPEN,
    CMD_LINK,
    CMD_REFRESH,
    CMD_BACK,
    CMD_HOME,
    CMD_UP,
    CMD_SET_BOOKMARK,
    CMD_GOTO_BOOKMARK,
    CMD_DELETE_BOOKMARK,
    CMD_COUNT
};

enum StyleCategory
{
    STYLE_HEADER1 = 0,
    STYLE_HEADER2,
    STYLE_HEADER3,
    STYLE_QUOTE,
    STYLE_LINK_BULLET,
    STYLE_LINK_TEXT,
    STYLE_LIST_BULLET,
    STYLE_LIST_TEXT,
    STYLE_COUNT
};

enum OptionIndex
{
    OI_MARGIN = 1,
    OI_HOMEPAGE,
    OI_KEY_QUIT,
    OI_KEY_OPEN,
    OI_KEY_LINK,
    OI_KEY_REFRESH,
    OI_KEY_BACK,
    OI_KEY_HOME,
    OI_KEY_UP,
    OI_KEY_SET_BOOKMARK,
    OI_KEY_GOTO_BOOKMARK,
    OI_KEY_DELETE_BOOKMARK,
    OI_STYLE_HEADER1,
    OI_STYLE_HEADER2,
    OI_STYLE_HEADER3,
    OI_STYLE_QUOTE,
    OI_STYLE_LINK_BULLET,
    OI_STYLE_LINK_TEXT,
    OI_STYLE_LIST_BULLET,
    OI_STYLE_LIST_TEXT,
    OI_COUNT
};

// Read once at startup and never changed afterwards.
struct Config
{
    int         margin;
    std::string homepage;
    char        keys[CMD_COUNT];
    std::string styles[STYLE_COUNT];
};

Config      default_config();
bool        read_config(const std::string &filename, Config &config);
void        parse_config(const std::string &text, Config &config);
bool        set_option(Config &config, OptionIndex num, const std::string &value);
const char *option_name(OptionIndex num);
bool        write_default_config(const std::string &filename);
std::string style_on(const Config &config, StyleCategory category);
std::string style_off(const Config &config, StyleCategory category);

#endif
