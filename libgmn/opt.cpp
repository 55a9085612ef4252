/* opt.c
 */
/* This software is copyrighted as detailed in the LICENSE file. */

#include "config/common.h"
#include "gmn/opt.h"

#include "gmn/string-algos.h"
#include "gmn/util.h"

#include <cstdio>
#include <cstdlib>
#include <string>

struct IniWords
{
    const char *item;
    const char *help_str;
};

static const IniWords s_options_ini[] = {
    // clang-format off
    { "OPTIONS", nullptr },
    { "margin", "<columns left blank on each side>" },
    { "homepage", "<url>" },
    { "key-quit", "<key>" },
    { "key-open", "<key>" },
    { "key-link", "<key>" },
    { "key-refresh", "<key>" },
    { "key-back", "<key>" },
    { "key-home", "<key>" },
    { "key-up", "<key>" },
    { "key-set-bookmark", "<key>" },
    { "key-goto-bookmark", "<key>" },
    { "key-delete-bookmark", "<key>" },
    { "style-header1", "<SGR parameters, e.g. 1;36>" },
    { "style-header2", "<SGR parameters>" },
    { "style-header3", "<SGR parameters>" },
    { "style-quote", "<SGR parameters>" },
    { "style-link-bullet", "<SGR parameters>" },
    { "style-link-text", "<SGR parameters>" },
    { "style-list-bullet", "<SGR parameters>" },
    { "style-list-text", "<SGR parameters>" },
    // clang-format on
};

Config default_config()
{
    Config config{};
    config.margin = 2;
    config.homepage = DEFAULT_HOMEPAGE;
    config.keys[CMD_NONE] = '\0';
    config.keys[CMD_QUIT] = 'q';
    config.keys[CMD_OPEN] = 'o';
    config.keys[CMD_LINK] = 'g';
    config.keys[CMD_REFRESH] = 'r';
    config.keys[CMD_BACK] = 'b';
    config.keys[CMD_HOME] = 'h';
    config.keys[CMD_UP] = 'u';
    config.keys[CMD_SET_BOOKMARK] = 'a';
    config.keys[CMD_GOTO_BOOKMARK] = 'B';
    config.keys[CMD_DELETE_BOOKMARK] = 'd';
    config.styles[STYLE_HEADER1] = "1;35";
    config.styles[STYLE_HEADER2] = "1;36";
    config.styles[STYLE_HEADER3] = "1;34";
    config.styles[STYLE_QUOTE] = "3;32";
    config.styles[STYLE_LINK_BULLET] = "1;33";
    config.styles[STYLE_LINK_TEXT] = "4;33";
    config.styles[STYLE_LIST_BULLET] = "1";
    config.styles[STYLE_LIST_TEXT] = "";
    return config;
}

const char *option_name(OptionIndex num)
{
    return s_options_ini[num].item;
}

bool set_option(Config &config, OptionIndex num, const std::string &value)
{
    switch (num)
    {
    case OI_MARGIN:
        if (!all_digits(value))
        {
            return false;
        }
        config.margin = std::atoi(value.c_str());
        break;

    case OI_HOMEPAGE:
        config.homepage = value;
        break;

    case OI_KEY_QUIT:
    case OI_KEY_OPEN:
    case OI_KEY_LINK:
    case OI_KEY_REFRESH:
    case OI_KEY_BACK:
    case OI_KEY_HOME:
    case OI_KEY_UP:
    case OI_KEY_SET_BOOKMARK:
    case OI_KEY_GOTO_BOOKMARK:
    case OI_KEY_DELETE_BOOKMARK:
        if (value.size() != 1)
        {
            return false;
        }
        config.keys[CMD_QUIT + (num - OI_KEY_QUIT)] = value[0];
        break;

    case OI_STYLE_HEADER1:
    case OI_STYLE_HEADER2:
    case OI_STYLE_HEADER3:
    case OI_STYLE_QUOTE:
    case OI_STYLE_LINK_BULLET:
    case OI_STYLE_LINK_TEXT:
    case OI_STYLE_LIST_BULLET:
    case OI_STYLE_LIST_TEXT:
        config.styles[STYLE_HEADER1 + (num - OI_STYLE_HEADER1)] = value;
        break;

    default:
        return false;
    }
    return true;
}

// key = value lines; [sections], # and ; comments are skipped.
void parse_config(const std::string &text, Config &config)
{
    std::string::size_type start = 0;
    while (start < text.size())
    {
        std::string::size_type end = text.find('\n', start);
        if (end == std::string::npos)
        {
            end = text.size();
        }
        const std::string line = trim(text.substr(start, end - start));
        start = end + 1;

        if (line.empty() || line[0] == '#' || line[0] == ';' || line[0] == '[')
        {
            continue;
        }
        const std::string::size_type equals = line.find('=');
        const std::string            name = trim(line.substr(0, equals));
        std::string value = equals == std::string::npos ? std::string{} : trim(line.substr(equals + 1));
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"')
        {
            value = value.substr(1, value.size() - 2);
        }

        int i;
        for (i = 1; i < OI_COUNT; i++)
        {
            if (string_case_equal(name, s_options_ini[i].item))
            {
                if (!set_option(config, static_cast<OptionIndex>(i), value))
                {
                    std::printf("Bad value for option %s: `%s'.\n", s_options_ini[i].item, value.c_str());
                }
                break;
            }
        }
        if (i == OI_COUNT)
        {
            std::printf("Unknown option: `%s'.\n", name.c_str());
        }
    }
}

bool read_config(const std::string &filename, Config &config)
{
    std::string text;
    if (!read_file(filename, text))
    {
        return false;
    }
    parse_config(text, config);
    return true;
}

bool write_default_config(const std::string &filename)
{
    if (!make_dir(filename, MD_FILE))
    {
        return false;
    }
    std::FILE *fp = std::fopen(filename.c_str(), "w");
    if (fp == nullptr)
    {
        return false;
    }

    const Config defaults = default_config();
    bool         written = std::fprintf(fp, "# gmn configuration\n\n[%s]\n", s_options_ini[0].item) >= 0;
    for (int i = 1; written && i < OI_COUNT; i++)
    {
        const OptionIndex num = static_cast<OptionIndex>(i);
        std::string       value;
        if (num == OI_MARGIN)
        {
            value = std::to_string(defaults.margin);
        }
        else if (num == OI_HOMEPAGE)
        {
            value = defaults.homepage;
        }
        else if (num <= OI_KEY_DELETE_BOOKMARK)
        {
            value.assign(1, defaults.keys[CMD_QUIT + (num - OI_KEY_QUIT)]);
        }
        else
        {
            value = '"' + defaults.styles[STYLE_HEADER1 + (num - OI_STYLE_HEADER1)] + '"';
        }
        written = std::fprintf(fp, "# %s\n%s = %s\n", s_options_ini[i].help_str, s_options_ini[i].item,
                               value.c_str()) >= 0;
    }
    return std::fclose(fp) == 0 && written;
}

std::string style_on(const Config &config, StyleCategory category)
{
    const std::string &style = config.styles[category];
    return style.empty() ? std::string{} : "\033[" + style + 'm';
}

std::string style_off(const Config &config, StyleCategory category)
{
    return config.styles[category].empty() ? std::string{} : "\033[0m";
}
