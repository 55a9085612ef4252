/* string-algos.h
 */
// This software is copyrighted as detailed in the LICENSE file.
#ifndef GMN_STRING_ALGOS_H
#define GMN_STRING_ALGOS_H

#include <cctype>
#include <string>

inline bool is_hor_space(char c)
{
    return c == ' ' || c == '\t';
}

template <typename Char>
Char *skip_hor_space(Char *str)
{
    if (str)
    {
        while (*str && is_hor_space(*str))
        {
            ++str;
        }
    }
    return str;
}

template <typename Char>
Char *skip_non_space(Char *str)
{
    if (str)
    {
        while (*str && !std::isspace(static_cast<unsigned char>(*str)))
        {
            ++str;
        }
    }
    return str;
}

template <typename Char>
Char *skip_digits(Char *str)
{
    if (str)
    {
        while (*str && std::isdigit(static_cast<unsigned char>(*str)))
        {
            ++str;
        }
    }
    return str;
}

inline bool all_digits(const std::string &str)
{
    return !str.empty() && *skip_digits(str.c_str()) == '\0';
}

inline std::string trim(const std::string &str)
{
    std::string::size_type begin = 0;
    while (begin < str.size() && std::isspace(static_cast<unsigned char>(str[begin])))
    {
        ++begin;
    }
    std::string::size_type end = str.size();
    while (end > begin && std::isspace(static_cast<unsigned char>(str[end - 1])))
    {
        --end;
    }
    return str.substr(begin, end - begin);
}

inline bool string_case_equal(const std::string &lhs, const std::string &rhs)
{
    if (lhs.size() != rhs.size())
    {
        return false;
    }
    for (std::string::size_type i = 0; i < lhs.size(); ++i)
    {
        if (std::tolower(static_cast<unsigned char>(lhs[i])) != std::tolower(static_cast<unsigned char>(rhs[i])))
        {
            return false;
        }
    }
    return true;
}

inline bool string_case_starts_with(const std::string &str, const std::string &prefix)
{
    return str.size() >= prefix.size() && string_case_equal(str.substr(0, prefix.size()), prefix);
}

inline std::string to_lower(std::string str)
{
    for (char &c : str)
    {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return str;
}

#endif
