/* gmn/url.h
 *
 * Routines for handling Gemini URL references.
 */
#ifndef GMN_URL_H
#define GMN_URL_H

#include "config/common.h"

#include <string>

struct Url
{
    std::string scheme{GEMINI_SCHEME};
    std::string host;
    int         port{GEMINI_PORT};
    std::string path; // never has a leading slash
    std::string query;
};

bool operator==(const Url &lhs, const Url &rhs);
inline bool operator!=(const Url &lhs, const Url &rhs)
{
    return !(lhs == rhs);
}

// Where relative references are resolved from: the page on display.
struct BrowseContext
{
    std::string host;
    int         port{GEMINI_PORT};
    std::string path;
};

enum ResolveResult
{
    RESOLVE_OK = 0,
    RESOLVE_EMPTY,  // nothing to resolve
    RESOLVE_NO_HOST // malformed authority, or relative without a context
};

ResolveResult resolve_url(const std::string &raw, const BrowseContext *context, Url &url);
std::string   url_request(const Url &url);
BrowseContext url_context(const Url &url);
std::string   percent_encode(const std::string &text);
std::string   parent_path(const std::string &path);
std::string   remove_dot_segments(const std::string &path);

inline bool is_gemini(const Url &url)
{
    return url.scheme == GEMINI_SCHEME;
}

#endif
