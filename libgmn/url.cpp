/* url.c
 *
 * Routines for handling Gemini URL references.
 */

#include "config/common.h"
#include "gmn/url.h"

#include "gmn/string-algos.h"

#include <cctype>
#include <cstdlib>
#include <string>
#include <vector>

bool operator==(const Url &lhs, const Url &rhs)
{
    return lhs.scheme == rhs.scheme && lhs.host == rhs.host && lhs.port == rhs.port && lhs.path == rhs.path
        && lhs.query == rhs.query;
}

static int parse_port(const std::string &text)
{
    if (!all_digits(text) || text.size() > 5)
    {
        return GEMINI_PORT;
    }
    const int port = std::atoi(text.c_str());
    return port > 0 && port <= 65535 ? port : GEMINI_PORT;
}

// [user@]host[:port], with host possibly an address literal: [ip:v6:address]
static bool parse_authority(std::string authority, Url &url)
{
    const std::string::size_type at = authority.rfind('@');
    if (at != std::string::npos)
    {
        authority = authority.substr(at + 1);
    }

    std::string port;
    if (!authority.empty() && authority[0] == '[')
    {
        const std::string::size_type close = authority.find(']');
        if (close == std::string::npos)
        {
            return false;
        }
        url.host = authority.substr(0, close + 1);
        if (close + 1 < authority.size() && authority[close + 1] == ':')
        {
            port = authority.substr(close + 2);
        }
    }
    else
    {
        const std::string::size_type colon = authority.rfind(':');
        url.host = authority.substr(0, colon);
        if (colon != std::string::npos)
        {
            port = authority.substr(colon + 1);
        }
    }
    url.port = parse_port(port);
    return !url.host.empty();
}

static void split_query(const std::string &text, std::string &path, std::string &query)
{
    const std::string::size_type mark = text.find('?');
    if (mark == std::string::npos)
    {
        path = text;
        query.clear();
    }
    else
    {
        path = text.substr(0, mark);
        query = text.substr(mark + 1);
    }
}

// scheme = ALPHA *( ALPHA / DIGIT / "+" / "-" / "." ) ":"
static std::string::size_type scheme_length(const std::string &text)
{
    if (text.empty() || !std::isalpha(static_cast<unsigned char>(text[0])))
    {
        return 0;
    }
    for (std::string::size_type i = 1; i < text.size(); ++i)
    {
        const char c = text[i];
        if (c == ':')
        {
            return i;
        }
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '+' && c != '-' && c != '.')
        {
            return 0;
        }
    }
    return 0;
}

static ResolveResult parse_absolute(const std::string &text, std::string::size_type scheme_len, Url &url)
{
    url = Url{};
    url.scheme = to_lower(text.substr(0, scheme_len));
    std::string rest = text.substr(scheme_len + 1);
    if (rest.compare(0, 2, "//") != 0)
    {
        // no authority: mailto:, news: and friends
        url.port = 0;
        split_query(rest, url.path, url.query);
        return url.scheme == GEMINI_SCHEME ? RESOLVE_NO_HOST : RESOLVE_OK;
    }
    rest = rest.substr(2);

    const std::string::size_type end = rest.find_first_of("/?");
    if (!parse_authority(rest.substr(0, end), url))
    {
        return RESOLVE_NO_HOST;
    }
    if (end == std::string::npos)
    {
        return RESOLVE_OK;
    }
    std::string path_part = rest.substr(end);
    if (path_part[0] == '/')
    {
        path_part.erase(0, 1);
    }
    split_query(path_part, url.path, url.query);
    return RESOLVE_OK;
}

ResolveResult resolve_url(const std::string &raw, const BrowseContext *context, Url &url)
{
    std::string text = trim(raw);
    const std::string::size_type fragment = text.find('#');
    if (fragment != std::string::npos)
    {
        text.erase(fragment);
    }
    if (text.empty())
    {
        return RESOLVE_EMPTY;
    }

    if (text.compare(0, 2, "//") == 0)
    {
        text = GEMINI_SCHEME ":" + text;
    }
    if (const std::string::size_type len = scheme_length(text))
    {
        return parse_absolute(text, len, url);
    }
    if (context == nullptr)
    {
        text = GEMINI_SCHEME_PREFIX + text;
        return parse_absolute(text, scheme_length(text), url);
    }
    if (context->host.empty())
    {
        return RESOLVE_NO_HOST;
    }

    url = Url{};
    url.host = context->host;
    url.port = context->port;
    std::string ref_path;
    split_query(text, ref_path, url.query);
    if (ref_path.empty())
    {
        url.path = context->path;
    }
    else if (ref_path[0] == '/')
    {
        url.path = ref_path.substr(1);
    }
    else
    {
        const std::string::size_type slash = context->path.rfind('/');
        const std::string dir = slash == std::string::npos ? std::string{} : context->path.substr(0, slash + 1);
        url.path = dir + ref_path;
    }
    url.path = remove_dot_segments(url.path);
    return RESOLVE_OK;
}

std::string url_request(const Url &url)
{
    if (url.host.empty())
    {
        std::string opaque{url.scheme + ':' + url.path};
        if (!url.query.empty())
        {
            opaque += '?' + url.query;
        }
        return opaque;
    }

    std::string request{url.scheme + "://" + url.host};
    if (url.port != GEMINI_PORT)
    {
        request += ':' + std::to_string(url.port);
    }
    request += '/' + url.path;
    if (!url.query.empty())
    {
        request += '?' + url.query;
    }
    return request;
}

BrowseContext url_context(const Url &url)
{
    BrowseContext context;
    context.host = url.host;
    context.port = url.port;
    context.path = url.path;
    return context;
}

std::string percent_encode(const std::string &text)
{
    static const char hex[] = "0123456789ABCDEF";
    std::string encoded;
    for (const char c : text)
    {
        const unsigned char byte = static_cast<unsigned char>(c);
        if ((byte >= 'A' && byte <= 'Z') || (byte >= 'a' && byte <= 'z') || (byte >= '0' && byte <= '9')
            || byte == '.' || byte == '~' || byte == '_' || byte == '-')
        {
            encoded += c;
        }
        else
        {
            encoded += '%';
            encoded += hex[byte >> 4];
            encoded += hex[byte & 0x0F];
        }
    }
    return encoded;
}

// "a/b/c" -> "a/b/", "a/b/" -> "a/", "a" -> ""
std::string parent_path(const std::string &path)
{
    std::string dir{path};
    if (!dir.empty() && dir.back() == '/')
    {
        dir.pop_back();
    }
    const std::string::size_type slash = dir.rfind('/');
    if (slash == std::string::npos)
    {
        return {};
    }
    return dir.substr(0, slash + 1);
}

std::string remove_dot_segments(const std::string &path)
{
    std::vector<std::string> segments;
    std::string::size_type   start = 0;
    while (true)
    {
        const std::string::size_type slash = path.find('/', start);
        const std::string segment = path.substr(start, slash == std::string::npos ? std::string::npos : slash - start);
        const bool last = slash == std::string::npos;
        if (segment == "." || segment == "..")
        {
            if (segment == ".." && !segments.empty())
            {
                segments.pop_back();
            }
            if (last)
            {
                segments.emplace_back();
            }
        }
        else
        {
            segments.push_back(segment);
        }
        if (last)
        {
            break;
        }
        start = slash + 1;
    }

    std::string result;
    for (std::vector<std::string>::size_type i = 0; i < segments.size(); ++i)
    {
        if (i)
        {
            result += '/';
        }
        result += segments[i];
    }
    return result;
}
