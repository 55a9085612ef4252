/* geminiclient.c
*/
// This software is copyrighted as detailed in the LICENSE file.

#include "gemini/geminiclient.h"

#include <config/common.h>

#include <boost/system/error_code.hpp>

#include <cctype>
#include <string>
#include <utility>

static ConnectionFactory s_gemini_connection_factory;

void set_gemini_connection_factory(ConnectionFactory factory)
{
    s_gemini_connection_factory = std::move(factory);
}

ConnectionPtr gemini_connect(const std::string &host, int port, const ClientCertificate *cert, error_code &ec)
{
    if (!s_gemini_connection_factory)
    {
        ec = boost::system::errc::make_error_code(boost::system::errc::not_connected);
        return nullptr;
    }
    ConnectionPtr connection = s_gemini_connection_factory(host, port, cert, ec);
    if (connection == nullptr && !ec)
    {
        ec = boost::system::errc::make_error_code(boost::system::errc::connection_refused);
    }
    return connection;
}

bool gemini_request(IGeminiConnection &connection, const std::string &request, error_code &ec)
{
    connection.write_line(request, ec);
    return !ec;
}

// <STATUS><SPACE><META>, CRLF already removed.
bool parse_response_header(const std::string &line, ResponseHeader &header)
{
    std::string text{line};
    while (!text.empty() && (text.back() == '\r' || text.back() == '\n'))
    {
        text.pop_back();
    }
    if (text.size() < 2 || !std::isdigit(static_cast<unsigned char>(text[0]))
        || !std::isdigit(static_cast<unsigned char>(text[1])))
    {
        return false;
    }
    if (text.size() > 2 && text[2] != ' ' && text[2] != '\t')
    {
        return false;
    }
    std::string meta = text.size() > 3 ? text.substr(3) : std::string{};
    if (meta.size() > GEMINI_MAX_META)
    {
        return false;
    }
    header.status = (text[0] - '0') * 10 + (text[1] - '0');
    header.meta = std::move(meta);
    return true;
}

const char *gemini_status_text(int status)
{
    switch (status)
    {
    case GEMINI_INPUT_VAL:
        return "Input requested";
    case GEMINI_SENSITIVE_INPUT_VAL:
        return "Sensitive input requested";
    case GEMINI_SUCCESS_VAL:
        return "Success";
    case GEMINI_REDIRECT_TEMP_VAL:
        return "Temporary redirect";
    case GEMINI_REDIRECT_PERM_VAL:
        return "Permanent redirect";
    case GEMINI_TEMPFAIL_VAL:
        return "Temporary failure";
    case GEMINI_UNAVAILABLE_VAL:
        return "Server unavailable";
    case GEMINI_CGI_ERROR_VAL:
        return "CGI error";
    case GEMINI_PROXY_ERROR_VAL:
        return "Proxy error";
    case GEMINI_SLOW_DOWN_VAL:
        return "Slow down";
    case GEMINI_PERMFAIL_VAL:
        return "Permanent failure";
    case GEMINI_NOT_FOUND_VAL:
        return "Not found";
    case GEMINI_GONE_VAL:
        return "Gone";
    case GEMINI_PROXY_REFUSED_VAL:
        return "Proxy request refused";
    case GEMINI_BAD_REQUEST_VAL:
        return "Bad request";
    case GEMINI_CERT_REQUIRED_VAL:
        return "Client certificate required";
    case GEMINI_CERT_UNAUTHORIZED_VAL:
        return "Certificate not authorized";
    case GEMINI_CERT_INVALID_VAL:
        return "Certificate not valid";
    default:
        return "Unknown status";
    }
}
