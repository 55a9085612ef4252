/* geminiclient.h
*/
/* This software is copyrighted as detailed in the LICENSE file. */
#ifndef GMN_GEMINICLIENT_H
#define GMN_GEMINICLIENT_H

#include <boost/system/error_code.hpp>

#include <cstdio>
#include <functional>
#include <memory>
#include <string>

using error_code = boost::system::error_code;

struct IGeminiConnection
{
    virtual ~IGeminiConnection() = default;

    virtual void        write_line(const std::string &line, error_code &ec) = 0;
    virtual std::string read_line(error_code &ec) = 0;
    virtual std::string read_body(error_code &ec) = 0;
};

using ConnectionPtr = std::shared_ptr<IGeminiConnection>;

// A client certificate is presented only when both files exist.
struct ClientCertificate
{
    std::string cert_path;
    std::string key_path;
};

using ConnectionFactory =
    std::function<ConnectionPtr(const std::string &host, int port, const ClientCertificate *cert, error_code &ec)>;

/* the tens digit of a status code */
enum
{
    GEMINI_CLASS_INPUT = '1',
    GEMINI_CLASS_SUCCESS = '2',
    GEMINI_CLASS_REDIRECT = '3',
    GEMINI_CLASS_TEMPFAIL = '4',
    GEMINI_CLASS_PERMFAIL = '5',
    GEMINI_CLASS_CERT = '6'
};

enum
{
    GEMINI_INPUT_VAL = 10,             /* prompt the user */
    GEMINI_SENSITIVE_INPUT_VAL = 11,   /* prompt without echo */
    GEMINI_SUCCESS_VAL = 20,           /* body follows */
    GEMINI_REDIRECT_TEMP_VAL = 30,     /* go there instead */
    GEMINI_REDIRECT_PERM_VAL = 31,     /* go there from now on */
    GEMINI_TEMPFAIL_VAL = 40,          /* try again later */
    GEMINI_UNAVAILABLE_VAL = 41,       /* server unavailable */
    GEMINI_CGI_ERROR_VAL = 42,         /* dynamic content failed */
    GEMINI_PROXY_ERROR_VAL = 43,       /* proxy could not complete */
    GEMINI_SLOW_DOWN_VAL = 44,         /* rate limited */
    GEMINI_PERMFAIL_VAL = 50,          /* will never work */
    GEMINI_NOT_FOUND_VAL = 51,         /* no such resource */
    GEMINI_GONE_VAL = 52,              /* resource removed */
    GEMINI_PROXY_REFUSED_VAL = 53,     /* proxy request refused */
    GEMINI_BAD_REQUEST_VAL = 59,       /* request could not be parsed */
    GEMINI_CERT_REQUIRED_VAL = 60,     /* present a client certificate */
    GEMINI_CERT_UNAUTHORIZED_VAL = 61, /* certificate not allowed here */
    GEMINI_CERT_INVALID_VAL = 62       /* certificate rejected */
};

struct ResponseHeader
{
    int         status;
    std::string meta;
};

void          set_gemini_connection_factory(ConnectionFactory factory);
ConnectionPtr gemini_connect(const std::string &host, int port, const ClientCertificate *cert, error_code &ec);
bool          gemini_request(IGeminiConnection &connection, const std::string &request, error_code &ec);
bool          parse_response_header(const std::string &line, ResponseHeader &header);
const char   *gemini_status_text(int status);

inline char gemini_status_class(int status)
{
    return static_cast<char>('0' + status / 10 % 10);
}

inline void gemini_advise(const char *str)
{
    std::fputs(str, stdout);
}
inline void gemini_error(const char *str)
{
    std::fputs(str, stderr);
}

#endif
