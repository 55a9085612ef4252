/* gmn/fetch.h
 */
// This software is copyrighted as detailed in the LICENSE file.
#ifndef GMN_FETCH_H
#define GMN_FETCH_H

#include "gemini/geminiclient.h"
#include "gmn/cert.h"
#include "gmn/history.h"
#include "gmn/url.h"

#include <string>

enum FetchKind
{
    FETCH_RENDERED = 0,
    FETCH_INPUT,
    FETCH_REDIRECT,
    FETCH_FAILURE,
    FETCH_CERT_REQUIRED
};

enum FailureKind
{
    FAIL_NONE = 0,
    FAIL_UNSUPPORTED_SCHEME,
    FAIL_CONNECT,     // could not connect, or the TLS handshake failed
    FAIL_TEMPORARY,   // 4x
    FAIL_PERMANENT,   // 50, 51
    FAIL_REQUEST_REFUSED, // 52, 53
    FAIL_BAD_REQUEST, // 59
    FAIL_BAD_RESPONSE,
    FAIL_TOO_MANY_REDIRECTS
};

enum Charset
{
    CHARSET_UTF8 = 0,
    CHARSET_ISO8859,
    CHARSET_ASCII
};

struct FetchOutcome
{
    FetchKind   kind{FETCH_FAILURE};
    int         status{};
    std::string meta;
    std::string body;         // FETCH_RENDERED
    std::string content_type; // FETCH_RENDERED
    Charset     charset{CHARSET_UTF8};
    bool        gemtext{};
    bool        sensitive{};  // FETCH_INPUT
    Url         redirect;     // FETCH_REDIRECT
    FailureKind failure{FAIL_NONE};
    std::string detail;
    std::string host;         // FETCH_CERT_REQUIRED
};

FetchOutcome gemini_fetch(const Url &url, HistoryStack &history, const CertificateRegistry &certs);
FetchOutcome classify_response(const Url &url, const ResponseHeader &header);
Charset      parse_charset(const std::string &meta);
const char  *charset_name(Charset charset);
bool         is_gemtext(const std::string &meta);
std::string  outcome_message(const FetchOutcome &outcome);

#endif
