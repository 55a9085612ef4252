/* fetch.c
 */
// This software is copyrighted as detailed in the LICENSE file.

#include "config/common.h"
#include "gmn/fetch.h"

#include "gmn/string-algos.h"

#include <string>
#include <utility>

Charset parse_charset(const std::string &meta)
{
    const std::string lower = to_lower(meta);
    const std::string::size_type pos = lower.find("charset=");
    if (pos == std::string::npos)
    {
        return CHARSET_UTF8;
    }
    std::string charset = lower.substr(pos + 8);
    const std::string::size_type end = charset.find_first_of("; \t");
    if (end != std::string::npos)
    {
        charset.erase(end);
    }
    if (!charset.empty() && charset.front() == '"')
    {
        charset.erase(0, 1);
    }
    if (charset.compare(0, 8, "iso-8859") == 0 || charset.compare(0, 7, "iso8859") == 0
        || charset.compare(0, 6, "latin1") == 0)
    {
        return CHARSET_ISO8859;
    }
    if (charset.compare(0, 5, "ascii") == 0 || charset.compare(0, 8, "us-ascii") == 0)
    {
        return CHARSET_ASCII;
    }
    return CHARSET_UTF8;
}

const char *charset_name(Charset charset)
{
    switch (charset)
    {
    case CHARSET_ISO8859:
        return "iso8859";
    case CHARSET_ASCII:
        return "ascii";
    default:
        return "utf8";
    }
}

// An empty meta means text/gemini.
bool is_gemtext(const std::string &meta)
{
    const std::string type = trim(meta);
    return type.empty() || string_case_starts_with(type, "text/gemini");
}

static std::string content_type(const std::string &meta)
{
    std::string type = trim(meta);
    const std::string::size_type semi = type.find(';');
    if (semi != std::string::npos)
    {
        type = trim(type.substr(0, semi));
    }
    return type.empty() ? std::string{"text/gemini"} : to_lower(type);
}

static FetchOutcome failure(FailureKind kind, int status, std::string detail)
{
    FetchOutcome outcome;
    outcome.kind = FETCH_FAILURE;
    outcome.failure = kind;
    outcome.status = status;
    outcome.detail = std::move(detail);
    return outcome;
}

// Everything but the body; codes not listed behave as their family's x0.
FetchOutcome classify_response(const Url &url, const ResponseHeader &header)
{
    FetchOutcome outcome;
    outcome.status = header.status;
    outcome.meta = header.meta;

    switch (gemini_status_class(header.status))
    {
    case GEMINI_CLASS_INPUT:
        outcome.kind = FETCH_INPUT;
        outcome.sensitive = header.status == GEMINI_SENSITIVE_INPUT_VAL;
        break;

    case GEMINI_CLASS_SUCCESS:
        outcome.kind = FETCH_RENDERED;
        outcome.gemtext = is_gemtext(header.meta);
        outcome.content_type = content_type(header.meta);
        outcome.charset = parse_charset(header.meta);
        break;

    case GEMINI_CLASS_REDIRECT:
    {
        const BrowseContext context = url_context(url);
        if (resolve_url(header.meta, &context, outcome.redirect) != RESOLVE_OK)
        {
            outcome = failure(FAIL_BAD_RESPONSE, header.status, "Invalid redirect: " + header.meta);
            break;
        }
        outcome.kind = FETCH_REDIRECT;
        break;
    }

    case GEMINI_CLASS_TEMPFAIL:
        outcome.kind = FETCH_FAILURE;
        outcome.failure = FAIL_TEMPORARY;
        break;

    case GEMINI_CLASS_PERMFAIL:
        outcome.kind = FETCH_FAILURE;
        switch (header.status)
        {
        case GEMINI_GONE_VAL:
        case GEMINI_PROXY_REFUSED_VAL:
            outcome.failure = FAIL_REQUEST_REFUSED;
            break;
        case GEMINI_BAD_REQUEST_VAL:
            outcome.failure = FAIL_BAD_REQUEST;
            break;
        default:
            outcome.failure = FAIL_PERMANENT;
            break;
        }
        break;

    case GEMINI_CLASS_CERT:
        outcome.kind = FETCH_CERT_REQUIRED;
        outcome.host = url.host;
        break;

    default:
        outcome = failure(FAIL_BAD_RESPONSE, header.status, "Unknown status " + std::to_string(header.status));
        break;
    }
    return outcome;
}

FetchOutcome gemini_fetch(const Url &url, HistoryStack &history, const CertificateRegistry &certs)
{
    if (!is_gemini(url))
    {
        return failure(FAIL_UNSUPPORTED_SCHEME, 0, "Unsupported scheme " + url.scheme + ": " + url_request(url));
    }

    history.push(url);

    ClientCertificate cert;
    const bool        have_cert = certs.lookup(url.host, cert);

    error_code    ec;
    ConnectionPtr connection = gemini_connect(url.host, url.port, have_cert ? &cert : nullptr, ec);
    if (connection == nullptr)
    {
        return failure(FAIL_CONNECT, 0,
                       "Could not connect to " + url.host + ':' + std::to_string(url.port) + ": " + ec.message());
    }

    if (!gemini_request(*connection, url_request(url), ec))
    {
        return failure(FAIL_CONNECT, 0, "Could not send request: " + ec.message());
    }

    const std::string line = connection->read_line(ec);
    if (ec)
    {
        return failure(FAIL_CONNECT, 0, "Could not read response: " + ec.message());
    }
    ResponseHeader header{};
    if (!parse_response_header(line, header))
    {
        return failure(FAIL_BAD_RESPONSE, 0, "Malformed response header: " + line);
    }

    FetchOutcome outcome = classify_response(url, header);
    if (outcome.kind == FETCH_RENDERED)
    {
        outcome.body = connection->read_body(ec);
        if (ec)
        {
            return failure(FAIL_CONNECT, header.status, "Could not read body: " + ec.message());
        }
    }
    return outcome;
}

std::string outcome_message(const FetchOutcome &outcome)
{
    std::string message;
    if (outcome.status)
    {
        message = std::to_string(outcome.status) + ' ' + gemini_status_text(outcome.status);
    }
    switch (outcome.failure)
    {
    case FAIL_UNSUPPORTED_SCHEME:
    case FAIL_CONNECT:
    case FAIL_BAD_RESPONSE:
    case FAIL_TOO_MANY_REDIRECTS:
        if (!outcome.detail.empty())
        {
            message += message.empty() ? outcome.detail : ": " + outcome.detail;
        }
        break;
    case FAIL_BAD_REQUEST:
        message += outcome.meta.empty() ? std::string{} : " (reason: " + outcome.meta + ')';
        break;
    default:
        if (!outcome.meta.empty())
        {
            message += ": " + outcome.meta;
        }
        break;
    }
    return message;
}
