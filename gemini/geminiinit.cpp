/* geminiinit.c
*/
/* This software is copyrighted as detailed in the LICENSE file. */

#include "gemini/geminiinit.h"

#include "gemini/geminiclient.h"

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <istream>
#include <memory>
#include <string>

namespace asio = boost::asio;
namespace ssl = boost::asio::ssl;

static asio::io_context s_context;

using resolver_results = asio::ip::tcp::resolver::results_type;

static bool is_address_literal(const std::string &host)
{
    error_code ec;
    asio::ip::make_address(host, ec);
    return !ec;
}

// Gemini servers are normally self-signed, so the peer is not verified.
static ssl::context make_tls_context(const ClientCertificate *cert)
{
    ssl::context tls{ssl::context::tls_client};
    tls.set_options(ssl::context::default_workarounds | ssl::context::no_sslv2 | ssl::context::no_sslv3);
    tls.set_verify_mode(ssl::verify_none);
    if (cert)
    {
        tls.use_certificate_chain_file(cert->cert_path);
        tls.use_private_key_file(cert->key_path, ssl::context::pem);
    }
    return tls;
}

class GeminiConnection : public IGeminiConnection
{
public:
    GeminiConnection(const std::string &host, const resolver_results &results, const ClientCertificate *cert)
        : m_tls(make_tls_context(cert))
    {
        asio::connect(m_stream.next_layer(), results);
        if (!is_address_literal(host) && !SSL_set_tlsext_host_name(m_stream.native_handle(), host.c_str()))
        {
            throw boost::system::system_error(
                error_code(static_cast<int>(::ERR_get_error()), asio::error::get_ssl_category()));
        }
        m_stream.handshake(ssl::stream_base::client);
    }
    ~GeminiConnection() override
    {
        error_code ec;
        m_stream.lowest_layer().close(ec);
    }

    void        write_line(const std::string &line, error_code &ec) override;
    std::string read_line(error_code &ec) override;
    std::string read_body(error_code &ec) override;

private:
    ssl::context                       m_tls;
    ssl::stream<asio::ip::tcp::socket> m_stream{s_context, m_tls};
    asio::streambuf                    m_buffer;
};

void GeminiConnection::write_line(const std::string &line, error_code &ec)
{
    const std::string buffer{line + "\r\n"};
    asio::write(m_stream, asio::buffer(buffer), ec);
}

std::string GeminiConnection::read_line(error_code &ec)
{
    asio::read_until(m_stream, m_buffer, "\r\n", ec);
    if (ec && m_buffer.size() == 0)
    {
        return {};
    }
    ec.clear();

    std::string line;
    std::istream istr(&m_buffer);
    std::getline(istr, line);
    if (!line.empty() && line.back() == '\r')
    {
        line.pop_back();
    }
    return line;
}

std::string GeminiConnection::read_body(error_code &ec)
{
    asio::read(m_stream, m_buffer, asio::transfer_all(), ec);
    // Many servers close without a TLS close_notify.
    if (ec == asio::error::eof || ec == ssl::error::stream_truncated)
    {
        ec.clear();
    }

    std::string body{asio::buffers_begin(m_buffer.data()), asio::buffers_end(m_buffer.data())};
    m_buffer.consume(m_buffer.size());
    return body;
}

static ConnectionPtr create_gemini_connection(const std::string &host, int port, const ClientCertificate *cert,
                                              error_code &ec)
{
    std::string machine{host};
    if (machine.size() > 2 && machine.front() == '[' && machine.back() == ']')
    {
        machine = machine.substr(1, machine.size() - 2);
    }

    asio::ip::tcp::resolver resolver(s_context);
    resolver_results results = resolver.resolve(machine, std::to_string(port), ec);
    if (ec)
    {
        return nullptr;
    }

    try
    {
        return std::make_shared<GeminiConnection>(machine, results, cert);
    }
    catch (const boost::system::system_error &e)
    {
        ec = e.code();
        return nullptr;
    }
}

void init_gemini()
{
    set_gemini_connection_factory(create_gemini_connection);
}
