/* cert.c
 */
// This software is copyrighted as detailed in the LICENSE file.

#include "gmn/cert.h"

#include <filesystem>
#include <system_error>
#include <utility>

CertificateRegistry::CertificateRegistry(std::string cert_dir) :
    m_dir(std::move(cert_dir))
{
}

std::string CertificateRegistry::cert_path(const std::string &host) const
{
    return m_dir + '/' + host + ".crt";
}

std::string CertificateRegistry::key_path(const std::string &host) const
{
    return m_dir + '/' + host + ".key";
}

bool CertificateRegistry::lookup(const std::string &host, ClientCertificate &cert) const
{
    if (host.empty())
    {
        return false;
    }
    std::error_code ec;
    const std::string crt = cert_path(host);
    const std::string key = key_path(host);
    if (!std::filesystem::is_regular_file(crt, ec) || !std::filesystem::is_regular_file(key, ec))
    {
        return false;
    }
    cert.cert_path = crt;
    cert.key_path = key;
    return true;
}

std::string CertificateRegistry::generate_command(const std::string &host) const
{
    return "openssl req -new -subj \"/CN=" + host + "\" -x509 -newkey ec -pkeyopt ec_paramgen_curve:prime256v1"
        + " -days 1825 -nodes -out \"" + cert_path(host) + "\" -keyout \"" + key_path(host) + '"';
}
