/* gmn/cert.h
 */
// This software is copyrighted as detailed in the LICENSE file.
#ifndef GMN_CERT_H
#define GMN_CERT_H

#include "gemini/geminiclient.h"

#include <string>

// Client certificates are created by the user as <dir>/<host>.crt and
// <dir>/<host>.key; we only notice whether both are there.
class CertificateRegistry
{
public:
    explicit CertificateRegistry(std::string cert_dir);

    bool        lookup(const std::string &host, ClientCertificate &cert) const;
    std::string cert_path(const std::string &host) const;
    std::string key_path(const std::string &host) const;
    std::string generate_command(const std::string &host) const;

    const std::string &dir() const
    {
        return m_dir;
    }

private:
    std::string m_dir;
};

#endif
