/* env.h
 */
// This software is copyrighted as detailed in the LICENSE file.
#ifndef GMN_ENV_H
#define GMN_ENV_H

#include <string>

struct Environment
{
    std::string home_dir;      // login directory
    std::string config_dir;    // where gmn.ini, bookmarks and certs go
    std::string config_file;   // %C/gmn.ini
    std::string bookmark_file; // %C/bookmarks
    std::string cert_dir;      // %C/certs
};

bool        env_init(Environment &env);
const char *get_val_const(const char *nam, const char *def = nullptr);

#endif
