/* env.c
 */
// This software is copyrighted as detailed in the LICENSE file.

#include "util/env-internal.h"

#include <config/common.h>

#include <cstdlib>
#include <functional>
#include <utility>

static std::function<char *(const char *name)> s_getenv_fn = std::getenv;

void set_environment(std::function<char *(const char *)> getenv_fn)
{
    if (getenv_fn)
    {
        s_getenv_fn = std::move(getenv_fn);
    }
    else
    {
        s_getenv_fn = std::getenv;
    }
}

const char *get_val_const(const char *nam, const char *def)
{
    const char *val = s_getenv_fn(nam);
    if (val == nullptr || !*val)
    {
        return def;
    }
    return val;
}

static std::string strip_trailing_slash(std::string dir)
{
    while (dir.size() > 1 && dir.back() == '/')
    {
        dir.pop_back();
    }
    return dir;
}

// Returns false when no directory for the configuration could be found;
// the current directory is used in that case.
bool env_init(Environment &env)
{
    bool fully_successful = true;

    const char *home_dir = get_val_const("HOME");
    if (home_dir == nullptr)
    {
        home_dir = get_val_const("LOGDIR");
    }
    env.home_dir = home_dir ? strip_trailing_slash(home_dir) : std::string{};

    if (const char *dir = get_val_const("GMNDIR"))
    {
        env.config_dir = strip_trailing_slash(dir);
    }
    else if (const char *xdg = get_val_const("XDG_CONFIG_HOME"))
    {
        env.config_dir = strip_trailing_slash(xdg) + "/gmn";
    }
    else if (!env.home_dir.empty())
    {
        env.config_dir = env.home_dir + "/.config/gmn";
    }
    else
    {
        env.config_dir = ".";
        fully_successful = false;
    }

    env.config_file = env.config_dir + '/' + CONFIG_FILE_NAME;
    env.bookmark_file = env.config_dir + '/' + BOOKMARK_FILE_NAME;
    env.cert_dir = env.config_dir + '/' + CERT_DIR_NAME;
    return fully_successful;
}
