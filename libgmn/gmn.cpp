/* This software is copyrighted as detailed in the LICENSE file. */

/*  gmn -- a Gemini browser for the terminal
 *
 *  Pages are fetched one at a time, rendered for the width of the
 *  terminal and shown in a pager that reads single keystrokes.
 */

#include "config/common.h"
#include "gmn/gmn.h"

#include "gemini/geminiclient.h"
#include "gemini/geminiinit.h"
#include "gmn/final.h"
#include "gmn/opt.h"
#include "gmn/session.h"
#include "gmn/terminal.h"
#include "gmn/util.h"
#include "util/env.h"

#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <string>

static void usage(std::FILE *fp, const char *name)
{
    std::fprintf(fp,
                 "Usage: %s [-h] [-v] [-f file] [url]\n"
                 "  -h       show this help\n"
                 "  -v       show the version\n"
                 "  -f file  display a local gemtext file\n"
                 "  url      page to open instead of the homepage\n",
                 name);
}

static void load_config(const Environment &env, Config &config)
{
    if (read_config(env.config_file, config))
    {
        return;
    }
    if (errno != ENOENT)
    {
        std::perror(env.config_file.c_str());
        return;
    }
    /* first run: leave a file to edit */
    if (!write_default_config(env.config_file))
    {
        gemini_error(("Couldn't create " + env.config_file + "\n").c_str());
        return;
    }
    gemini_advise(("Wrote default configuration to " + env.config_file + "\n").c_str());
}

int gmn_main(int argc, char *argv[])
{
    const char *name = std::strrchr(argv[0], '/');
    name = name ? name + 1 : argv[0];
    const char *file_name = nullptr;
    const char *url = nullptr;

    while (--argc)
    {
        if (**++argv == '-')
        {
            switch ((*argv)[1])
            {
            case 'h':
                usage(stdout, name);
                return 0;
            case 'v':
                std::printf("%s version %s\n", name, GMN_VERSION);
                return 0;
            case 'f':
                if (file_name || !--argc)
                {
                    usage(stderr, name);
                    return 1;
                }
                file_name = *++argv;
                break;
            default:
                usage(stderr, name);
                return 1;
            }
        }
        else if (!url)
        {
            url = *argv;
        }
        else
        {
            usage(stderr, name);
            return 1;
        }
    }

    Environment env;
    if (!env_init(env))
    {
        gemini_error("No home directory; keeping configuration in the current directory.\n");
    }
    Config config = default_config();
    load_config(env, config);
    if (!make_dir(env.cert_dir, MD_DIR))
    {
        gemini_error(("Couldn't create " + env.cert_dir + "\n").c_str());
    }

    std::string body;
    if (file_name && !read_file(file_name, body))
    {
        std::perror(file_name);
        return 1;
    }

    init_gemini();
    TtyTerminal terminal(STDIN_FILENO);
    final_init();

    Session session(config, env, terminal);
    if (!session.bookmarks.load())
    {
        std::perror(env.bookmark_file.c_str());
    }
    if (file_name)
    {
        start_document(session, body, file_name);
    }
    else
    {
        start_url(session, url ? url : config.homepage);
    }

    const int status = browse(session);
    terminal.restore_mode();
    finalize(status);
}
