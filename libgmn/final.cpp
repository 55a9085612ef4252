/* final.c
 */
/* This software is copyrighted as detailed in the LICENSE file. */

#include "gmn/final.h"

#include "gmn/terminal.h"

#include <signal.h>
#include <unistd.h>

#include <csignal>
#include <cstdio>
#include <cstdlib>

/* come here on signal other than stop or cont */

static void sig_catcher(int signo)
{
    termlib_reset();
    std::signal(signo, SIG_DFL);
    std::raise(signo);
}

/* come here on stop signal */

static void stop_catcher(int signo)
{
    const bool was_raw = termlib_suspend(); /* this is the point of all this */

    std::signal(signo, SIG_DFL); /* enable stop */
    sigset_t mask;
    sigemptyset(&mask);
    sigaddset(&mask, signo);
    sigprocmask(SIG_UNBLOCK, &mask, nullptr);
    kill(getpid(), signo); /* and do the stop */

    std::signal(signo, stop_catcher); /* unenable the stop */
    if (was_raw)
    {
        termlib_resume();
    }
}

void final_init()
{
    std::signal(SIGTSTP, stop_catcher); /* job control signals */
    std::signal(SIGTTOU, stop_catcher);
    std::signal(SIGTTIN, stop_catcher);

    std::signal(SIGINT, sig_catcher);
    std::signal(SIGHUP, sig_catcher);
    std::signal(SIGQUIT, sig_catcher);
    std::signal(SIGTERM, sig_catcher);

    /* a dropped connection shows up as a write error instead */
    std::signal(SIGPIPE, SIG_IGN);
}

[[noreturn]] //
void finalize(int status)
{
    std::fflush(stdout);
    termlib_reset();
    std::exit(status);
}
