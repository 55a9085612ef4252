#ifndef GMN_ENV_INTERNAL_H
#define GMN_ENV_INTERNAL_H

#include "env.h"

// Internal entry points exposed for the purposes of unit testing.

#include <functional>

void set_environment(std::function<char *(const char *)> getenv_fn);

#endif
