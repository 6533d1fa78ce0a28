/**
 * @file context.cpp
 * @brief Process-wide default context
 */

#include "cmdkit/core/context.hpp"

#ifdef _WIN32
    #include <io.h>
    #define CMDKIT_ISATTY _isatty
    #define CMDKIT_STDIN_FD 0
#else
    #include <unistd.h>
    #define CMDKIT_ISATTY ::isatty
    #define CMDKIT_STDIN_FD STDIN_FILENO
#endif

namespace cmdkit {

Context& Context::process() {
    static ProcessEnvironment environment;
    static Context context(std::cin, std::cout, std::cerr, environment,
                           CMDKIT_ISATTY(CMDKIT_STDIN_FD) != 0);
    return context;
}

} // namespace cmdkit
