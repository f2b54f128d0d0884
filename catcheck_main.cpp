#include "src/Catcheck.h"
#include <loguru/loguru.hpp>
#include <vector>

int main(int argc, char *argv[]) {
/* logging */
    // loguru::init would consume -v, which is our own flag
    loguru::g_stderr_verbosity = loguru::Verbosity_WARNING;

    std::vector<std::string> args (argv, argv + argc);
    return Catcheck::run(args);
}
