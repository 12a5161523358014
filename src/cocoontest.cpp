#include <iostream>
#include <csignal>

#include "version.hpp"
#include "util/signal.hpp"
#include "util/log.hpp"
#include "test/test.hpp"

using std::string;

extern "C" {
#include <string.h>
#include <errno.h>
}

static void Usage() {
    std::cout << "usage: " << program_invocation_short_name << " [-v] [<selftest>...]" << std::endl;
}

int main(int argc, char *argv[]) {
    std::vector<std::string> names;

    // helper trigger could hit dead process
    (void)Signal(SIGPIPE, SIG_IGN);

    for (int i = 1; i < argc; i++) {
        string arg(argv[i]);

        if (arg == "-h" || arg == "--help") {
            Usage();
            return EXIT_FAILURE;
        }

        if (arg == "--version") {
            std::cout << COCOON_VERSION << std::endl;
            return EXIT_FAILURE;
        }

        if (arg == "-v") {
            Verbose = Debug = true;
            OpenLog();
            continue;
        }

        names.push_back(arg);
    }

    try {
        return test::SelfTest(names);
    } catch (string err) {
        std::cerr << "Exception: " << err << std::endl;
    } catch (const std::exception &exc) {
        std::cerr << "Exception: " << exc.what() << std::endl;
    }

    return EXIT_FAILURE;
}
