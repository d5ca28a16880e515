//===----------------------------------------------------------------------===//
//
// Part of the regvm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Main entry point for the regvm-run command-line tool.
//
//===----------------------------------------------------------------------===//

#include "tools/regvm-run/cli.hpp"

#include <iostream>

/// @brief Parse arguments and run the named bytecode file.
/// @return 0 on success, 1 on usage or load errors, 2 on a VM trap.
int main(int argc, char **argv)
{
    using namespace regvm::tools;

    RunOptions opts;
    switch (parseArgs(argc - 1, argv + 1, opts, std::cerr))
    {
        case ParseOutcome::Help:
            printUsage(std::cout);
            return kExitOk;
        case ParseOutcome::Version:
            printVersion(std::cout);
            return kExitOk;
        case ParseOutcome::Error:
            printUsage(std::cerr);
            return kExitUsage;
        case ParseOutcome::Run:
            break;
    }
    return runFile(opts, std::cout, std::cerr);
}
