//===----------------------------------------------------------------------===//
//
// Part of the regvm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/regvm-run/cli.cpp
// Purpose: Implement option parsing and the run pipeline of regvm-run:
//          load -> build host roots -> execute -> report.
// Key invariants: Nothing is printed to the output stream unless the run
//                 completes or the program itself writes to the console.
// Ownership/Lifetime: Host roots live for the duration of runFile().
//
//===----------------------------------------------------------------------===//

#include "tools/regvm-run/cli.hpp"

#include "bytecode/Bytecode.hpp"
#include "host/ExprEvaluator.hpp"
#include "host/HostObjects.hpp"
#include "regvm/version.hpp"
#include "regvm/vm/VM.hpp"
#include "vm/ValueOps.hpp"

#include <memory>
#include <ostream>
#include <string_view>

namespace regvm::tools
{

void printUsage(std::ostream &os)
{
    os << "regvm-run v" << REGVM_VERSION_STR << " - register VM bytecode runner\n"
       << "\n"
       << "Usage: regvm-run [options] <file>\n"
       << "\n"
       << "Options:\n"
       << "  --hex                force hex-text decoding\n"
       << "  --binary             force raw binary decoding\n"
       << "  --trace              print each executed instruction to stderr\n"
       << "  --count              print executed instruction count to stderr\n"
       << "  --opcounts           print per-opcode execution counts to stderr\n"
       << "  -h, --help           show this help message\n"
       << "  --version            show version information\n"
       << "\n"
       << "Hex text may contain whitespace and '#' comments.\n";
}

void printVersion(std::ostream &os)
{
    os << "regvm-run v" << REGVM_VERSION_STR << "\n";
}

ParseOutcome parseArgs(int argc, char **argv, RunOptions &opts, std::ostream &err)
{
    for (int i = 0; i < argc; ++i)
    {
        const std::string_view arg = argv[i];
        if (arg == "-h" || arg == "--help")
            return ParseOutcome::Help;
        if (arg == "--version")
            return ParseOutcome::Version;
        if (arg == "--hex")
        {
            opts.format = bytecode::BytecodeFormat::Hex;
        }
        else if (arg == "--binary")
        {
            opts.format = bytecode::BytecodeFormat::Binary;
        }
        else if (arg == "--trace")
        {
            opts.trace.mode = vm::TraceConfig::Ops;
        }
        else if (arg == "--count")
        {
            opts.countFlag = true;
        }
        else if (arg == "--opcounts")
        {
            opts.opcountsFlag = true;
        }
        else if (arg.size() > 1 && arg[0] == '-')
        {
            err << "regvm-run: unknown option '" << arg << "'\n";
            return ParseOutcome::Error;
        }
        else if (!opts.path.empty())
        {
            err << "regvm-run: unexpected argument '" << arg << "'\n";
            return ParseOutcome::Error;
        }
        else
        {
            opts.path = std::string(arg);
        }
    }

    if (opts.path.empty())
    {
        err << "regvm-run: no input file\n";
        return ParseOutcome::Error;
    }
    return ParseOutcome::Run;
}

int runFile(const RunOptions &opts, std::ostream &out, std::ostream &err)
{
    auto loaded = bytecode::loadBytecodeFile(opts.path, opts.format);
    if (!loaded)
    {
        err << "regvm-run: " << loaded.error() << "\n";
        return kExitUsage;
    }

    auto env = host::makeDefaultEnvironment(out);
    auto document = host::makeDocument();

    vm::RunConfig config;
    config.trace = opts.trace;
    if (config.trace.enabled() && !config.trace.out)
        config.trace.out = &err;
    config.roots.env = env;
    config.roots.document = document;
    config.evaluator = std::make_shared<host::ExprEvaluator>(env);
    if (opts.opcountsFlag)
        config.opcodeCounts = true;

    vm::Runner runner(std::move(loaded.value()), std::move(config));
    const vm::RunResult result = runner.run();

    int rc = kExitOk;
    if (result)
    {
        out << vm::toDisplayString(result.value()) << "\n";
    }
    else
    {
        err << vm::formatTrap(result.error()) << "\n";
        rc = kExitTrap;
    }

    if (opts.countFlag)
        err << "[SUMMARY] instr=" << runner.instructionCount() << "\n";
    if (opts.opcountsFlag)
    {
        for (const auto &[op, count] : runner.topOpcodes(bytecode::kOpcodeSpace))
        {
            err << "[OPCOUNT] " << bytecode::opcodeName(static_cast<uint8_t>(op)) << " "
                << count << "\n";
        }
    }
    return rc;
}

} // namespace regvm::tools
