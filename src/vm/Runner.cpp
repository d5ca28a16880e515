//===----------------------------------------------------------------------===//
//
// Part of the regvm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/Runner.cpp
// Purpose: Implement the public VM runner facade backed by the interpreter.
// Key invariants: Runner forwards configuration to the underlying VM and
//                 reports traps as values instead of exceptions.
// Ownership/Lifetime: Runner owns its VM instance and bytecode copy.
//
//===----------------------------------------------------------------------===//

#include "regvm/vm/VM.hpp"

#include "vm/VM.hpp"

#include <utility>

namespace regvm::vm
{

/// @brief Private implementation that owns the actual VM instance.
class Runner::Impl
{
  public:
    Impl(std::vector<uint8_t> code, RunConfig config)
        : bytecode(std::move(code)), roots(std::move(config.roots)),
          vm(config.trace, std::move(config.evaluator))
    {
        if (config.opcodeCounts)
            vm.setOpcodeCountsEnabled(*config.opcodeCounts);
    }

    RunResult run()
    {
        vm.init(bytecode, roots);
        std::optional<Value> result = vm.run();
        if (!result)
            return RunResult::failure(*vm.lastError());
        return RunResult::success(std::move(*result));
    }

    std::vector<uint8_t> bytecode;
    HostRoots roots;
    VM vm;
};

Runner::Runner(std::vector<uint8_t> bytecode, RunConfig config)
    : impl(std::make_unique<Impl>(std::move(bytecode), std::move(config)))
{
}

Runner::~Runner() = default;

Runner::Runner(Runner &&) noexcept = default;

Runner &Runner::operator=(Runner &&) noexcept = default;

RunResult Runner::run()
{
    return impl->run();
}

uint64_t Runner::instructionCount() const
{
    return impl->vm.getInstrCount();
}

std::optional<std::string> Runner::lastTrapMessage() const
{
    return impl->vm.lastTrapMessage();
}

const std::array<uint64_t, 256> &Runner::opcodeCounts() const
{
    return impl->vm.opcodeCounts();
}

void Runner::resetOpcodeCounts()
{
    impl->vm.resetOpcodeCounts();
}

std::vector<std::pair<int, uint64_t>> Runner::topOpcodes(std::size_t n) const
{
    return impl->vm.topOpcodes(n);
}

RunResult runBytecode(std::vector<uint8_t> bytecode, RunConfig config)
{
    Runner runner(std::move(bytecode), std::move(config));
    return runner.run();
}

} // namespace regvm::vm
