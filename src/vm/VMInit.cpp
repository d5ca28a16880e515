//===----------------------------------------------------------------------===//
//
// Part of the regvm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/VMInit.cpp
// Purpose: VM construction, environment overrides and stream initialisation.
// Key invariants: After init() every reserved register holds its documented
//                 initial value and all other registers are void.
// Ownership/Lifetime: The VM takes ownership of the bytecode vector and
//                     shares ownership of host roots with the embedder.
//
//===----------------------------------------------------------------------===//

#include "vm/VM.hpp"

#include "host/HostObjects.hpp"
#include "vm/DebugLog.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <string>

namespace regvm::vm
{

namespace
{
std::string lowercase(const char *text)
{
    std::string v{text};
    std::transform(v.begin(),
                   v.end(),
                   v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return v;
}

Value handleOrVoid(const ObjectRef &handle)
{
    return handle ? Value(handle) : Value();
}
} // namespace

/// @brief Construct a VM with the given trace configuration and evaluator.
///
/// Environment overrides:
/// - REGVM_ENABLE_OPCOUNTS: 1/true/on enables counting, 0/false/off disables.
/// - REGVM_TRACE: "ops" turns instruction tracing on, "off" turns it off.
/// Other values are ignored and keep the supplied configuration.
VM::VM(TraceConfig tc, std::shared_ptr<HostEvaluator> evaluator)
    : tracer_(tc), evaluator_(std::move(evaluator))
{
    if (const char *envCounts = std::getenv("REGVM_ENABLE_OPCOUNTS"))
    {
        const std::string v = lowercase(envCounts);
        if (v == "0" || v == "false" || v == "off")
            enableOpcodeCounts = false;
        else if (v == "1" || v == "true" || v == "on")
            enableOpcodeCounts = true;
    }
    if (const char *envTrace = std::getenv("REGVM_TRACE"))
    {
        const std::string v = lowercase(envTrace);
        TraceConfig cfg = tracer_.config();
        if (v == "ops")
            cfg.mode = TraceConfig::Ops;
        else if (v == "off")
            cfg.mode = TraceConfig::Off;
        tracer_.setConfig(cfg);
    }

    if (isVmDebugLoggingEnabled())
    {
        std::fprintf(stderr,
                     "[DEBUG][VM] trace=%s opcounts=%s evaluator=%s\n",
                     tracer_.config().enabled() ? "ops" : "off",
                     enableOpcodeCounts ? "on" : "off",
                     evaluator_ ? "installed" : "none");
    }
}

void VM::init(std::vector<uint8_t> bytecode, HostRoots roots)
{
    stream_ = std::move(bytecode);
    regs_.clear();
    regs_.set(reg::kStackPtr, Value::number(0));
    regs_.set(reg::kReturnVal, Value::number(0));
    regs_.set(reg::kEnv, handleOrVoid(roots.env));
    regs_.set(reg::kDocument, handleOrVoid(roots.document));
    regs_.set(reg::kVoid, Value());
    regs_.set(reg::kEmptyObj, Value(ObjectRef(std::make_shared<host::PropertyObject>())));

    state_ = State::Ready;
    lastError_.reset();
    currentPc_ = 0;
    currentOpcode_ = 0;
    instrCount_ = 0;

    if (isVmDebugLoggingEnabled())
        std::fprintf(stderr, "[DEBUG][VM] init: %zu byte stream\n", stream_.size());
}

} // namespace regvm::vm
