//===----------------------------------------------------------------------===//
//
// Part of the regvm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/vm/Trace.hpp
// Purpose: Declare tracing configuration and sink for VM instruction steps.
// Key invariants: Trace output is deterministic and line-oriented.
// Ownership/Lifetime: Sink holds configuration by value and borrows the
//                     output stream.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <iosfwd>

namespace regvm::vm
{

/// @brief Configuration for interpreter tracing.
struct TraceConfig
{
    /// @brief Tracing modes.
    enum Mode
    {
        Off, ///< Tracing disabled
        Ops  ///< One line per executed instruction
    } mode{Off};

    /// @brief Destination stream; null selects std::cerr.
    std::ostream *out = nullptr;

    /// @brief Check whether tracing is enabled.
    /// @return True if mode is not Off.
    bool enabled() const;
};

/// @brief Sink that formats and emits trace lines.
class TraceSink
{
  public:
    /// @brief Create sink with configuration @p cfg.
    explicit TraceSink(TraceConfig cfg = {});

    /// @brief Record execution of @p opcode located at @p pc.
    void onStep(uint64_t pc, uint8_t opcode);

    const TraceConfig &config() const
    {
        return cfg;
    }

    /// @brief Replace the active configuration.
    void setConfig(TraceConfig next)
    {
        cfg = next;
    }

  private:
    TraceConfig cfg; ///< Active configuration
};

} // namespace regvm::vm
