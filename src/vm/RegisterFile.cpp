//===----------------------------------------------------------------------===//
//
// Part of the regvm project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Snapshot and restore of the register file used by the bytecode call
// convention.  A snapshot is an ordinary array Value so it can live in a
// register (REG_BACKUP) like any other value.
//
//===----------------------------------------------------------------------===//

#include "vm/RegisterFile.hpp"

#include <algorithm>

namespace regvm::vm
{

void RegisterFile::clear()
{
    regs_.fill(Value());
}

Value RegisterFile::snapshot() const
{
    return Value::array(ValueArray(regs_.begin(), regs_.end()));
}

bool RegisterFile::restore(const Value &saved)
{
    if (!saved.isArray())
        return false;
    const ValueArray &cells = *saved.asArray();
    if (cells.size() != regs_.size())
        return false;
    // Copy first: the snapshot may itself be referenced from a register.
    const ValueArray copy = cells;
    std::copy(copy.begin(), copy.end(), regs_.begin());
    return true;
}

} // namespace regvm::vm
