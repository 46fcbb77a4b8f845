#pragma once

#include <stdexcept>
#include <string>

namespace depotpack {

// A packing invariant was broken (unreachable split case, overlap after
// placement, non-converging buffer resolution). Indicates a defect, never an
// ordinary infeasible layout.
class InternalError : public std::logic_error {
public:
    explicit InternalError(const std::string& what) : std::logic_error(what) {}
};

// The caller broke the packing lifecycle (pack() twice, empty item list).
class UsageError : public std::logic_error {
public:
    explicit UsageError(const std::string& what) : std::logic_error(what) {}
};

}  // namespace depotpack
