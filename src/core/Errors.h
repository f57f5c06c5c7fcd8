#pragma once

#include <stdexcept>
#include <string>

namespace rs {

// Caller passed something the operation cannot work with (e.g. nothing to bake).
class InvalidArgumentError : public std::invalid_argument {
public:
    explicit InvalidArgumentError(const std::string& what) : std::invalid_argument(what) {}
};

// Parallel bookkeeping lists went out of step while building temporary bones.
// Always a bug in the builder, never a user error.
class InternalInconsistencyError : public std::logic_error {
public:
    explicit InternalInconsistencyError(const std::string& what) : std::logic_error(what) {}
};

} // namespace rs
