#pragma once
// Exception hierarchy. All failures are construction-time defects reported at
// the call site; none is raised while stepping a validated circuit.

#include <stdexcept>
#include <string>

namespace rtlsim {

struct SimError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// A magnitude (or width, index, period, ...) does not fit its declared range.
struct RangeError : SimError {
    using SimError::SimError;
};

// Values of incompatible width were combined, or a declared output width does
// not match the combinator's actual width.
struct WidthMismatchError : SimError {
    using SimError::SimError;
};

// A kernel's signature is not (ClockReset, I, Q) -> std::pair<O, D>.
struct ShapeError : SimError {
    using SimError::SimError;
};

// Unknown or duplicate component name in a ComponentRegistry.
struct RegistryError : SimError {
    using SimError::SimError;
};

} // namespace rtlsim
