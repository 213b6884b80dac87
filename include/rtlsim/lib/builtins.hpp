#pragma once
// Built-in component library registered by name:
//   dff             WIDTH in {1, 8, 16, 32}
//   accumulator     WIDTH in {4, 8, 16, 32}
//   shift_register  WIDTH in {4, 8, 16}
//   shift_out       WIDTH in {4, 8, 16}
// An unsupported WIDTH raises RangeError when the specialization is built.

#include "rtlsim/sim/registry.hpp"

namespace rtlsim::lib {

void registerBuiltinComponents(sim::ComponentRegistry& reg);

} // namespace rtlsim::lib
