#pragma once
#include "rtlsim/tcl/console.hpp"

// Declarations of per-file registration
namespace rtlsim::tcl {
void register_cmd_help(Console& c);       // help/commands
void register_cmd_components(Console& c); // components
void register_cmd_sim(Console& c); // sim-config/sim-run/sim-trace/sim-export

void register_all_commands(Console& c);
} // namespace rtlsim::tcl
