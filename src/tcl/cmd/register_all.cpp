#include "register_all.hpp"

namespace rtlsim::tcl {
void register_all_commands(Console& c) {
    register_cmd_help(c);
    register_cmd_components(c);
    register_cmd_sim(c);
}
} // namespace rtlsim::tcl
