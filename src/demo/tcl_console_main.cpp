#include <iostream>

#include "rtlsim/lib/builtins.hpp"
#include "rtlsim/sim/registry.hpp"
#include "rtlsim/tcl/console.hpp"

using namespace rtlsim;

// Demo wiring for the embeddable console: builtins plus the interpreter.
// Script arguments are evaluated in order; without any, a prompt opens.
int main(int argc, char** argv) {
    sim::ComponentRegistry reg;
    lib::registerBuiltinComponents(reg);

    tcl::Console console(reg, std::cerr);
    if (!console.init()) {
        error(&std::cerr, "failed to create the Tcl interpreter");
        return 1;
    }

    if (argc > 1) {
        int rc = 0;
        for (int i = 1; i < argc && rc == 0; ++i)
            rc = console.runScript(argv[i]);
        return rc;
    }
    return console.repl();
}
