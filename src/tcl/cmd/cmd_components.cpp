#include "rtlsim/tcl/console.hpp"

#include <sstream>

using rtlsim::tcl::Console;

// One line per registry entry: name, defaults, help.
static int cmd_components(Console& c, Tcl_Interp* ip,
                          const Console::Args& a) {
    const std::string pref = a.empty() ? "" : a[0];
    std::ostringstream oss;
    for (const auto* e : c.registry().entries()) {
        const std::string& name = e->mName.str();
        if (!pref.empty() && name.rfind(pref, 0) != 0) continue;
        oss << rtlsim::makeParamKey(name, e->mDefaults) << " - " << e->mHelp
            << "\n";
    }
    Tcl_SetObjResult(ip, Tcl_NewStringObj(oss.str().c_str(), -1));
    return TCL_OK;
}

static std::vector<std::string> compl_components(Console& c,
                                                 const Console::Args& toks) {
    if (toks.size() != 2) return {};
    return c.completeComponents(toks[1]);
}

namespace rtlsim::tcl {
void register_cmd_components(Console& c) {
    c.registerCommand("components",
                      "components [prefix]: list registered components with "
                      "their default parameters",
                      &cmd_components,
                      &compl_components);
}
} // namespace rtlsim::tcl
