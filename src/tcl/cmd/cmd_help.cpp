#include "rtlsim/tcl/console.hpp"

#include <algorithm>
#include <sstream>
#include <utility>

using rtlsim::tcl::Console;

namespace {

void set_result(Tcl_Interp* ip, const std::string& s) {
    Tcl_SetObjResult(ip, Tcl_NewStringObj(s.c_str(), -1));
}

size_t shared_prefix(const std::string& a, const std::string& b) {
    auto mm = std::mismatch(a.begin(), a.end(), b.begin(), b.end());
    return static_cast<size_t>(mm.first - a.begin());
}

std::string command_table(const Console& c) {
    const auto cmds = c.commands();
    size_t w = 0;
    for (const auto* cmd : cmds)
        w = std::max(w, cmd->mName.size());
    std::ostringstream oss;
    oss << "commands:\n";
    for (const auto* cmd : cmds) {
        oss << "  " << cmd->mName << std::string(w - cmd->mName.size(), ' ')
            << "  " << cmd->mHelp << "\n";
    }
    return oss.str();
}

// Key with defaults, help text and the port widths of the default build.
std::string describe_component(Console& c,
                               const rtlsim::sim::ComponentRegistry::Entry& e) {
    const auto& comp = c.registry().getOrCreate(e.mName.str(), {}, &c.diag());
    const auto& w = comp.widths();
    std::ostringstream oss;
    oss << rtlsim::makeParamKey(e.mName.str(), e.mDefaults) << " - " << e.mHelp
        << "\n  input " << w.mInput << " bits (fields";
    for (uint32_t f : comp.inputFields())
        oss << " " << f;
    oss << "), output " << w.mOutput << " bits, state " << w.mState
        << " bits";
    return oss.str();
}

// Commands and components sharing at least three leading characters with
// name, longest match first.
std::vector<std::string> near_names(Console& c, const std::string& name) {
    std::vector<std::pair<size_t, std::string>> cand;
    auto consider = [&](const std::string& other) {
        const size_t n = shared_prefix(name, other);
        if (n >= std::min<size_t>(3, name.size()) && n > 0)
            cand.emplace_back(n, other);
    };
    for (const auto* cmd : c.commands())
        consider(cmd->mName);
    for (const auto* e : c.registry().entries())
        consider(e->mName.str());
    std::stable_sort(cand.begin(), cand.end(),
                     [](const auto& x, const auto& y) {
                         return x.first > y.first;
                     });
    std::vector<std::string> out;
    for (size_t i = 0; i < cand.size() && i < 5; ++i)
        out.push_back(cand[i].second);
    return out;
}

} // namespace

// help            command table
// help <command>  usage line
// help <name>     component description
static int cmd_help(Console& c, Tcl_Interp* ip, const Console::Args& a) {
    if (a.empty()) {
        std::ostringstream oss;
        oss << command_table(c) << c.registry().entries().size()
            << " components registered; 'help <component>' describes one";
        set_result(ip, oss.str());
        return TCL_OK;
    }
    const std::string& name = a[0];
    if (const auto* cmd = c.findCommand(name)) {
        set_result(ip, cmd->mName + " - " + cmd->mHelp);
        return TCL_OK;
    }
    if (const auto* e = c.registry().find(name)) {
        set_result(ip, describe_component(c, *e));
        return TCL_OK;
    }
    std::string msg = "unknown command or component: " + name;
    const auto near = near_names(c, name);
    if (!near.empty()) {
        msg += "\ndid you mean:";
        for (const auto& n : near)
            msg += "\n  " + n;
    }
    set_result(ip, msg);
    return TCL_ERROR;
}

static std::vector<std::string> compl_help(Console& c,
                                           const Console::Args& toks) {
    if (toks.size() != 2) return {};
    auto out = c.completeCommands(toks[1]);
    for (auto& n : c.completeComponents(toks[1]))
        out.push_back(std::move(n));
    std::sort(out.begin(), out.end());
    return out;
}

// Command names as a Tcl list, for scripts.
static int cmd_commands(Console& c, Tcl_Interp* ip, const Console::Args&) {
    Tcl_Obj* list = Tcl_NewListObj(0, nullptr);
    for (const auto* cmd : c.commands()) {
        Tcl_ListObjAppendElement(
          ip, list, Tcl_NewStringObj(cmd->mName.c_str(), -1));
    }
    Tcl_SetObjResult(ip, list);
    return TCL_OK;
}

namespace rtlsim::tcl {
void register_cmd_help(Console& c) {
    c.registerCommand("help",
                      "help [command|component]: command table, one "
                      "command's usage, or a component's ports",
                      &cmd_help,
                      &compl_help);
    c.registerCommand(
      "commands", "commands: command names as a Tcl list", &cmd_commands);
}
} // namespace rtlsim::tcl
