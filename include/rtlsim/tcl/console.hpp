#pragma once
// Tcl testbench console: an embedded interpreter with top-level commands for
// listing, configuring, running and exporting registered components.

#include <map>
#include <ostream>
#include <string>
#include <vector>

#include <tcl.h>

#include "rtlsim/sim/dyn_component.hpp"
#include "rtlsim/sim/registry.hpp"

namespace rtlsim::tcl {

class Console {
  public:
    using Args = std::vector<std::string>;

    // Handlers set the interpreter result and return TCL_OK or TCL_ERROR.
    // Exceptions they throw become TCL_ERROR with "<command>: <what>".
    using Handler = int (*)(Console&, Tcl_Interp*, const Args&);
    // Receives the words of the line, the last one being the partial word.
    using Completer = std::vector<std::string> (*)(Console&, const Args&);

    struct Command {
        std::string mName;
        std::string mHelp; // usage first, then a short description
        Handler mHandler = nullptr;
        Completer mCompleter = nullptr;
    };

    Console(sim::ComponentRegistry& reg, std::ostream& diag);
    ~Console();
    Console(const Console&) = delete;
    Console& operator=(const Console&) = delete;

    // Creates the interpreter and registers the built-in commands.
    bool init();
    int repl();
    // Returns 0 on TCL_OK. The interpreter result goes to *result when given,
    // otherwise it is printed on the diagnostic stream.
    int evalLine(const std::string& line, std::string* result = nullptr);
    // Evaluates a Tcl script file. Returns 0 on success.
    int runScript(const std::string& path);

    void registerCommand(const std::string& name, const std::string& help,
                         Handler handler, Completer completer = nullptr);
    bool hasCommand(const std::string& name) const;
    const Command* findCommand(const std::string& name) const;
    // Sorted by name.
    std::vector<const Command*> commands() const;

    // Candidates for the last word of line.
    std::vector<std::string> complete(const std::string& line);
    std::vector<std::string> completeCommands(const std::string& prefix) const;
    std::vector<std::string>
    completeComponents(const std::string& prefix) const;
    std::vector<std::string> completeParams(const std::string& component,
                                            const std::string& prefix) const;

    sim::ComponentRegistry& registry() { return mRegistry; }
    sim::SimConfig& config() { return mConfig; }
    const sim::SimConfig& config() const { return mConfig; }
    std::ostream& diag() { return mDiag; }

  private:
    static int TclCmd(ClientData cd, Tcl_Interp* interp, int objc,
                      Tcl_Obj* const objv[]);
    int dispatch(Tcl_Interp* interp, const std::string& name,
                 const Args& args);
    bool readLine(std::string& out);

#ifdef RTLSIM_HAVE_READLINE
    static char** complt(const char* text, int start, int end);
    static Console* sSelf; // readline completion target
#endif

    Tcl_Interp* mInterp = nullptr;
    std::map<std::string, Command> mCommands;

    sim::ComponentRegistry& mRegistry;
    sim::SimConfig mConfig;
    std::ostream& mDiag;
};

} // namespace rtlsim::tcl
