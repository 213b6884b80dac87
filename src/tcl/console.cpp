#include "rtlsim/tcl/console.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string_view>
#include <utility>

#ifdef RTLSIM_HAVE_READLINE
#include <readline/history.h>
#include <readline/readline.h>
#endif

#include "cmd/register_all.hpp"

namespace rtlsim::tcl {

namespace {

bool isBlank(char ch) {
    return std::isspace(static_cast<unsigned char>(ch)) != 0;
}

bool hasPrefix(std::string_view s, std::string_view prefix) {
    return s.substr(0, prefix.size()) == prefix;
}

std::string trimLeft(const std::string& s) {
    size_t i = 0;
    while (i < s.size() && isBlank(s[i]))
        ++i;
    return s.substr(i);
}

Console::Args splitWords(const std::string& s) {
    Console::Args words;
    size_t i = 0;
    while (i < s.size()) {
        while (i < s.size() && isBlank(s[i]))
            ++i;
        size_t j = i;
        while (j < s.size() && !isBlank(s[j]))
            ++j;
        if (j > i) words.emplace_back(s, i, j - i);
        i = j;
    }
    return words;
}

#ifdef RTLSIM_HAVE_READLINE
// Candidates of the completion in progress; rl_completion_matches pulls them
// one at a time through nextCompletion.
std::vector<std::string> sCompletions;

char* nextCompletion(const char* text, int state) {
    static size_t next = 0;
    if (state == 0) next = 0;
    const std::string_view cur(text ? text : "");
    while (next < sCompletions.size()) {
        const std::string& cand = sCompletions[next++];
        if (hasPrefix(cand, cur)) return ::strdup(cand.c_str());
    }
    return nullptr;
}
#endif

} // namespace

#ifdef RTLSIM_HAVE_READLINE
Console* Console::sSelf = nullptr;
#endif

Console::Console(sim::ComponentRegistry& reg, std::ostream& diag)
    : mRegistry(reg)
    , mDiag(diag) {}

Console::~Console() {
#ifdef RTLSIM_HAVE_READLINE
    if (sSelf == this) sSelf = nullptr;
#endif
    if (mInterp) Tcl_DeleteInterp(mInterp);
}

bool Console::init() {
    Tcl_FindExecutable(nullptr);
    mInterp = Tcl_CreateInterp();
    if (!mInterp) return false;
    // Core commands work without init.tcl; only library procs go missing.
    if (Tcl_Init(mInterp) != TCL_OK) {
        warn(&mDiag,
             std::string("Tcl_Init failed: ") + Tcl_GetStringResult(mInterp));
    }
    register_all_commands(*this);
    return true;
}

void Console::registerCommand(const std::string& name, const std::string& help,
                              Handler handler, Completer completer) {
    mCommands[name] = Command{name, help, handler, completer};
    Tcl_CreateObjCommand(mInterp, name.c_str(), &Console::TclCmd, this,
                         nullptr);
}

bool Console::hasCommand(const std::string& name) const {
    return findCommand(name) != nullptr;
}

const Console::Command* Console::findCommand(const std::string& name) const {
    auto it = mCommands.find(name);
    return it == mCommands.end() ? nullptr : &it->second;
}

std::vector<const Console::Command*> Console::commands() const {
    std::vector<const Command*> out;
    out.reserve(mCommands.size());
    for (const auto& kv : mCommands)
        out.push_back(&kv.second);
    return out;
}

int Console::evalLine(const std::string& line, std::string* result) {
    if (line.empty()) return 0;
    const int code = Tcl_EvalEx(mInterp, line.c_str(),
                                static_cast<int>(line.size()), TCL_EVAL_GLOBAL);
    std::string res = Tcl_GetStringResult(mInterp);
    if (result) {
        *result = std::move(res);
    } else if (code != TCL_OK) {
        error(&mDiag, res);
    } else if (!res.empty()) {
        mDiag << res << "\n";
    }
    return code == TCL_OK ? 0 : 1;
}

int Console::runScript(const std::string& path) {
    if (Tcl_EvalFile(mInterp, path.c_str()) == TCL_OK) return 0;
    error(&mDiag, path + ": " + Tcl_GetStringResult(mInterp));
    return 1;
}

int Console::TclCmd(ClientData cd, Tcl_Interp* interp, int objc,
                    Tcl_Obj* const objv[]) {
    auto* self = static_cast<Console*>(cd);
    Args args;
    args.reserve(objc > 1 ? static_cast<size_t>(objc - 1) : 0);
    for (int i = 1; i < objc; ++i)
        args.emplace_back(Tcl_GetString(objv[i]));
    return self->dispatch(interp, Tcl_GetString(objv[0]), args);
}

int Console::dispatch(Tcl_Interp* interp, const std::string& name,
                      const Args& args) {
    const Command* cmd = findCommand(name);
    if (!cmd || !cmd->mHandler) {
        Tcl_SetObjResult(
          interp, Tcl_NewStringObj(("unknown command: " + name).c_str(), -1));
        return TCL_ERROR;
    }
    try {
        return cmd->mHandler(*this, interp, args);
    } catch (const std::exception& e) {
        const std::string msg = name + ": " + e.what();
        Tcl_SetObjResult(interp, Tcl_NewStringObj(msg.c_str(), -1));
        return TCL_ERROR;
    }
}

#ifdef RTLSIM_HAVE_READLINE
char** Console::complt(const char* text, int start, int end) {
    (void)end;
    rl_attempted_completion_over = 1; // no filename fallback
    if (!sSelf) return nullptr;
    std::string line(rl_line_buffer ? rl_line_buffer : "");
    line.resize(static_cast<size_t>(start));
    line += text ? text : "";
    sCompletions = sSelf->complete(line);
    return rl_completion_matches(text, &nextCompletion);
}
#endif

bool Console::readLine(std::string& out) {
#ifdef RTLSIM_HAVE_READLINE
    char* raw = readline("rtlsim> ");
    if (!raw) return false;
    out = raw;
    std::free(raw);
    if (!trimLeft(out).empty()) add_history(out.c_str());
#else
    mDiag << "rtlsim> " << std::flush;
    if (!std::getline(std::cin, out)) return false;
#endif
    return true;
}

int Console::repl() {
#ifdef RTLSIM_HAVE_READLINE
    sSelf = this;
    rl_attempted_completion_function = &Console::complt;
#endif
    info(&mDiag, "rtlsim console: 'help' lists commands, Ctrl+D exits");
    std::string line;
    while (readLine(line)) {
        line = trimLeft(line);
        // Errors are already reported on diag; the session goes on.
        if (!line.empty()) (void)evalLine(line);
    }
    return 0;
}

std::vector<std::string> Console::complete(const std::string& line) {
    Args words = splitWords(line);
    if (line.empty() || isBlank(line.back())) words.emplace_back();
    if (words.size() == 1) return completeCommands(words[0]);
    const Command* cmd = findCommand(words[0]);
    if (!cmd || !cmd->mCompleter) return {};
    return cmd->mCompleter(*this, words);
}

std::vector<std::string>
Console::completeCommands(const std::string& prefix) const {
    std::vector<std::string> r;
    for (const auto& kv : mCommands)
        if (hasPrefix(kv.first, prefix)) r.push_back(kv.first);
    return r;
}

std::vector<std::string>
Console::completeComponents(const std::string& prefix) const {
    std::vector<std::string> r;
    for (const auto* e : mRegistry.entries())
        if (hasPrefix(e->mName.str(), prefix)) r.push_back(e->mName.str());
    return r;
}

std::vector<std::string>
Console::completeParams(const std::string& component,
                        const std::string& prefix) const {
    std::vector<std::string> r;
    auto offer = [&](const std::string& name) {
        const std::string tok = name + "=";
        if (hasPrefix(tok, prefix)) r.push_back(tok);
    };
    offer("PERIOD");
    offer("RESET");
    if (const auto* e = mRegistry.find(component)) {
        for (const auto& kv : e->mDefaults)
            offer(kv.first.str());
    }
    std::sort(r.begin(), r.end());
    return r;
}

} // namespace rtlsim::tcl
