#include "rtlsim/tcl/console.hpp"
#include "rtlsim/vis/json.hpp"

#include <sstream>

using rtlsim::tcl::Console;
namespace sim = rtlsim::sim;
namespace value = rtlsim::value;

namespace {

const rtlsim::IdString& resetKey() {
    static const rtlsim::IdString k("RESET");
    return k;
}
const rtlsim::IdString& periodKey() {
    static const rtlsim::IdString k("PERIOD");
    return k;
}

// A parsed "<name> [PARAM=V ...] <input ...>" invocation, ready to run.
struct SimRequest {
    const sim::DynComponent* mComp = nullptr;
    sim::SimConfig mCfg;
    std::vector<value::BitString> mInputs;
};

std::vector<std::string> split_list(Tcl_Interp* ip, const std::string& s) {
    int n = 0;
    const char** elems = nullptr;
    if (Tcl_SplitList(ip, s.c_str(), &n, &elems) != TCL_OK) {
        throw rtlsim::RangeError("malformed input list: '" + s + "'");
    }
    std::vector<std::string> out(elems, elems + n);
    Tcl_Free(reinterpret_cast<char*>(elems));
    return out;
}

// One magnitude per top-level input field; a single-field input may be a
// bare magnitude.
value::BitString encode_input(Tcl_Interp* ip, const sim::DynComponent& comp,
                              const std::string& tok) {
    std::vector<int64_t> mags;
    for (const auto& part : split_list(ip, tok))
        mags.push_back(sim::parseMagnitude(part));
    return sim::encodeFields(comp.inputFields(), mags);
}

// Tokens from `start` on: component name, then NAME=VALUE parameters and
// input tokens in any order. RESET and PERIOD configure this run only.
SimRequest prepare(Console& c, Tcl_Interp* ip, const Console::Args& a,
                   size_t start) {
    SimRequest req;
    rtlsim::ParamSpec params = rtlsim::parseParamTokens(a, start + 1, &c.diag());
    req.mCfg = sim::configFromParams(params, c.config());
    params.erase(resetKey());
    params.erase(periodKey());
    req.mComp = &c.registry().getOrCreate(a[start], params, &c.diag());

    // Decode every input before anything runs.
    for (size_t i = start + 1; i < a.size(); ++i) {
        if (rtlsim::isParamToken(a[i])) continue;
        req.mInputs.push_back(encode_input(ip, *req.mComp, a[i]));
    }
    return req;
}

int usage(Tcl_Interp* ip, const char* text) {
    std::string msg = std::string("usage: ") + text;
    Tcl_SetObjResult(ip, Tcl_NewStringObj(msg.c_str(), -1));
    return TCL_ERROR;
}

std::string format_event(const sim::DynTraceEntry& e) {
    const sim::DynEvent& ev = e.mEvent;
    std::ostringstream oss;
    oss << "t=" << ev.mTime << " cycle=" << ev.mCycle << " "
        << sim::to_string(ev.mPhase) << " clk=" << ev.mCr.mClock
        << " rst=" << ev.mCr.mReset
        << " in=" << sim::formatBitString(ev.mInput)
        << " out=" << sim::formatBitString(e.mOutput);
    return oss.str();
}

} // namespace

static int cmd_sim_config(Console& c, Tcl_Interp* ip, const Console::Args& a) {
    for (const auto& t : a)
        if (!rtlsim::isParamToken(t))
            return usage(ip, "sim-config [RESET=n] [PERIOD=p]");
    rtlsim::ParamSpec params = rtlsim::parseParamTokens(a, 0, &c.diag());
    for (const auto& kv : params) {
        if (kv.first != resetKey() && kv.first != periodKey())
            rtlsim::warn(&c.diag(),
                         "sim-config: ignoring unknown key " + kv.first.str());
    }
    c.config() = sim::configFromParams(params, c.config());
    std::ostringstream oss;
    oss << "RESET=" << c.config().mResetCycles
        << " PERIOD=" << c.config().mPeriod;
    Tcl_SetObjResult(ip, Tcl_NewStringObj(oss.str().c_str(), -1));
    return TCL_OK;
}

static int cmd_sim_run(Console& c, Tcl_Interp* ip, const Console::Args& a) {
    if (a.empty())
        return usage(ip, "sim-run <name> [PARAM=V ...] <input ...>");
    SimRequest req = prepare(c, ip, a, 0);
    auto trace = req.mComp->run(req.mInputs, req.mCfg);
    Tcl_Obj* list = Tcl_NewListObj(0, nullptr);
    for (const auto& out : sim::sample(trace)) {
        const std::string s = sim::formatBitString(out);
        Tcl_ListObjAppendElement(ip, list, Tcl_NewStringObj(s.c_str(), -1));
    }
    Tcl_SetObjResult(ip, list);
    return TCL_OK;
}

static int cmd_sim_trace(Console& c, Tcl_Interp* ip, const Console::Args& a) {
    if (a.empty())
        return usage(ip, "sim-trace <name> [PARAM=V ...] <input ...>");
    SimRequest req = prepare(c, ip, a, 0);
    std::ostringstream oss;
    for (const auto& e : req.mComp->run(req.mInputs, req.mCfg))
        oss << format_event(e) << "\n";
    Tcl_SetObjResult(ip, Tcl_NewStringObj(oss.str().c_str(), -1));
    return TCL_OK;
}

static int cmd_sim_export(Console& c, Tcl_Interp* ip, const Console::Args& a) {
    if (a.size() < 2)
        return usage(ip, "sim-export <file> <name> [PARAM=V ...] <input ...>");
    SimRequest req = prepare(c, ip, a, 1);
    auto trace = req.mComp->run(req.mInputs, req.mCfg);
    rtlsim::vis::writeJsonFile(
      a[0], rtlsim::vis::traceToJson(*req.mComp, req.mCfg, trace));
    std::string msg = "wrote " + std::to_string(trace.size()) +
                      " events to " + a[0];
    Tcl_SetObjResult(ip, Tcl_NewStringObj(msg.c_str(), -1));
    return TCL_OK;
}

// Completion: component name first, then its parameters.
static std::vector<std::string> compl_sim(Console& c,
                                          const Console::Args& toks) {
    const size_t nameIdx = toks[0] == "sim-export" ? 2 : 1;
    if (toks.size() - 1 < nameIdx) return {};
    if (toks.size() - 1 == nameIdx) return c.completeComponents(toks.back());
    return c.completeParams(toks[nameIdx], toks.back());
}

static std::vector<std::string> compl_sim_config(Console& c,
                                                 const Console::Args& toks) {
    return c.completeParams("", toks.back());
}

namespace rtlsim::tcl {
void register_cmd_sim(Console& c) {
    c.registerCommand("sim-config",
                      "sim-config [RESET=n] [PERIOD=p]: show or set the "
                      "default reset cycles and clock period",
                      &cmd_sim_config,
                      &compl_sim_config);
    c.registerCommand("sim-run",
                      "sim-run <name> [PARAM=V ...] <input ...>: run and "
                      "return one sampled output per cycle",
                      &cmd_sim_run,
                      &compl_sim);
    c.registerCommand("sim-trace",
                      "sim-trace <name> [PARAM=V ...] <input ...>: run and "
                      "return every clock event, one per line",
                      &cmd_sim_trace,
                      &compl_sim);
    c.registerCommand("sim-export",
                      "sim-export <file> <name> [PARAM=V ...] <input ...>: "
                      "write the run as a JSON trace",
                      &cmd_sim_export,
                      &compl_sim);
}
} // namespace rtlsim::tcl
