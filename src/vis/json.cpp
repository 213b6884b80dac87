#include "rtlsim/vis/json.hpp"

namespace rtlsim {
namespace vis {

using nlohmann::json;

static json buildComponent(const sim::DynComponent& comp) {
    const sim::PortWidths w = comp.widths();
    return {{"key", comp.key()},
            {"inputWidth", w.mInput},
            {"outputWidth", w.mOutput},
            {"stateWidth", w.mState},
            {"inputFields", comp.inputFields()}};
}

static json buildEvent(const sim::DynTraceEntry& e) {
    const sim::DynEvent& ev = e.mEvent;
    return {{"time", ev.mTime},
            {"cycle", ev.mCycle},
            {"phase", sim::to_string(ev.mPhase)},
            {"clock", ev.mCr.mClock},
            {"reset", ev.mCr.mReset},
            {"input", value::bitStringToString(ev.mInput)},
            {"output", value::bitStringToString(e.mOutput)}};
}

json traceToJson(const sim::DynComponent& comp, const sim::SimConfig& cfg,
                 const sim::DynTrace& trace) {
    json events = json::array();
    for (const auto& e : trace)
        events.push_back(buildEvent(e));

    json samples = json::array();
    for (const auto& bs : sim::sample(trace))
        samples.push_back(value::bitStringToString(bs));

    return {{"component", buildComponent(comp)},
            {"config",
             {{"resetCycles", cfg.mResetCycles}, {"period", cfg.mPeriod}}},
            {"events", std::move(events)},
            {"samples", std::move(samples)}};
}

} // namespace vis
} // namespace rtlsim
