#pragma once
// Type-erased components: run a typed Synchronous unit from bit-string
// inputs. Used by the registry, the JSON exporter and the Tcl console, which
// only know widths and field layouts at run time.

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "rtlsim/common.hpp"
#include "rtlsim/sim/run.hpp"
#include "rtlsim/sim/sample.hpp"

namespace rtlsim::sim {

struct PortWidths {
    uint32_t mInput = 0;
    uint32_t mOutput = 0;
    uint32_t mState = 0;
};

struct SimConfig {
    uint32_t mResetCycles = 1;
    uint64_t mPeriod = 100;
};

// Apply RESET and PERIOD from params on top of base. RangeError on a negative
// RESET or a PERIOD below the minimum clock period. Other keys are ignored.
SimConfig configFromParams(const ParamSpec& params, const SimConfig& base = {});

struct DynEvent {
    uint64_t mTime = 0;
    uint64_t mCycle = 0;
    ClockPhase mPhase = ClockPhase::Low;
    ClockReset mCr;
    value::BitString mInput;
};

struct DynTraceEntry {
    DynEvent mEvent;
    value::BitString mOutput;
};

using DynTrace = std::vector<DynTraceEntry>;

// Outputs at the RisingEdge phase, one per logical cycle.
std::vector<value::BitString> sample(const DynTrace& trace);

class DynComponent {
  public:
    virtual ~DynComponent() = default;

    const std::string& key() const { return mKey; }

    virtual PortWidths widths() const = 0;
    virtual std::vector<uint32_t> inputFields() const = 0;

    // Every input must have exactly widths().mInput fully known bits. All
    // inputs are decoded before the first event is evaluated.
    virtual DynTrace run(const std::vector<value::BitString>& inputs,
                         const SimConfig& cfg) const = 0;

  protected:
    explicit DynComponent(std::string key)
        : mKey(std::move(key)) {}

  private:
    std::string mKey;
};

template <typename I, typename O>
DynTrace toDynTrace(const Trace<I, O>& trace) {
    DynTrace out;
    out.reserve(trace.size());
    for (const auto& e : trace) {
        const auto& ev = e.mEvent;
        out.push_back(DynTraceEntry{
          DynEvent{ev.mTime, ev.mCycle, ev.mPhase, ev.mCr,
                   value::toBitString(ev.mInput)},
          value::toBitString(e.mOutput)});
    }
    return out;
}

template <typename C>
class DynComponentImpl final : public DynComponent {
    static_assert(isSynchronous<C>, "C must derive from Synchronous");

  public:
    using Input = typename C::Input;

    DynComponentImpl(std::string key, C component)
        : DynComponent(std::move(key))
        , mComponent(std::move(component)) {}

    PortWidths widths() const override {
        return {value::widthOf<Input>, value::widthOf<typename C::Output>,
                value::widthOf<typename C::State>};
    }
    std::vector<uint32_t> inputFields() const override {
        return value::fieldWidths<Input>();
    }

    DynTrace run(const std::vector<value::BitString>& inputs,
                 const SimConfig& cfg) const override {
        std::vector<Input> decoded;
        decoded.reserve(inputs.size());
        for (const auto& bs : inputs)
            decoded.push_back(value::fromBitString<Input>(bs));
        Expander<Input> events(std::move(decoded), cfg.mResetCycles,
                               cfg.mPeriod);
        return toDynTrace(sim::run(mComponent, std::move(events)));
    }

  private:
    C mComponent;
};

template <typename C>
std::unique_ptr<DynComponent> makeDynComponent(std::string key, C component) {
    return std::make_unique<DynComponentImpl<C>>(std::move(key),
                                                 std::move(component));
}

// Pack one magnitude per field, first field lowest. WidthMismatchError if the
// counts differ, RangeError if a magnitude does not fit its field.
value::BitString encodeFields(const std::vector<uint32_t>& fieldWidths,
                              const std::vector<int64_t>& magnitudes);

// Decimal, 0x hex, or b / 0b binary. RangeError on anything else.
int64_t parseMagnitude(std::string_view text);

// Decimal when fully known and at most 64 bits, else "b" + MSB-first bits.
std::string formatBitString(const value::BitString& bs);

} // namespace rtlsim::sim
