#include "rtlsim/sim/dyn_component.hpp"

#include <cctype>
#include <stdexcept>
#include <string>
#include <limits>

namespace rtlsim::sim {

SimConfig configFromParams(const ParamSpec& params, const SimConfig& base) {
    SimConfig cfg = base;
    auto it = params.find(IdString("RESET"));
    if (it != params.end()) {
        if (it->second < 0 ||
            it->second > std::numeric_limits<uint32_t>::max()) {
            throw RangeError("RESET must be a non-negative cycle count, got " +
                             std::to_string(it->second));
        }
        cfg.mResetCycles = static_cast<uint32_t>(it->second);
    }
    it = params.find(IdString("PERIOD"));
    if (it != params.end()) {
        if (it->second < 0) {
            throw RangeError("PERIOD must be positive, got " +
                             std::to_string(it->second));
        }
        checkClockPeriod(static_cast<uint64_t>(it->second));
        cfg.mPeriod = static_cast<uint64_t>(it->second);
    }
    return cfg;
}

std::vector<value::BitString> sample(const DynTrace& trace) {
    std::vector<value::BitString> out;
    out.reserve(trace.size() / kEventsPerCycle);
    for (const auto& e : trace)
        if (e.mEvent.mPhase == ClockPhase::RisingEdge)
            out.push_back(e.mOutput);
    return out;
}

value::BitString encodeFields(const std::vector<uint32_t>& fieldWidths,
                              const std::vector<int64_t>& magnitudes) {
    if (fieldWidths.size() != magnitudes.size()) {
        throw WidthMismatchError("expected " +
                                 std::to_string(fieldWidths.size()) +
                                 " input fields, got " +
                                 std::to_string(magnitudes.size()));
    }
    value::BitString out;
    for (size_t i = 0; i < fieldWidths.size(); ++i) {
        value::Bits field;
        try {
            field = value::Bits::fromMagnitude(fieldWidths[i], magnitudes[i]);
        } catch (const RangeError& e) {
            throw RangeError("input field " + std::to_string(i) + ": " +
                             e.what());
        }
        const value::BitString bs = field.bits();
        out.insert(out.end(), bs.begin(), bs.end());
    }
    return out;
}

int64_t parseMagnitude(std::string_view text) {
    std::string t(text);
    int base = 10;
    size_t start = 0;
    if (t.size() > 2 && t[0] == '0' && (t[1] == 'x' || t[1] == 'X')) {
        base = 16;
        start = 2;
    } else if (t.size() > 2 && t[0] == '0' && (t[1] == 'b' || t[1] == 'B')) {
        base = 2;
        start = 2;
    } else if (t.size() > 1 && (t[0] == 'b' || t[0] == 'B')) {
        base = 2;
        start = 1;
    }
    const std::string digits = t.substr(start);
    // stoll/stoull would accept leading blanks and a sign; magnitudes do not.
    const unsigned char first =
      digits.empty() ? 0 : static_cast<unsigned char>(digits[0]);
    if (digits.empty() || (base == 10 ? !std::isdigit(first)
                                      : !std::isxdigit(first))) {
        throw RangeError("malformed magnitude: '" + t + "'");
    }
    size_t used = 0;
    try {
        if (base == 10) {
            const long long v = std::stoll(digits, &used, 10);
            if (used == digits.size()) return v;
        } else {
            const unsigned long long v = std::stoull(digits, &used, base);
            if (used == digits.size()) {
                if (v > static_cast<unsigned long long>(
                          std::numeric_limits<int64_t>::max())) {
                    throw RangeError("magnitude out of range: '" + t + "'");
                }
                return static_cast<int64_t>(v);
            }
        }
    } catch (const std::invalid_argument&) {
        throw RangeError("malformed magnitude: '" + t + "'");
    } catch (const std::out_of_range&) {
        throw RangeError("magnitude out of range: '" + t + "'");
    }
    throw RangeError("malformed magnitude: '" + t + "'");
}

std::string formatBitString(const value::BitString& bs) {
    if (value::isFullyKnown(bs) && bs.size() <= value::Bits::kMaxWidth) {
        return std::to_string(value::Bits::fromBitString(bs).value());
    }
    return "b" + value::bitStringToString(bs);
}

} // namespace rtlsim::sim
