#pragma once

#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "rtlsim/sim/dyn_component.hpp"

namespace rtlsim {
namespace vis {

// Build a trace document for one run:
// - component: key and port/state widths, plus top-level input fields
// - config: reset cycles and clock period
// - events: time, cycle, phase, clock, reset, input and output bits
// - samples: RisingEdge outputs, one per logical cycle
// Bits are written MSB first, e.g. "0101"; unknown bits as 'x'.
nlohmann::json traceToJson(const sim::DynComponent& comp,
                           const sim::SimConfig& cfg,
                           const sim::DynTrace& trace);

// Convenience: write JSON to a file
inline void writeJsonFile(const std::string& path, const nlohmann::json& j) {
    std::ofstream ofs(path);
    if (!ofs)
        throw std::runtime_error("Cannot open file for writing: " + path);
    ofs << j.dump(2) << std::endl;
}

} // namespace vis
} // namespace rtlsim
