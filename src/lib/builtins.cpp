#include "rtlsim/lib/builtins.hpp"

#include <string>

#include "rtlsim/lib/accumulator.hpp"
#include "rtlsim/lib/dff.hpp"
#include "rtlsim/lib/shift_out.hpp"
#include "rtlsim/lib/shift_register.hpp"

namespace rtlsim::lib {

namespace {

int64_t widthParam(const ParamSpec& env) {
    auto it = env.find(IdString("WIDTH"));
    return it == env.end() ? 0 : it->second;
}

[[noreturn]] void unsupportedWidth(const char* name, int64_t width,
                                   const char* supported) {
    throw RangeError(std::string(name) + ": unsupported WIDTH=" +
                     std::to_string(width) + " (supported: " + supported +
                     ")");
}

template <uint32_t W>
using Word = value::BitVector<W>;

std::unique_ptr<sim::DynComponent> makeDff(const std::string& key,
                                           const ParamSpec& env) {
    switch (widthParam(env)) {
    case 1: return sim::makeDynComponent(key, Dff<bool>());
    case 8: return sim::makeDynComponent(key, Dff<Word<8>>());
    case 16: return sim::makeDynComponent(key, Dff<Word<16>>());
    case 32: return sim::makeDynComponent(key, Dff<Word<32>>());
    }
    unsupportedWidth("dff", widthParam(env), "1, 8, 16, 32");
}

std::unique_ptr<sim::DynComponent> makeAccumulator(const std::string& key,
                                                   const ParamSpec& env) {
    switch (widthParam(env)) {
    case 4: return sim::makeDynComponent(key, Accumulator<4>());
    case 8: return sim::makeDynComponent(key, Accumulator<8>());
    case 16: return sim::makeDynComponent(key, Accumulator<16>());
    case 32: return sim::makeDynComponent(key, Accumulator<32>());
    }
    unsupportedWidth("accumulator", widthParam(env), "4, 8, 16, 32");
}

std::unique_ptr<sim::DynComponent> makeShiftRegister(const std::string& key,
                                                     const ParamSpec& env) {
    switch (widthParam(env)) {
    case 4: return sim::makeDynComponent(key, ShiftRegister<4>());
    case 8: return sim::makeDynComponent(key, ShiftRegister<8>());
    case 16: return sim::makeDynComponent(key, ShiftRegister<16>());
    }
    unsupportedWidth("shift_register", widthParam(env), "4, 8, 16");
}

std::unique_ptr<sim::DynComponent> makeShiftOut(const std::string& key,
                                                const ParamSpec& env) {
    switch (widthParam(env)) {
    case 4: return sim::makeDynComponent(key, ShiftOut<4>());
    case 8: return sim::makeDynComponent(key, ShiftOut<8>());
    case 16: return sim::makeDynComponent(key, ShiftOut<16>());
    }
    unsupportedWidth("shift_out", widthParam(env), "4, 8, 16");
}

ParamSpec widthDefault(int64_t w) { return ParamSpec{{IdString("WIDTH"), w}}; }

} // namespace

void registerBuiltinComponents(sim::ComponentRegistry& reg) {
    reg.add("dff", "D flip-flop; input d, output q", widthDefault(8),
            &makeDff);
    reg.add("accumulator",
            "Wrapping accumulator; input {enable data}, output sum",
            widthDefault(8), &makeAccumulator);
    reg.add("shift_register",
            "Serial-in parallel-out; input {enable serial_in}, output word",
            widthDefault(8), &makeShiftRegister);
    reg.add("shift_out",
            "Parallel-in serial-out, MSB first; input {enable load data_in}, "
            "output serial bit",
            widthDefault(8), &makeShiftOut);
}

} // namespace rtlsim::lib
