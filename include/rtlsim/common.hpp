#pragma once

#include <cstdint>
#include <iostream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "rtlsim/util/id_string.hpp"

namespace rtlsim {

// Parameter environment: NAME=VALUE pairs, e.g. WIDTH=8 RESET=2.
using ParamSpec = std::unordered_map<IdString, int64_t, IdString::Hash>;

struct Indent {
    int mN = 0;
    explicit Indent(int n)
        : mN(n) {}
};
std::ostream& operator<<(std::ostream& os, const Indent& i);

// Diagnostics. A null stream discards the message.
void info(std::ostream* diag, const std::string& msg, int indent = 0);
void warn(std::ostream* diag, const std::string& msg, int indent = 0);
void error(std::ostream* diag, const std::string& msg, int indent = 0);

// Overwrite entries of `out` with those present in `overrides`, adding new
// keys as needed.
void update(ParamSpec& out, const ParamSpec& overrides);

// Parse NAME=VALUE tokens starting at startIdx. Malformed tokens are warned
// about and skipped; other tokens are left for the caller.
ParamSpec parseParamTokens(const std::vector<std::string>& toks,
                           size_t startIdx, std::ostream* diag);
bool isParamToken(std::string_view tok);

// Canonical specialization key: name#A=1,B=2 with parameters sorted by name.
std::string makeParamKey(std::string_view nameText, const ParamSpec& params);

} // namespace rtlsim
