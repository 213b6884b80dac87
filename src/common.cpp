#include "rtlsim/common.hpp"

#include <algorithm>
#include <sstream>

namespace rtlsim {

std::ostream& operator<<(std::ostream& os, const Indent& i) {
    for (int k = 0; k < i.mN; ++k)
        os << ' ';
    return os;
}

void info(std::ostream* diag, const std::string& msg, int indent) {
    if (diag) *diag << Indent(indent) << "INFO: " << msg << "\n";
}
void warn(std::ostream* diag, const std::string& msg, int indent) {
    if (diag) *diag << Indent(indent) << "WARN: " << msg << "\n";
}
void error(std::ostream* diag, const std::string& msg, int indent) {
    if (diag) *diag << Indent(indent) << "ERROR: " << msg << "\n";
}

void update(ParamSpec& out, const ParamSpec& overrides) {
    for (const auto& [key, val] : overrides) {
        out[key] = val;
    }
}

bool isParamToken(std::string_view tok) {
    auto eq = tok.find('=');
    return eq != std::string_view::npos && eq != 0;
}

ParamSpec parseParamTokens(const std::vector<std::string>& toks,
                           size_t startIdx, std::ostream* diag) {
    ParamSpec env;
    for (size_t i = startIdx; i < toks.size(); ++i) {
        const std::string& t = toks[i];
        if (!isParamToken(t)) continue;
        auto eq = t.find('=');
        if (eq + 1 >= t.size()) {
            warn(diag, "ignoring param token (expect NAME=VALUE): " + t);
            continue;
        }
        std::string name = t.substr(0, eq);
        std::string val = t.substr(eq + 1);
        size_t used = 0;
        long long v = 0;
        try {
            v = std::stoll(val, &used, 0);
        } catch (const std::exception&) {
            used = 0;
        }
        if (used != val.size()) {
            warn(diag, "non-integer param value: " + t);
            continue;
        }
        env[IdString(name)] = v;
    }
    return env;
}

std::string makeParamKey(std::string_view nameText, const ParamSpec& params) {
    std::vector<std::pair<std::string, int64_t>> v;
    v.reserve(params.size());
    for (auto& kv : params) {
        v.emplace_back(kv.first.str(), kv.second);
    }
    std::sort(
      v.begin(), v.end(), [](auto& a, auto& b) { return a.first < b.first; });
    std::ostringstream oss;
    oss << nameText;
    if (!v.empty()) oss << "#";
    for (size_t i = 0; i < v.size(); ++i) {
        oss << v[i].first << "=" << v[i].second;
        if (i + 1 < v.size()) oss << ",";
    }
    return oss.str();
}

} // namespace rtlsim
