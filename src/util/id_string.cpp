#include "rtlsim/util/id_string.hpp"

namespace rtlsim {
IdString::Pool& IdString::pool() {
    static Pool p;
    return p;
}

uint32_t IdString::intern(std::string_view sv) {
    auto& p = pool();
    std::lock_guard<std::mutex> lock(p.mMu);
    if (auto it = p.mIndex.find(std::string(sv)); it != p.mIndex.end()) {
        return it->second;
    }
    uint32_t id = static_cast<uint32_t>(p.mNames.size());
    p.mNames.emplace_back(sv);
    p.mIndex.emplace(std::string(sv), id);
    return id;
}

uint32_t IdString::lookup(std::string_view sv) {
    auto& p = pool();
    std::lock_guard<std::mutex> lock(p.mMu);
    if (auto it = p.mIndex.find(std::string(sv)); it != p.mIndex.end()) {
        return it->second;
    }
    return kInvalid;
}

const std::string& IdString::resolve(uint32_t id) {
    static const std::string kInvalidStr = "<Invalid>";
    auto& p = pool();
    std::lock_guard<std::mutex> lock(p.mMu);
    if (id == kInvalid || id >= p.mNames.size()) return kInvalidStr;
    return p.mNames[id];
}
} // namespace rtlsim
