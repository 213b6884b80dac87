#include "rtlsim/sim/registry.hpp"

#include <algorithm>

namespace rtlsim::sim {

void ComponentRegistry::add(std::string_view name, std::string help,
                            ParamSpec defaults, Factory factory) {
    IdString id(name);
    if (mEntries.count(id)) {
        throw RegistryError("component '" + std::string(name) +
                            "' is already registered");
    }
    mEntries.emplace(id, Entry{id, std::move(help), std::move(defaults),
                               std::move(factory)});
}

const DynComponent& ComponentRegistry::getOrCreate(std::string_view name,
                                                   const ParamSpec& overrides,
                                                   std::ostream* diag) {
    const Entry* entry = find(name);
    if (!entry) {
        throw RegistryError("unknown component '" + std::string(name) + "'");
    }
    ParamSpec known;
    for (const auto& [param, val] : overrides) {
        if (entry->mDefaults.count(param)) {
            known.emplace(param, val);
            continue;
        }
        warn(diag, "component '" + entry->mName.str() + "' has no parameter " +
                     param.str() + " (=" + std::to_string(val) + "); ignored");
    }

    ParamSpec env = entry->mDefaults;
    update(env, known);

    IdString key(makeParamKey(entry->mName.str(), env));
    auto it = mCache.find(key);
    if (it != mCache.end()) return *it->second;
    auto comp = entry->mFactory(key.str(), env);
    info(diag, "built " + key.str());
    auto& slot = mCache[key];
    slot = std::move(comp);
    return *slot;
}

bool ComponentRegistry::has(std::string_view name) const {
    return find(name) != nullptr;
}

const ComponentRegistry::Entry* ComponentRegistry::find(
  std::string_view name) const {
    IdString id = IdString::tryLookup(name);
    if (!id.valid()) return nullptr;
    auto it = mEntries.find(id);
    return it == mEntries.end() ? nullptr : &it->second;
}

std::vector<const ComponentRegistry::Entry*> ComponentRegistry::entries()
  const {
    std::vector<const Entry*> out;
    out.reserve(mEntries.size());
    for (const auto& kv : mEntries)
        out.push_back(&kv.second);
    std::sort(out.begin(), out.end(), [](const Entry* a, const Entry* b) {
        return a->mName.str() < b->mName.str();
    });
    return out;
}

} // namespace rtlsim::sim
