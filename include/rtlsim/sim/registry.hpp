#pragma once
// Component registry: named factories over a parameter environment, with
// specializations cached under their canonical key (name#A=1,B=2).

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "rtlsim/common.hpp"
#include "rtlsim/sim/dyn_component.hpp"
#include "rtlsim/sim/kernel.hpp"

namespace rtlsim::sim {

class ComponentRegistry {
  public:
    // Builds the component for a fully resolved environment (defaults with
    // overrides applied). May throw RangeError for unsupported parameters.
    using Factory = std::function<std::unique_ptr<DynComponent>(
      const std::string& key, const ParamSpec& env)>;

    struct Entry {
        IdString mName;
        std::string mHelp;
        ParamSpec mDefaults;
        Factory mFactory;
    };

    // RegistryError if name is already registered.
    void add(std::string_view name, std::string help, ParamSpec defaults,
             Factory factory);

    // Register an unparameterized kernel. ShapeError if the kernel is not
    // (ClockReset, I, Q) -> std::pair<O, D>.
    template <typename F>
    void addKernel(std::string_view name, std::string help, F&& kernel) {
        using K = std::decay_t<F>;
        if constexpr (!KernelShape<K>::kValid) {
            throw ShapeError("kernel '" + std::string(name) +
                             "': " + KernelShape<K>::describe());
        } else {
            add(name, std::move(help), {},
                [k = K(std::forward<F>(kernel))](const std::string& key,
                                                 const ParamSpec&) {
                    return makeDynComponent(key, KernelComponent<K>(k));
                });
        }
    }

    // Register a default-constructible Synchronous unit without parameters.
    template <typename C>
    void addComponent(std::string_view name, std::string help) {
        add(name, std::move(help), {},
            [](const std::string& key, const ParamSpec&) {
                return makeDynComponent(key, C());
            });
    }

    // Look up (or build and cache) the specialization of name under the
    // registered defaults updated with overrides. RegistryError on an unknown
    // name; unknown parameters are reported on diag.
    const DynComponent& getOrCreate(std::string_view name,
                                    const ParamSpec& overrides,
                                    std::ostream* diag = nullptr);

    bool has(std::string_view name) const;
    const Entry* find(std::string_view name) const;
    // Sorted by name.
    std::vector<const Entry*> entries() const;
    size_t cachedCount() const { return mCache.size(); }

  private:
    std::unordered_map<IdString, Entry, IdString::Hash> mEntries;
    std::unordered_map<IdString, std::unique_ptr<DynComponent>, IdString::Hash>
      mCache;
};

} // namespace rtlsim::sim
