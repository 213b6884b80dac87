#pragma once
// Interned name handle used for component names and parameter keys.
// Construct with IdString("text"); the pool is a process-wide singleton.

#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace rtlsim {

class IdString {
  public:
    struct NoInternTag {
        explicit NoInternTag() = default;
    };
    static inline constexpr NoInternTag NoIntern{};

    IdString()
        : mId(kInvalid) {}

    explicit IdString(std::string_view sv)
        : mId(intern(sv)) {}

    // Look up without adding to the pool; invalid if never interned.
    IdString(std::string_view sv, NoInternTag)
        : mId(lookup(sv)) {}

    static IdString tryLookup(std::string_view sv) {
        return IdString(sv, NoIntern);
    }

    bool valid() const { return mId != kInvalid; }
    uint32_t id() const { return mId; }
    const std::string& str() const { return resolve(mId); }

    bool operator==(const IdString& o) const { return mId == o.mId; }
    bool operator!=(const IdString& o) const { return mId != o.mId; }
    bool operator<(const IdString& o) const { return mId < o.mId; }

    struct Hash {
        size_t operator()(const IdString& s) const noexcept {
            return std::hash<uint32_t>{}(s.mId);
        }
    };

  private:
    static constexpr uint32_t kInvalid = 0xFFFFFFFFu;
    uint32_t mId;

    static uint32_t intern(std::string_view sv);
    static uint32_t lookup(std::string_view sv);
    static const std::string& resolve(uint32_t id);

    struct Pool {
        std::deque<std::string> mNames; // stable references for str()
        std::unordered_map<std::string, uint32_t> mIndex;
        std::mutex mMu;
    };

    static Pool& pool();
};

} // namespace rtlsim
