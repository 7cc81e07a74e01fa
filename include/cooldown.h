#pragma once

#include "market_types.h"
#include <map>
#include <mutex>
#include <string>
#include <string_view>

namespace wick {

// Symbol -> re-entry forbidden until this time
class CooldownRegistry {
public:
    void set(std::string_view symbol, TimePoint until);
    bool is_active(std::string_view symbol, TimePoint now) const;

    // Drop expired entries, returning how many were removed
    std::size_t purge(TimePoint now);

    std::size_t size() const;
    std::map<std::string, TimePoint> snapshot() const;
    void restore(std::map<std::string, TimePoint>);

private:
    mutable std::mutex mutex_;
    std::map<std::string, TimePoint, std::less<>> expiry_;
};

} // namespace wick
