#include "cooldown.h"
#include <algorithm>

namespace wick {

void CooldownRegistry::set(std::string_view symbol, TimePoint until) {
  auto lock = std::scoped_lock{mutex_};
  auto it = expiry_.find(symbol);
  if (it == expiry_.end())
    expiry_.emplace(std::string{symbol}, until);
  else
    it->second = std::max(it->second, until);
}

bool CooldownRegistry::is_active(std::string_view symbol, TimePoint now) const {
  auto lock = std::scoped_lock{mutex_};
  auto it = expiry_.find(symbol);
  return it != expiry_.end() and now < it->second;
}

std::size_t CooldownRegistry::purge(TimePoint now) {
  auto lock = std::scoped_lock{mutex_};
  return std::erase_if(expiry_,
                       [now](const auto &entry) { return entry.second <= now; });
}

std::size_t CooldownRegistry::size() const {
  auto lock = std::scoped_lock{mutex_};
  return expiry_.size();
}

std::map<std::string, TimePoint> CooldownRegistry::snapshot() const {
  auto lock = std::scoped_lock{mutex_};
  return {expiry_.begin(), expiry_.end()};
}

void CooldownRegistry::restore(std::map<std::string, TimePoint> entries) {
  auto lock = std::scoped_lock{mutex_};
  expiry_ = decltype(expiry_)(entries.begin(), entries.end());
}

} // namespace wick
