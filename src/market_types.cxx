#include "market_types.h"
#include <charconv>

namespace wick {

std::chrono::seconds timeframe_duration(std::string_view tf) {
  if (tf.size() < 2)
    return std::chrono::seconds{60};

  auto count = 0;
  auto [ptr, ec] = std::from_chars(tf.data(), tf.data() + tf.size() - 1, count);
  if (ec != std::errc{} or count <= 0)
    return std::chrono::seconds{60};

  switch (tf.back()) {
  case 'm': return std::chrono::minutes{count};
  case 'h': return std::chrono::hours{count};
  case 'd': return std::chrono::days{count};
  default: return std::chrono::seconds{60};
  }
}

} // namespace wick
