#include "engine_context.h"
#include <print>

namespace wick {

void notify(EngineContext &ctx, std::string_view text) {
  auto sent = ctx.notifier.send(text);
  if (not sent and sent.error() != NotifyError::NotConfigured)
    std::println(stderr, "⚠️  Notification failed: {}", to_string(sent.error()));
}

} // namespace wick
