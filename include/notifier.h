#pragma once

#include <condition_variable>
#include <deque>
#include <expected>
#include <mutex>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace wick {

enum class NotifyError { NotConfigured, QueueFull, NetworkError, Rejected };

// Delivers operator messages; failures are logged, never retried, and never
// block trading logic
class Notifier {
public:
    virtual ~Notifier() = default;
    virtual std::expected<void, NotifyError> send(std::string_view text) = 0;
};

// Telegram Bot API sender. Messages are queued and posted from a worker
// thread so callers never wait on the network.
class TelegramNotifier : public Notifier {
public:
    TelegramNotifier(std::string token, std::vector<std::string> chat_ids);
    ~TelegramNotifier() override;

    std::expected<void, NotifyError> send(std::string_view) override;

    bool configured() const { return not token_.empty() and not chat_ids_.empty(); }

private:
    std::string token_;
    std::vector<std::string> chat_ids_;

    std::mutex mutex_;
    std::condition_variable_any ready_;
    std::deque<std::string> queue_;
    std::jthread worker_;

    void run(std::stop_token);
    std::expected<void, NotifyError> post(const std::string &chat_id, const std::string &text);
};

std::string_view to_string(NotifyError);

} // namespace wick
