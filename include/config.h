#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace wick {

enum class Strategy { WickSpike, RangeDca };

// Runtime settings read from the environment
struct Config {
    Strategy strategy{Strategy::WickSpike};
    std::string telegram_token;
    std::vector<std::string> telegram_chat_ids;
    std::string state_file;
    std::string trade_log_dir;
    std::string control_host;
    int control_port{};
};

std::string get_env_or_default(std::string_view, std::string_view);

// WICK_STRATEGY, TELEGRAM_BOT_TOKEN, TELEGRAM_CHAT_IDS (comma separated),
// WICK_STATE_FILE, WICK_TRADE_LOG_DIR, WICK_CONTROL_HOST, WICK_CONTROL_PORT
Config load_config();

std::string_view to_string(Strategy);

} // namespace wick
