#pragma once

#include "position.h"
#include "threshold.h"
#include <expected>
#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace wick {

enum class StateError { NotFound, IoError, ParseError };

// Everything needed to resume after a restart
struct EngineState {
    bool enabled{};
    ThresholdState threshold;
    std::vector<Position> positions;
    std::map<std::string, TimePoint> cooldowns;
    std::size_t rotation_offset{};
};

void to_json(nlohmann::json &, const DcaState &);
void from_json(const nlohmann::json &, DcaState &);
void to_json(nlohmann::json &, const Position &);
void from_json(const nlohmann::json &, Position &);
void to_json(nlohmann::json &, const EngineState &);
void from_json(const nlohmann::json &, EngineState &);

// Written to a temporary file and renamed into place
std::expected<void, StateError> save_state(const std::filesystem::path &, const EngineState &);

std::expected<EngineState, StateError> load_state(const std::filesystem::path &);

std::string_view to_string(StateError);

} // namespace wick
