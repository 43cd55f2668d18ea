#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <variant>

namespace conductor::pipeline {

enum class Stage {
    Implementation,
    Quality,
    Security,
    Testing,
    WaitingExternalIntegration,
    WaitingMerge,
    Completed
};

inline constexpr std::size_t kStageCount = 7;

inline constexpr std::array<Stage, kStageCount> kOrderedStages = {
    Stage::Implementation,
    Stage::Quality,
    Stage::Security,
    Stage::Testing,
    Stage::WaitingExternalIntegration,
    Stage::WaitingMerge,
    Stage::Completed,
};

// A persisted stage name this build does not recognize.
struct UnknownStage {
    std::string name;
};

using StageValue = std::variant<Stage, UnknownStage>;

std::string to_string(Stage stage);
std::string to_string(const StageValue& value);

// Case-insensitive, accepts historical aliases (e.g. "waiting-pr-merged").
// Anything else becomes UnknownStage carrying the raw name.
StageValue parse_stage(const std::string& name);

inline bool is_known(const StageValue& value) {
    return std::holds_alternative<Stage>(value);
}

}  // namespace conductor::pipeline
