#include "pipeline/stage.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_map>

namespace conductor::pipeline {

std::string to_string(const Stage stage) {
    switch (stage) {
        case Stage::Implementation:
            return "implementation";
        case Stage::Quality:
            return "quality";
        case Stage::Security:
            return "security";
        case Stage::Testing:
            return "testing";
        case Stage::WaitingExternalIntegration:
            return "waiting-external-integration";
        case Stage::WaitingMerge:
            return "waiting-merge";
        case Stage::Completed:
            return "completed";
    }
    return "unknown";
}

std::string to_string(const StageValue& value) {
    if (const auto* stage = std::get_if<Stage>(&value)) {
        return to_string(*stage);
    }
    return std::get<UnknownStage>(value).name;
}

StageValue parse_stage(const std::string& name) {
    static const std::unordered_map<std::string, Stage> kNames = {
        {"implementation", Stage::Implementation},
        {"implementation-in-progress", Stage::Implementation},
        {"quality", Stage::Quality},
        {"code-quality", Stage::Quality},
        {"quality-in-progress", Stage::Quality},
        {"security", Stage::Security},
        {"security-in-progress", Stage::Security},
        {"testing", Stage::Testing},
        {"testing-in-progress", Stage::Testing},
        {"waiting-external-integration", Stage::WaitingExternalIntegration},
        {"waiting-atlas-integration", Stage::WaitingExternalIntegration},
        {"atlas", Stage::WaitingExternalIntegration},
        {"waiting-merge", Stage::WaitingMerge},
        {"waiting-pr-merged", Stage::WaitingMerge},
        {"merge", Stage::WaitingMerge},
        {"completed", Stage::Completed},
        {"complete", Stage::Completed},
        {"done", Stage::Completed},
    };

    std::string key = name;
    key.erase(0, key.find_first_not_of(" \t\r\n"));
    key.erase(key.find_last_not_of(" \t\r\n") + 1);
    std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c) {
        return static_cast<char>(c == '_' ? '-' : std::tolower(c));
    });

    auto it = kNames.find(key);
    if (it == kNames.end()) {
        return UnknownStage{name};
    }
    return it->second;
}

}  // namespace conductor::pipeline
