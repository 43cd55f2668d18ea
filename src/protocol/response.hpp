#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace conductor::protocol {

    struct ToolCall {
        std::string name;
        nlohmann::json arguments = nlohmann::json::object();
        std::string id;
    };

    enum class FinishReason {
        Stop,
        ToolCall,
        Length,
        Error
    };

    inline std::string to_string(FinishReason reason) {
        switch (reason) {
            case FinishReason::Stop:     return "stop";
            case FinishReason::ToolCall: return "tool_call";
            case FinishReason::Length:   return "length";
            case FinishReason::Error:    return "error";
        }
        return "unknown";
    }

    // Missing metadata stays empty rather than defaulting to zero.
    struct ResponseMetadata {
        std::optional<std::uint64_t> input_tokens;
        std::optional<std::uint64_t> output_tokens;
        std::optional<std::string> model;
        std::optional<std::uint64_t> duration_ms;
        nlohmann::json extra = nlohmann::json::object();
    };

    // Normalized output of one agent turn. Tool-call ids are unique.
    struct ParsedResponse {
        std::string content;
        std::vector<ToolCall> tool_calls;
        FinishReason finish_reason = FinishReason::Stop;
        ResponseMetadata metadata;
    };

} // namespace conductor::protocol
