#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace conductor::protocol {

    enum class ConfigFormat {
        Json,
        Toml,
        Yaml,
        Markdown
    };

    enum class AuthMethod {
        ApiKey,
        SessionToken,
        OAuth
    };

    inline std::string to_string(ConfigFormat format) {
        switch (format) {
            case ConfigFormat::Json:     return "json";
            case ConfigFormat::Toml:     return "toml";
            case ConfigFormat::Yaml:     return "yaml";
            case ConfigFormat::Markdown: return "markdown";
        }
        return "unknown";
    }

    // Static facts about one adapter. Immutable once the adapter exists.
    struct CapabilityDescriptor {
        bool supports_streaming = false;
        bool supports_multimodal = false;
        bool supports_function_calling = false;
        bool supports_system_prompts = false;
        std::uint32_t max_context_tokens = 0;
        std::string memory_filename;
        ConfigFormat config_format = ConfigFormat::Json;
        std::vector<AuthMethod> auth_methods;
    };

} // namespace conductor::protocol
