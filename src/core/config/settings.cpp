#include "core/config/settings.hpp"

#include <charconv>
#include <cstdlib>
#include <system_error>

namespace conductor::core::config {

using errors::AgentError;
using errors::ErrorCategory;

namespace {

errors::Result<std::uint32_t> parse_u32(const std::string& name,
                                        const std::string& text,
                                        std::uint32_t min_value,
                                        std::uint32_t max_value) {
    std::uint32_t value = 0;
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc() || ptr != end) {
        return AgentError{ErrorCategory::Input,
                          "Invalid number for " + name + ": '" + text + "'",
                          "invalid_integer", "Provide a non-negative integer."};
    }
    if (value < min_value || value > max_value) {
        return AgentError{ErrorCategory::Input, name + " out of bounds",
                          "bounds_error",
                          "Must be between " + std::to_string(min_value) +
                              " and " + std::to_string(max_value) + "."};
    }
    return value;
}

// Applies an optional numeric variable to `target`. Returns an error only
// when the variable is present and malformed.
std::optional<AgentError> apply_u32(const EnvLookup& lookup,
                                    const std::string& name,
                                    std::uint32_t min_value,
                                    std::uint32_t max_value,
                                    std::uint32_t& target) {
    const auto raw = lookup(name);
    if (!raw.has_value() || raw->empty()) {
        return std::nullopt;
    }
    auto parsed = parse_u32(name, *raw, min_value, max_value);
    if (errors::is_error(parsed)) {
        return errors::get_error(parsed);
    }
    target = errors::get_value(parsed);
    return std::nullopt;
}

}  // namespace

std::optional<std::string> process_env(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

std::string trim_trailing_slash(std::string url) {
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url;
}

errors::Result<Settings> load_settings(const EnvLookup& lookup) {
    Settings settings;

    if (auto v = lookup("CONDUCTOR_TEMPLATE_ROOT"); v && !v->empty()) {
        settings.template_root = *v;
    }
    if (auto v = lookup("TOOLS_SERVER_URL"); v && !v->empty()) {
        settings.tools_server_url = *v;
    }
    settings.tools_server_url = trim_trailing_slash(settings.tools_server_url);
    if (auto v = lookup("CONDUCTOR_PROGRESS_DIR"); v && !v->empty()) {
        settings.progress_dir = *v;
    }
    if (auto v = lookup("CONDUCTOR_JOURNAL_DIR"); v && !v->empty()) {
        settings.journal_dir = *v;
    }
    if (auto v = lookup("FIFO_PATH"); v && !v->empty()) {
        settings.fifo_path = *v;
    }
    if (auto v = lookup("CONDUCTOR_COMPANION_URL"); v && !v->empty()) {
        settings.companion_url = trim_trailing_slash(*v);
    }
    if (auto v = lookup("CONDUCTOR_CODE_HOST_COMMAND"); v && !v->empty()) {
        settings.code_host_command = *v;
    }

    std::uint32_t backoff_ms = static_cast<std::uint32_t>(settings.readiness_backoff.count());
    std::uint32_t grace_ms = static_cast<std::uint32_t>(settings.termination_grace.count());
    std::uint32_t hang_ms = static_cast<std::uint32_t>(settings.hang_timeout.count());
    std::uint32_t interval_s = static_cast<std::uint32_t>(settings.health_check_interval.count());
    std::uint32_t health_timeout_ms = static_cast<std::uint32_t>(settings.health_check_timeout.count());
    std::uint32_t poll_s = static_cast<std::uint32_t>(settings.code_host_poll_interval.count());

    const std::optional<AgentError> failures[] = {
        apply_u32(lookup, "CONDUCTOR_READINESS_ATTEMPTS", 1, 1000, settings.readiness_attempts),
        apply_u32(lookup, "CONDUCTOR_READINESS_BACKOFF_MS", 0, 600000, backoff_ms),
        apply_u32(lookup, "CONDUCTOR_TERMINATION_GRACE_MS", 0, 600000, grace_ms),
        apply_u32(lookup, "CONDUCTOR_HANG_TIMEOUT_MS", 0, 86400000, hang_ms),
        apply_u32(lookup, "CONDUCTOR_HEALTH_INTERVAL_SECS", 1, 86400, interval_s),
        apply_u32(lookup, "CONDUCTOR_HEALTH_TIMEOUT_MS", 1, 600000, health_timeout_ms),
        apply_u32(lookup, "CONDUCTOR_HEALTH_HISTORY", 1, 100000, settings.health_history_size),
        apply_u32(lookup, "CONDUCTOR_FAILURE_THRESHOLD", 1, 1000, settings.failure_threshold),
        apply_u32(lookup, "CONDUCTOR_CODE_HOST_POLL_SECS", 0, 86400, poll_s),
        apply_u32(lookup, "CONDUCTOR_CODE_HOST_MAX_POLLS", 1, 100000, settings.code_host_max_polls),
        apply_u32(lookup, "CONDUCTOR_MAX_ATTEMPTS", 1, 100, settings.max_attempts),
    };
    for (const auto& failure : failures) {
        if (failure.has_value()) {
            return *failure;
        }
    }

    settings.readiness_backoff = std::chrono::milliseconds(backoff_ms);
    settings.termination_grace = std::chrono::milliseconds(grace_ms);
    settings.hang_timeout = std::chrono::milliseconds(hang_ms);
    settings.health_check_interval = std::chrono::seconds(interval_s);
    settings.health_check_timeout = std::chrono::milliseconds(health_timeout_ms);
    settings.code_host_poll_interval = std::chrono::seconds(poll_s);

    if (auto v = lookup("CONDUCTOR_LOG_LEVEL"); v && !v->empty()) {
        if (!logging::parse_log_level(*v, settings.log_level)) {
            return AgentError{ErrorCategory::Input,
                              "Unknown log level: " + *v, "invalid_log_level",
                              "Use debug, info, warn or error."};
        }
    }

    return settings;
}

}  // namespace conductor::core::config
