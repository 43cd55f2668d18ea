#include "bridge/companion_endpoint.hpp"

#include <curl/curl.h>
#include <mutex>
#include <thread>
#include <utility>
#include <nlohmann/json.hpp>
#include "core/config/settings.hpp"
#include "core/logging/logger.hpp"

namespace conductor::bridge {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using core::errors::Unit;

namespace {

size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    const size_t total_size = size * nmemb;
    auto* out = static_cast<std::string*>(userp);
    out->append(static_cast<char*>(contents), total_size);
    return total_size;
}

void ensure_curl_global_init() {
    static std::once_flag once;
    std::call_once(once, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

}  // namespace

struct HttpCompanionEndpoint::Impl {
    std::mutex mutex;
    CURL* curl = nullptr;

    Impl() {
        ensure_curl_global_init();
        curl = curl_easy_init();
    }

    ~Impl() {
        if (curl) {
            curl_easy_cleanup(curl);
        }
    }
};

HttpCompanionEndpoint::HttpCompanionEndpoint(std::string base_url,
                                             std::uint32_t readiness_attempts,
                                             std::chrono::milliseconds readiness_backoff,
                                             std::chrono::milliseconds request_timeout)
    : impl_(std::make_unique<Impl>()),
      base_url_(core::config::trim_trailing_slash(std::move(base_url))),
      readiness_attempts_(readiness_attempts == 0 ? 1 : readiness_attempts),
      readiness_backoff_(readiness_backoff),
      request_timeout_(request_timeout) {}

HttpCompanionEndpoint::~HttpCompanionEndpoint() = default;

core::errors::Result<HttpCompanionEndpoint::HttpReply> HttpCompanionEndpoint::request(
    const std::string& method, const std::string& path, const std::string& body) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (!impl_->curl) {
        return AgentError{ErrorCategory::Delivery, "Failed to initialize CURL.",
                          "companion_init_failed"};
    }

    const std::string url = base_url_ + path;
    CURL* curl = impl_->curl;
    curl_easy_reset(curl);
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(request_timeout_.count()));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(request_timeout_.count()));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    struct curl_slist* headers = nullptr;
    if (method == "POST") {
        headers = curl_slist_append(headers, "Content-Type: application/json");
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    }

    HttpReply reply;
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &reply.body);

    const CURLcode res = curl_easy_perform(curl);
    if (headers) {
        curl_slist_free_all(headers);
    }
    if (res != CURLE_OK) {
        return AgentError{ErrorCategory::Delivery,
                          method + " " + url + " failed: " + curl_easy_strerror(res),
                          "companion_unreachable"};
    }
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &reply.status);
    return reply;
}

bool HttpCompanionEndpoint::wait_until_ready(const core::cancellation::CancelToken& cancel) {
    for (std::uint32_t attempt = 1; attempt <= readiness_attempts_; ++attempt) {
        if (core::cancellation::is_cancelled(cancel)) {
            return false;
        }
        auto reply = request("GET", "/health", "");
        if (!core::errors::is_error(reply)) {
            const long status = core::errors::get_value(reply).status;
            if (status >= 200 && status < 300) {
                LOG_DEBUG("Companion ready after " + std::to_string(attempt) + " probe(s)");
                return true;
            }
        }
        if (attempt < readiness_attempts_) {
            std::this_thread::sleep_for(readiness_backoff_);
        }
    }
    LOG_WARN("Companion at " + base_url_ + " not ready after " +
             std::to_string(readiness_attempts_) + " probe(s)");
    return false;
}

core::errors::Result<Unit> HttpCompanionEndpoint::deliver(const std::string& text) {
    const nlohmann::json payload = {{"text", text}};
    auto reply = request("POST", "/input", payload.dump());
    if (core::errors::is_error(reply)) {
        return core::errors::get_error(reply);
    }
    const auto& value = core::errors::get_value(reply);
    if (value.status < 200 || value.status >= 300) {
        return AgentError{ErrorCategory::Delivery,
                          "Companion rejected input with HTTP " + std::to_string(value.status) +
                              ": " + value.body,
                          "companion_rejected"};
    }
    return Unit{};
}

}  // namespace conductor::bridge
