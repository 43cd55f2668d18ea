#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include "core/cancellation/cancel_token.hpp"
#include "core/errors/agent_errors.hpp"

namespace conductor::bridge {

// Optional HTTP sidecar that forwards a prompt into the agent's pipe. It
// starts its listener only after the pipe exists, so it can lag behind the
// agent.
class CompanionEndpoint {
public:
    virtual ~CompanionEndpoint() = default;

    // Bounded readiness probe. False on timeout or cancellation.
    virtual bool wait_until_ready(const core::cancellation::CancelToken& cancel) = 0;

    virtual core::errors::Result<core::errors::Unit> deliver(const std::string& text) = 0;
};

// Talks to the sidecar over HTTP: GET /health, POST /input {"text": ...}.
class HttpCompanionEndpoint : public CompanionEndpoint {
public:
    HttpCompanionEndpoint(std::string base_url, std::uint32_t readiness_attempts,
                          std::chrono::milliseconds readiness_backoff,
                          std::chrono::milliseconds request_timeout = std::chrono::milliseconds(2000));
    ~HttpCompanionEndpoint() override;

    bool wait_until_ready(const core::cancellation::CancelToken& cancel) override;
    core::errors::Result<core::errors::Unit> deliver(const std::string& text) override;

    const std::string& base_url() const { return base_url_; }

private:
    struct HttpReply {
        long status = 0;
        std::string body;
    };

    core::errors::Result<HttpReply> request(const std::string& method, const std::string& path,
                                            const std::string& body);

    struct Impl;
    std::unique_ptr<Impl> impl_;
    std::string base_url_;
    std::uint32_t readiness_attempts_;
    std::chrono::milliseconds readiness_backoff_;
    std::chrono::milliseconds request_timeout_;
};

}  // namespace conductor::bridge
