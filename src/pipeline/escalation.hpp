#pragma once

#include <cstdint>
#include <string>

namespace conductor::pipeline {

// What a human needs to pick up a stage that gave up.
struct EscalationNotice {
    std::string repository;
    std::string task_id;
    std::string run_id;
    std::string stage;
    std::string error_kind;   // error category name
    std::string error_code;
    std::string cause;        // first line, at most 200 characters
    std::uint32_t attempts = 0;
    bool retryable = false;
};

class Escalation {
public:
    virtual ~Escalation() = default;
    virtual void notify(const EscalationNotice& notice) = 0;
};

// Writes the notice to the log at ERROR level.
class LogEscalation : public Escalation {
public:
    void notify(const EscalationNotice& notice) override;
};

std::string describe(const EscalationNotice& notice);

}  // namespace conductor::pipeline
