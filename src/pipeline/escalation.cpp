#include "pipeline/escalation.hpp"

#include "core/logging/logger.hpp"

namespace conductor::pipeline {

std::string describe(const EscalationNotice& notice) {
    std::string text = "Stage '" + notice.stage + "' of " + notice.repository + " (task " +
                       notice.task_id + ") failed after " + std::to_string(notice.attempts) +
                       (notice.attempts == 1 ? " attempt" : " attempts") + " [" +
                       notice.error_kind;
    if (!notice.error_code.empty()) {
        text += "/" + notice.error_code;
    }
    text += "]: " + notice.cause;
    return text;
}

void LogEscalation::notify(const EscalationNotice& notice) {
    LOG_ERROR("Escalation: " + describe(notice));
}

}  // namespace conductor::pipeline
