#include "Logging.hpp"

Q_LOGGING_CATEGORY(lcElephantine, "elephantine", QtInfoMsg)

namespace elephantine {

    void setDebugLogging(bool enabled) {
        QLoggingCategory::setFilterRules(QStringLiteral("elephantine.debug=%1").arg(enabled ? "true" : "false"));
    }

} // namespace elephantine
