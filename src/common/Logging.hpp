#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(lcElephantine)

namespace elephantine {

    // Debug output is off unless enabled; warnings and above always reach stderr.
    void setDebugLogging(bool enabled);

} // namespace elephantine
