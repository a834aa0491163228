#include "Paths.hpp"

#include <QStandardPaths>

namespace elephantine {

    QString configFilePath() {
        const auto configDir = QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation);
        return configDir + QStringLiteral("/elephantine/elephantine.conf");
    }

} // namespace elephantine
