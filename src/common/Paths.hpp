#pragma once

#include <QString>

namespace elephantine {

    // Returns the default config file: $XDG_CONFIG_HOME/elephantine/elephantine.conf
    QString configFilePath();

} // namespace elephantine
