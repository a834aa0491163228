#pragma once

#include <cstddef>
#include <limits>

namespace elephantine {

    inline constexpr const char* PROJECT_NAME    = "elephantine";
    inline constexpr const char* PROJECT_VERSION = "0.2.0";
    inline constexpr const char* PINENTRY_FLAVOR = "elephantine";

    // Assuan framing
    inline constexpr std::size_t MAX_LINE_LENGTH = 1000;
    inline constexpr std::size_t MAX_DATA_CHUNK  = 1000; // payload bytes per D line, before escaping

    // Dialog defaults
    inline constexpr int         DEFAULT_TIMEOUT_SECONDS = 300;
    inline constexpr int         MAX_TIMEOUT_SECONDS     = std::numeric_limits<int>::max() / 1000; // watchdog arms in int milliseconds
    inline constexpr const char* DEFAULT_COMMAND         = "walker --password";
    inline constexpr const char* DEFAULT_DESCRIPTION     = "Please enter the passphrase";
    inline constexpr const char* DEFAULT_PROMPT          = "PIN:";
    inline constexpr const char* DEFAULT_OK_LABEL        = "OK";
    inline constexpr const char* DEFAULT_CANCEL_LABEL    = "Cancel";

    // Session policy
    inline constexpr int MAX_CONSECUTIVE_LAUNCH_FAILURES = 3;
    inline constexpr int KILL_REAP_TIMEOUT_MS            = 2000;

} // namespace elephantine
