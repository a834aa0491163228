#pragma once

namespace elephantine {
    struct Config;
}

namespace modes {

    // Write errors on a closed agent pipe then surface as EPIPE instead of killing the process.
    void ignoreBrokenPipe();

    // Serves one Assuan session on stdin/stdout. Returns the process exit code.
    int runPinentry(const elephantine::Config& config);

} // namespace modes
