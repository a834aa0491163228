#include "pinentry.hpp"

#include "../common/Config.hpp"
#include "../common/Constants.hpp"
#include "../common/Logging.hpp"
#include "../core/Session.hpp"
#include "../core/Transport.hpp"
#include "../core/dialog/ProcessDialogInvoker.hpp"

#include <iostream>

#include <signal.h>

namespace modes {

    void ignoreBrokenPipe() {
        if (::signal(SIGPIPE, SIG_IGN) == SIG_ERR)
            qCWarning(lcElephantine) << "Failed to ignore SIGPIPE";
    }

    int runPinentry(const elephantine::Config& config) {
        ignoreBrokenPipe();

        elephantine::ProcessDialogInvoker invoker(config);
        elephantine::Session              session(config, invoker);
        elephantine::Transport            transport(std::cin, std::cout);

        qCDebug(lcElephantine) << "Dialog command:" << config.command << "timeout" << config.timeoutSeconds << "s";

        switch (transport.run(session)) {
            case elephantine::Transport::ExitReason::Terminated:
                return session.consecutiveLaunchFailures() >= elephantine::MAX_CONSECUTIVE_LAUNCH_FAILURES ? 1 : 0;
            case elephantine::Transport::ExitReason::EndOfInput: return 0;
            case elephantine::Transport::ExitReason::IoError: return 1;
        }
        return 1;
    }

} // namespace modes
