#pragma once

#include "DialogRequest.hpp"

#include <chrono>

namespace elephantine {

    // Runs one human-facing dialog to completion. A zero timeout waits indefinitely.
    class DialogInvoker {
      public:
        virtual ~DialogInvoker() = default;

        virtual DialogResult invoke(DialogKind kind, const DialogRequest& request, std::chrono::seconds timeout) = 0;
    };

} // namespace elephantine
