#include "DialogRequest.hpp"

namespace elephantine {

    QString dialogKindName(DialogKind kind) {
        switch (kind) {
            case DialogKind::Pin: return "pin";
            case DialogKind::Confirm: return "confirm";
            case DialogKind::Message: return "message";
        }
        return "unknown";
    }

    QString grabModeName(GrabMode mode) {
        switch (mode) {
            case GrabMode::Global: return "global";
            case GrabMode::Local: return "local";
            case GrabMode::None: return "none";
        }
        return "unknown";
    }

} // namespace elephantine
