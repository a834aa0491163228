#pragma once

#include "../SecretBuffer.hpp"

#include <QString>

#include <utility>

namespace elephantine {

    enum class DialogKind {
        Pin,
        Confirm,
        Message
    };

    enum class GrabMode {
        Global,
        Local, // only while the dialog window has focus
        None
    };

    // Snapshot of the session taken when a dialog command runs.
    struct DialogRequest {
        QString description;
        QString prompt;
        QString errorText;
        QString okLabel;
        QString cancelLabel;
        QString notOkLabel;
        QString title;
        QString keyinfo;
        QString repeat;
        QString repeatError;
        QString repeatOk;
        QString qualityBar;
        QString qualityBarTooltip;
        QString genpinLabel;
        QString genpinTooltip;
        bool    oneButton = false;

        // Display context, forwarded as-is
        QString  display;
        QString  ttyname;
        QString  ttytype;
        QString  lcCtype;
        QString  lcMessages;
        QString  parentWid;
        QString  colors;
        QString  ttyalert;
        GrabMode grab = GrabMode::Global;
    };

    struct DialogResult {
        enum class Status {
            Accepted,
            Cancelled,
            TimedOut,
            Failed
        };

        Status       status = Status::Failed;
        SecretBuffer secret; // Pin only
        QString      reason; // Failed only

        static DialogResult accepted(SecretBuffer secret = {}) {
            return DialogResult{Status::Accepted, std::move(secret), {}};
        }
        static DialogResult cancelled() {
            return DialogResult{Status::Cancelled, {}, {}};
        }
        static DialogResult timedOut() {
            return DialogResult{Status::TimedOut, {}, {}};
        }
        static DialogResult failed(const QString& reason) {
            return DialogResult{Status::Failed, {}, reason};
        }
    };

    QString dialogKindName(DialogKind kind);
    QString grabModeName(GrabMode mode);

} // namespace elephantine
