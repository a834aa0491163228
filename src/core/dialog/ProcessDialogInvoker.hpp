#pragma once

#include "DialogInvoker.hpp"

#include <QProcessEnvironment>
#include <QStringList>

namespace elephantine {

    struct Config;

    // Spawns the configured dialog program for each request.
    //
    // Context reaches the program two ways:
    //  - ELEPHANTINE_* environment variables (ELEPHANTINE_KIND, _DESCRIPTION, _PROMPT, _ERROR,
    //    _OK, _CANCEL, _NOTOK, _TITLE, _KEYINFO, _REPEAT, _ONE_BUTTON, _TIMEOUT, _GRAB, ...),
    //    plus DISPLAY, GPG_TTY, TERM, LC_CTYPE and LC_MESSAGES when known;
    //  - {description}, {prompt}, {error}, {ok}, {cancel}, {title} and {kind} placeholders
    //    in the command arguments, substituted verbatim.
    //
    // Pin dialogs print the passphrase on stdout; every kind reports its decision
    // through the exit status (0 accepts).
    class ProcessDialogInvoker : public DialogInvoker {
      public:
        ProcessDialogInvoker(QStringList pinCommand, QStringList confirmCommand = {}, QStringList messageCommand = {});
        explicit ProcessDialogInvoker(const Config& config);

        DialogResult invoke(DialogKind kind, const DialogRequest& request, std::chrono::seconds timeout) override;

        void setBaseEnvironment(const QProcessEnvironment& env) {
            m_baseEnvironment = env;
        }

        [[nodiscard]] QStringList commandFor(DialogKind kind) const;

        [[nodiscard]] static QStringList  expandArguments(const QStringList& arguments, DialogKind kind, const DialogRequest& request);
        [[nodiscard]] QProcessEnvironment buildEnvironment(DialogKind kind, const DialogRequest& request, std::chrono::seconds timeout) const;

      private:
        QStringList         m_pinCommand;
        QStringList         m_confirmCommand;
        QStringList         m_messageCommand;
        QProcessEnvironment m_baseEnvironment;
    };

} // namespace elephantine
