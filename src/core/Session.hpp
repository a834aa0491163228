#pragma once

#include "assuan/Command.hpp"
#include "assuan/Response.hpp"
#include "dialog/DialogInvoker.hpp"

#include <QHash>
#include <QString>

#include <chrono>

namespace elephantine {

    struct Config;

    // Receives the responses of one command, in order. Data payloads are only
    // valid for the duration of the call.
    class ResponseSink {
      public:
        virtual ~ResponseSink() = default;

        virtual void send(const assuan::Response& response) = 0;
    };

    class Session {
      public:
        enum class State {
            Active,
            Terminated
        };

        Session(const Config& config, DialogInvoker& invoker);

        Session(const Session&)            = delete;
        Session& operator=(const Session&) = delete;

        // Runs one command to completion: zero or more Data/Comment responses,
        // then exactly one Ok or Err.
        void dispatch(const assuan::Command& command, ResponseSink& sink);

        [[nodiscard]] State state() const {
            return m_state;
        }
        [[nodiscard]] bool isTerminated() const {
            return m_state == State::Terminated;
        }

        [[nodiscard]] QString description() const {
            return m_description;
        }
        [[nodiscard]] QString prompt() const {
            return m_prompt;
        }
        [[nodiscard]] QString okLabel() const {
            return m_okLabel;
        }
        [[nodiscard]] QString cancelLabel() const {
            return m_cancelLabel;
        }
        [[nodiscard]] QString errorText() const {
            return m_errorText;
        }
        [[nodiscard]] QString title() const {
            return m_title;
        }
        [[nodiscard]] QString keyinfo() const {
            return m_keyinfo;
        }
        [[nodiscard]] int timeoutSeconds() const {
            return m_timeoutSeconds;
        }
        [[nodiscard]] const QHash<QString, QString>& options() const {
            return m_options;
        }
        [[nodiscard]] int consecutiveLaunchFailures() const {
            return m_launchFailures;
        }

        // What a dialog started now would show, defaults filled in.
        [[nodiscard]] DialogRequest makeDialogRequest(bool oneButton = false) const;

      private:
        void reset();

        void handleOption(const QByteArray& argument, ResponseSink& sink);
        void handleSetTimeout(const QByteArray& argument, ResponseSink& sink);
        void handleGetPin(ResponseSink& sink);
        void handleConfirm(const QByteArray& argument, ResponseSink& sink);
        void handleMessage(ResponseSink& sink);
        void handleGetInfo(const QByteArray& argument, ResponseSink& sink);
        void handleHelp(ResponseSink& sink);

        DialogResult runDialog(DialogKind kind, bool oneButton = false);

        // Ok for Accepted, the matching Err otherwise.
        void sendDialogOutcome(const DialogResult& result, ResponseSink& sink);

        [[nodiscard]] QString optionValue(const QString& name) const;
        [[nodiscard]] QString ttyInfo() const;

        const Config&           m_config;
        DialogInvoker&          m_invoker;
        State                   m_state{State::Active};

        QString                 m_description;
        QString                 m_prompt;
        QString                 m_okLabel;
        QString                 m_cancelLabel;
        QString                 m_notOkLabel;
        QString                 m_errorText;
        QString                 m_title;
        QString                 m_keyinfo;
        QString                 m_repeat;
        QString                 m_repeatError;
        QString                 m_repeatOk;
        QString                 m_qualityBar;
        QString                 m_qualityBarTooltip;
        QString                 m_genpinLabel;
        QString                 m_genpinTooltip;
        int                     m_timeoutSeconds{0};
        QHash<QString, QString> m_options;

        int                     m_launchFailures{0};
    };

} // namespace elephantine
