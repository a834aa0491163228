#include "Session.hpp"
#include "../common/Config.hpp"
#include "../common/Constants.hpp"
#include "../common/Logging.hpp"

#include <unistd.h>

namespace elephantine {

    using assuan::Error;
    using assuan::Response;
    using assuan::Verb;

    namespace {

        QString decodeText(const QByteArray& argument) {
            return QString::fromUtf8(argument);
        }

        QString firstNonEmpty(const QString& a, const QString& b, const QString& fallback = {}) {
            if (!a.isEmpty())
                return a;
            if (!b.isEmpty())
                return b;
            return fallback;
        }

        bool isBlank(char c) {
            return c == ' ' || c == '\t';
        }

    } // namespace

    Session::Session(const Config& config, DialogInvoker& invoker) : m_config(config), m_invoker(invoker) {
        reset();
    }

    void Session::reset() {
        m_description.clear();
        m_prompt.clear();
        m_okLabel.clear();
        m_cancelLabel.clear();
        m_notOkLabel.clear();
        m_errorText.clear();
        m_title.clear();
        m_keyinfo.clear();
        m_repeat.clear();
        m_repeatError.clear();
        m_repeatOk.clear();
        m_qualityBar.clear();
        m_qualityBarTooltip.clear();
        m_genpinLabel.clear();
        m_genpinTooltip.clear();
        m_options.clear();
        m_timeoutSeconds = m_config.timeoutSeconds;
    }

    void Session::dispatch(const assuan::Command& command, ResponseSink& sink) {
        if (m_state == State::Terminated) {
            qCDebug(lcElephantine) << "Ignoring" << command.name << "after session end";
            sink.send(Response::err(Error(GPG_ERR_ASS_UNEXPECTED_CMD), "Session terminated"));
            return;
        }

        qCDebug(lcElephantine) << "Request:" << command.name << command.argument;

        const QByteArray& arg = command.argument;
        switch (command.verb) {
            case Verb::Option: handleOption(arg, sink); return;
            case Verb::SetDesc: m_description = decodeText(arg); break;
            case Verb::SetPrompt: m_prompt = decodeText(arg); break;
            case Verb::SetTitle: m_title = decodeText(arg); break;
            case Verb::SetOk: m_okLabel = decodeText(arg); break;
            case Verb::SetCancel: m_cancelLabel = decodeText(arg); break;
            case Verb::SetNotOk: m_notOkLabel = decodeText(arg); break;
            case Verb::SetError: m_errorText = decodeText(arg); break;
            case Verb::SetKeyInfo: m_keyinfo = decodeText(arg); break;
            case Verb::SetRepeat: m_repeat = arg.isEmpty() ? QStringLiteral("Repeat:") : decodeText(arg); break;
            case Verb::SetRepeatError: m_repeatError = decodeText(arg); break;
            case Verb::SetRepeatOk: m_repeatOk = decodeText(arg); break;
            case Verb::SetQualityBar: m_qualityBar = arg.isEmpty() ? QStringLiteral("Quality:") : decodeText(arg); break;
            case Verb::SetQualityBarTt: m_qualityBarTooltip = decodeText(arg); break;
            case Verb::SetGenPin: m_genpinLabel = decodeText(arg); break;
            case Verb::SetGenPinTt: m_genpinTooltip = decodeText(arg); break;
            case Verb::SetTimeout: handleSetTimeout(arg, sink); return;
            case Verb::GetPin: handleGetPin(sink); return;
            case Verb::Confirm: handleConfirm(arg, sink); return;
            case Verb::Message: handleMessage(sink); return;
            case Verb::GetInfo: handleGetInfo(arg, sink); return;
            case Verb::ClearPassphrase: break; // nothing is cached
            case Verb::Reset: reset(); break;
            case Verb::Nop: break;
            case Verb::Help: handleHelp(sink); return;
            case Verb::Bye:
            case Verb::End:
            case Verb::Quit:
            case Verb::Cancel:
            case Verb::Auth:
                m_state = State::Terminated;
                sink.send(Response::ok("closing connection"));
                return;
            case Verb::Unknown: sink.send(Response::err(Error(GPG_ERR_ASS_UNKNOWN_CMD))); return;
        }

        sink.send(Response::ok());
    }

    void Session::handleOption(const QByteArray& argument, ResponseSink& sink) {
        // name, --name, name=value, name value, name = value
        QByteArrayView rest(argument);
        if (rest.startsWith("--"))
            rest = rest.sliced(2);

        qsizetype nameEnd = 0;
        while (nameEnd < rest.size() && !isBlank(rest[nameEnd]) && rest[nameEnd] != '=')
            ++nameEnd;
        const QString name = QString::fromUtf8(rest.first(nameEnd)).toLower();

        qsizetype valueStart = nameEnd;
        while (valueStart < rest.size() && isBlank(rest[valueStart]))
            ++valueStart;
        if (valueStart < rest.size() && rest[valueStart] == '=')
            ++valueStart;
        while (valueStart < rest.size() && isBlank(rest[valueStart]))
            ++valueStart;
        const QString value = QString::fromUtf8(rest.sliced(valueStart));

        if (name.isEmpty()) {
            sink.send(Response::err(Error(GPG_ERR_ASS_PARAMETER), "Missing option name"));
            return;
        }

        // grab and no-grab cancel each other; the last one sent wins.
        if (name == "grab")
            m_options.remove("no-grab");
        else if (name == "no-grab")
            m_options.remove("grab");

        m_options.insert(name, value);
        sink.send(Response::ok());
    }

    void Session::handleSetTimeout(const QByteArray& argument, ResponseSink& sink) {
        const QByteArray trimmed = argument.trimmed();
        bool             digits  = !trimmed.isEmpty();
        for (char c : trimmed)
            digits = digits && c >= '0' && c <= '9';

        if (!digits) {
            sink.send(Response::err(Error(GPG_ERR_ASS_SYNTAX), "Invalid timeout value"));
            return;
        }

        bool       ok      = false;
        const auto seconds = trimmed.toLongLong(&ok);
        if (!ok || seconds > MAX_TIMEOUT_SECONDS) {
            sink.send(Response::err(Error(GPG_ERR_ASS_PARAMETER), "Timeout value out of range"));
            return;
        }

        m_timeoutSeconds = static_cast<int>(seconds);
        sink.send(Response::ok());
    }

    DialogResult Session::runDialog(DialogKind kind, bool oneButton) {
        const DialogRequest request = makeDialogRequest(oneButton);
        DialogResult        result  = m_invoker.invoke(kind, request, std::chrono::seconds(m_timeoutSeconds));

        if (result.status == DialogResult::Status::Failed)
            ++m_launchFailures;
        else
            m_launchFailures = 0;

        return result;
    }

    void Session::sendDialogOutcome(const DialogResult& result, ResponseSink& sink) {
        switch (result.status) {
            case DialogResult::Status::TimedOut: sink.send(Response::err(Error(GPG_ERR_TIMEOUT))); return;

            case DialogResult::Status::Failed:
                qCWarning(lcElephantine) << "Dialog failed:" << result.reason;
                sink.send(Response::err(Error(GPG_ERR_NO_PIN_ENTRY), result.reason.toUtf8()));
                if (m_launchFailures >= MAX_CONSECUTIVE_LAUNCH_FAILURES) {
                    qCCritical(lcElephantine) << "Giving up after" << m_launchFailures << "consecutive dialog failures";
                    m_state = State::Terminated;
                }
                return;

            case DialogResult::Status::Cancelled: sink.send(Response::err(Error(GPG_ERR_CANCELED))); return;

            case DialogResult::Status::Accepted: break;
        }
        sink.send(Response::ok());
    }

    void Session::handleGetPin(ResponseSink& sink) {
        DialogResult result = runDialog(DialogKind::Pin);
        m_errorText.clear();

        if (result.status != DialogResult::Status::Accepted) {
            sendDialogOutcome(result, sink);
            return;
        }

        if (!result.secret.isEmpty())
            sink.send(Response::data(result.secret.view()));
        result.secret.wipe();
        sink.send(Response::ok());
    }

    void Session::handleConfirm(const QByteArray& argument, ResponseSink& sink) {
        const QByteArray flag = argument.trimmed();
        if (!flag.isEmpty() && flag != "--one-button") {
            sink.send(Response::err(Error(GPG_ERR_ASS_PARAMETER), "Unknown CONFIRM flag"));
            return;
        }

        const DialogResult result = runDialog(DialogKind::Confirm, !flag.isEmpty());
        m_errorText.clear();
        sendDialogOutcome(result, sink);
    }

    void Session::handleMessage(ResponseSink& sink) {
        const DialogResult result = runDialog(DialogKind::Message, true);

        // Dismissing a message is not a refusal.
        if (result.status == DialogResult::Status::Cancelled) {
            sink.send(Response::ok());
            return;
        }
        sendDialogOutcome(result, sink);
    }

    void Session::handleGetInfo(const QByteArray& argument, ResponseSink& sink) {
        const QByteArray key = argument.trimmed();
        QByteArray       value;

        if (key == "flavor")
            value = PINENTRY_FLAVOR;
        else if (key == "version")
            value = PROJECT_VERSION;
        else if (key == "pid")
            value = QByteArray::number(static_cast<qint64>(::getpid()));
        else if (key == "ttyinfo")
            value = ttyInfo().toUtf8();
        else {
            sink.send(Response::err(Error(GPG_ERR_ASS_PARAMETER), "Unknown GETINFO key"));
            return;
        }

        sink.send(Response::data(value));
        sink.send(Response::ok());
    }

    void Session::handleHelp(ResponseSink& sink) {
        for (Verb verb : assuan::supportedVerbs())
            sink.send(Response::comment(assuan::verbName(verb)));
        sink.send(Response::ok());
    }

    QString Session::optionValue(const QString& name) const {
        return m_options.value(name);
    }

    QString Session::ttyInfo() const {
        const DialogRequest request = makeDialogRequest();
        auto                orDash  = [](const QString& s) { return s.isEmpty() ? QStringLiteral("-") : s; };
        return QString("%1 %2 %3 %4 %5/%6 %7")
            .arg(orDash(request.ttyname), orDash(request.ttytype), orDash(request.display), orDash(request.ttyalert))
            .arg(::geteuid())
            .arg(::getegid())
            .arg(request.grab == GrabMode::None ? 0 : 1);
    }

    DialogRequest Session::makeDialogRequest(bool oneButton) const {
        DialogRequest request;
        request.description       = m_description.isEmpty() ? QString(DEFAULT_DESCRIPTION) : m_description;
        request.prompt            = firstNonEmpty(m_prompt, optionValue("default-prompt"), DEFAULT_PROMPT);
        request.okLabel           = firstNonEmpty(m_okLabel, optionValue("default-ok"), DEFAULT_OK_LABEL);
        request.cancelLabel       = firstNonEmpty(m_cancelLabel, optionValue("default-cancel"), DEFAULT_CANCEL_LABEL);
        request.notOkLabel        = firstNonEmpty(m_notOkLabel, optionValue("default-notok"));
        request.errorText         = m_errorText;
        request.title             = m_title;
        request.keyinfo           = m_keyinfo;
        request.repeat            = m_repeat;
        request.repeatError       = m_repeatError;
        request.repeatOk          = m_repeatOk;
        request.qualityBar        = m_qualityBar;
        request.qualityBarTooltip = m_qualityBarTooltip;
        request.genpinLabel       = m_genpinLabel;
        request.genpinTooltip     = m_genpinTooltip;
        request.oneButton         = oneButton;

        request.display    = firstNonEmpty(optionValue("display"), m_config.display);
        request.ttyname    = firstNonEmpty(optionValue("ttyname"), m_config.ttyname);
        request.ttytype    = firstNonEmpty(optionValue("ttytype"), m_config.ttytype);
        request.lcCtype    = firstNonEmpty(optionValue("lc-ctype"), m_config.lcCtype);
        request.lcMessages = firstNonEmpty(optionValue("lc-messages"), m_config.lcMessages);
        request.parentWid  = firstNonEmpty(optionValue("parent-wid"), m_config.parentWid);
        request.colors     = firstNonEmpty(optionValue("colors"), m_config.colors);
        request.ttyalert   = firstNonEmpty(optionValue("ttyalert"), m_config.ttyalert);

        if (m_options.contains("no-grab"))
            request.grab = GrabMode::None;
        else if (m_options.contains("grab"))
            request.grab = GrabMode::Global;
        else
            request.grab = m_config.noGlobalGrab ? GrabMode::Local : GrabMode::Global;

        return request;
    }

} // namespace elephantine
