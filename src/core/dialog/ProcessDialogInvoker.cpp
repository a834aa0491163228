#include "ProcessDialogInvoker.hpp"
#include "../../common/Config.hpp"
#include "../../common/Constants.hpp"
#include "../../common/Logging.hpp"

#include <QEventLoop>
#include <QHash>
#include <QProcess>
#include <QTimer>

#include <signal.h>
#include <unistd.h>

#include <algorithm>
#include <utility>

namespace elephantine {

    namespace {

        enum class WaitOutcome {
            Pending,
            Exited,
            TimedOut
        };

        // Each placeholder is replaced once; substituted text is never rescanned.
        QString expandPlaceholders(const QString& argument, const QHash<QString, QString>& values) {
            QString   result;
            qsizetype pos = 0;
            while (pos < argument.size()) {
                const qsizetype open = argument.indexOf('{', pos);
                if (open < 0)
                    break;
                const qsizetype close = argument.indexOf('}', open + 1);
                if (close < 0)
                    break;

                const QString key = argument.mid(open + 1, close - open - 1);
                auto          it  = values.constFind(key);
                if (it == values.constEnd()) {
                    result += argument.mid(pos, open + 1 - pos);
                    pos = open + 1;
                    continue;
                }

                result += argument.mid(pos, open - pos);
                result += it.value();
                pos = close + 1;
            }
            result += argument.mid(pos);
            return result;
        }

        void setOrRemove(QProcessEnvironment& env, const QString& name, const QString& value) {
            if (value.isEmpty())
                env.remove(name);
            else
                env.insert(name, value);
        }

        void insertIfKnown(QProcessEnvironment& env, const QString& name, const QString& value) {
            if (!value.isEmpty())
                env.insert(name, value);
        }

        // SIGKILL to the whole group (the dialog may have spawned helpers), then reap the leader.
        void killAndReap(QProcess& process) {
            const qint64 pid = process.processId();
            if (pid > 0)
                ::kill(-static_cast<pid_t>(pid), SIGKILL);
            process.kill();
            if (!process.waitForFinished(KILL_REAP_TIMEOUT_MS))
                qCWarning(lcElephantine) << "Dialog process" << pid << "was not reaped after SIGKILL";
        }

    } // namespace

    ProcessDialogInvoker::ProcessDialogInvoker(QStringList pinCommand, QStringList confirmCommand, QStringList messageCommand) :
        m_pinCommand(std::move(pinCommand)), m_confirmCommand(std::move(confirmCommand)), m_messageCommand(std::move(messageCommand)),
        m_baseEnvironment(QProcessEnvironment::systemEnvironment()) {}

    ProcessDialogInvoker::ProcessDialogInvoker(const Config& config) : ProcessDialogInvoker(config.command, config.confirmCommand, config.messageCommand) {}

    QStringList ProcessDialogInvoker::commandFor(DialogKind kind) const {
        switch (kind) {
            case DialogKind::Pin: return m_pinCommand;
            case DialogKind::Confirm: return m_confirmCommand.isEmpty() ? m_pinCommand : m_confirmCommand;
            case DialogKind::Message: return m_messageCommand.isEmpty() ? m_pinCommand : m_messageCommand;
        }
        return m_pinCommand;
    }

    QStringList ProcessDialogInvoker::expandArguments(const QStringList& arguments, DialogKind kind, const DialogRequest& request) {
        const QHash<QString, QString> values{
            {"description", request.description},
            {"prompt", request.prompt},
            {"error", request.errorText},
            {"ok", request.okLabel},
            {"cancel", request.cancelLabel},
            {"title", request.title},
            {"kind", dialogKindName(kind)},
        };

        QStringList expanded;
        expanded.reserve(arguments.size());
        for (const QString& argument : arguments)
            expanded << expandPlaceholders(argument, values);
        return expanded;
    }

    QProcessEnvironment ProcessDialogInvoker::buildEnvironment(DialogKind kind, const DialogRequest& request, std::chrono::seconds timeout) const {
        QProcessEnvironment env = m_baseEnvironment;

        env.insert("ELEPHANTINE_KIND", dialogKindName(kind));
        env.insert("ELEPHANTINE_TIMEOUT", QString::number(timeout.count()));
        env.insert("ELEPHANTINE_GRAB", grabModeName(request.grab));
        env.insert("ELEPHANTINE_ONE_BUTTON", request.oneButton ? "1" : "0");

        setOrRemove(env, "ELEPHANTINE_DESCRIPTION", request.description);
        setOrRemove(env, "ELEPHANTINE_PROMPT", request.prompt);
        setOrRemove(env, "ELEPHANTINE_ERROR", request.errorText);
        setOrRemove(env, "ELEPHANTINE_OK", request.okLabel);
        setOrRemove(env, "ELEPHANTINE_CANCEL", request.cancelLabel);
        setOrRemove(env, "ELEPHANTINE_NOTOK", request.notOkLabel);
        setOrRemove(env, "ELEPHANTINE_TITLE", request.title);
        setOrRemove(env, "ELEPHANTINE_KEYINFO", request.keyinfo);
        setOrRemove(env, "ELEPHANTINE_REPEAT", request.repeat);
        setOrRemove(env, "ELEPHANTINE_REPEAT_ERROR", request.repeatError);
        setOrRemove(env, "ELEPHANTINE_REPEAT_OK", request.repeatOk);
        setOrRemove(env, "ELEPHANTINE_QUALITYBAR", request.qualityBar);
        setOrRemove(env, "ELEPHANTINE_QUALITYBAR_TT", request.qualityBarTooltip);
        setOrRemove(env, "ELEPHANTINE_GENPIN", request.genpinLabel);
        setOrRemove(env, "ELEPHANTINE_GENPIN_TT", request.genpinTooltip);
        setOrRemove(env, "ELEPHANTINE_PARENT_WID", request.parentWid);
        setOrRemove(env, "ELEPHANTINE_COLORS", request.colors);
        setOrRemove(env, "ELEPHANTINE_TTYALERT", request.ttyalert);

        insertIfKnown(env, "DISPLAY", request.display);
        insertIfKnown(env, "GPG_TTY", request.ttyname);
        insertIfKnown(env, "TERM", request.ttytype);
        insertIfKnown(env, "LC_CTYPE", request.lcCtype);
        insertIfKnown(env, "LC_MESSAGES", request.lcMessages);

        return env;
    }

    DialogResult ProcessDialogInvoker::invoke(DialogKind kind, const DialogRequest& request, std::chrono::seconds timeout) {
        const QStringList command = commandFor(kind);
        if (command.isEmpty() || command.first().isEmpty())
            return DialogResult::failed("no dialog command configured");

        QProcess process;
        process.setProgram(command.first());
        process.setArguments(expandArguments(command.mid(1), kind, request));
        process.setProcessEnvironment(buildEnvironment(kind, request, timeout));
        process.setChildProcessModifier([] { ::setpgid(0, 0); });
        if (kind != DialogKind::Pin)
            process.setStandardOutputFile(QProcess::nullDevice());

        qCDebug(lcElephantine) << "Starting" << dialogKindName(kind) << "dialog:" << process.program() << "timeout" << timeout.count() << "s";

        process.start(QIODevice::ReadWrite);
        if (!process.waitForStarted()) {
            const QString reason = QString("%1: %2").arg(process.program(), process.errorString());
            qCWarning(lcElephantine) << "Failed to start dialog:" << reason;
            if (process.state() != QProcess::NotRunning)
                killAndReap(process);
            return DialogResult::failed(reason);
        }
        process.closeWriteChannel();

        // Process exit and watchdog race; the first one to fire decides the outcome.
        WaitOutcome outcome = WaitOutcome::Pending;
        QEventLoop  loop;
        QTimer      watchdog;
        watchdog.setSingleShot(true);

        QObject::connect(&process, &QProcess::finished, &loop, [&outcome, &loop]() {
            if (outcome == WaitOutcome::Pending)
                outcome = WaitOutcome::Exited;
            loop.quit();
        });
        QObject::connect(&watchdog, &QTimer::timeout, &loop, [&outcome, &loop]() {
            if (outcome == WaitOutcome::Pending)
                outcome = WaitOutcome::TimedOut;
            loop.quit();
        });

        // QTimer takes int milliseconds.
        if (timeout.count() > 0)
            watchdog.start(std::min(timeout, std::chrono::seconds(MAX_TIMEOUT_SECONDS)));

        if (process.state() != QProcess::NotRunning)
            loop.exec();
        else
            outcome = WaitOutcome::Exited;
        watchdog.stop();

        if (outcome == WaitOutcome::TimedOut) {
            qCInfo(lcElephantine) << "Dialog timed out after" << timeout.count() << "s, killing pid" << process.processId();
            killAndReap(process);
            return DialogResult::timedOut();
        }

        const QByteArray errorOutput = process.readAllStandardError().trimmed();
        if (!errorOutput.isEmpty())
            qCDebug(lcElephantine) << "Dialog stderr:" << errorOutput;

        if (process.exitStatus() == QProcess::CrashExit) {
            QByteArray partial = process.readAllStandardOutput();
            SecretBuffer::takeFrom(partial).wipe();
            return DialogResult::failed(QString("%1 crashed").arg(process.program()));
        }

        qCDebug(lcElephantine) << "Dialog exited with code" << process.exitCode();

        if (kind != DialogKind::Pin)
            return process.exitCode() == 0 ? DialogResult::accepted() : DialogResult::cancelled();

        QByteArray   output = process.readAllStandardOutput();
        SecretBuffer secret = SecretBuffer::takeFrom(output);
        if (process.exitCode() != 0)
            return DialogResult::cancelled();

        secret.chopTrailingNewline();
        return DialogResult::accepted(std::move(secret));
    }

} // namespace elephantine
