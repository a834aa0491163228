#include "Config.hpp"
#include "Constants.hpp"
#include "Logging.hpp"
#include "Paths.hpp"

#include <QCommandLineParser>
#include <QFileInfo>
#include <QProcess>
#include <QSettings>

#include <string>

namespace elephantine {

    namespace {

        void overrideIfSet(QString& field, const QString& value) {
            if (!value.isEmpty())
                field = value;
        }

        bool parseFlag(const QString& value) {
            const QString v = value.trimmed().toLower();
            return v == "1" || v == "true" || v == "yes" || v == "on";
        }

    } // namespace

    Config Config::defaults() {
        Config config;
        config.timeoutSeconds = DEFAULT_TIMEOUT_SECONDS;
        config.command        = QProcess::splitCommand(QString::fromLatin1(DEFAULT_COMMAND));
        return config;
    }

    int parseTimeoutSeconds(const QString& value) {
        bool      ok      = false;
        const int seconds = value.trimmed().toInt(&ok);
        if (!ok || seconds < 0)
            throw ConfigError("invalid timeout value: " + value.toStdString());
        if (seconds > MAX_TIMEOUT_SECONDS)
            throw ConfigError("timeout value out of range (at most " + std::to_string(MAX_TIMEOUT_SECONDS) + " seconds): " + value.toStdString());
        return seconds;
    }

    QStringList parseCommand(const QString& value) {
        const QStringList args = QProcess::splitCommand(value);
        if (args.isEmpty())
            throw ConfigError("empty dialog command: \"" + value.toStdString() + "\"");
        return args;
    }

    void Config::loadFile(const QString& path) {
        QSettings settings(path, QSettings::IniFormat);
        if (settings.status() != QSettings::NoError)
            throw ConfigError("cannot read configuration file " + path.toStdString());

        qCDebug(lcElephantine) << "Loading configuration from" << path;

        if (settings.contains("timeout"))
            timeoutSeconds = parseTimeoutSeconds(settings.value("timeout").toString());
        if (settings.contains("command"))
            command = parseCommand(settings.value("command").toString());
        if (settings.contains("confirm-command"))
            confirmCommand = parseCommand(settings.value("confirm-command").toString());
        if (settings.contains("message-command"))
            messageCommand = parseCommand(settings.value("message-command").toString());
        if (settings.contains("debug"))
            debug = parseFlag(settings.value("debug").toString());
        if (settings.contains("no-global-grab"))
            noGlobalGrab = parseFlag(settings.value("no-global-grab").toString());

        overrideIfSet(display, settings.value("display").toString());
        overrideIfSet(ttyname, settings.value("ttyname").toString());
        overrideIfSet(ttytype, settings.value("ttytype").toString());
        overrideIfSet(lcCtype, settings.value("lc-ctype").toString());
        overrideIfSet(lcMessages, settings.value("lc-messages").toString());
        overrideIfSet(parentWid, settings.value("parent-wid").toString());
        overrideIfSet(colors, settings.value("colors").toString());
        overrideIfSet(ttyalert, settings.value("ttyalert").toString());
    }

    void Config::loadEnvironment(const QProcessEnvironment& env) {
        const QString pinentryDisplay = env.value("PINENTRY_DISPLAY");
        overrideIfSet(display, pinentryDisplay.isEmpty() ? env.value("DISPLAY") : pinentryDisplay);
        overrideIfSet(ttyname, env.value("GPG_TTY"));
        overrideIfSet(ttytype, env.value("TERM"));
        overrideIfSet(lcCtype, env.value("LC_CTYPE"));
        overrideIfSet(lcMessages, env.value("LC_MESSAGES"));

        if (env.contains("ELEPHANTINE_TIMEOUT"))
            timeoutSeconds = parseTimeoutSeconds(env.value("ELEPHANTINE_TIMEOUT"));
        if (env.contains("ELEPHANTINE_COMMAND"))
            command = parseCommand(env.value("ELEPHANTINE_COMMAND"));
        if (env.contains("ELEPHANTINE_NO_LOCAL_GRAB"))
            noGlobalGrab = parseFlag(env.value("ELEPHANTINE_NO_LOCAL_GRAB"));
    }

    void addCommandLineOptions(QCommandLineParser& parser) {
        parser.addOptions({
            {{"d", "debug"}, "Turn on debugging output."},
            {{"D", "display"}, "Set the X display.", "DISPLAY"},
            {{"T", "ttyname"}, "Set the tty terminal node name.", "FILE"},
            {{"N", "ttytype"}, "Set the tty terminal type.", "NAME"},
            {{"C", "lc-ctype"}, "Set the tty LC_CTYPE value.", "STRING"},
            {{"M", "lc-messages"}, "Set the tty LC_MESSAGES value.", "STRING"},
            {{"o", "timeout"}, "Timeout in seconds for dialogs (0 disables it).", "SECS"},
            {{"g", "no-global-grab"}, "Grab keyboard only while the window is focused."},
            {{"W", "parent-wid"}, "Parent window ID (for positioning).", "WINDOW_ID"},
            {{"c", "colors"}, "Custom colors for the dialog.", "STRING"},
            {{"a", "ttyalert"}, "The alert mode (none, beep or flash).", "STRING"},
            {"command", "Dialog command printing the passphrase to stdout.", "COMMAND"},
            {"confirm-command", "Dialog command for CONFIRM (defaults to --command).", "COMMAND"},
            {"message-command", "Dialog command for MESSAGE (defaults to --command).", "COMMAND"},
            {"config", "Read settings from FILE.", "FILE"},
        });
    }

    void Config::applyCommandLine(const QCommandLineParser& parser) {
        debug = debug || parser.isSet("debug");
        noGlobalGrab = noGlobalGrab || parser.isSet("no-global-grab");

        overrideIfSet(display, parser.value("display"));
        overrideIfSet(ttyname, parser.value("ttyname"));
        overrideIfSet(ttytype, parser.value("ttytype"));
        overrideIfSet(lcCtype, parser.value("lc-ctype"));
        overrideIfSet(lcMessages, parser.value("lc-messages"));
        overrideIfSet(parentWid, parser.value("parent-wid"));
        overrideIfSet(colors, parser.value("colors"));
        overrideIfSet(ttyalert, parser.value("ttyalert"));

        if (parser.isSet("timeout"))
            timeoutSeconds = parseTimeoutSeconds(parser.value("timeout"));
        if (parser.isSet("command"))
            command = parseCommand(parser.value("command"));
        if (parser.isSet("confirm-command"))
            confirmCommand = parseCommand(parser.value("confirm-command"));
        if (parser.isSet("message-command"))
            messageCommand = parseCommand(parser.value("message-command"));
    }

    Config loadConfig(const QCommandLineParser& parser, const QProcessEnvironment& env) {
        Config config = Config::defaults();

        if (parser.isSet("config")) {
            const QString path = parser.value("config");
            if (!QFileInfo(path).isReadable())
                throw ConfigError("cannot read configuration file " + path.toStdString());
            config.loadFile(path);
        } else if (const QString path = configFilePath(); QFileInfo::exists(path)) {
            config.loadFile(path);
        }

        config.loadEnvironment(env);
        config.applyCommandLine(parser);
        return config;
    }

} // namespace elephantine
