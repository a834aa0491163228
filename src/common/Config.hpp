#pragma once

#include <QProcessEnvironment>
#include <QString>
#include <QStringList>

#include <stdexcept>

class QCommandLineParser;

namespace elephantine {

    class ConfigError : public std::runtime_error {
      public:
        using std::runtime_error::runtime_error;
    };

    // Settings handed to the engine at session start. Built once, then read-only.
    struct Config {
        QString     display;
        QString     ttyname;
        QString     ttytype;
        QString     lcCtype;
        QString     lcMessages;
        QString     parentWid;
        QString     colors;
        QString     ttyalert;
        int         timeoutSeconds = 0;
        bool        noGlobalGrab   = false;
        bool        debug          = false;

        QStringList command;
        QStringList confirmCommand;
        QStringList messageCommand;

        static Config defaults();

        // Each layer only overrides what it actually sets.
        void loadFile(const QString& path);
        void loadEnvironment(const QProcessEnvironment& env);
        void applyCommandLine(const QCommandLineParser& parser);
    };

    // Registers the pinentry-compatible options (-d, -D, -T, -N, -C, -M, -o, -g, -W, -c, -a, ...)
    void addCommandLineOptions(QCommandLineParser& parser);

    // Defaults, then config file (--config or the default path), environment, command line.
    // Throws ConfigError when an explicit config file is unusable or a value is invalid.
    Config loadConfig(const QCommandLineParser& parser, const QProcessEnvironment& env);

    // Non-negative whole seconds; throws ConfigError otherwise.
    int parseTimeoutSeconds(const QString& value);

    // Splits a command template with shell-like quoting; throws ConfigError when empty.
    QStringList parseCommand(const QString& value);

} // namespace elephantine
