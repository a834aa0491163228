#include "common/Config.hpp"
#include "common/Constants.hpp"
#include "common/Logging.hpp"
#include "modes/pinentry.hpp"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QProcessEnvironment>

#include <print>

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    app.setApplicationName(elephantine::PROJECT_NAME);
    app.setApplicationVersion(elephantine::PROJECT_VERSION);

    QCommandLineParser parser;
    parser.setApplicationDescription("Pinentry that delegates passphrase dialogs to an external program");
    parser.addHelpOption();
    parser.addVersionOption();
    elephantine::addCommandLineOptions(parser);
    parser.process(app);

    elephantine::setDebugLogging(parser.isSet("debug"));

    elephantine::Config config;
    try {
        config = elephantine::loadConfig(parser, QProcessEnvironment::systemEnvironment());
    } catch (const elephantine::ConfigError& e) {
        std::print(stderr, "{}: {}\n", elephantine::PROJECT_NAME, e.what());
        return 1;
    }

    elephantine::setDebugLogging(config.debug);

    return modes::runPinentry(config);
}
