#include "../src/common/Config.hpp"
#include "../src/common/Constants.hpp"
#include "../src/core/Session.hpp"
#include "../src/core/assuan/Codec.hpp"

#include <QtTest/QtTest>
#include <QCoreApplication>

#include <deque>
#include <utility>
#include <vector>

int runCodecTests(int argc, char** argv);
int runSecretBufferTests(int argc, char** argv);
int runDialogInvokerTests(int argc, char** argv);
int runTransportTests(int argc, char** argv);
int runConfigTests(int argc, char** argv);

namespace elephantine {

    namespace {

        struct SentResponse {
            assuan::Response::Kind kind;
            QByteArray             text;
            assuan::Error          error;
            QByteArray             payload;
        };

        class RecordingSink : public ResponseSink {
          public:
            void send(const assuan::Response& response) override {
                m_sent.push_back({response.kind, response.text, response.error, response.payload.toByteArray()});
            }

            const std::vector<SentResponse>& sent() const {
                return m_sent;
            }
            const SentResponse& last() const {
                return m_sent.back();
            }
            void clear() {
                m_sent.clear();
            }

          private:
            std::vector<SentResponse> m_sent;
        };

        struct Invocation {
            DialogKind           kind;
            DialogRequest        request;
            std::chrono::seconds timeout;
        };

        class FakeDialogInvoker : public DialogInvoker {
          public:
            DialogResult invoke(DialogKind kind, const DialogRequest& request, std::chrono::seconds timeout) override {
                m_invocations.push_back({kind, request, timeout});
                if (m_results.empty())
                    return DialogResult::cancelled();
                DialogResult result = std::move(m_results.front());
                m_results.pop_front();
                return result;
            }

            void enqueue(DialogResult result) {
                m_results.push_back(std::move(result));
            }
            void clear() {
                m_results.clear();
                m_invocations.clear();
            }

            const std::vector<Invocation>& invocations() const {
                return m_invocations;
            }

          private:
            std::deque<DialogResult> m_results;
            std::vector<Invocation>  m_invocations;
        };

        assuan::Command command(const QByteArray& line) {
            const auto decoded = assuan::decodeLine(line);
            return decoded ? *decoded : assuan::Command{};
        }

    } // namespace

    class SessionTest : public QObject {
        Q_OBJECT

      private slots:
        void init() {
            m_config = Config::defaults();
            m_config.timeoutSeconds = 60;
            m_invoker.clear();
            m_sink.clear();
        }

        void setCommandsAnswerOk() {
            Session session(m_config, m_invoker);

            session.dispatch(command("SETDESC Enter%20passphrase%0Afor key"), m_sink);
            session.dispatch(command("SETPROMPT Passphrase:"), m_sink);
            session.dispatch(command("SETTITLE Unlock"), m_sink);
            session.dispatch(command("SETKEYINFO n/ABCDEF"), m_sink);

            QCOMPARE(m_sink.sent().size(), std::size_t(4));
            for (const SentResponse& r : m_sink.sent())
                QCOMPARE(r.kind, assuan::Response::Kind::Ok);

            QCOMPARE(session.description(), QString("Enter passphrase\nfor key"));
            QCOMPARE(session.prompt(), QString("Passphrase:"));
            QCOMPARE(session.title(), QString("Unlock"));
            QCOMPARE(session.keyinfo(), QString("n/ABCDEF"));
        }

        void getPinSendsDataThenOk() {
            m_invoker.enqueue(DialogResult::accepted(SecretBuffer(QByteArrayView("hunter2"))));
            Session session(m_config, m_invoker);

            session.dispatch(command("GETPIN"), m_sink);

            QCOMPARE(m_sink.sent().size(), std::size_t(2));
            QCOMPARE(m_sink.sent()[0].kind, assuan::Response::Kind::Data);
            QCOMPARE(m_sink.sent()[0].payload, QByteArray("hunter2"));
            QCOMPARE(m_sink.sent()[1].kind, assuan::Response::Kind::Ok);
        }

        void emptyPinSendsOnlyOk() {
            m_invoker.enqueue(DialogResult::accepted());
            Session session(m_config, m_invoker);

            session.dispatch(command("GETPIN"), m_sink);

            QCOMPARE(m_sink.sent().size(), std::size_t(1));
            QCOMPARE(m_sink.last().kind, assuan::Response::Kind::Ok);
        }

        void cancelledPinIsCanceledError() {
            m_invoker.enqueue(DialogResult::cancelled());
            Session session(m_config, m_invoker);

            session.dispatch(command("GETPIN"), m_sink);

            QCOMPARE(m_sink.sent().size(), std::size_t(1));
            QCOMPARE(m_sink.last().kind, assuan::Response::Kind::Err);
            QCOMPARE(m_sink.last().error.code(), GPG_ERR_CANCELED);
            QCOMPARE(m_sink.last().error.value(), gpg_error_t(83886179));
            QVERIFY(!session.isTerminated());
        }

        void timedOutDialogIsTimeoutError() {
            m_invoker.enqueue(DialogResult::timedOut());
            Session session(m_config, m_invoker);

            session.dispatch(command("CONFIRM"), m_sink);

            QCOMPARE(m_sink.last().kind, assuan::Response::Kind::Err);
            QCOMPARE(m_sink.last().error.code(), GPG_ERR_TIMEOUT);
        }

        void failedDialogIsNoPinEntryError() {
            m_invoker.enqueue(DialogResult::failed("walker: No such file or directory"));
            Session session(m_config, m_invoker);

            session.dispatch(command("GETPIN"), m_sink);

            QCOMPARE(m_sink.last().kind, assuan::Response::Kind::Err);
            QCOMPARE(m_sink.last().error.code(), GPG_ERR_NO_PIN_ENTRY);
            QCOMPARE(m_sink.last().text, QByteArray("walker: No such file or directory"));
            QCOMPARE(session.consecutiveLaunchFailures(), 1);
            QVERIFY(!session.isTerminated());
        }

        void repeatedLaunchFailuresTerminateSession() {
            for (int i = 0; i < MAX_CONSECUTIVE_LAUNCH_FAILURES; ++i)
                m_invoker.enqueue(DialogResult::failed("broken"));
            Session session(m_config, m_invoker);

            for (int i = 0; i < MAX_CONSECUTIVE_LAUNCH_FAILURES; ++i) {
                QVERIFY(!session.isTerminated());
                session.dispatch(command("GETPIN"), m_sink);
                QCOMPARE(m_sink.last().error.code(), GPG_ERR_NO_PIN_ENTRY);
            }
            QVERIFY(session.isTerminated());

            session.dispatch(command("NOP"), m_sink);
            QCOMPARE(m_sink.last().error.code(), GPG_ERR_ASS_UNEXPECTED_CMD);
            QCOMPARE(m_invoker.invocations().size(), std::size_t(MAX_CONSECUTIVE_LAUNCH_FAILURES));
        }

        void successResetsLaunchFailureCount() {
            m_invoker.enqueue(DialogResult::failed("broken"));
            m_invoker.enqueue(DialogResult::failed("broken"));
            m_invoker.enqueue(DialogResult::accepted());
            m_invoker.enqueue(DialogResult::failed("broken"));
            Session session(m_config, m_invoker);

            for (int i = 0; i < 4; ++i)
                session.dispatch(command("CONFIRM"), m_sink);

            QCOMPARE(session.consecutiveLaunchFailures(), 1);
            QVERIFY(!session.isTerminated());
        }

        void confirmExitNonZeroIsCancel() {
            m_invoker.enqueue(DialogResult::cancelled());
            Session session(m_config, m_invoker);

            session.dispatch(command("CONFIRM"), m_sink);

            QCOMPARE(m_sink.last().error.value(), gpg_error_t(83886179));
            QCOMPARE(m_invoker.invocations().front().kind, DialogKind::Confirm);
            QVERIFY(!m_invoker.invocations().front().request.oneButton);
        }

        void confirmOneButton() {
            m_invoker.enqueue(DialogResult::accepted());
            Session session(m_config, m_invoker);

            session.dispatch(command("CONFIRM --one-button"), m_sink);

            QCOMPARE(m_sink.last().kind, assuan::Response::Kind::Ok);
            QVERIFY(m_invoker.invocations().front().request.oneButton);
        }

        void confirmRejectsUnknownFlag() {
            Session session(m_config, m_invoker);

            session.dispatch(command("CONFIRM --bogus"), m_sink);

            QCOMPARE(m_sink.last().error.code(), GPG_ERR_ASS_PARAMETER);
            QVERIFY(m_invoker.invocations().empty());
        }

        void messageDismissIsOk() {
            m_invoker.enqueue(DialogResult::cancelled());
            Session session(m_config, m_invoker);

            session.dispatch(command("MESSAGE"), m_sink);

            QCOMPARE(m_sink.last().kind, assuan::Response::Kind::Ok);
            QCOMPARE(m_invoker.invocations().front().kind, DialogKind::Message);
            QVERIFY(m_invoker.invocations().front().request.oneButton);
        }

        void errorTextIsOneShot() {
            m_invoker.enqueue(DialogResult::cancelled());
            m_invoker.enqueue(DialogResult::cancelled());
            Session session(m_config, m_invoker);

            session.dispatch(command("SETERROR Bad passphrase"), m_sink);
            session.dispatch(command("GETPIN"), m_sink);
            session.dispatch(command("GETPIN"), m_sink);

            QCOMPARE(m_invoker.invocations()[0].request.errorText, QString("Bad passphrase"));
            QVERIFY(m_invoker.invocations()[1].request.errorText.isEmpty());
            QVERIFY(session.errorText().isEmpty());
        }

        void dialogRequestFallsBackToDefaults() {
            Session             session(m_config, m_invoker);
            const DialogRequest request = session.makeDialogRequest();

            QCOMPARE(request.description, QString(DEFAULT_DESCRIPTION));
            QCOMPARE(request.prompt, QString(DEFAULT_PROMPT));
            QCOMPARE(request.okLabel, QString(DEFAULT_OK_LABEL));
            QCOMPARE(request.cancelLabel, QString(DEFAULT_CANCEL_LABEL));
            QVERIFY(request.notOkLabel.isEmpty());
        }

        void defaultOptionsApplyWhenUnset() {
            Session session(m_config, m_invoker);

            session.dispatch(command("OPTION default-ok=_Unlock"), m_sink);
            session.dispatch(command("OPTION default-prompt=Passphrase:"), m_sink);
            QCOMPARE(session.makeDialogRequest().okLabel, QString("_Unlock"));
            QCOMPARE(session.makeDialogRequest().prompt, QString("Passphrase:"));

            session.dispatch(command("SETOK Sign"), m_sink);
            QCOMPARE(session.makeDialogRequest().okLabel, QString("Sign"));
        }

        void optionForms_data() {
            QTest::addColumn<QByteArray>("line");
            QTest::addColumn<QString>("name");
            QTest::addColumn<QString>("value");

            QTest::newRow("equals") << QByteArray("OPTION ttyname=/dev/pts/3") << QString("ttyname") << QString("/dev/pts/3");
            QTest::newRow("blank") << QByteArray("OPTION ttytype xterm") << QString("ttytype") << QString("xterm");
            QTest::newRow("spaced equals") << QByteArray("OPTION lc-ctype = C.UTF-8") << QString("lc-ctype") << QString("C.UTF-8");
            QTest::newRow("dashed") << QByteArray("OPTION --display=:1") << QString("display") << QString(":1");
            QTest::newRow("flag") << QByteArray("OPTION no-grab") << QString("no-grab") << QString();
            QTest::newRow("upper case name") << QByteArray("OPTION Allow-External-Password-Cache") << QString("allow-external-password-cache")
                                             << QString();
        }

        void optionForms() {
            QFETCH(QByteArray, line);
            QFETCH(QString, name);
            QFETCH(QString, value);

            Session session(m_config, m_invoker);
            session.dispatch(command(line), m_sink);

            QCOMPARE(m_sink.last().kind, assuan::Response::Kind::Ok);
            QVERIFY(session.options().contains(name));
            QCOMPARE(session.options().value(name), value);
        }

        void optionWithoutNameIsRejected() {
            Session session(m_config, m_invoker);
            session.dispatch(command("OPTION =value"), m_sink);
            QCOMPARE(m_sink.last().error.code(), GPG_ERR_ASS_PARAMETER);
        }

        void optionsOverrideDisplayContext() {
            m_config.display = ":0";
            m_config.ttyname = "/dev/tty1";
            Session session(m_config, m_invoker);

            session.dispatch(command("OPTION display=:7"), m_sink);
            const DialogRequest request = session.makeDialogRequest();

            QCOMPARE(request.display, QString(":7"));
            QCOMPARE(request.ttyname, QString("/dev/tty1"));
        }

        void grabOptionsSelectGrabMode() {
            Session session(m_config, m_invoker);
            QCOMPARE(session.makeDialogRequest().grab, GrabMode::Global);

            session.dispatch(command("OPTION no-grab"), m_sink);
            QCOMPARE(session.makeDialogRequest().grab, GrabMode::None);

            session.dispatch(command("OPTION grab"), m_sink);
            QCOMPARE(session.makeDialogRequest().grab, GrabMode::Global);
            QVERIFY(!session.options().contains("no-grab"));

            m_config.noGlobalGrab = true;
            Session local(m_config, m_invoker);
            QCOMPARE(local.makeDialogRequest().grab, GrabMode::Local);
        }

        void setTimeoutUpdatesDialogTimeout() {
            m_invoker.enqueue(DialogResult::accepted());
            Session session(m_config, m_invoker);
            QCOMPARE(session.timeoutSeconds(), 60);

            session.dispatch(command("SETTIMEOUT 5"), m_sink);
            QCOMPARE(m_sink.last().kind, assuan::Response::Kind::Ok);
            session.dispatch(command("CONFIRM"), m_sink);

            QCOMPARE(m_invoker.invocations().front().timeout.count(), std::chrono::seconds(5).count());
        }

        void setTimeoutZeroDisablesTimeout() {
            Session session(m_config, m_invoker);
            session.dispatch(command("SETTIMEOUT 0"), m_sink);
            QCOMPARE(m_sink.last().kind, assuan::Response::Kind::Ok);
            QCOMPARE(session.timeoutSeconds(), 0);
        }

        void setTimeoutAcceptsLargestValue() {
            Session session(m_config, m_invoker);
            session.dispatch(command("SETTIMEOUT " + QByteArray::number(MAX_TIMEOUT_SECONDS)), m_sink);
            QCOMPARE(m_sink.last().kind, assuan::Response::Kind::Ok);
            QCOMPARE(session.timeoutSeconds(), MAX_TIMEOUT_SECONDS);
        }

        void setTimeoutRejectsOversizeValue_data() {
            QTest::addColumn<QByteArray>("value");
            QTest::newRow("one past the limit") << QByteArray::number(MAX_TIMEOUT_SECONDS + 1);
            QTest::newRow("milliseconds overflow int") << QByteArray("4294968");
            QTest::newRow("beyond int") << QByteArray("99999999999999999999");
        }

        void setTimeoutRejectsOversizeValue() {
            QFETCH(QByteArray, value);
            Session session(m_config, m_invoker);

            session.dispatch(command("SETTIMEOUT " + value), m_sink);

            QCOMPARE(m_sink.last().kind, assuan::Response::Kind::Err);
            QCOMPARE(m_sink.last().error.code(), GPG_ERR_ASS_PARAMETER);
            QCOMPARE(session.timeoutSeconds(), 60);
        }

        void setTimeoutRejectsGarbage_data() {
            QTest::addColumn<QByteArray>("line");
            QTest::newRow("negative") << QByteArray("SETTIMEOUT -1");
            QTest::newRow("word") << QByteArray("SETTIMEOUT soon");
            QTest::newRow("empty") << QByteArray("SETTIMEOUT");
            QTest::newRow("fraction") << QByteArray("SETTIMEOUT 1.5");
        }

        void setTimeoutRejectsGarbage() {
            QFETCH(QByteArray, line);
            Session session(m_config, m_invoker);

            session.dispatch(command(line), m_sink);

            QCOMPARE(m_sink.last().error.code(), GPG_ERR_ASS_SYNTAX);
            QCOMPARE(session.timeoutSeconds(), 60);
        }

        void resetClearsState() {
            Session session(m_config, m_invoker);
            session.dispatch(command("SETDESC something"), m_sink);
            session.dispatch(command("SETERROR wrong"), m_sink);
            session.dispatch(command("SETTIMEOUT 3"), m_sink);
            session.dispatch(command("OPTION ttyname=/dev/pts/9"), m_sink);

            session.dispatch(command("RESET"), m_sink);

            QCOMPARE(m_sink.last().kind, assuan::Response::Kind::Ok);
            QVERIFY(session.description().isEmpty());
            QVERIFY(session.errorText().isEmpty());
            QVERIFY(session.options().isEmpty());
            QCOMPARE(session.timeoutSeconds(), 60);
            QVERIFY(!session.isTerminated());
        }

        void getInfoAnswersWithData_data() {
            QTest::addColumn<QByteArray>("key");
            QTest::addColumn<QByteArray>("expected");

            QTest::newRow("flavor") << QByteArray("flavor") << QByteArray(PINENTRY_FLAVOR);
            QTest::newRow("version") << QByteArray("version") << QByteArray(PROJECT_VERSION);
            QTest::newRow("pid") << QByteArray("pid") << QByteArray::number(QCoreApplication::applicationPid());
        }

        void getInfoAnswersWithData() {
            QFETCH(QByteArray, key);
            QFETCH(QByteArray, expected);
            Session session(m_config, m_invoker);

            session.dispatch(command("GETINFO " + key), m_sink);

            QCOMPARE(m_sink.sent().size(), std::size_t(2));
            QCOMPARE(m_sink.sent()[0].kind, assuan::Response::Kind::Data);
            QCOMPARE(m_sink.sent()[0].payload, expected);
            QCOMPARE(m_sink.sent()[1].kind, assuan::Response::Kind::Ok);
        }

        void getInfoTtyInfo() {
            m_config.ttyname = "/dev/pts/2";
            Session session(m_config, m_invoker);

            session.dispatch(command("GETINFO ttyinfo"), m_sink);

            const QList<QByteArray> fields = m_sink.sent()[0].payload.split(' ');
            QCOMPARE(fields.size(), qsizetype(6));
            QCOMPARE(fields[0], QByteArray("/dev/pts/2"));
            QCOMPARE(fields[5], QByteArray("1"));
        }

        void getInfoUnknownKey() {
            Session session(m_config, m_invoker);
            session.dispatch(command("GETINFO bogus"), m_sink);
            QCOMPARE(m_sink.sent().size(), std::size_t(1));
            QCOMPARE(m_sink.last().error.code(), GPG_ERR_ASS_PARAMETER);
        }

        void helpListsCommands() {
            Session session(m_config, m_invoker);
            session.dispatch(command("HELP"), m_sink);

            QCOMPARE(m_sink.last().kind, assuan::Response::Kind::Ok);
            QStringList listed;
            for (const SentResponse& r : m_sink.sent()) {
                if (r.kind == assuan::Response::Kind::Comment)
                    listed << QString::fromLatin1(r.text);
            }
            for (const char* verb : {"GETPIN", "BYE", "END", "QUIT", "CANCEL", "AUTH"})
                QVERIFY2(listed.contains(QString::fromLatin1(verb)), verb);
        }

        void unknownCommandKeepsSessionActive() {
            Session session(m_config, m_invoker);
            session.dispatch(command("FROBNICATE"), m_sink);

            QCOMPARE(m_sink.last().error.code(), GPG_ERR_ASS_UNKNOWN_CMD);
            QCOMPARE(session.state(), Session::State::Active);
        }

        void closeVerbsTerminateSession_data() {
            QTest::addColumn<QByteArray>("line");
            QTest::newRow("END") << QByteArray("END");
            QTest::newRow("QUIT") << QByteArray("QUIT");
            QTest::newRow("CANCEL") << QByteArray("CANCEL");
            QTest::newRow("AUTH") << QByteArray("AUTH");
            QTest::newRow("lower case quit") << QByteArray("quit");
        }

        void closeVerbsTerminateSession() {
            QFETCH(QByteArray, line);
            Session session(m_config, m_invoker);

            session.dispatch(command(line), m_sink);

            QCOMPARE(m_sink.sent().size(), std::size_t(1));
            QCOMPARE(m_sink.last().kind, assuan::Response::Kind::Ok);
            QCOMPARE(m_sink.last().text, QByteArray("closing connection"));
            QVERIFY(session.isTerminated());
        }

        void setCancelIsNotCancel() {
            Session session(m_config, m_invoker);
            session.dispatch(command("SETCANCEL Abort"), m_sink);

            QCOMPARE(session.cancelLabel(), QString("Abort"));
            QVERIFY(!session.isTerminated());
        }

        void nonUtf8TextIsReplaced() {
            Session session(m_config, m_invoker);
            session.dispatch(command("SETDESC caf%E9"), m_sink);

            QCOMPARE(m_sink.last().kind, assuan::Response::Kind::Ok);
            QCOMPARE(session.description(), QString("caf") + QChar(QChar::ReplacementCharacter));
        }

        void byeTerminatesSession() {
            Session session(m_config, m_invoker);
            session.dispatch(command("BYE"), m_sink);

            QCOMPARE(m_sink.last().kind, assuan::Response::Kind::Ok);
            QCOMPARE(m_sink.last().text, QByteArray("closing connection"));
            QCOMPARE(session.state(), Session::State::Terminated);

            session.dispatch(command("GETPIN"), m_sink);
            QCOMPARE(m_sink.last().error.code(), GPG_ERR_ASS_UNEXPECTED_CMD);
            QVERIFY(m_invoker.invocations().empty());
        }

      private:
        Config            m_config;
        FakeDialogInvoker m_invoker;
        RecordingSink     m_sink;
    };

} // namespace elephantine

int main(int argc, char** argv) {
    QCoreApplication         app(argc, argv);
    elephantine::SessionTest sessionTest;
    const int                sessionResult      = QTest::qExec(&sessionTest, argc, argv);
    const int                codecResult        = runCodecTests(argc, argv);
    const int                secretBufferResult = runSecretBufferTests(argc, argv);
    const int                configResult       = runConfigTests(argc, argv);
    const int                invokerResult      = runDialogInvokerTests(argc, argv);
    const int                transportResult    = runTransportTests(argc, argv);

    for (int result : {sessionResult, codecResult, secretBufferResult, configResult, invokerResult, transportResult}) {
        if (result != 0)
            return result;
    }
    return 0;
}

#include "test_session.moc"
