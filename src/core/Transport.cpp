#include "Transport.hpp"
#include "SecretBuffer.hpp"
#include "assuan/Codec.hpp"
#include "../common/Logging.hpp"

#include <string>

namespace elephantine {

    Transport::Transport(std::istream& input, std::ostream& output) : m_input(input), m_output(output) {}

    void Transport::send(const assuan::Response& response) {
        if (m_writeFailed)
            return;

        QByteArray bytes = assuan::encode(response);
        m_output.write(bytes.constData(), bytes.size());
        m_output.flush();

        if (response.kind == assuan::Response::Kind::Data)
            secureZero(bytes.data(), static_cast<std::size_t>(bytes.size()));

        if (!m_output) {
            qCCritical(lcElephantine) << "Failed to write response";
            m_writeFailed = true;
        }
    }

    Transport::ExitReason Transport::run(Session& session) {
        send(assuan::Response::ok("Pleased to meet you"));
        qCDebug(lcElephantine) << "Assuan server started";

        std::string line;
        while (!m_writeFailed && std::getline(m_input, line)) {
            assuan::DecodeError error;
            const auto          command = assuan::decodeLine(QByteArrayView(line.data(), static_cast<qsizetype>(line.size())), &error);

            if (!command) {
                if (error.kind != assuan::DecodeError::Ignored) {
                    qCDebug(lcElephantine) << "Rejecting line:" << error.message();
                    send(assuan::Response::err(error.toError(), error.message()));
                }
                continue;
            }

            session.dispatch(*command, *this);

            if (session.isTerminated())
                break;
        }

        if (m_writeFailed)
            return ExitReason::IoError;

        if (session.isTerminated())
            return ExitReason::Terminated;

        if (m_input.bad()) {
            qCCritical(lcElephantine) << "Failed to read from input";
            return ExitReason::IoError;
        }

        qCInfo(lcElephantine) << "Input closed before BYE";
        return ExitReason::EndOfInput;
    }

} // namespace elephantine
