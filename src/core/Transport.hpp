#pragma once

#include "Session.hpp"

#include <istream>
#include <ostream>

namespace elephantine {

    // Line loop between the agent's pipe and the session. Strictly one command
    // at a time: a running dialog blocks further reads.
    class Transport : public ResponseSink {
      public:
        enum class ExitReason {
            Terminated, // BYE or the session gave up
            EndOfInput,
            IoError
        };

        Transport(std::istream& input, std::ostream& output);

        // Sends the greeting, then serves until BYE, end of input or an I/O failure.
        ExitReason run(Session& session);

        void       send(const assuan::Response& response) override;

      private:
        std::istream& m_input;
        std::ostream& m_output;
        bool          m_writeFailed = false;
    };

} // namespace elephantine
