#pragma once

#include "Errors.hpp"

#include <QByteArray>
#include <QByteArrayView>

namespace elephantine::assuan {

    // One protocol reply. Data responses only borrow their payload: the owner
    // (usually a SecretBuffer) must outlive the write.
    struct Response {
        enum class Kind {
            Ok,
            Err,
            Data,
            Comment
        };

        Kind           kind = Kind::Ok;
        QByteArray     text; // OK comment, ERR message or comment text
        Error          error;
        QByteArrayView payload;

        static Response ok(const QByteArray& comment = {}) {
            return Response{Kind::Ok, comment, {}, {}};
        }
        static Response err(Error error, const QByteArray& message = {}) {
            return Response{Kind::Err, message.isEmpty() ? error.message() : message, error, {}};
        }
        static Response data(QByteArrayView payload) {
            return Response{Kind::Data, {}, {}, payload};
        }
        static Response comment(const QByteArray& text) {
            return Response{Kind::Comment, text, {}, {}};
        }

        [[nodiscard]] bool isTerminal() const {
            return kind == Kind::Ok || kind == Kind::Err;
        }
    };

} // namespace elephantine::assuan
