#pragma once

#include "Command.hpp"
#include "Errors.hpp"
#include "Response.hpp"

#include <QByteArray>
#include <QByteArrayView>

#include <optional>

namespace elephantine::assuan {

    struct DecodeError {
        enum Kind {
            NoError,
            Ignored, // empty line or "#" comment
            BadEscape,
            LineTooLong
        };

        Kind      kind   = NoError;
        qsizetype offset = -1;

        [[nodiscard]] Error      toError() const;
        [[nodiscard]] QByteArray message() const;
    };

    // "%XX" escapes for bytes below 0x20 and '%'. Upper-case hex.
    QByteArray percentEncode(QByteArrayView input);

    // Decodes "%XX" escapes. A '%' not followed by two hex digits fails with *ok = false
    // and *badOffset set to its position.
    QByteArray percentDecode(QByteArrayView input, bool* ok = nullptr, qsizetype* badOffset = nullptr);

    // Parses one request line. A single trailing "\n" and then "\r" are stripped.
    // Returns std::nullopt with error->kind == Ignored for empty lines and comments.
    std::optional<Command> decodeLine(QByteArrayView raw, DecodeError* error = nullptr);

    // Serializes a response as one or more "\n"-terminated lines. Data payloads are
    // split into MAX_DATA_CHUNK-byte pieces, one "D" line each; an empty payload yields nothing.
    QByteArray encode(const Response& response);

    // Number of "D" lines encode() produces for a payload of the given size.
    qsizetype dataLineCount(qsizetype payloadSize);

} // namespace elephantine::assuan
