#include "Codec.hpp"
#include "../../common/Constants.hpp"

#include <algorithm>

namespace elephantine::assuan {

    namespace {

        constexpr char HEX_CHARS[] = "0123456789ABCDEF";

        int hexValue(char c) {
            if (c >= '0' && c <= '9')
                return c - '0';
            if (c >= 'A' && c <= 'F')
                return c - 'A' + 10;
            if (c >= 'a' && c <= 'f')
                return c - 'a' + 10;
            return -1;
        }

        bool needsEscape(unsigned char c) {
            return c < 0x20 || c == '%';
        }

        bool isBlank(char c) {
            return c == ' ' || c == '\t';
        }

        // Scans for malformed escapes without building the decoded string.
        qsizetype findBadEscape(QByteArrayView input) {
            for (qsizetype i = 0; i < input.size(); ++i) {
                if (input[i] != '%')
                    continue;
                if (i + 2 >= input.size() || hexValue(input[i + 1]) < 0 || hexValue(input[i + 2]) < 0)
                    return i;
                i += 2;
            }
            return -1;
        }

        void appendStatusLine(QByteArray& out, QByteArrayView keyword, QByteArrayView text) {
            out.append(keyword.data(), keyword.size());
            if (!text.isEmpty()) {
                out.append(' ');
                out.append(percentEncode(text));
            }
            out.append('\n');
        }

    } // namespace

    Error DecodeError::toError() const {
        switch (kind) {
            case NoError:
            case Ignored: return Error();
            case BadEscape: return Error(GPG_ERR_ASS_SYNTAX);
            case LineTooLong: return Error(GPG_ERR_ASS_LINE_TOO_LONG);
        }
        return Error(GPG_ERR_ASS_GENERAL);
    }

    QByteArray DecodeError::message() const {
        switch (kind) {
            case NoError:
            case Ignored: return QByteArray();
            case BadEscape: return "Invalid percent escape at offset " + QByteArray::number(offset);
            case LineTooLong: return "Line too long";
        }
        return QByteArray();
    }

    QByteArray percentEncode(QByteArrayView input) {
        QByteArray result;
        result.reserve(input.size());

        for (char ch : input) {
            const auto uc = static_cast<unsigned char>(ch);
            if (needsEscape(uc)) {
                result.append('%');
                result.append(HEX_CHARS[(uc >> 4) & 0xF]);
                result.append(HEX_CHARS[uc & 0xF]);
            } else {
                result.append(ch);
            }
        }
        return result;
    }

    QByteArray percentDecode(QByteArrayView input, bool* ok, qsizetype* badOffset) {
        QByteArray result;
        result.reserve(input.size());

        for (qsizetype i = 0; i < input.size(); ++i) {
            if (input[i] != '%') {
                result.append(input[i]);
                continue;
            }

            const int hi = i + 2 < input.size() ? hexValue(input[i + 1]) : -1;
            const int lo = i + 2 < input.size() ? hexValue(input[i + 2]) : -1;
            if (hi < 0 || lo < 0) {
                if (ok)
                    *ok = false;
                if (badOffset)
                    *badOffset = i;
                return QByteArray();
            }
            result.append(static_cast<char>((hi << 4) | lo));
            i += 2;
        }

        if (ok)
            *ok = true;
        return result;
    }

    std::optional<Command> decodeLine(QByteArrayView raw, DecodeError* error) {
        DecodeError status;
        auto        fail = [&](DecodeError::Kind kind, qsizetype offset = -1) -> std::optional<Command> {
            status.kind   = kind;
            status.offset = offset;
            if (error)
                *error = status;
            return std::nullopt;
        };

        QByteArrayView line = raw;
        if (line.endsWith('\n'))
            line.chop(1);
        if (line.endsWith('\r'))
            line.chop(1);

        if (line.isEmpty() || line.front() == '#')
            return fail(DecodeError::Ignored);

        if (static_cast<std::size_t>(line.size()) > MAX_LINE_LENGTH)
            return fail(DecodeError::LineTooLong);

        if (const qsizetype bad = findBadEscape(line); bad >= 0)
            return fail(DecodeError::BadEscape, bad);

        qsizetype verbEnd = 0;
        while (verbEnd < line.size() && !isBlank(line[verbEnd]))
            ++verbEnd;

        qsizetype argStart = verbEnd;
        while (argStart < line.size() && isBlank(line[argStart]))
            ++argStart;

        Command command;
        command.name     = line.first(verbEnd).toByteArray().toUpper();
        command.verb     = verbFromName(command.name);
        command.argument = percentDecode(line.sliced(argStart));

        if (error)
            *error = status;
        return command;
    }

    qsizetype dataLineCount(qsizetype payloadSize) {
        const auto chunk = static_cast<qsizetype>(MAX_DATA_CHUNK);
        return (payloadSize + chunk - 1) / chunk;
    }

    QByteArray encode(const Response& response) {
        QByteArray out;

        switch (response.kind) {
            case Response::Kind::Ok: appendStatusLine(out, "OK", response.text); break;

            case Response::Kind::Err: {
                QByteArray text = QByteArray::number(response.error.value());
                if (!response.text.isEmpty())
                    text += ' ' + response.text;
                text += " <" + QByteArray(gpg_strsource(response.error.value())) + '>';
                appendStatusLine(out, "ERR", text);
                break;
            }

            case Response::Kind::Comment:
                out.append('#');
                if (!response.text.isEmpty()) {
                    out.append(' ');
                    out.append(percentEncode(response.text));
                }
                out.append('\n');
                break;

            case Response::Kind::Data: {
                const QByteArrayView payload = response.payload;
                const auto           chunk   = static_cast<qsizetype>(MAX_DATA_CHUNK);
                out.reserve(dataLineCount(payload.size()) * 3 + payload.size() * 3);
                // Escaped in place: no temporary copies of a possibly secret payload.
                for (qsizetype pos = 0; pos < payload.size(); pos += chunk) {
                    const QByteArrayView piece = payload.sliced(pos, std::min(chunk, payload.size() - pos));
                    out.append("D ");
                    for (char ch : piece) {
                        const auto uc = static_cast<unsigned char>(ch);
                        if (needsEscape(uc)) {
                            out.append('%');
                            out.append(HEX_CHARS[(uc >> 4) & 0xF]);
                            out.append(HEX_CHARS[uc & 0xF]);
                        } else {
                            out.append(ch);
                        }
                    }
                    out.append('\n');
                }
                break;
            }
        }

        return out;
    }

} // namespace elephantine::assuan
