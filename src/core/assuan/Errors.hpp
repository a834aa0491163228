#pragma once

#include <QByteArray>

#include <gpg-error.h>

namespace elephantine::assuan {

    // gpg-error code tagged with the pinentry error source, as agents expect on ERR lines.
    class Error {
      public:
        Error() = default;
        explicit Error(gpg_err_code_t code) : m_err(gpg_err_make(GPG_ERR_SOURCE_PINENTRY, code)) {}

        [[nodiscard]] gpg_error_t value() const noexcept {
            return m_err;
        }
        [[nodiscard]] gpg_err_code_t code() const noexcept {
            return gpg_err_code(m_err);
        }
        [[nodiscard]] bool isError() const noexcept {
            return m_err != GPG_ERR_NO_ERROR;
        }

        // Default ERR text for this code ("Operation cancelled", "Timeout", ...)
        [[nodiscard]] QByteArray message() const;

        bool operator==(const Error& other) const noexcept = default;

      private:
        gpg_error_t m_err = GPG_ERR_NO_ERROR;
    };

} // namespace elephantine::assuan
