#pragma once

#include <QByteArray>
#include <QByteArrayView>

#include <cstddef>

namespace elephantine {

    void secureZero(void* ptr, std::size_t size);

    // Owned bytes of a passphrase. Zeroed exactly once: by wipe() or, failing that,
    // on destruction. Move-only so the bytes are never duplicated implicitly.
    class SecretBuffer {
      public:
        SecretBuffer() = default;
        explicit SecretBuffer(QByteArrayView bytes);
        ~SecretBuffer();

        SecretBuffer(const SecretBuffer&)            = delete;
        SecretBuffer& operator=(const SecretBuffer&) = delete;

        SecretBuffer(SecretBuffer&& other) noexcept;
        SecretBuffer& operator=(SecretBuffer&& other) noexcept;

        // Copies source into a fresh buffer, then zeroes and clears source.
        static SecretBuffer takeFrom(QByteArray& source);

        [[nodiscard]] QByteArrayView view() const {
            return QByteArrayView(m_storage.constData(), m_length);
        }
        [[nodiscard]] qsizetype size() const {
            return m_length;
        }
        [[nodiscard]] bool isEmpty() const {
            return m_length == 0;
        }
        [[nodiscard]] bool isWiped() const {
            return m_wiped;
        }

        // Drops one trailing '\n' without reallocating.
        void chopTrailingNewline();

        // Zeroes the storage now; later calls and the destructor do nothing.
        void wipe();

      private:
        QByteArray m_storage;
        qsizetype  m_length = 0;
        bool       m_wiped  = false;
    };

} // namespace elephantine
