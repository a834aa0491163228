#include "SecretBuffer.hpp"

#include <utility>

namespace elephantine {

    void secureZero(void* ptr, std::size_t size) {
        volatile unsigned char* p = static_cast<volatile unsigned char*>(ptr);
        while (size--) {
            *p++ = 0;
        }
    }

    SecretBuffer::SecretBuffer(QByteArrayView bytes) : m_storage(bytes.data(), bytes.size()), m_length(bytes.size()) {}

    SecretBuffer::~SecretBuffer() {
        wipe();
    }

    SecretBuffer::SecretBuffer(SecretBuffer&& other) noexcept :
        m_storage(std::exchange(other.m_storage, QByteArray())), m_length(std::exchange(other.m_length, 0)), m_wiped(std::exchange(other.m_wiped, true)) {}

    SecretBuffer& SecretBuffer::operator=(SecretBuffer&& other) noexcept {
        if (this != &other) {
            wipe();
            m_storage = std::exchange(other.m_storage, QByteArray());
            m_length  = std::exchange(other.m_length, 0);
            m_wiped   = std::exchange(other.m_wiped, true);
        }
        return *this;
    }

    SecretBuffer SecretBuffer::takeFrom(QByteArray& source) {
        SecretBuffer secret{QByteArrayView(source)};
        if (!source.isEmpty())
            secureZero(source.data(), static_cast<std::size_t>(source.size()));
        source.clear();
        return secret;
    }

    void SecretBuffer::chopTrailingNewline() {
        if (m_length > 0 && m_storage.at(m_length - 1) == '\n')
            --m_length;
    }

    void SecretBuffer::wipe() {
        if (m_wiped)
            return;
        if (!m_storage.isEmpty())
            secureZero(m_storage.data(), static_cast<std::size_t>(m_storage.size()));
        m_length = 0;
        m_wiped  = true;
    }

} // namespace elephantine
