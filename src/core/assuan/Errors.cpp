#include "Errors.hpp"

namespace elephantine::assuan {

    QByteArray Error::message() const {
        return QByteArray(gpg_strerror(m_err));
    }

} // namespace elephantine::assuan
