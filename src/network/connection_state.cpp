#include "network/connection_state.hpp"

namespace astv::network {

QString ConnectionState::toString() const {
    switch (kind_) {
        case Kind::Disconnected: return QStringLiteral("disconnected");
        case Kind::Connecting: return QStringLiteral("connecting");
        case Kind::Connected: return QStringLiteral("connected");
        case Kind::Failed:
            return QStringLiteral("failed(%1)")
                .arg(QString::fromLatin1(reason_ ? to_string(*reason_) : "unknown"));
    }
    return QStringLiteral("unknown");
}

} // namespace astv::network
