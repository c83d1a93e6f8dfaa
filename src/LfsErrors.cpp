#include "LfsErrors.h"

namespace QLfs {

bool LfsErrors::isHttpStatusCode(int errorCode)
{
    return errorCode >= FirstHttpStatus && errorCode <= LastHttpStatus;
}

LfsErrors::Kind LfsErrors::kind(int errorCode)
{
    if (isHttpStatusCode(errorCode)) {
        return Kind::Protocol;
    }

    switch (static_cast<LfsErrorCode>(errorCode)) {
    case LfsErrorCode::NoError:
        return Kind::None;
    case LfsErrorCode::Configuration:
        return Kind::Configuration;
    case LfsErrorCode::Protocol:
        return Kind::Protocol;
    case LfsErrorCode::Transfer:
        return Kind::Transfer;
    case LfsErrorCode::Network:
        return Kind::Network;
    case LfsErrorCode::Io:
        return Kind::Io;
    }
    return Kind::Unknown;
}

int LfsErrors::httpStatus(int errorCode)
{
    return isHttpStatusCode(errorCode) ? errorCode : 0;
}

QString LfsErrors::kindName(Kind kind)
{
    switch (kind) {
    case Kind::None:
        return QStringLiteral("none");
    case Kind::Configuration:
        return QStringLiteral("configuration");
    case Kind::Protocol:
        return QStringLiteral("protocol");
    case Kind::Transfer:
        return QStringLiteral("transfer");
    case Kind::Network:
        return QStringLiteral("network");
    case Kind::Io:
        return QStringLiteral("io");
    case Kind::Unknown:
        break;
    }
    return QStringLiteral("unknown");
}

} // namespace QLfs
