#include "LfsCredentials.h"
#include "LfsErrors.h"

//Qt includes
#include <QNetworkRequest>

namespace QLfs {

LfsCredentials::LfsCredentials(Kind kind, QString token, QString username, QString password)
    : mKind(kind),
    mToken(std::move(token)),
    mUsername(std::move(username)),
    mPassword(std::move(password))
{
}

LfsCredentials LfsCredentials::none()
{
    return LfsCredentials();
}

LfsCredentials LfsCredentials::bearer(QString token)
{
    return LfsCredentials(Kind::Bearer, std::move(token), QString(), QString());
}

LfsCredentials LfsCredentials::basic(QString username, QString password)
{
    return LfsCredentials(Kind::Basic, QString(), std::move(username), std::move(password));
}

Monad::Result<LfsCredentials> LfsCredentials::fromSettings(const QString& token,
                                                           const QString& username,
                                                           const QString& password)
{
    const bool hasToken = !token.isEmpty();
    const bool hasBasic = !username.isEmpty() || !password.isEmpty();

    if (hasToken && hasBasic) {
        return Monad::Result<LfsCredentials>(QStringLiteral("Only either an auth token or basic auth credentials can be supplied, but not both"),
                                             static_cast<int>(LfsErrorCode::Configuration));
    }

    if (hasToken) {
        return Monad::Result<LfsCredentials>(bearer(token));
    }
    if (hasBasic) {
        return Monad::Result<LfsCredentials>(basic(username, password));
    }
    return Monad::Result<LfsCredentials>(none());
}

QByteArray LfsCredentials::authorizationHeader() const
{
    switch (mKind) {
    case Kind::Bearer:
        return QByteArray("Bearer ") + mToken.toUtf8();
    case Kind::Basic: {
        const QByteArray credentials = (mUsername + QLatin1Char(':') + mPassword).toUtf8().toBase64();
        return QByteArray("Basic ") + credentials;
    }
    case Kind::None:
        break;
    }
    return QByteArray();
}

void LfsCredentials::applyTo(QNetworkRequest* request) const
{
    if (!request) {
        return;
    }

    const QByteArray header = authorizationHeader();
    if (!header.isEmpty()) {
        request->setRawHeader("Authorization", header);
    }
}

} // namespace QLfs
