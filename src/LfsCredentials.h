#ifndef LFSCREDENTIALS_H
#define LFSCREDENTIALS_H

//Qt includes
#include <QByteArray>
#include <QString>

//Our includes
#include "Monad/Result.h"

class QNetworkRequest;

namespace QLfs {

class LfsCredentials
{
public:
    enum class Kind {
        None,
        Bearer,
        Basic
    };

    LfsCredentials() = default;

    static LfsCredentials none();
    static LfsCredentials bearer(QString token);
    static LfsCredentials basic(QString username, QString password);

    //For loosely typed settings (environment, config files). Supplying a token and a
    //username/password pair together is a configuration error.
    static Monad::Result<LfsCredentials> fromSettings(const QString& token,
                                                      const QString& username,
                                                      const QString& password);

    Kind kind() const { return mKind; }
    QString token() const { return mToken; }
    QString username() const { return mUsername; }
    QString password() const { return mPassword; }

    QByteArray authorizationHeader() const;
    void applyTo(QNetworkRequest* request) const;

private:
    LfsCredentials(Kind kind, QString token, QString username, QString password);

    Kind mKind = Kind::None;
    QString mToken;
    QString mUsername;
    QString mPassword;
};

} // namespace QLfs

#endif // LFSCREDENTIALS_H
