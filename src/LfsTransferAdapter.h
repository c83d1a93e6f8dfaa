#ifndef LFSTRANSFERADAPTER_H
#define LFSTRANSFERADAPTER_H

//Qt includes
#include <QByteArray>
#include <QHash>
#include <QJsonObject>
#include <QMap>
#include <QString>
#include <QStringList>
#include <QUrl>
#include <functional>
#include <memory>

//Our includes
#include "LfsBatch.h"
#include "Monad/Result.h"

class QIODevice;

namespace QLfs {

class LfsHttp;

struct LfsAction {
    QUrl href;
    QMap<QByteArray, QByteArray> headers;
    QByteArray method;

    bool isValid() const;

    static LfsAction fromJson(const QJsonObject& object, const QByteArray& defaultMethod);
};

class LfsTransferAdapter
{
public:
    explicit LfsTransferAdapter(LfsHttp* http);
    virtual ~LfsTransferAdapter() = default;

    virtual QString name() const = 0;

    //source is expected at the start of the object
    virtual Monad::ResultBase upload(QIODevice* source, const LfsObjectResponse& object) = 0;
    virtual Monad::ResultBase download(QIODevice* destination, const LfsObjectResponse& object) = 0;

protected:
    LfsHttp* http() const { return mHttp; }

    Monad::ResultBase verify(const LfsObjectResponse& object) const;
    static Monad::ResultBase objectError(const LfsObjectResponse& object);

private:
    LfsHttp* mHttp;
};

class LfsTransferAdapterRegistry
{
public:
    using Factory = std::function<std::unique_ptr<LfsTransferAdapter>(LfsHttp* http)>;

    LfsTransferAdapterRegistry() = default;

    void registerAdapter(const QString& name, Factory factory);
    void unregisterAdapter(const QString& name);

    bool contains(const QString& name) const;
    QStringList names() const;

    std::unique_ptr<LfsTransferAdapter> create(const QString& name, LfsHttp* http) const;

    static LfsTransferAdapterRegistry defaultRegistry();

private:
    QHash<QString, Factory> mFactories;
};

} // namespace QLfs

#endif // LFSTRANSFERADAPTER_H
