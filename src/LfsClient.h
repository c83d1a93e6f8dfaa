#ifndef LFSCLIENT_H
#define LFSCLIENT_H

//Qt includes
#include <QByteArray>
#include <QJsonObject>
#include <QMap>
#include <QString>
#include <QStringList>
#include <QUrl>
#include <QUrlQuery>
#include <QVariantMap>
#include <QVector>

//Our includes
#include "LfsBatch.h"
#include "LfsCredentials.h"
#include "LfsHttp.h"
#include "LfsObjectAttributes.h"
#include "LfsTransferAdapter.h"
#include "Monad/Result.h"

class QIODevice;
class QNetworkRequest;

namespace QLfs {

struct LfsClientConfig {
    QUrl serverUrl;
    LfsCredentials credentials;

    //Adapter names offered to the server, most preferred first
    QStringList transfers = defaultTransfers();

    //Sent with batch and lock requests, e.g. from git's http.extraheader
    QMap<QByteArray, QByteArray> extraHeaders;

    int transferTimeoutMs = LfsHttp::DefaultTransferTimeoutMs;

    static QStringList defaultTransfers();
};

struct LfsLockQuery {
    QString path;
    QString id;
    QString cursor;
    int limit = 0;
    QString refspec;

    QUrlQuery toUrlQuery() const;
};

//Blocking Git LFS client. Every call runs its own HTTP session on the calling thread;
//the configuration and adapter registry are never modified after construction.
class LfsClient
{
public:
    explicit LfsClient(LfsClientConfig config,
                       LfsTransferAdapterRegistry adapters = LfsTransferAdapterRegistry::defaultRegistry());
    LfsClient(const QUrl& serverUrl, LfsCredentials credentials = LfsCredentials());

    const LfsClientConfig& config() const { return mConfig; }
    const LfsTransferAdapterRegistry& adapters() const { return mAdapters; }

    //prefix is "organization/repo", or empty for the server root
    Monad::Result<LfsBatchResponse> batch(const QString& prefix,
                                          LfsOperation operation,
                                          const QVector<LfsObjectAttributes>& objects,
                                          const QString& ref = QString(),
                                          const QStringList& transfers = QStringList()) const;

    //The stream is rewound after hashing and handed to the adapter from the start.
    //TODO: accept several streams and send them in one batch request
    Monad::Result<LfsObjectAttributes> upload(QIODevice* source,
                                              const QString& organization = QString(),
                                              const QString& repo = QString(),
                                              const QVariantMap& extras = QVariantMap()) const;

    Monad::ResultBase download(QIODevice* destination,
                               const QString& oid,
                               qint64 size,
                               const QString& organization = QString(),
                               const QString& repo = QString(),
                               const QVariantMap& extras = QVariantMap()) const;

    Monad::Result<QJsonObject> listLocks(const LfsLockQuery& query = LfsLockQuery()) const;

    static QString prefixFor(const QString& organization, const QString& repo);
    QUrl urlFor(const QString& path) const;

private:
    LfsClientConfig mConfig;
    LfsTransferAdapterRegistry mAdapters;

    Monad::Result<LfsBatchResponse> sendBatch(LfsHttp* http,
                                              const QString& prefix,
                                              const LfsBatchRequest& batchRequest) const;
    Monad::ResultBase transfer(LfsHttp* http,
                               LfsOperation operation,
                               QIODevice* stream,
                               const LfsObjectAttributes& attributes,
                               const QString& prefix) const;
    void prepareRequest(QNetworkRequest* request) const;
};

} // namespace QLfs

#endif // LFSCLIENT_H
