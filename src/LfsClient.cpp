#include "LfsClient.h"
#include "LfsErrors.h"

//Qt includes
#include <QDebug>
#include <QIODevice>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QNetworkRequest>

namespace {

QString trimTrailingSlash(QString value)
{
    while (value.endsWith(QLatin1Char('/'))) {
        value.chop(1);
    }
    return value;
}

} // namespace

namespace QLfs {

QStringList LfsClientConfig::defaultTransfers()
{
    return {
        QStringLiteral("multipart-basic"),
        QStringLiteral("basic")
    };
}

QUrlQuery LfsLockQuery::toUrlQuery() const
{
    QUrlQuery query;
    if (!path.isEmpty()) {
        query.addQueryItem(QStringLiteral("path"), path);
    }
    if (!id.isEmpty()) {
        query.addQueryItem(QStringLiteral("id"), id);
    }
    if (!cursor.isEmpty()) {
        query.addQueryItem(QStringLiteral("cursor"), cursor);
    }
    if (limit > 0) {
        query.addQueryItem(QStringLiteral("limit"), QString::number(limit));
    }
    if (!refspec.isEmpty()) {
        query.addQueryItem(QStringLiteral("refspec"), refspec);
    }
    return query;
}

LfsClient::LfsClient(LfsClientConfig config, LfsTransferAdapterRegistry adapters)
    : mConfig(std::move(config)),
    mAdapters(std::move(adapters))
{
    mConfig.serverUrl.setPath(trimTrailingSlash(mConfig.serverUrl.path()));
}

LfsClient::LfsClient(const QUrl& serverUrl, LfsCredentials credentials)
    : LfsClient(LfsClientConfig{serverUrl, std::move(credentials)})
{
}

QString LfsClient::prefixFor(const QString& organization, const QString& repo)
{
    if (organization.isEmpty() && repo.isEmpty()) {
        return QString();
    }
    return QStringLiteral("%1/%2").arg(organization, repo);
}

QUrl LfsClient::urlFor(const QString& path) const
{
    QUrl url(mConfig.serverUrl);
    url.setPath(mConfig.serverUrl.path() + QLatin1Char('/') + path);
    return url;
}

void LfsClient::prepareRequest(QNetworkRequest* request) const
{
    request->setHeader(QNetworkRequest::ContentTypeHeader, LfsHttp::LfsJsonMime);
    request->setRawHeader("Accept", LfsHttp::LfsJsonMime);
    LfsHttp::applyHeaders(request, mConfig.extraHeaders);
    mConfig.credentials.applyTo(request);
}

Monad::Result<LfsBatchResponse> LfsClient::batch(const QString& prefix,
                                                 LfsOperation operation,
                                                 const QVector<LfsObjectAttributes>& objects,
                                                 const QString& ref,
                                                 const QStringList& transfers) const
{
    LfsBatchRequest batchRequest;
    batchRequest.operation = operation;
    batchRequest.objects = objects;
    batchRequest.ref = ref;
    batchRequest.transfers = transfers.isEmpty() ? mConfig.transfers : transfers;

    LfsHttp http(mConfig.transferTimeoutMs);
    return sendBatch(&http, prefix, batchRequest);
}

Monad::Result<LfsBatchResponse> LfsClient::sendBatch(LfsHttp* http,
                                                     const QString& prefix,
                                                     const LfsBatchRequest& batchRequest) const
{
    const QString path = prefix.isEmpty()
        ? QStringLiteral("objects/batch")
        : QStringLiteral("%1/objects/batch").arg(prefix);

    QNetworkRequest request(urlFor(path));
    prepareRequest(&request);

    const auto result = LfsHttp::waitFor(http->post(request, batchRequest.toPayload()));
    if (result.hasError()) {
        return Monad::Result<LfsBatchResponse>(result.errorMessage(), result.errorCode());
    }

    const LfsHttp::Reply& reply = result.value();
    if (reply.httpStatus != 200) {
        return Monad::Result<LfsBatchResponse>(LfsHttp::failureMessage(QStringLiteral("LFS batch request failed"), reply),
                                               reply.httpStatus);
    }

    qDebug() << "[LfsClient] Got reply for batch request:" << reply.body;
    return LfsBatchResponse::fromPayload(reply.body);
}

Monad::ResultBase LfsClient::transfer(LfsHttp* http,
                                      LfsOperation operation,
                                      QIODevice* stream,
                                      const LfsObjectAttributes& attributes,
                                      const QString& prefix) const
{
    LfsBatchRequest batchRequest;
    batchRequest.operation = operation;
    batchRequest.transfers = mConfig.transfers;
    batchRequest.objects = {attributes};

    const auto batchResult = sendBatch(http, prefix, batchRequest);
    if (batchResult.hasError()) {
        return Monad::ResultBase(batchResult.errorMessage(), batchResult.errorCode());
    }

    const LfsBatchResponse& response = batchResult.value();
    auto adapter = mAdapters.create(response.transfer, http);
    if (!adapter) {
        return Monad::ResultBase(QStringLiteral("Unsupported transfer adapter: %1").arg(response.transfer),
                                 static_cast<int>(LfsErrorCode::Configuration));
    }

    if (response.objects.isEmpty()) {
        return Monad::ResultBase(QStringLiteral("LFS batch response has no objects"),
                                 static_cast<int>(LfsErrorCode::Protocol));
    }

    const LfsObjectResponse& object = response.objects.first();
    switch (operation) {
    case LfsOperation::Upload:
        return adapter->upload(stream, object);
    case LfsOperation::Download:
        return adapter->download(stream, object);
    }
    return Monad::ResultBase();
}

Monad::Result<LfsObjectAttributes> LfsClient::upload(QIODevice* source,
                                                     const QString& organization,
                                                     const QString& repo,
                                                     const QVariantMap& extras) const
{
    auto identityResult = LfsObjectAttributes::fromStream(source);
    if (identityResult.hasError()) {
        return identityResult;
    }

    LfsObjectAttributes attributes = identityResult.value();
    attributes.addExtraAttributes(extras);

    LfsHttp http(mConfig.transferTimeoutMs);
    auto transferResult = transfer(&http, LfsOperation::Upload, source, attributes, prefixFor(organization, repo));
    if (transferResult.hasError()) {
        return Monad::Result<LfsObjectAttributes>(transferResult.errorMessage(), transferResult.errorCode());
    }

    return Monad::Result<LfsObjectAttributes>(attributes);
}

Monad::ResultBase LfsClient::download(QIODevice* destination,
                                      const QString& oid,
                                      qint64 size,
                                      const QString& organization,
                                      const QString& repo,
                                      const QVariantMap& extras) const
{
    LfsObjectAttributes attributes;
    attributes.oid = oid;
    attributes.size = size;
    attributes.addExtraAttributes(extras);

    LfsHttp http(mConfig.transferTimeoutMs);
    return transfer(&http, LfsOperation::Download, destination, attributes, prefixFor(organization, repo));
}

Monad::Result<QJsonObject> LfsClient::listLocks(const LfsLockQuery& query) const
{
    QUrl url = urlFor(QStringLiteral("list"));
    url.setQuery(query.toUrlQuery());

    QNetworkRequest request(url);
    prepareRequest(&request);

    LfsHttp http(mConfig.transferTimeoutMs);
    const auto result = LfsHttp::waitFor(http.get(request));
    if (result.hasError()) {
        return Monad::Result<QJsonObject>(result.errorMessage(), result.errorCode());
    }

    const LfsHttp::Reply& reply = result.value();
    if (reply.httpStatus != 200) {
        return Monad::Result<QJsonObject>(LfsHttp::failureMessage(QStringLiteral("LFS lock list request failed"), reply),
                                          reply.httpStatus);
    }

    QJsonParseError parseError{};
    const QJsonDocument document = QJsonDocument::fromJson(reply.body, &parseError);
    if (document.isNull() || !document.isObject()) {
        return Monad::Result<QJsonObject>(QStringLiteral("Invalid LFS lock list response"),
                                          static_cast<int>(LfsErrorCode::Protocol));
    }

    qDebug() << "[LfsClient] Got reply for lock list request:" << reply.body;
    return Monad::Result<QJsonObject>(document.object());
}

} // namespace QLfs
