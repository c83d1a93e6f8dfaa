#include "LfsBasicTransferAdapter.h"
#include "LfsErrors.h"
#include "LfsHttp.h"

//Qt includes
#include <QIODevice>
#include <QNetworkRequest>

namespace QLfs {

LfsBasicTransferAdapter::LfsBasicTransferAdapter(LfsHttp* http)
    : LfsTransferAdapter(http)
{
}

QString LfsBasicTransferAdapter::name() const
{
    return QLatin1String(Name);
}

Monad::ResultBase LfsBasicTransferAdapter::upload(QIODevice* source, const LfsObjectResponse& object)
{
    auto errorResult = objectError(object);
    if (errorResult.hasError()) {
        return errorResult;
    }

    //No upload action means the server already has the object
    const QJsonValue uploadValue = object.actions.value(QStringLiteral("upload"));
    if (!uploadValue.isObject()) {
        return verify(object);
    }

    const LfsAction action = LfsAction::fromJson(uploadValue.toObject(), QByteArrayLiteral("PUT"));
    if (!action.isValid()) {
        return Monad::ResultBase(QStringLiteral("Missing LFS upload href"),
                                 static_cast<int>(LfsErrorCode::Transfer));
    }

    if (!source || !source->isReadable()) {
        return Monad::ResultBase(QStringLiteral("LFS upload stream is not readable"),
                                 static_cast<int>(LfsErrorCode::Io));
    }

    QNetworkRequest request(action.href);
    request.setHeader(QNetworkRequest::ContentTypeHeader, QByteArrayLiteral("application/octet-stream"));
    //Length of the stream itself, not the size the server echoed
    const qint64 contentLength = source->isSequential() ? object.size : source->size() - source->pos();
    request.setHeader(QNetworkRequest::ContentLengthHeader, contentLength);
    LfsHttp::applyHeaders(&request, action.headers);

    const auto result = LfsHttp::waitFor(http()->put(request, source));
    if (result.hasError()) {
        return Monad::ResultBase(result.errorMessage(), result.errorCode());
    }

    if (!result.value().isSuccess()) {
        return Monad::ResultBase(LfsHttp::failureMessage(QStringLiteral("LFS upload failed"), result.value()),
                                 static_cast<int>(LfsErrorCode::Transfer));
    }

    return verify(object);
}

Monad::ResultBase LfsBasicTransferAdapter::download(QIODevice* destination, const LfsObjectResponse& object)
{
    auto errorResult = objectError(object);
    if (errorResult.hasError()) {
        return errorResult;
    }

    const QJsonValue downloadValue = object.actions.value(QStringLiteral("download"));
    const LfsAction action = LfsAction::fromJson(downloadValue.toObject(), QByteArrayLiteral("GET"));
    if (!action.isValid()) {
        return Monad::ResultBase(QStringLiteral("Missing LFS download href"),
                                 static_cast<int>(LfsErrorCode::Transfer));
    }

    if (!destination || !destination->isWritable()) {
        return Monad::ResultBase(QStringLiteral("LFS download stream is not writable"),
                                 static_cast<int>(LfsErrorCode::Io));
    }

    QNetworkRequest request(action.href);
    LfsHttp::applyHeaders(&request, action.headers);

    const auto result = LfsHttp::waitFor(http()->get(request, destination));
    if (result.hasError()) {
        return Monad::ResultBase(result.errorMessage(), result.errorCode());
    }

    const LfsHttp::Reply& reply = result.value();
    if (!reply.isSuccess()) {
        return Monad::ResultBase(LfsHttp::failureMessage(QStringLiteral("LFS download failed"), reply),
                                 static_cast<int>(LfsErrorCode::Transfer));
    }

    if (reply.bytesWritten != object.size) {
        return Monad::ResultBase(QStringLiteral("LFS download size mismatch (expected %1, got %2)")
                                     .arg(object.size)
                                     .arg(reply.bytesWritten),
                                 static_cast<int>(LfsErrorCode::Transfer));
    }

    return Monad::ResultBase();
}

} // namespace QLfs
