#include "LfsMultipartTransferAdapter.h"
#include "LfsErrors.h"
#include "LfsHttp.h"

//Qt includes
#include <QCryptographicHash>
#include <QIODevice>
#include <QJsonArray>
#include <QJsonDocument>
#include <QNetworkRequest>

namespace QLfs {

LfsMultipartTransferAdapter::LfsMultipartTransferAdapter(LfsHttp* http)
    : LfsTransferAdapter(http)
{
}

QString LfsMultipartTransferAdapter::name() const
{
    return QLatin1String(Name);
}

QVector<LfsMultipartTransferAdapter::Part> LfsMultipartTransferAdapter::parts(const LfsObjectResponse& object,
                                                                              const QByteArray& defaultMethod)
{
    QVector<Part> result;

    const QJsonArray partsArray = object.actions.value(QStringLiteral("parts")).toArray();
    result.reserve(partsArray.size());
    for (const auto& entry : partsArray) {
        if (!entry.isObject()) {
            continue;
        }
        const QJsonObject partObject = entry.toObject();
        Part part;
        part.action = LfsAction::fromJson(partObject, defaultMethod);
        part.pos = static_cast<qint64>(partObject.value(QStringLiteral("pos")).toDouble());
        part.size = static_cast<qint64>(partObject.value(QStringLiteral("size")).toDouble(-1));
        part.wantDigest = partObject.value(QStringLiteral("want_digest")).toString();
        result.push_back(part);
    }

    return result;
}

QPair<QByteArray, QByteArray> LfsMultipartTransferAdapter::digestHeader(const QString& wantDigest, const QByteArray& data)
{
    const QStringList tokens = wantDigest.split(QLatin1Char(','), Qt::SkipEmptyParts);
    for (const QString& token : tokens) {
        const QString algorithm = token.section(QLatin1Char(';'), 0, 0).trimmed().toLower();
        if (algorithm == QStringLiteral("contentmd5")) {
            return qMakePair(QByteArrayLiteral("Content-MD5"),
                             QCryptographicHash::hash(data, QCryptographicHash::Md5).toBase64());
        }
        if (algorithm == QStringLiteral("sha-256")) {
            return qMakePair(QByteArrayLiteral("Digest"),
                             QByteArrayLiteral("SHA-256=") + QCryptographicHash::hash(data, QCryptographicHash::Sha256).toBase64());
        }
        if (algorithm == QStringLiteral("md5")) {
            return qMakePair(QByteArrayLiteral("Digest"),
                             QByteArrayLiteral("MD5=") + QCryptographicHash::hash(data, QCryptographicHash::Md5).toBase64());
        }
    }
    return qMakePair(QByteArray(), QByteArray());
}

Monad::ResultBase LfsMultipartTransferAdapter::upload(QIODevice* source, const LfsObjectResponse& object)
{
    auto errorResult = objectError(object);
    if (errorResult.hasError()) {
        return errorResult;
    }

    const QVector<Part> uploadParts = parts(object, QByteArrayLiteral("PUT"));

    //Nothing to send, the server already has the object
    if (uploadParts.isEmpty() && !object.hasAction(QStringLiteral("commit"))) {
        return verify(object);
    }

    if (!source || !source->isReadable() || source->isSequential()) {
        return Monad::ResultBase(QStringLiteral("LFS multipart upload needs a readable, seekable stream"),
                                 static_cast<int>(LfsErrorCode::Io));
    }

    QJsonArray uploadedParts;
    for (const Part& part : uploadParts) {
        if (!part.action.isValid() || part.size < 0) {
            return Monad::ResultBase(QStringLiteral("Invalid LFS multipart upload part at %1").arg(part.pos),
                                     static_cast<int>(LfsErrorCode::Transfer));
        }

        if (!source->seek(part.pos)) {
            return Monad::ResultBase(QStringLiteral("Failed to seek LFS upload stream to %1").arg(part.pos),
                                     static_cast<int>(LfsErrorCode::Io));
        }

        const QByteArray data = source->read(part.size);
        if (data.size() != part.size) {
            return Monad::ResultBase(QStringLiteral("Short read for LFS part at %1 (expected %2, got %3)")
                                         .arg(part.pos)
                                         .arg(part.size)
                                         .arg(data.size()),
                                     static_cast<int>(LfsErrorCode::Io));
        }

        QNetworkRequest request(part.action.href);
        request.setHeader(QNetworkRequest::ContentTypeHeader, QByteArrayLiteral("application/octet-stream"));
        LfsHttp::applyHeaders(&request, part.action.headers);

        const auto digest = digestHeader(part.wantDigest, data);
        if (!digest.first.isEmpty()) {
            request.setRawHeader(digest.first, digest.second);
        }

        const auto result = LfsHttp::waitFor(http()->send(part.action.method, request, data));
        if (result.hasError()) {
            return Monad::ResultBase(result.errorMessage(), result.errorCode());
        }

        if (!result.value().isSuccess()) {
            return Monad::ResultBase(LfsHttp::failureMessage(QStringLiteral("LFS part upload failed at %1").arg(part.pos),
                                                             result.value()),
                                     static_cast<int>(LfsErrorCode::Transfer));
        }

        QJsonObject uploaded;
        uploaded.insert(QStringLiteral("pos"), static_cast<double>(part.pos));
        uploaded.insert(QStringLiteral("size"), static_cast<double>(part.size));
        const QByteArray etag = result.value().header(QByteArrayLiteral("ETag"));
        if (!etag.isEmpty()) {
            uploaded.insert(QStringLiteral("etag"), QString::fromLatin1(etag));
        }
        uploadedParts.append(uploaded);
    }

    auto commitResult = commit(object, uploadedParts);
    if (commitResult.hasError()) {
        return commitResult;
    }

    return verify(object);
}

Monad::ResultBase LfsMultipartTransferAdapter::commit(const LfsObjectResponse& object, const QJsonArray& uploadedParts) const
{
    const QJsonValue commitValue = object.actions.value(QStringLiteral("commit"));
    if (!commitValue.isObject()) {
        return Monad::ResultBase();
    }

    const LfsAction action = LfsAction::fromJson(commitValue.toObject(), QByteArrayLiteral("POST"));
    if (!action.isValid()) {
        return Monad::ResultBase(QStringLiteral("Missing LFS commit href"),
                                 static_cast<int>(LfsErrorCode::Transfer));
    }

    QNetworkRequest request(action.href);
    request.setHeader(QNetworkRequest::ContentTypeHeader, LfsHttp::LfsJsonMime);
    request.setRawHeader("Accept", LfsHttp::LfsJsonMime);
    LfsHttp::applyHeaders(&request, action.headers);

    QJsonObject body;
    body.insert(QStringLiteral("oid"), object.oid);
    body.insert(QStringLiteral("size"), static_cast<double>(object.size));
    body.insert(QStringLiteral("parts"), uploadedParts);
    const QByteArray payload = QJsonDocument(body).toJson(QJsonDocument::Compact);

    const auto result = LfsHttp::waitFor(http()->send(action.method, request, payload));
    if (result.hasError()) {
        return Monad::ResultBase(result.errorMessage(), result.errorCode());
    }

    if (!result.value().isSuccess()) {
        return Monad::ResultBase(LfsHttp::failureMessage(QStringLiteral("LFS multipart commit failed"), result.value()),
                                 static_cast<int>(LfsErrorCode::Transfer));
    }

    return Monad::ResultBase();
}

Monad::ResultBase LfsMultipartTransferAdapter::download(QIODevice* destination, const LfsObjectResponse& object)
{
    auto errorResult = objectError(object);
    if (errorResult.hasError()) {
        return errorResult;
    }

    QVector<Part> downloadParts = parts(object, QByteArrayLiteral("GET"));
    if (downloadParts.isEmpty()) {
        const QJsonValue downloadValue = object.actions.value(QStringLiteral("download"));
        Part whole;
        whole.action = LfsAction::fromJson(downloadValue.toObject(), QByteArrayLiteral("GET"));
        whole.size = object.size;
        downloadParts.push_back(whole);
    }

    if (!destination || !destination->isWritable()) {
        return Monad::ResultBase(QStringLiteral("LFS download stream is not writable"),
                                 static_cast<int>(LfsErrorCode::Io));
    }

    qint64 totalWritten = 0;
    for (const Part& part : downloadParts) {
        if (!part.action.isValid()) {
            return Monad::ResultBase(QStringLiteral("Missing LFS download href for part at %1").arg(part.pos),
                                     static_cast<int>(LfsErrorCode::Transfer));
        }

        if (destination->isSequential()) {
            if (part.pos != totalWritten) {
                return Monad::ResultBase(QStringLiteral("LFS part at %1 needs a seekable destination").arg(part.pos),
                                         static_cast<int>(LfsErrorCode::Io));
            }
        } else if (!destination->seek(part.pos)) {
            return Monad::ResultBase(QStringLiteral("Failed to seek LFS download stream to %1").arg(part.pos),
                                     static_cast<int>(LfsErrorCode::Io));
        }

        QNetworkRequest request(part.action.href);
        LfsHttp::applyHeaders(&request, part.action.headers);

        const auto result = LfsHttp::waitFor(http()->get(request, destination));
        if (result.hasError()) {
            return Monad::ResultBase(result.errorMessage(), result.errorCode());
        }

        if (!result.value().isSuccess()) {
            return Monad::ResultBase(LfsHttp::failureMessage(QStringLiteral("LFS part download failed at %1").arg(part.pos),
                                                             result.value()),
                                     static_cast<int>(LfsErrorCode::Transfer));
        }

        totalWritten += result.value().bytesWritten;
    }

    if (totalWritten != object.size) {
        return Monad::ResultBase(QStringLiteral("LFS download size mismatch (expected %1, got %2)")
                                     .arg(object.size)
                                     .arg(totalWritten),
                                 static_cast<int>(LfsErrorCode::Transfer));
    }

    return Monad::ResultBase();
}

} // namespace QLfs
