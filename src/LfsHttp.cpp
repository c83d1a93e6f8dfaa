#include "LfsHttp.h"
#include "LfsErrors.h"

//Qt includes
#include <QDebug>
#include <QIODevice>
#include <QNetworkAccessManager>
#include <QNetworkReply>

//Async Future includes
#include "asyncfuture.h"

namespace {
constexpr int ErrorBodyPreviewBytes = 512;

struct ReplyState {
    QByteArray body;
    qint64 bytesWritten = 0;
    Monad::ResultBase writeError;
};

QString bodyPreview(const QByteArray& body)
{
    if (body.isEmpty()) {
        return QString();
    }

    const bool truncated = body.size() > ErrorBodyPreviewBytes;
    const QByteArray previewBytes = truncated ? body.left(ErrorBodyPreviewBytes) : body;
    const QString previewText = QString::fromUtf8(previewBytes).simplified();
    if (previewText.isEmpty()) {
        return QString();
    }

    if (truncated) {
        return QStringLiteral("%1 [truncated]").arg(previewText);
    }
    return previewText;
}

QString enrichReplyErrorMessage(const QString& baseMessage, QNetworkReply* reply, const QByteArray& body)
{
    QString message = baseMessage;
    message += QStringLiteral(" [networkError=%1").arg(static_cast<int>(reply->error()));

    const QString detail = reply->errorString();
    if (!detail.isEmpty()) {
        message += QStringLiteral(", detail=\"%1\"").arg(detail);
    }

    const QString preview = bodyPreview(body);
    if (!preview.isEmpty()) {
        message += QStringLiteral(", response=\"%1\"").arg(preview);
    }

    message += QLatin1Char(']');
    return message;
}

void consumeReplyData(QNetworkReply* reply, QIODevice* sink, ReplyState* state)
{
    if (state->writeError.hasError()) {
        return;
    }

    const QByteArray chunk = reply->readAll();
    if (chunk.isEmpty()) {
        return;
    }

    const int httpStatus = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    if (sink && httpStatus >= 200 && httpStatus < 300) {
        const qint64 written = sink->write(chunk);
        if (written != chunk.size()) {
            state->writeError = Monad::ResultBase(QStringLiteral("Failed to write LFS response data: %1").arg(sink->errorString()),
                                                  static_cast<int>(QLfs::LfsErrorCode::Io));
            reply->abort();
            return;
        }
        state->bytesWritten += written;
    } else {
        state->body.append(chunk);
    }
}

} // namespace

namespace QLfs {

LfsHttp::LfsHttp(int transferTimeoutMs)
    : mManager(std::make_unique<QNetworkAccessManager>()),
    mTransferTimeoutMs(transferTimeoutMs)
{
}

LfsHttp::~LfsHttp() = default;

LfsHttp::ReplyFuture LfsHttp::get(QNetworkRequest request, QIODevice* sink)
{
    request.setTransferTimeout(mTransferTimeoutMs);
    return track(mManager->get(request), sink, QStringLiteral("GET"));
}

LfsHttp::ReplyFuture LfsHttp::put(QNetworkRequest request, QIODevice* source)
{
    request.setTransferTimeout(mTransferTimeoutMs);
    return track(mManager->put(request, source), nullptr, QStringLiteral("PUT"));
}

LfsHttp::ReplyFuture LfsHttp::post(QNetworkRequest request, const QByteArray& body)
{
    request.setTransferTimeout(mTransferTimeoutMs);
    return track(mManager->post(request, body), nullptr, QStringLiteral("POST"));
}

LfsHttp::ReplyFuture LfsHttp::send(const QByteArray& verb, QNetworkRequest request, const QByteArray& body)
{
    request.setTransferTimeout(mTransferTimeoutMs);
    return track(mManager->sendCustomRequest(request, verb, body), nullptr, QString::fromLatin1(verb));
}

LfsHttp::ReplyFuture LfsHttp::track(QNetworkReply* reply, QIODevice* sink, const QString& description)
{
    auto deferred = AsyncFuture::deferred<Monad::Result<Reply>>();
    deferred.reportStarted();

    auto state = std::make_shared<ReplyState>();
    const QString what = QStringLiteral("%1 %2").arg(description, reply->url().toString(QUrl::RemoveUserInfo | QUrl::RemoveQuery));

    auto finish = [deferred, reply](const Monad::Result<Reply>& result) mutable {
        deferred.complete(result);
        reply->deleteLater();
    };

    QObject::connect(reply, &QNetworkReply::readyRead, reply, [reply, sink, state]() {
        consumeReplyData(reply, sink, state.get());
    });

    QObject::connect(reply, &QNetworkReply::finished, reply, [reply, sink, state, what, finish]() mutable {
        consumeReplyData(reply, sink, state.get());

        if (state->writeError.hasError()) {
            finish(Monad::Result<Reply>(state->writeError.errorMessage(), state->writeError.errorCode()));
            return;
        }

        const int httpStatus = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
        if (httpStatus == 0 && reply->error() != QNetworkReply::NoError) {
            finish(Monad::Result<Reply>(enrichReplyErrorMessage(QStringLiteral("LFS request failed: %1").arg(what),
                                                                reply,
                                                                state->body),
                                        static_cast<int>(LfsErrorCode::Network)));
            return;
        }

        Reply result;
        result.httpStatus = httpStatus;
        result.body = state->body;
        result.bytesWritten = state->bytesWritten;
        for (const auto& header : reply->rawHeaderPairs()) {
            result.headers.insert(header.first.toLower(), header.second);
        }

        qDebug() << "[LfsHttp]" << what << "->" << httpStatus;
        finish(Monad::Result<Reply>(result));
    });

    return deferred.future();
}

void LfsHttp::applyHeaders(QNetworkRequest* request, const QMap<QByteArray, QByteArray>& headers)
{
    if (!request) {
        return;
    }
    for (auto it = headers.begin(); it != headers.end(); ++it) {
        request->setRawHeader(it.key(), it.value());
    }
}

QString LfsHttp::failureMessage(const QString& baseMessage, const Reply& reply)
{
    QString message = QStringLiteral("%1 (%2) [httpStatus=%2").arg(baseMessage).arg(reply.httpStatus);

    const QString preview = bodyPreview(reply.body);
    if (!preview.isEmpty()) {
        message += QStringLiteral(", response=\"%1\"").arg(preview);
    }

    message += QLatin1Char(']');
    return message;
}

} // namespace QLfs
