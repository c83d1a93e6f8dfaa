#ifndef LFSHTTP_H
#define LFSHTTP_H

//Qt includes
#include <QByteArray>
#include <QEventLoop>
#include <QFuture>
#include <QFutureWatcher>
#include <QHash>
#include <QMap>
#include <QNetworkRequest>
#include <QString>
#include <memory>

//Our includes
#include "Monad/Result.h"

class QIODevice;
class QNetworkAccessManager;
class QNetworkReply;

namespace QLfs {

//One HTTP session for a single client call. Owns its QNetworkAccessManager, so it
//must be created and used on the calling thread.
class LfsHttp
{
public:
    struct Reply {
        int httpStatus = 0;
        QByteArray body;
        QHash<QByteArray, QByteArray> headers; //lower case names
        qint64 bytesWritten = 0;

        bool isSuccess() const { return httpStatus >= 200 && httpStatus < 300; }
        QByteArray header(const QByteArray& name) const { return headers.value(name.toLower()); }
    };

    typedef QFuture<Monad::Result<Reply>> ReplyFuture;

    explicit LfsHttp(int transferTimeoutMs = DefaultTransferTimeoutMs);
    ~LfsHttp();

    LfsHttp(const LfsHttp&) = delete;
    LfsHttp& operator=(const LfsHttp&) = delete;

    //With a sink, a successful response body is streamed into it instead of Reply::body
    ReplyFuture get(QNetworkRequest request, QIODevice* sink = nullptr);
    ReplyFuture put(QNetworkRequest request, QIODevice* source);
    ReplyFuture post(QNetworkRequest request, const QByteArray& body);
    ReplyFuture send(const QByteArray& verb, QNetworkRequest request, const QByteArray& body);

    int transferTimeoutMs() const { return mTransferTimeoutMs; }

    //Runs a local event loop until the future finishes. Network replies created by this
    //thread are serviced while waiting.
    template<typename T>
    static T waitFor(QFuture<T> future)
    {
        if (!future.isFinished()) {
            QEventLoop loop;
            QFutureWatcher<T> watcher;
            QObject::connect(&watcher, &QFutureWatcherBase::finished, &loop, &QEventLoop::quit);
            watcher.setFuture(future);
            if (!future.isFinished()) {
                loop.exec();
            }
        }
        return future.result();
    }

    static void applyHeaders(QNetworkRequest* request, const QMap<QByteArray, QByteArray>& headers);
    static QString failureMessage(const QString& baseMessage, const Reply& reply);

    static constexpr int DefaultTransferTimeoutMs = 30000;
    static constexpr const char* LfsJsonMime = "application/vnd.git-lfs+json";

private:
    ReplyFuture track(QNetworkReply* reply, QIODevice* sink, const QString& description);

    std::unique_ptr<QNetworkAccessManager> mManager;
    int mTransferTimeoutMs;
};

} // namespace QLfs

#endif // LFSHTTP_H
