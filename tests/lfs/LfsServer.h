#ifndef LFS_SERVER_H
#define LFS_SERVER_H

#include <QByteArray>
#include <QHash>
#include <QJsonArray>
#include <QJsonObject>
#include <QMap>
#include <QObject>
#include <QString>
#include <QTcpServer>
#include <QVector>

class QTcpSocket;

//In-process Git LFS server speaking the batch API plus the transfer endpoints that its
//action descriptors point at. Runs on the test thread; the blocking client services it
//while it waits for replies.
class LfsServer : public QObject
{
    Q_OBJECT

public:
    struct Request {
        QByteArray method;
        QByteArray path;
        QByteArray query;
        QHash<QByteArray, QByteArray> headers; //lower case names
        QByteArray body;

        QByteArray header(const QByteArray& name) const { return headers.value(name.toLower()); }
    };

    explicit LfsServer(QObject* parent = nullptr);

    bool start();
    QString endpoint() const;

    void setObject(const QString& oid, const QByteArray& bytes);
    bool hasObject(const QString& oid) const;
    QByteArray object(const QString& oid) const;

    void setTransfer(const QString& transfer);
    void setPartSize(qint64 partSize);
    void setWantDigest(const QString& wantDigest);
    void setVerifyEnabled(bool enabled);
    void setBatchStatus(int status);

    //Status for upload, part, download and range requests, 0 serves them normally
    void setTransferFailureStatus(int status);

    //Size put in batch response objects instead of the requested one, -1 echoes the request
    void setReportedSize(qint64 size);
    void setLockListResponse(int status, const QByteArray& body);

    QVector<Request> requests() const { return mRequests; }
    int requestCount(const QByteArray& method, const QByteArray& pathPart) const;

    int batchRequestCount() const;
    Request lastBatchRequest() const;
    QJsonObject lastBatchPayload() const;
    Request lastLockListRequest() const;

private:
    void handleNewConnections();
    bool handleRequest(QTcpSocket* socket, const QByteArray& request);
    void respond(QTcpSocket* socket,
                 int status,
                 const QByteArray& contentType,
                 const QByteArray& body,
                 const QMap<QByteArray, QByteArray>& headers = QMap<QByteArray, QByteArray>()) const;

    void handleBatch(QTcpSocket* socket, const Request& request);
    QJsonObject uploadActions(const QString& oid, qint64 size) const;
    QJsonObject downloadActions(const QString& oid) const;
    QJsonArray partActions(const QString& route, const QString& oid, qint64 size, bool withDigest) const;

    QString baseUrl() const;

    QTcpServer mServer;
    QHash<QTcpSocket*, QByteArray> mPendingRequests;
    QVector<Request> mRequests;

    QHash<QString, QByteArray> mObjects;
    QHash<QString, QMap<qint64, QByteArray>> mPendingParts;

    QString mTransfer = QStringLiteral("basic");
    qint64 mPartSize = 4;
    QString mWantDigest;
    bool mVerifyEnabled = false;
    int mBatchStatus = 200;
    int mTransferFailureStatus = 0;
    qint64 mReportedSize = -1;
    int mLockListStatus = 200;
    QByteArray mLockListBody = QByteArray("{\"locks\":[],\"next_cursor\":\"\"}");
};

#endif // LFS_SERVER_H
