#ifndef LFSBATCH_H
#define LFSBATCH_H

//Qt includes
#include <QByteArray>
#include <QJsonObject>
#include <QString>
#include <QStringList>
#include <QVector>

//Our includes
#include "LfsObjectAttributes.h"
#include "Monad/Result.h"

namespace QLfs {

enum class LfsOperation {
    Upload,
    Download
};

QString toString(LfsOperation operation);

struct LfsBatchRequest {
    LfsOperation operation = LfsOperation::Download;
    QStringList transfers;
    QVector<LfsObjectAttributes> objects;
    QString ref;

    QJsonObject toJson() const;
    QByteArray toPayload() const;
};

struct LfsObjectResponse {
    QString oid;
    qint64 size = 0;

    //Transfer specific, only the adapter that the server picked knows how to read it
    QJsonObject actions;

    int errorCode = 0;
    QString errorMessage;

    bool hasError() const { return errorCode != 0 || !errorMessage.isEmpty(); }
    bool hasAction(const QString& name) const;

    static LfsObjectResponse fromJson(const QJsonObject& object);
};

struct LfsBatchResponse {
    QString transfer;
    QVector<LfsObjectResponse> objects;

    static Monad::Result<LfsBatchResponse> fromPayload(const QByteArray& payload);

    static constexpr const char* DefaultTransfer = "basic";
};

} // namespace QLfs

#endif // LFSBATCH_H
