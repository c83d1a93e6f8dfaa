#include "LfsBatch.h"
#include "LfsErrors.h"

//Qt includes
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>

namespace QLfs {

QString toString(LfsOperation operation)
{
    switch (operation) {
    case LfsOperation::Upload:
        return QStringLiteral("upload");
    case LfsOperation::Download:
        return QStringLiteral("download");
    }
    return QString();
}

QJsonObject LfsBatchRequest::toJson() const
{
    QJsonObject root;
    root.insert(QStringLiteral("operation"), toString(operation));
    root.insert(QStringLiteral("transfers"), QJsonArray::fromStringList(transfers));

    QJsonArray objectArray;
    for (const auto& object : objects) {
        objectArray.append(object.toJson());
    }
    root.insert(QStringLiteral("objects"), objectArray);

    if (!ref.isEmpty()) {
        QJsonObject refObject;
        refObject.insert(QStringLiteral("name"), ref);
        root.insert(QStringLiteral("ref"), refObject);
    }

    return root;
}

QByteArray LfsBatchRequest::toPayload() const
{
    return QJsonDocument(toJson()).toJson(QJsonDocument::Compact);
}

bool LfsObjectResponse::hasAction(const QString& name) const
{
    return actions.value(name).isObject() || actions.value(name).isArray();
}

LfsObjectResponse LfsObjectResponse::fromJson(const QJsonObject& object)
{
    LfsObjectResponse response;
    response.oid = object.value(QStringLiteral("oid")).toString();
    response.size = static_cast<qint64>(object.value(QStringLiteral("size")).toDouble());
    response.actions = object.value(QStringLiteral("actions")).toObject();

    const QJsonObject errorObject = object.value(QStringLiteral("error")).toObject();
    if (!errorObject.isEmpty()) {
        response.errorCode = errorObject.value(QStringLiteral("code")).toInt();
        response.errorMessage = errorObject.value(QStringLiteral("message")).toString();
    }

    return response;
}

Monad::Result<LfsBatchResponse> LfsBatchResponse::fromPayload(const QByteArray& payload)
{
    QJsonParseError parseError{};
    const QJsonDocument document = QJsonDocument::fromJson(payload, &parseError);
    if (document.isNull() || !document.isObject()) {
        QString message = QStringLiteral("Invalid LFS batch response");
        if (parseError.error != QJsonParseError::NoError) {
            message += QStringLiteral(" (%1)").arg(parseError.errorString());
        }
        return Monad::Result<LfsBatchResponse>(message, static_cast<int>(LfsErrorCode::Protocol));
    }

    const QJsonObject root = document.object();

    LfsBatchResponse response;
    response.transfer = root.value(QStringLiteral("transfer")).toString();
    if (response.transfer.isEmpty()) {
        response.transfer = QLatin1String(DefaultTransfer);
    }

    const QJsonArray objectsArray = root.value(QStringLiteral("objects")).toArray();
    response.objects.reserve(objectsArray.size());
    for (const auto& entry : objectsArray) {
        if (!entry.isObject()) {
            continue;
        }
        response.objects.push_back(LfsObjectResponse::fromJson(entry.toObject()));
    }

    return Monad::Result<LfsBatchResponse>(response);
}

} // namespace QLfs
