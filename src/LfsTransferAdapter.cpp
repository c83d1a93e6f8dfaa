#include "LfsTransferAdapter.h"
#include "LfsBasicTransferAdapter.h"
#include "LfsErrors.h"
#include "LfsHttp.h"
#include "LfsMultipartTransferAdapter.h"

//Qt includes
#include <QJsonDocument>
#include <QNetworkRequest>
#include <algorithm>

namespace QLfs {

bool LfsAction::isValid() const
{
    const QString scheme = href.scheme().toLower();
    return href.isValid() && (scheme == QStringLiteral("http") || scheme == QStringLiteral("https"));
}

LfsAction LfsAction::fromJson(const QJsonObject& object, const QByteArray& defaultMethod)
{
    LfsAction action;
    action.href = QUrl(object.value(QStringLiteral("href")).toString());

    const QJsonObject headers = object.value(QStringLiteral("header")).toObject();
    for (auto it = headers.begin(); it != headers.end(); ++it) {
        action.headers.insert(it.key().toUtf8(), it.value().toString().toUtf8());
    }

    const QString method = object.value(QStringLiteral("method")).toString();
    action.method = method.isEmpty() ? defaultMethod : method.toUpper().toLatin1();
    return action;
}

LfsTransferAdapter::LfsTransferAdapter(LfsHttp* http)
    : mHttp(http)
{
}

Monad::ResultBase LfsTransferAdapter::objectError(const LfsObjectResponse& object)
{
    if (!object.hasError()) {
        return Monad::ResultBase();
    }
    return Monad::ResultBase(QStringLiteral("LFS server rejected object %1 (%2): %3")
                                 .arg(object.oid)
                                 .arg(object.errorCode)
                                 .arg(object.errorMessage),
                             static_cast<int>(LfsErrorCode::Transfer));
}

Monad::ResultBase LfsTransferAdapter::verify(const LfsObjectResponse& object) const
{
    const QJsonValue verifyValue = object.actions.value(QStringLiteral("verify"));
    if (!verifyValue.isObject()) {
        return Monad::ResultBase();
    }

    const LfsAction action = LfsAction::fromJson(verifyValue.toObject(), QByteArrayLiteral("POST"));
    if (!action.isValid()) {
        return Monad::ResultBase(QStringLiteral("Missing LFS verify href"),
                                 static_cast<int>(LfsErrorCode::Transfer));
    }

    QNetworkRequest request(action.href);
    LfsHttp::applyHeaders(&request, action.headers);
    request.setHeader(QNetworkRequest::ContentTypeHeader, LfsHttp::LfsJsonMime);
    request.setRawHeader("Accept", LfsHttp::LfsJsonMime);

    QJsonObject body;
    body.insert(QStringLiteral("oid"), object.oid);
    body.insert(QStringLiteral("size"), static_cast<double>(object.size));
    const QByteArray payload = QJsonDocument(body).toJson(QJsonDocument::Compact);

    const auto result = LfsHttp::waitFor(mHttp->send(action.method, request, payload));
    if (result.hasError()) {
        return Monad::ResultBase(result.errorMessage(), result.errorCode());
    }

    if (!result.value().isSuccess()) {
        return Monad::ResultBase(LfsHttp::failureMessage(QStringLiteral("LFS verify failed"), result.value()),
                                 static_cast<int>(LfsErrorCode::Transfer));
    }

    return Monad::ResultBase();
}

void LfsTransferAdapterRegistry::registerAdapter(const QString& name, Factory factory)
{
    if (name.isEmpty() || !factory) {
        return;
    }
    mFactories[name] = std::move(factory);
}

void LfsTransferAdapterRegistry::unregisterAdapter(const QString& name)
{
    mFactories.remove(name);
}

bool LfsTransferAdapterRegistry::contains(const QString& name) const
{
    return mFactories.contains(name);
}

QStringList LfsTransferAdapterRegistry::names() const
{
    QStringList names = mFactories.keys();
    std::sort(names.begin(), names.end());
    return names;
}

std::unique_ptr<LfsTransferAdapter> LfsTransferAdapterRegistry::create(const QString& name, LfsHttp* http) const
{
    auto it = mFactories.find(name);
    if (it == mFactories.end()) {
        return nullptr;
    }
    return it.value()(http);
}

LfsTransferAdapterRegistry LfsTransferAdapterRegistry::defaultRegistry()
{
    LfsTransferAdapterRegistry registry;
    registry.registerAdapter(QLatin1String(LfsBasicTransferAdapter::Name), [](LfsHttp* http) {
        return std::unique_ptr<LfsTransferAdapter>(new LfsBasicTransferAdapter(http));
    });
    registry.registerAdapter(QLatin1String(LfsMultipartTransferAdapter::Name), [](LfsHttp* http) {
        return std::unique_ptr<LfsTransferAdapter>(new LfsMultipartTransferAdapter(http));
    });
    return registry;
}

} // namespace QLfs
