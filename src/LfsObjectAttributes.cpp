#include "LfsObjectAttributes.h"
#include "LfsErrors.h"

//Qt includes
#include <QByteArray>
#include <QCryptographicHash>
#include <QIODevice>
#include <QJsonValue>

namespace {

//Puts the stream back at the start on every exit path of fromStream()
class ScopedStreamRewind
{
public:
    explicit ScopedStreamRewind(QIODevice* stream)
        : mStream(stream)
    {
    }

    ~ScopedStreamRewind()
    {
        if (!mRewound) {
            rewind();
        }
    }

    bool rewind()
    {
        mRewound = true;
        return mStream->seek(0);
    }

private:
    QIODevice* mStream;
    bool mRewound = false;
};

} // namespace

namespace QLfs {

bool LfsObjectAttributes::isValidOid(const QString& oid)
{
    if (oid.size() != 64) {
        return false;
    }
    for (QChar ch : oid) {
        const bool isDigit = ch >= QLatin1Char('0') && ch <= QLatin1Char('9');
        const bool isLowerHex = ch >= QLatin1Char('a') && ch <= QLatin1Char('f');
        if (!isDigit && !isLowerHex) {
            return false;
        }
    }
    return true;
}

bool LfsObjectAttributes::isValid() const
{
    return isValidOid(oid) && size >= 0;
}

QJsonObject LfsObjectAttributes::toJson() const
{
    QJsonObject object;
    object.insert(QStringLiteral("oid"), oid);
    object.insert(QStringLiteral("size"), static_cast<double>(size));
    for (auto it = extras.begin(); it != extras.end(); ++it) {
        object.insert(it.key(), QJsonValue::fromVariant(it.value()));
    }
    return object;
}

void LfsObjectAttributes::addExtraAttributes(const QVariantMap& attributes)
{
    for (auto it = attributes.begin(); it != attributes.end(); ++it) {
        extras.insert(QLatin1String(ExtraAttributePrefix) + it.key(), it.value());
    }
}

Monad::Result<LfsObjectAttributes> LfsObjectAttributes::fromStream(QIODevice* stream)
{
    if (!stream || !stream->isReadable()) {
        return Monad::Result<LfsObjectAttributes>(QStringLiteral("LFS object stream is not readable"),
                                                  static_cast<int>(LfsErrorCode::Io));
    }

    if (stream->isSequential()) {
        return Monad::Result<LfsObjectAttributes>(QStringLiteral("LFS object stream must be seekable"),
                                                  static_cast<int>(LfsErrorCode::Io));
    }

    ScopedStreamRewind rewindGuard(stream);

    //The oid covers the whole object, whatever position the caller left the stream at
    if (!stream->seek(0)) {
        return Monad::Result<LfsObjectAttributes>(QStringLiteral("Failed to seek LFS object stream to the start"),
                                                  static_cast<int>(LfsErrorCode::Io));
    }

    QCryptographicHash hash(QCryptographicHash::Sha256);
    QByteArray buffer(static_cast<qsizetype>(ReadBufferSize), Qt::Uninitialized);

    while (true) {
        const qint64 bytesRead = stream->read(buffer.data(), buffer.size());
        if (bytesRead < 0) {
            const QString detail = stream->errorString();
            rewindGuard.rewind();
            return Monad::Result<LfsObjectAttributes>(QStringLiteral("Failed to read LFS object stream: %1").arg(detail),
                                                      static_cast<int>(LfsErrorCode::Io));
        }
        if (bytesRead == 0) {
            break;
        }
        hash.addData(QByteArrayView(buffer.constData(), static_cast<qsizetype>(bytesRead)));
    }

    LfsObjectAttributes attributes;
    attributes.size = stream->pos();
    attributes.oid = QString::fromLatin1(hash.result().toHex());

    if (!rewindGuard.rewind()) {
        return Monad::Result<LfsObjectAttributes>(QStringLiteral("Failed to rewind LFS object stream"),
                                                  static_cast<int>(LfsErrorCode::Io));
    }

    return Monad::Result<LfsObjectAttributes>(attributes);
}

} // namespace QLfs
