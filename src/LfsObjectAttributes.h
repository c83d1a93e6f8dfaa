#ifndef LFSOBJECTATTRIBUTES_H
#define LFSOBJECTATTRIBUTES_H

//Qt includes
#include <QJsonObject>
#include <QString>
#include <QVariantMap>

//Our includes
#include "Monad/Result.h"

class QIODevice;

namespace QLfs {

struct LfsObjectAttributes {
    QString oid;
    qint64 size = 0;

    //Keys are already "x-" prefixed, see addExtraAttributes()
    QVariantMap extras;

    bool isValid() const;
    QJsonObject toJson() const;

    void addExtraAttributes(const QVariantMap& attributes);

    static Monad::Result<LfsObjectAttributes> fromStream(QIODevice* stream);
    static bool isValidOid(const QString& oid);

    static constexpr qint64 ReadBufferSize = 4 * 1024 * 1000;
    static constexpr const char* ExtraAttributePrefix = "x-";
};

} // namespace QLfs

#endif // LFSOBJECTATTRIBUTES_H
