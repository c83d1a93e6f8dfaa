#ifndef LFSMULTIPARTTRANSFERADAPTER_H
#define LFSMULTIPARTTRANSFERADAPTER_H

//Our includes
#include "LfsTransferAdapter.h"

//Qt includes
#include <QJsonArray>
#include <QPair>
#include <QVector>

namespace QLfs {

class LfsMultipartTransferAdapter : public LfsTransferAdapter
{
public:
    struct Part {
        LfsAction action;
        qint64 pos = 0;
        qint64 size = 0;
        QString wantDigest;
    };

    explicit LfsMultipartTransferAdapter(LfsHttp* http);

    QString name() const override;

    Monad::ResultBase upload(QIODevice* source, const LfsObjectResponse& object) override;
    Monad::ResultBase download(QIODevice* destination, const LfsObjectResponse& object) override;

    static QVector<Part> parts(const LfsObjectResponse& object, const QByteArray& defaultMethod);

    //Header name and value for a part's want_digest, empty name when nothing supported is asked for
    static QPair<QByteArray, QByteArray> digestHeader(const QString& wantDigest, const QByteArray& data);

    static constexpr const char* Name = "multipart-basic";

private:
    Monad::ResultBase commit(const LfsObjectResponse& object, const QJsonArray& uploadedParts) const;
};

} // namespace QLfs

#endif // LFSMULTIPARTTRANSFERADAPTER_H
