#ifndef LFSBASICTRANSFERADAPTER_H
#define LFSBASICTRANSFERADAPTER_H

//Our includes
#include "LfsTransferAdapter.h"

namespace QLfs {

//Whole object in one request: PUT to actions.upload, GET from actions.download
class LfsBasicTransferAdapter : public LfsTransferAdapter
{
public:
    explicit LfsBasicTransferAdapter(LfsHttp* http);

    QString name() const override;

    Monad::ResultBase upload(QIODevice* source, const LfsObjectResponse& object) override;
    Monad::ResultBase download(QIODevice* destination, const LfsObjectResponse& object) override;

    static constexpr const char* Name = "basic";
};

} // namespace QLfs

#endif // LFSBASICTRANSFERADAPTER_H
