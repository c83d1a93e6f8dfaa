#ifndef LFSERRORS_H
#define LFSERRORS_H

//Qt includes
#include <QString>

namespace QLfs {

//Error codes carried by Monad::Result::errorCode(). A protocol error from the batch or
//lock endpoint uses the HTTP status itself as the code, so these stay below 100.
enum class LfsErrorCode {
    NoError = 0,
    Configuration = 1,
    Protocol = 2,
    Transfer = 3,
    Network = 4,
    Io = 5
};

class LfsErrors
{
public:
    enum class Kind {
        None,
        Configuration,
        Protocol,
        Transfer,
        Network,
        Io,
        Unknown
    };

    static Kind kind(int errorCode);
    static int httpStatus(int errorCode);
    static bool isHttpStatusCode(int errorCode);
    static QString kindName(Kind kind);

    static constexpr int FirstHttpStatus = 100;
    static constexpr int LastHttpStatus = 599;
};

} // namespace QLfs

#endif // LFSERRORS_H
