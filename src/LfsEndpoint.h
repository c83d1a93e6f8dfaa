#ifndef LFSENDPOINT_H
#define LFSENDPOINT_H

//Qt includes
#include <QByteArray>
#include <QMap>
#include <QString>
#include <QUrl>

//Our includes
#include "LfsClient.h"
#include "Monad/Result.h"

struct git_repository;
struct git_config;

namespace QLfs {

//Builds an LfsClientConfig from a repository's git configuration, the way git-lfs
//finds its server: lfs.url, remote.<name>.lfsurl, then <remote url>/info/lfs.
//Only reads the configuration.
class LfsEndpoint
{
public:
    static Monad::Result<LfsClientConfig> fromRepository(const QString& gitDirPath,
                                                         const QString& remoteName = QString());

    static QUrl fixGitUrl(const QString& sshUrl);
    static QUrl lfsUrlFromRemoteUrl(const QString& remoteUrl);

    //Moves user info embedded in config->serverUrl into Basic credentials
    static void takeCredentialsFromUrl(LfsClientConfig* config);

private:
    static bool isHttpUrl(const QUrl& url);
    static QString defaultRemoteName(git_repository* repo);
    static QString configString(git_config* config, const QString& key);
    static Monad::Result<QUrl> resolveUrl(git_repository* repo, git_config* config, const QString& remoteName);
    static QMap<QByteArray, QByteArray> extraHeaders(git_config* config, const QUrl& url);
};

} // namespace QLfs

#endif // LFSENDPOINT_H
