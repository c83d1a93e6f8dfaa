#include "LfsEndpoint.h"
#include "LfsErrors.h"

//Qt includes
#include <QDebug>
#include <QStringList>
#include <memory>

//libgit2
#include "git2.h"
#include "git2/config.h"
#include "git2/remote.h"

namespace {

QString trimTrailingSlash(QString value)
{
    while (value.endsWith(QLatin1Char('/'))) {
        value.chop(1);
    }
    return value;
}

//A git extraheader value is a single "Name: value" line
void insertHeaderLine(QMap<QByteArray, QByteArray>* headers, const QString& headerLine)
{
    const QString name = headerLine.section(QLatin1Char(':'), 0, 0).trimmed();
    if (name.isEmpty() || !headerLine.contains(QLatin1Char(':'))) {
        qDebug() << "[LfsEndpoint] ignoring malformed extraheader:" << headerLine;
        return;
    }
    headers->insert(name.toUtf8(), headerLine.section(QLatin1Char(':'), 1).trimmed().toUtf8());
}

struct ScopedHeaderMatch {
    QString url;
    QMap<QByteArray, QByteArray> headers;
};

//http.<url>.extraheader applies when <url> is a prefix of the request URL
int collectScopedExtraHeader(const git_config_entry* entry, void* payload)
{
    auto* match = static_cast<ScopedHeaderMatch*>(payload);
    const QString name = QString::fromUtf8(entry->name);

    const QString prefix = QStringLiteral("http.");
    const QString suffix = QStringLiteral(".extraheader");
    if (name.size() <= prefix.size() + suffix.size()) {
        return 0;
    }

    const QString scope = name.mid(prefix.size(), name.size() - prefix.size() - suffix.size());
    if (match->url.startsWith(scope) || match->url == trimTrailingSlash(scope)) {
        insertHeaderLine(&match->headers, QString::fromUtf8(entry->value));
    }
    return 0;
}

class ScopedGitEngine
{
public:
    ScopedGitEngine() { git_libgit2_init(); }
    ~ScopedGitEngine() { git_libgit2_shutdown(); }
};

} // namespace

namespace QLfs {

bool LfsEndpoint::isHttpUrl(const QUrl& url)
{
    const QString scheme = url.scheme().toLower();
    return scheme == QStringLiteral("http") || scheme == QStringLiteral("https");
}

//scp-like remotes (user@host:org/repo.git) aren't valid QUrls, they become ssh://user@host/org/repo.git
QUrl LfsEndpoint::fixGitUrl(const QString& sshUrl)
{
    QUrl url(sshUrl);

    if (url.isValid() && !url.scheme().isEmpty()) {
        return url;
    }

    auto parts = sshUrl.split(QLatin1Char(':'));
    if (parts.size() == 2) {
        auto newUrl = QStringLiteral("ssh://") + parts.at(0) + QLatin1Char('/') + parts.at(1);
        url = QUrl(newUrl);
    }

    return url;
}

QUrl LfsEndpoint::lfsUrlFromRemoteUrl(const QString& remoteUrl)
{
    QUrl url = fixGitUrl(remoteUrl);
    if (url.scheme().toLower() == QStringLiteral("ssh")) {
        url.setScheme(QStringLiteral("https"));
        url.setUserInfo(QString());
        url.setPort(-1);
    }

    if (!isHttpUrl(url)) {
        return QUrl();
    }

    url.setPath(trimTrailingSlash(url.path()) + QStringLiteral("/info/lfs"));
    return url;
}

void LfsEndpoint::takeCredentialsFromUrl(LfsClientConfig* config)
{
    if (!config) {
        return;
    }

    const QString user = config->serverUrl.userName();
    const QString pass = config->serverUrl.password();
    if (user.isEmpty() && pass.isEmpty()) {
        return;
    }

    config->credentials = LfsCredentials::basic(user, pass);
    config->serverUrl.setUserInfo(QString());
}

QString LfsEndpoint::configString(git_config* config, const QString& key)
{
    git_buf buf = GIT_BUF_INIT;
    const int result = git_config_get_string_buf(&buf, config, key.toUtf8().constData());
    const QString value = (result == GIT_OK && buf.ptr) ? QString::fromUtf8(buf.ptr) : QString();
    git_buf_dispose(&buf);
    return value;
}

QString LfsEndpoint::defaultRemoteName(git_repository* repo)
{
    git_strarray remotes{};
    if (git_remote_list(&remotes, repo) != GIT_OK) {
        return QString();
    }

    QStringList names;
    for (size_t i = 0; i < remotes.count; ++i) {
        names.append(QString::fromUtf8(remotes.strings[i]));
    }
    git_strarray_dispose(&remotes);

    //origin when present, otherwise the first configured remote
    const QString origin = QStringLiteral("origin");
    return names.contains(origin) ? origin : names.value(0);
}

Monad::Result<QUrl> LfsEndpoint::resolveUrl(git_repository* repo, git_config* config, const QString& remoteName)
{
    const QString lfsUrl = configString(config, QStringLiteral("lfs.url"));
    if (!lfsUrl.isEmpty()) {
        return Monad::Result<QUrl>(QUrl(lfsUrl));
    }

    QString resolvedRemote = remoteName;
    if (resolvedRemote.isEmpty()) {
        resolvedRemote = defaultRemoteName(repo);
    }
    if (resolvedRemote.isEmpty()) {
        return Monad::Result<QUrl>(QStringLiteral("No git remote configured for LFS"),
                                   static_cast<int>(LfsErrorCode::Configuration));
    }

    const QString remoteLfsUrl = configString(config, QStringLiteral("remote.%1.lfsurl").arg(resolvedRemote));
    if (!remoteLfsUrl.isEmpty()) {
        return Monad::Result<QUrl>(QUrl(remoteLfsUrl));
    }

    git_remote* remote = nullptr;
    if (git_remote_lookup(&remote, repo, resolvedRemote.toUtf8().constData()) != GIT_OK) {
        return Monad::Result<QUrl>(QStringLiteral("Failed to resolve git remote \"%1\" for LFS").arg(resolvedRemote),
                                   static_cast<int>(LfsErrorCode::Configuration));
    }

    std::unique_ptr<git_remote, decltype(&git_remote_free)> remoteHolder(remote, &git_remote_free);

    const char* remoteUrl = git_remote_url(remote);
    if (!remoteUrl) {
        return Monad::Result<QUrl>(QStringLiteral("Missing remote URL for LFS"),
                                   static_cast<int>(LfsErrorCode::Configuration));
    }

    return Monad::Result<QUrl>(lfsUrlFromRemoteUrl(QString::fromUtf8(remoteUrl)));
}

QMap<QByteArray, QByteArray> LfsEndpoint::extraHeaders(git_config* config, const QUrl& url)
{
    QMap<QByteArray, QByteArray> headers;

    const QString globalHeader = configString(config, QStringLiteral("http.extraheader"));
    if (!globalHeader.isEmpty()) {
        insertHeaderLine(&headers, globalHeader);
    }

    ScopedHeaderMatch match;
    match.url = url.toString(QUrl::RemoveUserInfo);
    const int foreachResult = git_config_foreach_match(config,
                                                       "^http\\..+\\.extraheader$",
                                                       collectScopedExtraHeader,
                                                       &match);
    if (foreachResult != GIT_OK) {
        qDebug() << "[LfsEndpoint] failed to scan http.<url>.extraheader entries:" << foreachResult;
        return headers;
    }

    for (auto it = match.headers.begin(); it != match.headers.end(); ++it) {
        headers.insert(it.key(), it.value());
    }
    return headers;
}

Monad::Result<LfsClientConfig> LfsEndpoint::fromRepository(const QString& gitDirPath, const QString& remoteName)
{
    ScopedGitEngine engine;

    git_repository* repo = nullptr;
    if (git_repository_open(&repo, gitDirPath.toUtf8().constData()) != GIT_OK) {
        return Monad::Result<LfsClientConfig>(QStringLiteral("Failed to open git repository"),
                                              static_cast<int>(LfsErrorCode::Configuration));
    }

    std::unique_ptr<git_repository, decltype(&git_repository_free)> repoHolder(repo, &git_repository_free);

    git_config* config = nullptr;
    if (git_repository_config(&config, repo) != GIT_OK) {
        return Monad::Result<LfsClientConfig>(QStringLiteral("Failed to read git config"),
                                              static_cast<int>(LfsErrorCode::Configuration));
    }

    std::unique_ptr<git_config, decltype(&git_config_free)> configHolder(config, &git_config_free);

    auto urlResult = resolveUrl(repo, config, remoteName);
    if (urlResult.hasError()) {
        return Monad::Result<LfsClientConfig>(urlResult.errorMessage(), urlResult.errorCode());
    }

    const QUrl url = urlResult.value();
    if (!isHttpUrl(url)) {
        return Monad::Result<LfsClientConfig>(QStringLiteral("Unsupported LFS remote URL"),
                                              static_cast<int>(LfsErrorCode::Configuration));
    }

    LfsClientConfig clientConfig;
    clientConfig.serverUrl = url;
    clientConfig.extraHeaders = extraHeaders(config, url);
    takeCredentialsFromUrl(&clientConfig);

    qDebug() << "[LfsEndpoint] resolved LFS server" << clientConfig.serverUrl.toString();
    return Monad::Result<LfsClientConfig>(clientConfig);
}

} // namespace QLfs
