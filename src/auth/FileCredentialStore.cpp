/*
 * Copyright 2024 The assetbridge contributors
 *
 * This file is part of assetbridge
 *
 * assetbridge is free software; you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as published by
 * the Free Software Foundation, version 3 of the License.
 *
 * assetbridge is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with assetbridge. If not, see <http://www.gnu.org/licenses/>.
 */

#include "FileCredentialStore.h"

#include <assetbridge/exception/InvalidArgument.h>
#include <assetbridge/exception/RuntimeError.h>
#include <assetbridge/logging/AssetBridgeLogger.h>
#include <assetbridge/utility/DateTime.h>

#include <QDir>
#include <QFile>
#include <QFileDevice>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QLockFile>
#include <QMutexLocker>
#include <QSaveFile>

namespace assetbridge::auth {

namespace {

constexpr int gLockTimeoutMsec = 10000;

const QString gAccessTokenKey = QStringLiteral("access_token");
const QString gRefreshTokenKey = QStringLiteral("refresh_token");
const QString gExpiresAtKey = QStringLiteral("expires_at");
const QString gTokenTypeKey = QStringLiteral("token_type");
const QString gScopesKey = QStringLiteral("scopes");

/**
 * Takes the lock file next to the record; the lock is released when
 * the object goes out of scope
 */
class RecordLock
{
public:
    explicit RecordLock(const QString & recordFilePath) :
        m_lockFile{recordFilePath + QStringLiteral(".lock")}
    {
        m_locked = m_lockFile.tryLock(gLockTimeoutMsec);
    }

    ~RecordLock()
    {
        if (m_locked) {
            m_lockFile.unlock();
        }
    }

    [[nodiscard]] bool isLocked() const noexcept
    {
        return m_locked;
    }

    [[nodiscard]] QLockFile::LockError error() const
    {
        return m_lockFile.error();
    }

private:
    QLockFile m_lockFile;
    bool m_locked = false;
};

[[nodiscard]] QByteArray serializeSession(const Session & session)
{
    QJsonObject object;
    object[gAccessTokenKey] = session.accessToken;
    if (!session.refreshToken.isEmpty()) {
        object[gRefreshTokenKey] = session.refreshToken;
    }
    object[gExpiresAtKey] = toIsoDateTimeString(session.expiresAt);
    object[gTokenTypeKey] = session.tokenType;
    object[gScopesKey] = QJsonArray::fromStringList(session.scopes);
    return QJsonDocument{object}.toJson(QJsonDocument::Indented);
}

[[nodiscard]] std::optional<Session> deserializeSession(
    const ServiceId serviceId, const QByteArray & data,
    ErrorString & errorDescription)
{
    QJsonParseError parseError;
    const auto document = QJsonDocument::fromJson(data, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        errorDescription.setBase(QStringLiteral("malformed JSON"));
        errorDescription.setDetails(parseError.errorString());
        return std::nullopt;
    }

    if (!document.isObject()) {
        errorDescription.setBase(QStringLiteral("JSON object expected"));
        return std::nullopt;
    }

    const auto object = document.object();

    Session session;
    session.serviceId = serviceId;
    session.accessToken = object.value(gAccessTokenKey).toString();
    if (session.accessToken.isEmpty()) {
        errorDescription.setBase(QStringLiteral("no access token"));
        return std::nullopt;
    }

    session.refreshToken = object.value(gRefreshTokenKey).toString();

    const QString expiresAt = object.value(gExpiresAtKey).toString();
    session.expiresAt = fromIsoDateTimeString(expiresAt);
    if (!session.expiresAt.isValid()) {
        errorDescription.setBase(QStringLiteral("invalid expiration time"));
        errorDescription.setDetails(expiresAt);
        return std::nullopt;
    }

    const QString tokenType = object.value(gTokenTypeKey).toString();
    if (!tokenType.isEmpty()) {
        session.tokenType = tokenType;
    }

    const auto scopes = object.value(gScopesKey).toArray();
    for (const auto & scope: scopes) {
        const QString scopeStr = scope.toString();
        if (!scopeStr.isEmpty()) {
            session.scopes << scopeStr;
        }
    }

    return session;
}

} // namespace

FileCredentialStore::FileCredentialStore(QString dirPath) :
    m_dirPath{std::move(dirPath)}
{
    if (Q_UNLIKELY(m_dirPath.isEmpty())) {
        throw InvalidArgument{ErrorString{
            QStringLiteral("FileCredentialStore ctor: directory path is "
                           "empty")}};
    }
}

QString FileCredentialStore::recordFilePath(const ServiceId serviceId) const
{
    return m_dirPath + QStringLiteral("/") + serviceName(serviceId) +
        QStringLiteral("_token.json");
}

std::optional<Session> FileCredentialStore::load(const ServiceId serviceId)
{
    const QMutexLocker locker{&m_mutex};
    return loadImpl(serviceId);
}

std::optional<Session> FileCredentialStore::loadImpl(const ServiceId serviceId)
{
    const QString filePath = recordFilePath(serviceId);
    if (!QFile::exists(filePath)) {
        ABDEBUG(
            "auth::FileCredentialStore",
            "No persisted session for " << serviceId);
        return std::nullopt;
    }

    const RecordLock lock{filePath};
    if (Q_UNLIKELY(!lock.isLocked())) {
        ABWARNING(
            "auth::FileCredentialStore",
            "Failed to lock the token record for reading: " << filePath
                << ", lock error " << static_cast<int>(lock.error()));
        return std::nullopt;
    }

    QFile file{filePath};
    if (!file.open(QIODevice::ReadOnly)) {
        ABWARNING(
            "auth::FileCredentialStore",
            "Failed to open the token record " << filePath << ": "
                << file.errorString());
        return std::nullopt;
    }

    const QByteArray data = file.readAll();
    file.close();

    ErrorString errorDescription;
    auto session = deserializeSession(serviceId, data, errorDescription);
    if (!session) {
        ABWARNING(
            "auth::FileCredentialStore",
            "Ignoring corrupt token record " << filePath << ": "
                << errorDescription);
        return std::nullopt;
    }

    ABDEBUG("auth::FileCredentialStore", "Loaded " << *session);
    return session;
}

void FileCredentialStore::save(const Session & session)
{
    const QMutexLocker locker{&m_mutex};

    ABDEBUG("auth::FileCredentialStore", "Saving " << session);

    if (!QDir{}.mkpath(m_dirPath)) {
        ErrorString error{
            QT_TRANSLATE_NOOP("auth", "Cannot create tokens directory")};
        error.setDetails(m_dirPath);
        throw RuntimeError{std::move(error)};
    }

    const QString filePath = recordFilePath(session.serviceId);
    const RecordLock lock{filePath};
    if (Q_UNLIKELY(!lock.isLocked())) {
        ErrorString error{
            QT_TRANSLATE_NOOP("auth", "Cannot lock token record for writing")};
        error.setDetails(filePath);
        throw RuntimeError{std::move(error)};
    }

    QSaveFile file{filePath};
    if (!file.open(QIODevice::WriteOnly)) {
        ErrorString error{
            QT_TRANSLATE_NOOP("auth", "Cannot open token record for writing")};
        error.setDetails(file.errorString());
        throw RuntimeError{std::move(error)};
    }

    const QByteArray data = serializeSession(session);
    if (file.write(data) != data.size() || !file.commit()) {
        ErrorString error{
            QT_TRANSLATE_NOOP("auth", "Cannot write token record")};
        error.setDetails(file.errorString());
        throw RuntimeError{std::move(error)};
    }

    if (!QFile::setPermissions(
            filePath, QFileDevice::ReadOwner | QFileDevice::WriteOwner))
    {
        ABWARNING(
            "auth::FileCredentialStore",
            "Failed to restrict permissions of " << filePath);
    }
}

void FileCredentialStore::clear(const ServiceId serviceId)
{
    const QMutexLocker locker{&m_mutex};
    clearImpl(serviceId);
}

void FileCredentialStore::clearAll()
{
    const QMutexLocker locker{&m_mutex};
    for (const auto serviceId: allServiceIds()) {
        clearImpl(serviceId);
    }
}

void FileCredentialStore::clearImpl(const ServiceId serviceId)
{
    const QString filePath = recordFilePath(serviceId);
    if (!QFile::exists(filePath)) {
        return;
    }

    const RecordLock lock{filePath};
    if (Q_UNLIKELY(!lock.isLocked())) {
        ErrorString error{
            QT_TRANSLATE_NOOP("auth", "Cannot lock token record for removal")};
        error.setDetails(filePath);
        throw RuntimeError{std::move(error)};
    }

    QFile file{filePath};
    if (!file.remove()) {
        ErrorString error{
            QT_TRANSLATE_NOOP("auth", "Cannot remove token record")};
        error.setDetails(file.errorString());
        throw RuntimeError{std::move(error)};
    }

    ABINFO(
        "auth::FileCredentialStore",
        "Removed persisted session for " << serviceId);
}

QMap<ServiceId, bool> FileCredentialStore::authenticationStatus()
{
    const QMutexLocker locker{&m_mutex};
    const auto now = QDateTime::currentDateTimeUtc();

    QMap<ServiceId, bool> result;
    for (const auto serviceId: allServiceIds()) {
        const auto session = loadImpl(serviceId);
        result[serviceId] = session && isSessionValid(*session, now);
    }

    return result;
}

} // namespace assetbridge::auth
