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

#include "TokenLifecycleManager.h"

#include <assetbridge/auth/IAuthorizationCodeReceiver.h>
#include <assetbridge/auth/ICredentialStore.h>
#include <assetbridge/exception/AuthenticationFailure.h>
#include <assetbridge/exception/IAssetBridgeException.h>
#include <assetbridge/exception/InvalidArgument.h>
#include <assetbridge/exception/TransportFailure.h>
#include <assetbridge/logging/AssetBridgeLogger.h>
#include <assetbridge/network/INetworkTransport.h>
#include <assetbridge/utility/DateTime.h>

#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QMutexLocker>
#include <QRegularExpression>
#include <QUuid>

namespace assetbridge::auth {

namespace {

constexpr qint64 gDefaultExpiresInSeconds = 3600;

[[nodiscard]] QByteArray formEncode(
    const QList<std::pair<QString, QString>> & parameters)
{
    QByteArray result;
    for (const auto & [key, value]: parameters) {
        if (!result.isEmpty()) {
            result += '&';
        }

        result += QUrl::toPercentEncoding(key);
        result += '=';
        result += QUrl::toPercentEncoding(value);
    }

    return result;
}

[[nodiscard]] QString describeTokenEndpointResponse(
    const int statusCode, const QByteArray & body)
{
    return QStringLiteral("HTTP ") + QString::number(statusCode) +
        QStringLiteral(": ") + QString::fromUtf8(body);
}

} // namespace

TokenLifecycleManager::TokenLifecycleManager(
    const ServiceId serviceId, OAuthClientConfig clientConfig,
    ICredentialStorePtr credentialStore,
    IAuthorizationCodeReceiverPtr authorizationCodeReceiver,
    network::INetworkTransportPtr networkTransport, Clock clock) :
    m_serviceId{serviceId}, m_clientConfig{std::move(clientConfig)},
    m_credentialStore{std::move(credentialStore)},
    m_authorizationCodeReceiver{std::move(authorizationCodeReceiver)},
    m_networkTransport{std::move(networkTransport)},
    m_clock{
        clock ? std::move(clock) : Clock{[] {
            return QDateTime::currentDateTimeUtc();
        }}}
{
    if (Q_UNLIKELY(!m_credentialStore)) {
        throw InvalidArgument{ErrorString{QStringLiteral(
            "TokenLifecycleManager ctor: credential store is null")}};
    }

    if (Q_UNLIKELY(!m_authorizationCodeReceiver)) {
        throw InvalidArgument{ErrorString{QStringLiteral(
            "TokenLifecycleManager ctor: authorization code receiver is "
            "null")}};
    }

    if (Q_UNLIKELY(!m_networkTransport)) {
        throw InvalidArgument{ErrorString{QStringLiteral(
            "TokenLifecycleManager ctor: network transport is null")}};
    }

    if (Q_UNLIKELY(m_clientConfig.clientId.isEmpty())) {
        throw InvalidArgument{ErrorString{QStringLiteral(
            "TokenLifecycleManager ctor: OAuth client id is empty")}};
    }

    if (Q_UNLIKELY(!m_clientConfig.tokenEndpoint.isValid())) {
        throw InvalidArgument{ErrorString{QStringLiteral(
            "TokenLifecycleManager ctor: token endpoint is invalid")}};
    }
}

ServiceId TokenLifecycleManager::serviceId() const noexcept
{
    return m_serviceId;
}

Session TokenLifecycleManager::acquireSession()
{
    const QMutexLocker locker{&m_mutex};

    if (!m_session) {
        m_session = m_credentialStore->load(m_serviceId);
    }

    if (m_session && isSessionValid(*m_session, now())) {
        return *m_session;
    }

    if (m_session && !m_session->refreshToken.isEmpty()) {
        ABINFO(
            "auth::TokenLifecycleManager",
            "Session with " << m_serviceId
                            << " has expired or is about to, refreshing");
        try {
            auto session = refresh(*m_session);
            persist(session);
            m_session = session;
            return session;
        }
        catch (const AuthenticationFailure & e) {
            ABWARNING(
                "auth::TokenLifecycleManager",
                "Failed to refresh session with "
                    << m_serviceId << ", falling back to interactive "
                    << "authorization: " << e.nonLocalizedErrorMessage());
        }
    }

    m_session.reset();

    auto session = authorizeInteractively();
    persist(session);
    m_session = session;
    return session;
}

bool TokenLifecycleManager::isValid() const
{
    const QMutexLocker locker{&m_mutex};
    return m_session && isSessionValid(*m_session, now());
}

network::HttpHeaders TokenLifecycleManager::headers()
{
    const auto session = acquireSession();

    QString tokenType = session.tokenType;
    if (tokenType.isEmpty() ||
        tokenType.compare(QStringLiteral("bearer"), Qt::CaseInsensitive) == 0)
    {
        tokenType = QStringLiteral("Bearer");
    }

    network::HttpHeaders result;
    result << network::HttpHeader{
        QByteArrayLiteral("Authorization"),
        (tokenType + QStringLiteral(" ") + session.accessToken).toUtf8()};

    result << additionalHeaders();
    return result;
}

void TokenLifecycleManager::logout()
{
    const QMutexLocker locker{&m_mutex};

    ABINFO("auth::TokenLifecycleManager", "Logging out from " << m_serviceId);

    m_session.reset();
    m_credentialStore->clear(m_serviceId);
}

const OAuthClientConfig & TokenLifecycleManager::clientConfig() const noexcept
{
    return m_clientConfig;
}

QUrlQuery TokenLifecycleManager::authorizationQuery(
    const QUrl & redirectUri, const QString & state) const
{
    QUrlQuery query;
    query.addQueryItem(QStringLiteral("client_id"), m_clientConfig.clientId);
    query.addQueryItem(QStringLiteral("redirect_uri"), redirectUri.toString());
    query.addQueryItem(QStringLiteral("response_type"), QStringLiteral("code"));
    query.addQueryItem(
        QStringLiteral("scope"), joinScopes(m_clientConfig.scopes));
    query.addQueryItem(QStringLiteral("state"), state);
    return query;
}

QString TokenLifecycleManager::joinScopes(const QStringList & scopes) const
{
    return scopes.join(QStringLiteral(" "));
}

QByteArray TokenLifecycleManager::normalizeTokenResponse(QByteArray body) const
{
    return body;
}

network::HttpHeaders TokenLifecycleManager::additionalHeaders() const
{
    return {};
}

Session TokenLifecycleManager::refresh(const Session & session)
{
    QList<std::pair<QString, QString>> parameters;
    parameters << std::make_pair(
                      QStringLiteral("grant_type"),
                      QStringLiteral("refresh_token"))
               << std::make_pair(
                      QStringLiteral("refresh_token"), session.refreshToken)
               << std::make_pair(
                      QStringLiteral("client_id"), m_clientConfig.clientId);

    if (!m_clientConfig.clientSecret.isEmpty()) {
        parameters << std::make_pair(
            QStringLiteral("client_secret"), m_clientConfig.clientSecret);
    }

    const auto response = sendTokenRequest(parameters);
    if (!response.isSuccessful()) {
        ABWARNING(
            "auth::TokenLifecycleManager",
            "Refresh token for " << m_serviceId
                                 << " was rejected, clearing persisted "
                                 << "session");
        clearPersisted();
    }

    return sessionFromTokenResponse(response, session.refreshToken);
}

Session TokenLifecycleManager::authorizeInteractively()
{
    ABINFO(
        "auth::TokenLifecycleManager",
        "Starting interactive authorization with " << m_serviceId);

    const QUrl redirectUri = m_authorizationCodeReceiver->redirectUri();
    const QString state = QUuid::createUuid().toString(QUuid::Id128);

    QUrl authorizationUrl = m_clientConfig.authorizationEndpoint;
    authorizationUrl.setQuery(authorizationQuery(redirectUri, state));

    const QString code = m_authorizationCodeReceiver->receiveAuthorizationCode(
        authorizationUrl, state);

    if (Q_UNLIKELY(code.isEmpty())) {
        throw AuthenticationFailure{ErrorString{
            QT_TRANSLATE_NOOP("auth", "No authorization code received")}};
    }

    QList<std::pair<QString, QString>> parameters;
    parameters << std::make_pair(
                      QStringLiteral("grant_type"),
                      QStringLiteral("authorization_code"))
               << std::make_pair(QStringLiteral("code"), code)
               << std::make_pair(
                      QStringLiteral("redirect_uri"), redirectUri.toString())
               << std::make_pair(
                      QStringLiteral("client_id"), m_clientConfig.clientId);

    if (!m_clientConfig.clientSecret.isEmpty()) {
        parameters << std::make_pair(
            QStringLiteral("client_secret"), m_clientConfig.clientSecret);
    }

    auto session =
        sessionFromTokenResponse(sendTokenRequest(parameters), QString{});

    ABINFO(
        "auth::TokenLifecycleManager",
        "Interactive authorization with " << m_serviceId << " succeeded");

    return session;
}

network::HttpResponse TokenLifecycleManager::sendTokenRequest(
    const QList<std::pair<QString, QString>> & parameters)
{
    network::HttpRequest request;
    request.method = network::HttpMethod::Post;
    request.url = m_clientConfig.tokenEndpoint;
    request.headers << network::HttpHeader{
        QByteArrayLiteral("Content-Type"),
        QByteArrayLiteral("application/x-www-form-urlencoded")};
    request.headers << network::HttpHeader{
        QByteArrayLiteral("Accept"), QByteArrayLiteral("application/json")};
    request.body = formEncode(parameters);

    network::HttpResponse response;
    try {
        response = m_networkTransport->send(request);
    }
    catch (const TransportFailure & e) {
        ErrorString error{
            QT_TRANSLATE_NOOP("auth", "Token endpoint is unreachable")};
        error.setDetails(e.nonLocalizedErrorMessage());
        throw AuthenticationFailure{std::move(error)};
    }

    return response;
}

Session TokenLifecycleManager::sessionFromTokenResponse(
    const network::HttpResponse & response,
    const QString & previousRefreshToken)
{
    const QByteArray body = normalizeTokenResponse(response.body);
    if (!response.isSuccessful()) {
        ErrorString error{
            QT_TRANSLATE_NOOP("auth", "Token request was rejected")};
        error.setDetails(
            describeTokenEndpointResponse(response.statusCode, body));
        throw AuthenticationFailure{std::move(error)};
    }

    auto session = parseTokenResponse(body, previousRefreshToken);
    if (!isSessionValid(session, now())) {
        ErrorString error{QT_TRANSLATE_NOOP(
            "auth", "Received access token expires too soon to be used")};
        error.setDetails(toIsoDateTimeString(session.expiresAt));
        throw AuthenticationFailure{std::move(error)};
    }

    return session;
}

Session TokenLifecycleManager::parseTokenResponse(
    const QByteArray & body, const QString & previousRefreshToken) const
{
    QJsonParseError parseError;
    const auto document = QJsonDocument::fromJson(body, &parseError);
    if (parseError.error != QJsonParseError::NoError || !document.isObject())
    {
        ErrorString error{QT_TRANSLATE_NOOP(
            "auth", "Cannot parse token endpoint response")};
        error.setDetails(parseError.errorString());
        throw AuthenticationFailure{std::move(error)};
    }

    const auto object = document.object();

    Session session;
    session.serviceId = m_serviceId;
    session.accessToken = object.value(QStringLiteral("access_token")).toString();
    if (session.accessToken.isEmpty()) {
        throw AuthenticationFailure{ErrorString{QT_TRANSLATE_NOOP(
            "auth", "Token endpoint response contains no access token")}};
    }

    session.refreshToken =
        object.value(QStringLiteral("refresh_token")).toString();
    if (session.refreshToken.isEmpty()) {
        session.refreshToken = previousRefreshToken;
    }

    qint64 expiresIn = gDefaultExpiresInSeconds;
    const auto expiresInValue = object.value(QStringLiteral("expires_in"));
    if (expiresInValue.isDouble()) {
        expiresIn = static_cast<qint64>(expiresInValue.toDouble());
    }
    else if (expiresInValue.isString()) {
        bool conversionResult = false;
        const qint64 value =
            expiresInValue.toString().toLongLong(&conversionResult);
        if (conversionResult) {
            expiresIn = value;
        }
    }

    session.expiresAt = now().addSecs(expiresIn);

    const QString tokenType =
        object.value(QStringLiteral("token_type")).toString();
    if (!tokenType.isEmpty()) {
        session.tokenType = tokenType;
    }

    const QString scope = object.value(QStringLiteral("scope")).toString();
    if (scope.isEmpty()) {
        session.scopes = m_clientConfig.scopes;
    }
    else {
        session.scopes = scope.split(
            QRegularExpression{QStringLiteral("[\\s,]+")},
            Qt::SkipEmptyParts);
    }

    return session;
}

void TokenLifecycleManager::persist(const Session & session)
{
    try {
        m_credentialStore->save(session);
    }
    catch (const IAssetBridgeException & e) {
        ABWARNING(
            "auth::TokenLifecycleManager",
            "Failed to persist session with "
                << m_serviceId << ": " << e.nonLocalizedErrorMessage());
    }
}

void TokenLifecycleManager::clearPersisted()
{
    try {
        m_credentialStore->clear(m_serviceId);
    }
    catch (const IAssetBridgeException & e) {
        ABWARNING(
            "auth::TokenLifecycleManager",
            "Failed to clear persisted session with "
                << m_serviceId << ": " << e.nonLocalizedErrorMessage());
    }
}

QDateTime TokenLifecycleManager::now() const
{
    return m_clock();
}

} // namespace assetbridge::auth
