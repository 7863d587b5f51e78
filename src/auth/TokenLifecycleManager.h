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

#pragma once

#include <assetbridge/auth/Fwd.h>
#include <assetbridge/auth/ITokenLifecycleManager.h>
#include <assetbridge/auth/OAuthClientConfig.h>
#include <assetbridge/network/Fwd.h>

#include <QDateTime>
#include <QMutex>
#include <QUrlQuery>

#include <functional>
#include <optional>

namespace assetbridge::auth {

/**
 * @brief The TokenLifecycleManager class implements session acquisition
 * common to all services. Subclasses adjust the authorization request,
 * the token endpoint response handling and the authorization headers.
 */
class TokenLifecycleManager : public ITokenLifecycleManager
{
public:
    using Clock = std::function<QDateTime()>;

    TokenLifecycleManager(
        ServiceId serviceId, OAuthClientConfig clientConfig,
        ICredentialStorePtr credentialStore,
        IAuthorizationCodeReceiverPtr authorizationCodeReceiver,
        network::INetworkTransportPtr networkTransport, Clock clock = {});

public: // ITokenLifecycleManager
    [[nodiscard]] ServiceId serviceId() const noexcept override;
    [[nodiscard]] Session acquireSession() override;
    [[nodiscard]] bool isValid() const override;
    [[nodiscard]] network::HttpHeaders headers() override;
    void logout() override;

protected:
    [[nodiscard]] const OAuthClientConfig & clientConfig() const noexcept;

    /**
     * Query of the authorization URL. Contains client_id, redirect_uri,
     * response_type, scope and state by default.
     */
    [[nodiscard]] virtual QUrlQuery authorizationQuery(
        const QUrl & redirectUri, const QString & state) const;

    [[nodiscard]] virtual QString joinScopes(const QStringList & scopes) const;

    /**
     * Called on the token endpoint's response body before it is parsed
     */
    [[nodiscard]] virtual QByteArray normalizeTokenResponse(
        QByteArray body) const;

    /**
     * Headers sent along with Authorization header
     */
    [[nodiscard]] virtual network::HttpHeaders additionalHeaders() const;

private:
    [[nodiscard]] Session refresh(const Session & session);
    [[nodiscard]] Session authorizeInteractively();

    [[nodiscard]] network::HttpResponse sendTokenRequest(
        const QList<std::pair<QString, QString>> & parameters);

    [[nodiscard]] Session sessionFromTokenResponse(
        const network::HttpResponse & response,
        const QString & previousRefreshToken);

    [[nodiscard]] Session parseTokenResponse(
        const QByteArray & body, const QString & previousRefreshToken) const;

    void persist(const Session & session);
    void clearPersisted();

    [[nodiscard]] QDateTime now() const;

private:
    const ServiceId m_serviceId;
    const OAuthClientConfig m_clientConfig;
    const ICredentialStorePtr m_credentialStore;
    const IAuthorizationCodeReceiverPtr m_authorizationCodeReceiver;
    const network::INetworkTransportPtr m_networkTransport;
    const Clock m_clock;

    mutable QMutex m_mutex;
    std::optional<Session> m_session;
};

} // namespace assetbridge::auth
