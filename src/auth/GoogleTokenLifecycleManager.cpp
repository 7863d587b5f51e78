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

#include "GoogleTokenLifecycleManager.h"

#include <assetbridge/auth/ServiceId.h>

namespace assetbridge::auth {

GoogleTokenLifecycleManager::GoogleTokenLifecycleManager(
    OAuthClientConfig clientConfig, ICredentialStorePtr credentialStore,
    IAuthorizationCodeReceiverPtr authorizationCodeReceiver,
    network::INetworkTransportPtr networkTransport, Clock clock) :
    TokenLifecycleManager{
        ServiceId::Google,          std::move(clientConfig),
        std::move(credentialStore), std::move(authorizationCodeReceiver),
        std::move(networkTransport), std::move(clock)}
{}

QUrlQuery GoogleTokenLifecycleManager::authorizationQuery(
    const QUrl & redirectUri, const QString & state) const
{
    auto query = TokenLifecycleManager::authorizationQuery(redirectUri, state);

    // Refresh token is issued only for offline access with forced consent
    query.addQueryItem(QStringLiteral("access_type"), QStringLiteral("offline"));
    query.addQueryItem(QStringLiteral("prompt"), QStringLiteral("consent"));
    return query;
}

} // namespace assetbridge::auth
