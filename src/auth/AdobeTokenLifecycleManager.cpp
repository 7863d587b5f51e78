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

#include "AdobeTokenLifecycleManager.h"

#include <assetbridge/auth/ServiceId.h>
#include <assetbridge/network/ResponseNormalization.h>

namespace assetbridge::auth {

AdobeTokenLifecycleManager::AdobeTokenLifecycleManager(
    OAuthClientConfig clientConfig, ICredentialStorePtr credentialStore,
    IAuthorizationCodeReceiverPtr authorizationCodeReceiver,
    network::INetworkTransportPtr networkTransport, Clock clock) :
    TokenLifecycleManager{
        ServiceId::Adobe,           std::move(clientConfig),
        std::move(credentialStore), std::move(authorizationCodeReceiver),
        std::move(networkTransport), std::move(clock)}
{}

QString AdobeTokenLifecycleManager::joinScopes(const QStringList & scopes) const
{
    return scopes.join(QStringLiteral(","));
}

QByteArray AdobeTokenLifecycleManager::normalizeTokenResponse(
    QByteArray body) const
{
    return network::stripAntiHijackingPrefix(std::move(body));
}

network::HttpHeaders AdobeTokenLifecycleManager::additionalHeaders() const
{
    return network::HttpHeaders{} << network::HttpHeader{
               QByteArrayLiteral("X-API-Key"), clientConfig().clientId.toUtf8()};
}

} // namespace assetbridge::auth
