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

#include "AuthenticatedRequestClient.h"
#include "DurableRequestClient.h"
#include "NetworkAccessManagerTransport.h"

#include <assetbridge/network/Factory.h>

namespace assetbridge::network {

INetworkTransportPtr createNetworkTransport(
    const std::chrono::milliseconds timeout,
    const std::chrono::milliseconds transferTimeout)
{
    return std::make_shared<NetworkAccessManagerTransport>(
        timeout, transferTimeout);
}

IRequestClientPtr createRequestClient(
    auth::ITokenLifecycleManagerPtr tokenLifecycleManager,
    INetworkTransportPtr networkTransport, QUrl apiBaseUrl,
    const ResponseNormalization responseNormalization)
{
    return std::make_shared<AuthenticatedRequestClient>(
        std::move(tokenLifecycleManager), std::move(networkTransport),
        std::move(apiBaseUrl), responseNormalization);
}

IRequestClientPtr createDurableRequestClient(
    IRequestClientPtr requestClient, const RetryPolicy & retryPolicy)
{
    if (retryPolicy.maxAttempts <= 1) {
        return requestClient;
    }

    return std::make_shared<DurableRequestClient>(
        std::move(requestClient), retryPolicy);
}

} // namespace assetbridge::network
