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
#include <assetbridge/network/Fwd.h>
#include <assetbridge/network/ResponseNormalization.h>
#include <assetbridge/network/RetryPolicy.h>

#include <QUrl>

#include <chrono>

namespace assetbridge::network {

/**
 * @param timeout           Maximum time without any data sent or received
 * @param transferTimeout   Maximum duration of a whole request, not shorter
 *                          than timeout
 */
[[nodiscard]] ASSETBRIDGE_EXPORT INetworkTransportPtr createNetworkTransport(
    std::chrono::milliseconds timeout,
    std::chrono::milliseconds transferTimeout);

[[nodiscard]] ASSETBRIDGE_EXPORT IRequestClientPtr createRequestClient(
    auth::ITokenLifecycleManagerPtr tokenLifecycleManager,
    INetworkTransportPtr networkTransport, QUrl apiBaseUrl,
    ResponseNormalization responseNormalization = ResponseNormalization::None);

/**
 * Wraps the request client with retrying on transient failures. Returns
 * the client itself if the policy allows a single attempt only.
 */
[[nodiscard]] ASSETBRIDGE_EXPORT IRequestClientPtr
    createDurableRequestClient(
        IRequestClientPtr requestClient, const RetryPolicy & retryPolicy);

} // namespace assetbridge::network
