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

#include <assetbridge/network/HttpTypes.h>
#include <assetbridge/utility/Linkage.h>

namespace assetbridge::network {

/**
 * @brief The INetworkTransport interface performs a single HTTP exchange
 * without any knowledge of credentials or provider specifics.
 */
class ASSETBRIDGE_EXPORT INetworkTransport
{
public:
    virtual ~INetworkTransport() = default;

    /**
     * Sends the request and waits for the response.
     *
     * @return the response for any HTTP status, including non-2xx ones
     * @throw TransportFailure if no HTTP response was received, i.e. on
     *        connection errors or when the configured timeout expires
     */
    [[nodiscard]] virtual HttpResponse send(const HttpRequest & request) = 0;
};

} // namespace assetbridge::network
