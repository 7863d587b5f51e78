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

#include <assetbridge/network/INetworkTransport.h>

#include <chrono>
#include <memory>

QT_BEGIN_NAMESPACE

class QNetworkAccessManager;

QT_END_NAMESPACE

namespace assetbridge::network {

/**
 * @brief The NetworkAccessManagerTransport class sends requests through
 * QNetworkAccessManager and waits for the reply in a local event loop.
 * The timeout bounds inactivity: it restarts whenever data is sent or
 * received. The transfer timeout bounds the whole request.
 */
class NetworkAccessManagerTransport final : public INetworkTransport
{
public:
    NetworkAccessManagerTransport(
        std::chrono::milliseconds timeout,
        std::chrono::milliseconds transferTimeout);
    ~NetworkAccessManagerTransport() override;

    [[nodiscard]] HttpResponse send(const HttpRequest & request) override;

private:
    const std::chrono::milliseconds m_timeout;
    const std::chrono::milliseconds m_transferTimeout;
    const std::unique_ptr<QNetworkAccessManager> m_networkAccessManager;
};

} // namespace assetbridge::network
