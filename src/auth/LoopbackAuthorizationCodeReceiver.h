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

#include <assetbridge/auth/IAuthorizationCodeReceiver.h>

#include <QTcpServer>

#include <chrono>
#include <memory>

namespace assetbridge::auth {

/**
 * @brief The LoopbackAuthorizationCodeReceiver class receives the
 * authorization code through the browser's redirect to a local TCP server.
 * Port 0 in the configured redirect URI means any free port.
 */
class LoopbackAuthorizationCodeReceiver final :
    public IAuthorizationCodeReceiver
{
public:
    LoopbackAuthorizationCodeReceiver(
        QUrl redirectUri, std::chrono::milliseconds timeout,
        UrlOpener urlOpener);

    ~LoopbackAuthorizationCodeReceiver() override;

public: // IAuthorizationCodeReceiver
    [[nodiscard]] QUrl redirectUri() override;

    [[nodiscard]] QString receiveAuthorizationCode(
        const QUrl & authorizationUrl, const QString & state) override;

private:
    void ensureListening();

private:
    const QUrl m_configuredRedirectUri;
    const std::chrono::milliseconds m_timeout;
    const UrlOpener m_urlOpener;

    std::unique_ptr<QTcpServer> m_server;
};

} // namespace assetbridge::auth
