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
#include <assetbridge/auth/IAuthorizationCodeReceiver.h>
#include <assetbridge/network/Fwd.h>
#include <assetbridge/utility/Linkage.h>

#include <QDateTime>
#include <QString>
#include <QUrl>

#include <chrono>
#include <functional>

namespace assetbridge::auth {

using Clock = std::function<QDateTime()>;

[[nodiscard]] ASSETBRIDGE_EXPORT ICredentialStorePtr
    createFileCredentialStore(QString dirPath);

[[nodiscard]] ASSETBRIDGE_EXPORT ITokenLifecycleManagerPtr
    createGoogleTokenLifecycleManager(
        OAuthClientConfig clientConfig, ICredentialStorePtr credentialStore,
        IAuthorizationCodeReceiverPtr authorizationCodeReceiver,
        network::INetworkTransportPtr networkTransport, Clock clock = {});

[[nodiscard]] ASSETBRIDGE_EXPORT ITokenLifecycleManagerPtr
    createAdobeTokenLifecycleManager(
        OAuthClientConfig clientConfig, ICredentialStorePtr credentialStore,
        IAuthorizationCodeReceiverPtr authorizationCodeReceiver,
        network::INetworkTransportPtr networkTransport, Clock clock = {});

[[nodiscard]] ASSETBRIDGE_EXPORT IAuthorizationCodeReceiverPtr
    createLoopbackAuthorizationCodeReceiver(
        QUrl redirectUri, std::chrono::milliseconds timeout,
        UrlOpener urlOpener = {});

[[nodiscard]] ASSETBRIDGE_EXPORT IAuthorizationCodeReceiverPtr
    createPastedCodeAuthorizationCodeReceiver(
        QUrl redirectUri, UrlOpener urlOpener = {},
        LineReader lineReader = {});

/**
 * Prints the URL to stderr and tries to open it with the desktop's browser
 */
[[nodiscard]] ASSETBRIDGE_EXPORT UrlOpener defaultUrlOpener();

/**
 * Reads lines from the standard input
 */
[[nodiscard]] ASSETBRIDGE_EXPORT LineReader standardInputLineReader();

} // namespace assetbridge::auth
