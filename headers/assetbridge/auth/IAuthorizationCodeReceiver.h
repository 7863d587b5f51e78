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

#include <assetbridge/utility/Linkage.h>

#include <QString>
#include <QUrl>

#include <functional>
#include <optional>

namespace assetbridge::auth {

/**
 * Presents the authorization URL to the user, i.e. opens it in a browser.
 * Returns false if the URL could not be opened.
 */
using UrlOpener = std::function<bool(const QUrl &)>;

/**
 * Blocks until the user enters a line of text; returns std::nullopt if the
 * input is closed
 */
using LineReader = std::function<std::optional<QString>()>;

/**
 * @brief The IAuthorizationCodeReceiver interface is the interactive part of
 * OAuth authorization code flow: it lets the user authorize the client and
 * hands the resulting authorization code back.
 */
class ASSETBRIDGE_EXPORT IAuthorizationCodeReceiver
{
public:
    virtual ~IAuthorizationCodeReceiver() = default;

    /**
     * Redirect URI to be put into the authorization request. The loopback
     * receiver starts listening when this method is called so that the port
     * in the returned URI is the actual one.
     */
    [[nodiscard]] virtual QUrl redirectUri() = 0;

    /**
     * Presents the authorization URL and blocks until the authorization code
     * is received.
     *
     * @param authorizationUrl  Fully composed authorization URL
     * @param state             Value of state parameter within the URL which
     *                          the redirect must carry back, if the receiver
     *                          can observe the redirect
     * @return                  The authorization code
     * @throw AuthenticationFailure if the user denied the authorization,
     *        the input was malformed or the wait timed out
     */
    [[nodiscard]] virtual QString receiveAuthorizationCode(
        const QUrl & authorizationUrl, const QString & state) = 0;
};

} // namespace assetbridge::auth
