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

#include <assetbridge/utility/Printable.h>

#include <QString>
#include <QStringList>
#include <QUrl>

namespace assetbridge::auth {

/**
 * @brief The OAuthClientConfig struct describes an OAuth client registered
 * with a service: its credentials, the service's endpoints and the scopes
 * to request.
 */
struct ASSETBRIDGE_EXPORT OAuthClientConfig : public utility::Printable
{
    QTextStream & print(QTextStream & strm) const override;

    QString clientId;
    QString clientSecret;
    QUrl authorizationEndpoint;
    QUrl tokenEndpoint;
    QUrl redirectUri;
    QStringList scopes;
};

/**
 * Google endpoints, read-only Drive scope and a loopback redirect URI on
 * a random free port. Client credentials are left empty.
 */
[[nodiscard]] ASSETBRIDGE_EXPORT OAuthClientConfig
    defaultGoogleOAuthClientConfig();

/**
 * Adobe IMS endpoints, Lightroom partner API scopes and the redirect URI
 * registered for pasted code flow. Client credentials are left empty.
 */
[[nodiscard]] ASSETBRIDGE_EXPORT OAuthClientConfig
    defaultAdobeOAuthClientConfig();

} // namespace assetbridge::auth
