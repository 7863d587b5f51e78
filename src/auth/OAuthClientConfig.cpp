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

#include <assetbridge/auth/OAuthClientConfig.h>

namespace assetbridge::auth {

QTextStream & OAuthClientConfig::print(QTextStream & strm) const
{
    strm << "OAuthClientConfig: client id = " << clientId
         << ", client secret: "
         << (clientSecret.isEmpty() ? "<not set>" : "<set>")
         << ", authorization endpoint = " << authorizationEndpoint.toString()
         << ", token endpoint = " << tokenEndpoint.toString()
         << ", redirect uri = " << redirectUri.toString()
         << ", scopes = " << scopes.join(QStringLiteral(" "));
    return strm;
}

OAuthClientConfig defaultGoogleOAuthClientConfig()
{
    OAuthClientConfig config;
    config.authorizationEndpoint =
        QUrl{QStringLiteral("https://accounts.google.com/o/oauth2/auth")};
    config.tokenEndpoint =
        QUrl{QStringLiteral("https://oauth2.googleapis.com/token")};
    config.redirectUri = QUrl{QStringLiteral("http://127.0.0.1:0/")};
    config.scopes = QStringList{
        QStringLiteral("https://www.googleapis.com/auth/drive.readonly")};
    return config;
}

OAuthClientConfig defaultAdobeOAuthClientConfig()
{
    OAuthClientConfig config;
    config.authorizationEndpoint = QUrl{
        QStringLiteral("https://ims-na1.adobelogin.com/ims/authorize/v2")};
    config.tokenEndpoint =
        QUrl{QStringLiteral("https://ims-na1.adobelogin.com/ims/token/v3")};
    config.redirectUri = QUrl{QStringLiteral("http://localhost:8080/callback")};
    config.scopes = QStringList{
        QStringLiteral("openid"), QStringLiteral("lr_partner_apis")};
    return config;
}

} // namespace assetbridge::auth
