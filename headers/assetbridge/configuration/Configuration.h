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

#include <assetbridge/auth/OAuthClientConfig.h>
#include <assetbridge/network/RetryPolicy.h>
#include <assetbridge/utility/Printable.h>

#include <QString>
#include <QUrl>

#include <chrono>

namespace assetbridge {

namespace utility {

class ApplicationSettings;

} // namespace utility

/**
 * @brief The Configuration struct holds the tunables of a transfer session.
 * Default values are used for settings which are absent.
 */
struct ASSETBRIDGE_EXPORT Configuration : public utility::Printable
{
    Configuration();

    QTextStream & print(QTextStream & strm) const override;

    // Network
    std::chrono::milliseconds networkTimeout{60000};

    /**
     * Upper bound of a whole request including body transfer; networkTimeout
     * bounds only the time without any data sent or received
     */
    std::chrono::milliseconds transferTimeout{600000};
    network::RetryPolicy retryPolicy;

    // Auth
    std::chrono::milliseconds authorizationTimeout{300000};
    QUrl googleRedirectUri;
    QUrl adobeRedirectUri;
    QString googleClientSecretsFile;

    // Transfer
    int batchSize = 5;
    bool strictAssociation = false;

    // Browsing
    int sourcePageSize = 100;
    int destinationPageSize = 25;
    int maxPathDepth = 32;

    // Storage
    QString tokensDirPath;

    // Endpoints
    QUrl sourceApiBaseUrl;
    QUrl destinationApiBaseUrl;
};

/**
 * Reads configuration from groups Network, Auth, Transfer, Browsing, Storage
 * and Endpoints of the settings
 * @throw InvalidArgument if some setting has invalid value
 */
[[nodiscard]] ASSETBRIDGE_EXPORT Configuration
    readConfiguration(utility::ApplicationSettings & settings);

/**
 * Reads Google OAuth client from client secrets JSON file as downloaded from
 * Google Cloud console ("installed" or "web" application)
 * @throw InvalidArgument if the file cannot be read or lacks client id
 */
[[nodiscard]] ASSETBRIDGE_EXPORT auth::OAuthClientConfig
    readGoogleOAuthClientConfig(const QString & clientSecretsFilePath);

/**
 * Reads Adobe OAuth client from ADOBE_CLIENT_ID, ADOBE_CLIENT_SECRET and
 * optional ADOBE_REDIRECT_URI environment variables
 * @throw InvalidArgument naming the missing variable
 */
[[nodiscard]] ASSETBRIDGE_EXPORT auth::OAuthClientConfig
    readAdobeOAuthClientConfig();

} // namespace assetbridge
