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

#include <assetbridge/configuration/Configuration.h>

#include <assetbridge/exception/InvalidArgument.h>
#include <assetbridge/logging/AssetBridgeLogger.h>
#include <assetbridge/utility/ApplicationSettings.h>
#include <assetbridge/utility/StandardPaths.h>

#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>

#include <algorithm>

namespace assetbridge {

namespace {

constexpr const char * gAdobeClientIdEnvVar = "ADOBE_CLIENT_ID";
constexpr const char * gAdobeClientSecretEnvVar = "ADOBE_CLIENT_SECRET";
constexpr const char * gAdobeRedirectUriEnvVar = "ADOBE_REDIRECT_URI";

[[noreturn]] void throwInvalidSetting(
    const utility::ApplicationSettings & settings, const QString & key,
    const QVariant & value)
{
    ErrorString error{
        QT_TRANSLATE_NOOP("configuration", "Invalid configuration value")};
    error.setDetails(
        settings.group() + QStringLiteral("/") + key + QStringLiteral(" = ") +
        value.toString());
    throw InvalidArgument{std::move(error)};
}

[[nodiscard]] int readInt(
    utility::ApplicationSettings & settings, const QString & key,
    const int defaultValue, const int minValue)
{
    const auto value = settings.value(key);
    if (!value.isValid()) {
        return defaultValue;
    }

    bool conversionResult = false;
    const int result = value.toInt(&conversionResult);
    if (!conversionResult || result < minValue) {
        throwInvalidSetting(settings, key, value);
    }

    return result;
}

[[nodiscard]] std::chrono::milliseconds readDuration(
    utility::ApplicationSettings & settings, const QString & key,
    const std::chrono::milliseconds defaultValue)
{
    return std::chrono::milliseconds{readInt(
        settings, key, static_cast<int>(defaultValue.count()), 1)};
}

[[nodiscard]] bool readBool(
    utility::ApplicationSettings & settings, const QString & key,
    const bool defaultValue)
{
    const auto value = settings.value(key);
    if (!value.isValid()) {
        return defaultValue;
    }

    const QString str = value.toString().toLower();
    if (str == QStringLiteral("true") || str == QStringLiteral("1")) {
        return true;
    }

    if (str == QStringLiteral("false") || str == QStringLiteral("0")) {
        return false;
    }

    throwInvalidSetting(settings, key, value);
}

[[nodiscard]] QUrl readUrl(
    utility::ApplicationSettings & settings, const QString & key,
    const QUrl & defaultValue)
{
    const auto value = settings.value(key);
    if (!value.isValid()) {
        return defaultValue;
    }

    const QUrl url{value.toString(), QUrl::StrictMode};
    if (!url.isValid() || url.isRelative()) {
        throwInvalidSetting(settings, key, value);
    }

    return url;
}

[[nodiscard]] QString readEnvironmentVariable(const char * name)
{
    return qEnvironmentVariable(name).trimmed();
}

} // namespace

Configuration::Configuration() :
    googleRedirectUri{auth::defaultGoogleOAuthClientConfig().redirectUri},
    adobeRedirectUri{auth::defaultAdobeOAuthClientConfig().redirectUri},
    tokensDirPath{utility::defaultTokensStoragePath()},
    sourceApiBaseUrl{QStringLiteral("https://www.googleapis.com")},
    destinationApiBaseUrl{QStringLiteral("https://lr.adobe.io")}
{}

QTextStream & Configuration::print(QTextStream & strm) const
{
    strm << "Configuration:\n"
         << "  network timeout: " << networkTimeout.count() << " msec\n"
         << "  transfer timeout: " << transferTimeout.count() << " msec\n"
         << "  " << retryPolicy << "\n"
         << "  authorization timeout: " << authorizationTimeout.count()
         << " msec\n"
         << "  Google redirect URI: " << googleRedirectUri.toString() << "\n"
         << "  Adobe redirect URI: " << adobeRedirectUri.toString() << "\n"
         << "  Google client secrets file: " << googleClientSecretsFile
         << "\n"
         << "  batch size: " << batchSize << "\n"
         << "  strict association: " << (strictAssociation ? "true" : "false")
         << "\n"
         << "  source page size: " << sourcePageSize << "\n"
         << "  destination page size: " << destinationPageSize << "\n"
         << "  max path depth: " << maxPathDepth << "\n"
         << "  tokens dir: " << tokensDirPath << "\n"
         << "  source API: " << sourceApiBaseUrl.toString() << "\n"
         << "  destination API: " << destinationApiBaseUrl.toString() << "\n";
    return strm;
}

Configuration readConfiguration(utility::ApplicationSettings & settings)
{
    Configuration config;

    settings.beginGroup(QStringLiteral("Network"));
    {
        utility::ApplicationSettings::GroupCloser groupCloser{settings};

        config.networkTimeout = readDuration(
            settings, QStringLiteral("timeoutMsec"), config.networkTimeout);

        config.transferTimeout = readDuration(
            settings, QStringLiteral("transferTimeoutMsec"),
            std::max(config.transferTimeout, config.networkTimeout));

        if (config.transferTimeout < config.networkTimeout) {
            throwInvalidSetting(
                settings, QStringLiteral("transferTimeoutMsec"),
                QVariant::fromValue(
                    static_cast<qint64>(config.transferTimeout.count())));
        }

        config.retryPolicy.maxAttempts = readInt(
            settings, QStringLiteral("maxAttempts"),
            config.retryPolicy.maxAttempts, 1);

        config.retryPolicy.initialDelay = readDuration(
            settings, QStringLiteral("retryInitialDelayMsec"),
            config.retryPolicy.initialDelay);

        config.retryPolicy.maxDelay = readDuration(
            settings, QStringLiteral("retryMaxDelayMsec"),
            config.retryPolicy.maxDelay);

        if (config.retryPolicy.maxDelay < config.retryPolicy.initialDelay) {
            throwInvalidSetting(
                settings, QStringLiteral("retryMaxDelayMsec"),
                QVariant::fromValue(
                    static_cast<qint64>(config.retryPolicy.maxDelay.count())));
        }
    }

    settings.beginGroup(QStringLiteral("Auth"));
    {
        utility::ApplicationSettings::GroupCloser groupCloser{settings};

        config.authorizationTimeout = readDuration(
            settings, QStringLiteral("timeoutMsec"),
            config.authorizationTimeout);

        config.googleRedirectUri = readUrl(
            settings, QStringLiteral("googleRedirectUri"),
            config.googleRedirectUri);

        config.adobeRedirectUri = readUrl(
            settings, QStringLiteral("adobeRedirectUri"),
            config.adobeRedirectUri);

        config.googleClientSecretsFile =
            settings
                .value(
                    QStringLiteral("googleClientSecretsFile"),
                    config.googleClientSecretsFile)
                .toString();
    }

    settings.beginGroup(QStringLiteral("Transfer"));
    {
        utility::ApplicationSettings::GroupCloser groupCloser{settings};

        config.batchSize =
            readInt(settings, QStringLiteral("batchSize"), config.batchSize, 1);

        config.strictAssociation = readBool(
            settings, QStringLiteral("strictAssociation"),
            config.strictAssociation);
    }

    settings.beginGroup(QStringLiteral("Browsing"));
    {
        utility::ApplicationSettings::GroupCloser groupCloser{settings};

        config.sourcePageSize = readInt(
            settings, QStringLiteral("sourcePageSize"), config.sourcePageSize,
            1);

        config.destinationPageSize = readInt(
            settings, QStringLiteral("destinationPageSize"),
            config.destinationPageSize, 1);

        config.maxPathDepth = readInt(
            settings, QStringLiteral("maxPathDepth"), config.maxPathDepth, 1);
    }

    settings.beginGroup(QStringLiteral("Storage"));
    {
        utility::ApplicationSettings::GroupCloser groupCloser{settings};

        config.tokensDirPath =
            settings
                .value(QStringLiteral("tokensDir"), config.tokensDirPath)
                .toString();
    }

    settings.beginGroup(QStringLiteral("Endpoints"));
    {
        utility::ApplicationSettings::GroupCloser groupCloser{settings};

        config.sourceApiBaseUrl = readUrl(
            settings, QStringLiteral("sourceApiBaseUrl"),
            config.sourceApiBaseUrl);

        config.destinationApiBaseUrl = readUrl(
            settings, QStringLiteral("destinationApiBaseUrl"),
            config.destinationApiBaseUrl);
    }

    ABDEBUG("configuration", config);
    return config;
}

auth::OAuthClientConfig readGoogleOAuthClientConfig(
    const QString & clientSecretsFilePath)
{
    QFile file{clientSecretsFilePath};
    if (!file.open(QIODevice::ReadOnly)) {
        ErrorString error{QT_TRANSLATE_NOOP(
            "configuration", "Cannot open Google client secrets file")};
        error.setDetails(clientSecretsFilePath);
        throw InvalidArgument{std::move(error)};
    }

    QJsonParseError parseError;
    const auto document = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !document.isObject())
    {
        ErrorString error{QT_TRANSLATE_NOOP(
            "configuration", "Cannot parse Google client secrets file")};
        error.setDetails(clientSecretsFilePath);
        throw InvalidArgument{std::move(error)};
    }

    const auto root = document.object();
    QJsonObject section = root.value(QStringLiteral("installed")).toObject();
    if (section.isEmpty()) {
        section = root.value(QStringLiteral("web")).toObject();
    }

    auto config = auth::defaultGoogleOAuthClientConfig();
    config.clientId = section.value(QStringLiteral("client_id")).toString();
    config.clientSecret =
        section.value(QStringLiteral("client_secret")).toString();

    if (config.clientId.isEmpty()) {
        ErrorString error{QT_TRANSLATE_NOOP(
            "configuration", "Google client secrets file has no client_id")};
        error.setDetails(clientSecretsFilePath);
        throw InvalidArgument{std::move(error)};
    }

    const QString authUri = section.value(QStringLiteral("auth_uri")).toString();
    if (!authUri.isEmpty()) {
        config.authorizationEndpoint = QUrl{authUri};
    }

    const QString tokenUri =
        section.value(QStringLiteral("token_uri")).toString();
    if (!tokenUri.isEmpty()) {
        config.tokenEndpoint = QUrl{tokenUri};
    }

    return config;
}

auth::OAuthClientConfig readAdobeOAuthClientConfig()
{
    auto config = auth::defaultAdobeOAuthClientConfig();

    config.clientId = readEnvironmentVariable(gAdobeClientIdEnvVar);
    if (config.clientId.isEmpty()) {
        ErrorString error{QT_TRANSLATE_NOOP(
            "configuration", "Missing environment variable")};
        error.setDetails(QString::fromUtf8(gAdobeClientIdEnvVar));
        throw InvalidArgument{std::move(error)};
    }

    config.clientSecret = readEnvironmentVariable(gAdobeClientSecretEnvVar);
    if (config.clientSecret.isEmpty()) {
        ErrorString error{QT_TRANSLATE_NOOP(
            "configuration", "Missing environment variable")};
        error.setDetails(QString::fromUtf8(gAdobeClientSecretEnvVar));
        throw InvalidArgument{std::move(error)};
    }

    const QString redirectUri = readEnvironmentVariable(gAdobeRedirectUriEnvVar);
    if (!redirectUri.isEmpty()) {
        const QUrl url{redirectUri, QUrl::StrictMode};
        if (!url.isValid()) {
            ErrorString error{QT_TRANSLATE_NOOP(
                "configuration", "Invalid redirect URI in environment")};
            error.setDetails(QString::fromUtf8(gAdobeRedirectUriEnvVar));
            throw InvalidArgument{std::move(error)};
        }
        config.redirectUri = url;
    }

    return config;
}

} // namespace assetbridge
