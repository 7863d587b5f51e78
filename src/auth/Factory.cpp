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

#include "AdobeTokenLifecycleManager.h"
#include "FileCredentialStore.h"
#include "GoogleTokenLifecycleManager.h"
#include "LoopbackAuthorizationCodeReceiver.h"
#include "PastedCodeAuthorizationCodeReceiver.h"

#include <assetbridge/auth/Factory.h>

#include <QProcess>
#include <QTextStream>

#include <cstdio>

namespace assetbridge::auth {

ICredentialStorePtr createFileCredentialStore(QString dirPath)
{
    return std::make_shared<FileCredentialStore>(std::move(dirPath));
}

ITokenLifecycleManagerPtr createGoogleTokenLifecycleManager(
    OAuthClientConfig clientConfig, ICredentialStorePtr credentialStore,
    IAuthorizationCodeReceiverPtr authorizationCodeReceiver,
    network::INetworkTransportPtr networkTransport, Clock clock)
{
    return std::make_shared<GoogleTokenLifecycleManager>(
        std::move(clientConfig), std::move(credentialStore),
        std::move(authorizationCodeReceiver), std::move(networkTransport),
        std::move(clock));
}

ITokenLifecycleManagerPtr createAdobeTokenLifecycleManager(
    OAuthClientConfig clientConfig, ICredentialStorePtr credentialStore,
    IAuthorizationCodeReceiverPtr authorizationCodeReceiver,
    network::INetworkTransportPtr networkTransport, Clock clock)
{
    return std::make_shared<AdobeTokenLifecycleManager>(
        std::move(clientConfig), std::move(credentialStore),
        std::move(authorizationCodeReceiver), std::move(networkTransport),
        std::move(clock));
}

IAuthorizationCodeReceiverPtr createLoopbackAuthorizationCodeReceiver(
    QUrl redirectUri, const std::chrono::milliseconds timeout,
    UrlOpener urlOpener)
{
    return std::make_shared<LoopbackAuthorizationCodeReceiver>(
        std::move(redirectUri), timeout,
        urlOpener ? std::move(urlOpener) : defaultUrlOpener());
}

IAuthorizationCodeReceiverPtr createPastedCodeAuthorizationCodeReceiver(
    QUrl redirectUri, UrlOpener urlOpener, LineReader lineReader)
{
    return std::make_shared<PastedCodeAuthorizationCodeReceiver>(
        std::move(redirectUri),
        urlOpener ? std::move(urlOpener) : defaultUrlOpener(),
        lineReader ? std::move(lineReader) : standardInputLineReader());
}

UrlOpener defaultUrlOpener()
{
    return [](const QUrl & url) {
        QTextStream strm{stderr};
        strm << "Open the following URL in a browser to authorize access:\n"
             << url.toString(QUrl::FullyEncoded) << "\n";
        strm.flush();

#ifdef Q_OS_MAC
        const QString program = QStringLiteral("open");
#else
        const QString program = QStringLiteral("xdg-open");
#endif

        return QProcess::startDetached(
            program, QStringList{} << url.toString(QUrl::FullyEncoded));
    };
}

LineReader standardInputLineReader()
{
    return []() -> std::optional<QString> {
        QTextStream strm{stdin};
        const QString line = strm.readLine();
        if (line.isNull()) {
            return std::nullopt;
        }
        return line;
    };
}

} // namespace assetbridge::auth
