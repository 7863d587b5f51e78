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

#include "LoopbackAuthorizationCodeReceiver.h"

#include <network/HttpRequestParser.h>

#include <assetbridge/exception/AuthenticationFailure.h>
#include <assetbridge/exception/InvalidArgument.h>
#include <assetbridge/logging/AssetBridgeLogger.h>
#include <assetbridge/utility/EventLoopWithExitStatus.h>

#include <QHostAddress>
#include <QTcpSocket>
#include <QTimer>
#include <QUrlQuery>

namespace assetbridge::auth {

namespace {

[[nodiscard]] QByteArray composeHtmlResponse(
    const QByteArray & status, const QString & message)
{
    const QByteArray html =
        QStringLiteral(
            "<html><head><title>Authorization</title></head>"
            "<body><p>%1</p></body></html>")
            .arg(message.toHtmlEscaped())
            .toUtf8();

    QByteArray response;
    response.append("HTTP/1.1 ");
    response.append(status);
    response.append("\r\nContent-Type: text/html; charset=utf-8\r\n");
    response.append("Content-Length: ");
    response.append(QByteArray::number(html.size()));
    response.append("\r\nConnection: close\r\n\r\n");
    response.append(html);
    return response;
}

void respond(QTcpSocket & socket, const QByteArray & response)
{
    socket.write(response);
    socket.waitForBytesWritten(1000);
    socket.disconnectFromHost();
}

[[nodiscard]] QHostAddress hostAddress(const QUrl & redirectUri)
{
    const QString host = redirectUri.host();
    if (host.isEmpty() ||
        host.compare(QStringLiteral("localhost"), Qt::CaseInsensitive) == 0)
    {
        return QHostAddress{QHostAddress::LocalHost};
    }

    return QHostAddress{host};
}

[[nodiscard]] QString redirectPath(const QUrl & redirectUri)
{
    const QString path = redirectUri.path();
    return path.isEmpty() ? QStringLiteral("/") : path;
}

} // namespace

LoopbackAuthorizationCodeReceiver::LoopbackAuthorizationCodeReceiver(
    QUrl redirectUri, const std::chrono::milliseconds timeout,
    UrlOpener urlOpener) :
    m_configuredRedirectUri{std::move(redirectUri)},
    m_timeout{timeout}, m_urlOpener{std::move(urlOpener)}
{
    if (Q_UNLIKELY(!m_configuredRedirectUri.isValid())) {
        throw InvalidArgument{ErrorString{QStringLiteral(
            "LoopbackAuthorizationCodeReceiver ctor: redirect URI is "
            "invalid")}};
    }

    if (Q_UNLIKELY(!m_urlOpener)) {
        throw InvalidArgument{ErrorString{QStringLiteral(
            "LoopbackAuthorizationCodeReceiver ctor: URL opener is null")}};
    }

    if (Q_UNLIKELY(m_timeout.count() <= 0)) {
        throw InvalidArgument{ErrorString{QStringLiteral(
            "LoopbackAuthorizationCodeReceiver ctor: timeout must be "
            "positive")}};
    }
}

LoopbackAuthorizationCodeReceiver::~LoopbackAuthorizationCodeReceiver() =
    default;

QUrl LoopbackAuthorizationCodeReceiver::redirectUri()
{
    ensureListening();

    QUrl result = m_configuredRedirectUri;
    result.setPort(m_server->serverPort());
    if (result.path().isEmpty()) {
        result.setPath(QStringLiteral("/"));
    }
    return result;
}

QString LoopbackAuthorizationCodeReceiver::receiveAuthorizationCode(
    const QUrl & authorizationUrl, const QString & state)
{
    ensureListening();

    const QString expectedPath = redirectPath(m_configuredRedirectUri);

    QString code;
    utility::EventLoopWithExitStatus loop;

    QObject::connect(
        m_server.get(), &QTcpServer::newConnection, &loop,
        [&, server = m_server.get()] {
            while (auto * socket = server->nextPendingConnection()) {
                auto * parser = new network::HttpRequestParser(*socket, socket);

                QObject::connect(
                    parser, &network::HttpRequestParser::failed, socket,
                    [socket] {
                        respond(
                            *socket,
                            composeHtmlResponse(
                                QByteArrayLiteral("400 Bad Request"),
                                QStringLiteral("Malformed request")));
                    });

                QObject::connect(
                    parser, &network::HttpRequestParser::finished, &loop,
                    [&, socket, parser] {
                        const QUrl uri{QString::fromUtf8(parser->request().uri)};
                        if (uri.path() != expectedPath) {
                            ABDEBUG(
                                "auth::LoopbackAuthorizationCodeReceiver",
                                "Ignoring request to " << uri.path());
                            respond(
                                *socket,
                                composeHtmlResponse(
                                    QByteArrayLiteral("404 Not Found"),
                                    QStringLiteral("Not found")));
                            return;
                        }

                        const QUrlQuery query{uri};
                        const QString error = query.queryItemValue(
                            QStringLiteral("error"), QUrl::FullyDecoded);
                        if (!error.isEmpty()) {
                            respond(
                                *socket,
                                composeHtmlResponse(
                                    QByteArrayLiteral("200 OK"),
                                    QStringLiteral(
                                        "Authorization failed. You can close "
                                        "this window.")));
                            loop.exitAsFailureWithError(
                                QStringLiteral("Authorization was denied: ") +
                                error);
                            return;
                        }

                        if (query.queryItemValue(
                                QStringLiteral("state"), QUrl::FullyDecoded) !=
                            state)
                        {
                            respond(
                                *socket,
                                composeHtmlResponse(
                                    QByteArrayLiteral("400 Bad Request"),
                                    QStringLiteral("State mismatch")));
                            loop.exitAsFailureWithError(QStringLiteral(
                                "State parameter of the redirect does not "
                                "match the authorization request"));
                            return;
                        }

                        const QString receivedCode = query.queryItemValue(
                            QStringLiteral("code"), QUrl::FullyDecoded);
                        if (receivedCode.isEmpty()) {
                            respond(
                                *socket,
                                composeHtmlResponse(
                                    QByteArrayLiteral("400 Bad Request"),
                                    QStringLiteral("No authorization code")));
                            loop.exitAsFailureWithError(QStringLiteral(
                                "Redirect carries no authorization code"));
                            return;
                        }

                        respond(
                            *socket,
                            composeHtmlResponse(
                                QByteArrayLiteral("200 OK"),
                                QStringLiteral(
                                    "Authorization complete. You can close "
                                    "this window.")));
                        code = receivedCode;
                        loop.exitAsSuccess();
                    });
            }
        });

    QTimer timer;
    timer.setSingleShot(true);
    QObject::connect(
        &timer, &QTimer::timeout, &loop,
        &utility::EventLoopWithExitStatus::exitAsTimeout);

    ABINFO(
        "auth::LoopbackAuthorizationCodeReceiver",
        "Waiting for authorization redirect on port "
            << m_server->serverPort());

    if (!m_urlOpener(authorizationUrl)) {
        ABWARNING(
            "auth::LoopbackAuthorizationCodeReceiver",
            "Failed to open authorization URL, it has to be opened manually: "
                << authorizationUrl.toString());
    }

    timer.start(static_cast<int>(m_timeout.count()));
    loop.exec();

    const auto status = loop.exitStatus();
    m_server.reset();

    if (status == utility::EventLoopWithExitStatus::ExitStatus::Timeout) {
        throw AuthenticationFailure{ErrorString{QT_TRANSLATE_NOOP(
            "auth", "Timed out waiting for the authorization redirect")}};
    }

    if (status == utility::EventLoopWithExitStatus::ExitStatus::Failure) {
        throw AuthenticationFailure{loop.errorDescription()};
    }

    return code;
}

void LoopbackAuthorizationCodeReceiver::ensureListening()
{
    if (m_server && m_server->isListening()) {
        return;
    }

    m_server = std::make_unique<QTcpServer>();

    const auto address = hostAddress(m_configuredRedirectUri);
    const auto port = static_cast<quint16>(m_configuredRedirectUri.port(0));
    if (Q_UNLIKELY(!m_server->listen(address, port))) {
        ErrorString error{QT_TRANSLATE_NOOP(
            "auth", "Cannot listen for the authorization redirect")};
        error.setDetails(m_server->errorString());
        m_server.reset();
        throw AuthenticationFailure{std::move(error)};
    }

    ABDEBUG(
        "auth::LoopbackAuthorizationCodeReceiver",
        "Listening on " << address.toString() << ":"
                        << m_server->serverPort());
}

} // namespace assetbridge::auth
