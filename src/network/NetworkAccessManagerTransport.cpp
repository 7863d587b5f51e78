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

#include "NetworkAccessManagerTransport.h"

#include <assetbridge/exception/InvalidArgument.h>
#include <assetbridge/exception/TransportFailure.h>
#include <assetbridge/logging/AssetBridgeLogger.h>
#include <assetbridge/network/HttpTypes.h>
#include <assetbridge/utility/EventLoopWithExitStatus.h>

#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>

namespace assetbridge::network {

namespace {

struct ReplyDeleter
{
    void operator()(QNetworkReply * reply) const noexcept
    {
        reply->deleteLater();
    }
};

} // namespace

NetworkAccessManagerTransport::NetworkAccessManagerTransport(
    const std::chrono::milliseconds timeout,
    const std::chrono::milliseconds transferTimeout) :
    m_timeout{timeout},
    m_transferTimeout{transferTimeout},
    m_networkAccessManager{std::make_unique<QNetworkAccessManager>()}
{
    if (Q_UNLIKELY(m_timeout.count() <= 0)) {
        throw InvalidArgument{ErrorString{QStringLiteral(
            "NetworkAccessManagerTransport ctor: timeout must be positive")}};
    }

    if (Q_UNLIKELY(m_transferTimeout < m_timeout)) {
        throw InvalidArgument{ErrorString{QStringLiteral(
            "NetworkAccessManagerTransport ctor: transfer timeout is shorter "
            "than timeout")}};
    }
}

NetworkAccessManagerTransport::~NetworkAccessManagerTransport() = default;

HttpResponse NetworkAccessManagerTransport::send(const HttpRequest & request)
{
    ABDEBUG("network::NetworkAccessManagerTransport", "Sending " << request);

    QNetworkRequest networkRequest{request.url};
    networkRequest.setAttribute(
        QNetworkRequest::RedirectPolicyAttribute,
        QNetworkRequest::NoLessSafeRedirectPolicy);

    for (const auto & [name, value]: request.headers) {
        networkRequest.setRawHeader(name, value);
    }

    const std::unique_ptr<QNetworkReply, ReplyDeleter> reply{
        m_networkAccessManager->sendCustomRequest(
            networkRequest, httpMethodVerb(request.method), request.body)};

    utility::EventLoopWithExitStatus loop;
    QObject::connect(
        reply.get(), &QNetworkReply::finished, &loop,
        &utility::EventLoopWithExitStatus::exitAsSuccess);

    QTimer timer;
    timer.setSingleShot(true);
    QObject::connect(
        &timer, &QTimer::timeout, &loop,
        &utility::EventLoopWithExitStatus::exitAsTimeout);

    const int timeoutMsec = static_cast<int>(m_timeout.count());
    const auto restartTimer = [&timer, timeoutMsec] {
        timer.start(timeoutMsec);
    };

    QObject::connect(
        reply.get(), &QNetworkReply::downloadProgress, &timer, restartTimer);
    QObject::connect(
        reply.get(), &QNetworkReply::uploadProgress, &timer, restartTimer);

    QTimer deadlineTimer;
    deadlineTimer.setSingleShot(true);
    QObject::connect(
        &deadlineTimer, &QTimer::timeout, &loop,
        &utility::EventLoopWithExitStatus::exitAsTimeout);

    if (!reply->isFinished()) {
        timer.start(timeoutMsec);
        deadlineTimer.start(static_cast<int>(m_transferTimeout.count()));
        loop.exec();
    }

    if (loop.exitStatus() ==
        utility::EventLoopWithExitStatus::ExitStatus::Timeout)
    {
        reply->disconnect(&loop);
        reply->abort();

        ErrorString error{QT_TRANSLATE_NOOP("network", "Request timed out")};
        error.setDetails(
            QString::fromLatin1(httpMethodVerb(request.method)) +
            QStringLiteral(" ") +
            request.url.toString(QUrl::RemoveQuery));
        ABWARNING(
            "network::NetworkAccessManagerTransport",
            error.nonLocalizedString());
        throw TransportFailure{std::move(error), true};
    }

    const QVariant statusCode =
        reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);
    if (!statusCode.isValid()) {
        ErrorString error{
            QT_TRANSLATE_NOOP("network", "No response was received")};
        error.setDetails(reply->errorString());
        ABWARNING(
            "network::NetworkAccessManagerTransport",
            error.nonLocalizedString() << ", request: " << request);
        throw TransportFailure{std::move(error)};
    }

    HttpResponse response;
    response.statusCode = statusCode.toInt();
    for (const auto & pair: reply->rawHeaderPairs()) {
        response.headers << HttpHeader{pair.first, pair.second};
    }
    response.body = reply->readAll();

    ABDEBUG("network::NetworkAccessManagerTransport", "Received " << response);
    return response;
}

} // namespace assetbridge::network
