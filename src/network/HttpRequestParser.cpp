/*
 * Copyright 2023-2024 Dmitry Ivanov
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

#include "HttpRequestParser.h"

#include <assetbridge/logging/AssetBridgeLogger.h>

#include <QTcpSocket>

namespace assetbridge::network {

HttpRequestParser::HttpRequestParser(QTcpSocket & socket, QObject * parent) :
    QObject(parent)
{
    QObject::connect(
        &socket, &QIODevice::readyRead, this,
        &HttpRequestParser::onSocketReadyRead, Qt::QueuedConnection);
}

bool HttpRequestParser::status() const noexcept
{
    return m_status;
}

const ReceivedHttpRequest & HttpRequestParser::request() const noexcept
{
    return m_request;
}

void HttpRequestParser::onSocketReadyRead()
{
    auto * socket = qobject_cast<QTcpSocket *>(sender());
    Q_ASSERT(socket);

    m_data.append(socket->read(socket->bytesAvailable()));
    tryParseData();
}

void HttpRequestParser::tryParseData()
{
    if (m_done) {
        return;
    }

    // The request may arrive in pieces; parsing is retried on each piece
    // until the headers and the whole body are present.
    const auto headersEndIndex = m_data.indexOf("\r\n\r\n");
    if (headersEndIndex < 0) {
        return;
    }

    const auto lines = m_data.left(headersEndIndex).split('\n');
    const auto requestLine = lines.value(0).trimmed().split(' ');
    if (requestLine.size() < 3) {
        ABWARNING(
            "network::HttpRequestParser",
            "Malformed HTTP request line: " << lines.value(0));
        m_done = true;
        m_status = false;
        Q_EMIT failed();
        return;
    }

    ReceivedHttpRequest request;
    request.method = requestLine[0];
    request.uri = requestLine[1];

    for (int i = 1; i < lines.size(); ++i) {
        const QByteArray line = lines[i].trimmed();
        const auto colonIndex = line.indexOf(':');
        if (colonIndex <= 0) {
            continue;
        }

        request.headers << HttpHeader{
            line.left(colonIndex).trimmed(), line.mid(colonIndex + 1).trimmed()};
    }

    int contentLength = 0;
    if (const auto value =
            findHeader(request.headers, QByteArrayLiteral("Content-Length")))
    {
        bool conversionResult = false;
        contentLength = value->toInt(&conversionResult);
        if (Q_UNLIKELY(!conversionResult || contentLength < 0)) {
            ABWARNING(
                "network::HttpRequestParser",
                "Failed to convert content length header value to int: "
                    << *value);
            m_done = true;
            m_status = false;
            Q_EMIT failed();
            return;
        }
    }

    const QByteArray body = m_data.mid(headersEndIndex + 4);
    if (body.size() < contentLength) {
        // Not all data has arrived yet
        return;
    }

    request.body = body.left(contentLength);
    m_request = std::move(request);
    m_done = true;
    m_status = true;
    Q_EMIT finished();
}

} // namespace assetbridge::network
