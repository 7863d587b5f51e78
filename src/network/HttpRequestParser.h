/*
 * Copyright 2023 Dmitry Ivanov
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

#include <assetbridge/network/HttpTypes.h>

#include <QObject>

QT_BEGIN_NAMESPACE

class QTcpSocket;

QT_END_NAMESPACE

namespace assetbridge::network {

struct ReceivedHttpRequest
{
    QByteArray method;
    QByteArray uri;
    HttpHeaders headers;
    QByteArray body;
};

// Simplistic parser of HTTP request data arriving through QTcpSocket
class HttpRequestParser : public QObject
{
    Q_OBJECT
public:
    explicit HttpRequestParser(QTcpSocket & socket, QObject * parent = nullptr);

    [[nodiscard]] bool status() const noexcept;
    [[nodiscard]] const ReceivedHttpRequest & request() const noexcept;

Q_SIGNALS:
    void finished();
    void failed();

private Q_SLOTS:
    void onSocketReadyRead();

private:
    void tryParseData();

private:
    bool m_status = false;
    bool m_done = false;
    ReceivedHttpRequest m_request;
    QByteArray m_data;
};

} // namespace assetbridge::network
