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

#include <assetbridge/network/IRequestClient.h>

namespace assetbridge::network {

HttpResponse IRequestClient::execute(
    const HttpMethod method, QString endpoint,
    std::optional<QJsonDocument> body, std::optional<QByteArray> rawBody,
    HttpHeaders headers)
{
    ApiRequest request;
    request.method = method;
    request.endpoint = std::move(endpoint);
    request.body = std::move(body);
    request.rawBody = std::move(rawBody);
    request.headers = std::move(headers);
    return execute(request);
}

QTextStream & ApiRequest::print(QTextStream & strm) const
{
    strm << "ApiRequest: " << method << " " << endpoint;
    if (!query.isEmpty()) {
        strm << "?" << query.toString(QUrl::FullyDecoded);
    }

    strm << " (" << responseKind << ")";

    if (rawBody) {
        strm << ", raw body of " << rawBody->size() << " bytes";
    }
    else if (body) {
        strm << ", body: "
             << QString::fromUtf8(body->toJson(QJsonDocument::Compact));
    }

    if (!headers.isEmpty()) {
        strm << ", extra headers:";
        for (const auto & [name, value]: headers) {
            strm << " " << QString::fromUtf8(name) << "="
                 << QString::fromUtf8(value) << ";";
        }
    }

    return strm;
}

QTextStream & operator<<(QTextStream & strm, const ResponseKind kind)
{
    switch (kind) {
    case ResponseKind::Json:
        strm << "Json";
        break;
    case ResponseKind::Stream:
        strm << "Stream";
        break;
    }

    return strm;
}

} // namespace assetbridge::network
