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

#include <assetbridge/network/HttpTypes.h>
#include <assetbridge/utility/Linkage.h>

#include <QJsonDocument>
#include <QString>
#include <QUrlQuery>

#include <optional>

namespace assetbridge::network {

enum class ResponseKind
{
    /**
     * Response is expected to carry JSON; provider specific normalization is
     * applied to it
     */
    Json,
    /**
     * Binary content which is passed through untouched
     */
    Stream
};

ASSETBRIDGE_DECLARE_PRINTABLE(ResponseKind)

struct ASSETBRIDGE_EXPORT ApiRequest : public utility::Printable
{
    QTextStream & print(QTextStream & strm) const override;

    HttpMethod method = HttpMethod::Get;

    /**
     * Endpoint relative to the provider's API base URL. Absolute URLs are
     * used as is.
     */
    QString endpoint;
    QUrlQuery query;

    std::optional<QJsonDocument> body;

    /**
     * Sent verbatim; takes precedence over body if both are set
     */
    std::optional<QByteArray> rawBody;

    /**
     * Take precedence over the session's authorization headers
     */
    HttpHeaders headers;

    ResponseKind responseKind = ResponseKind::Json;
};

/**
 * @brief The IRequestClient interface executes requests against one
 * provider's API on behalf of the current session of that provider.
 */
class ASSETBRIDGE_EXPORT IRequestClient
{
public:
    virtual ~IRequestClient() = default;

    /**
     * @return response with 2xx status
     * @throw ProviderError on non-2xx status, carrying the status and body
     * @throw TransportFailure if no response was received
     * @throw AuthenticationFailure if the provider session cannot be obtained
     */
    [[nodiscard]] virtual HttpResponse execute(const ApiRequest & request) = 0;

    [[nodiscard]] HttpResponse execute(
        HttpMethod method, QString endpoint,
        std::optional<QJsonDocument> body = std::nullopt,
        std::optional<QByteArray> rawBody = std::nullopt,
        HttpHeaders headers = {});
};

} // namespace assetbridge::network
