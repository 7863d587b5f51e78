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

#include "AuthenticatedRequestClient.h"

#include <assetbridge/auth/ITokenLifecycleManager.h>
#include <assetbridge/exception/InvalidArgument.h>
#include <assetbridge/exception/ProviderError.h>
#include <assetbridge/logging/AssetBridgeLogger.h>
#include <assetbridge/network/INetworkTransport.h>

namespace assetbridge::network {

AuthenticatedRequestClient::AuthenticatedRequestClient(
    auth::ITokenLifecycleManagerPtr tokenLifecycleManager,
    INetworkTransportPtr networkTransport, QUrl apiBaseUrl,
    const ResponseNormalization responseNormalization) :
    m_tokenLifecycleManager{std::move(tokenLifecycleManager)},
    m_networkTransport{std::move(networkTransport)},
    m_apiBaseUrl{std::move(apiBaseUrl)},
    m_responseNormalization{responseNormalization}
{
    if (Q_UNLIKELY(!m_tokenLifecycleManager)) {
        throw InvalidArgument{ErrorString{QStringLiteral(
            "AuthenticatedRequestClient ctor: token lifecycle manager is "
            "null")}};
    }

    if (Q_UNLIKELY(!m_networkTransport)) {
        throw InvalidArgument{ErrorString{QStringLiteral(
            "AuthenticatedRequestClient ctor: network transport is null")}};
    }

    if (Q_UNLIKELY(!m_apiBaseUrl.isValid() || m_apiBaseUrl.isRelative())) {
        throw InvalidArgument{ErrorString{QStringLiteral(
            "AuthenticatedRequestClient ctor: API base URL is invalid")}};
    }
}

HttpResponse AuthenticatedRequestClient::execute(const ApiRequest & apiRequest)
{
    HttpRequest request;
    request.method = apiRequest.method;
    request.url = resolveUrl(apiRequest);

    auto headers = m_tokenLifecycleManager->headers();
    if (apiRequest.rawBody) {
        request.body = *apiRequest.rawBody;
    }
    else if (apiRequest.body) {
        request.body = apiRequest.body->toJson(QJsonDocument::Compact);
        setHeader(
            headers, QByteArrayLiteral("Content-Type"),
            QByteArrayLiteral("application/json"));
    }

    request.headers = mergeHeaders(std::move(headers), apiRequest.headers);

    auto response = m_networkTransport->send(request);
    if (!response.isSuccessful()) {
        ErrorString error{QT_TRANSLATE_NOOP("network", "Request failed")};
        error.setDetails(
            QString::fromLatin1(httpMethodVerb(request.method)) +
            QStringLiteral(" ") + request.url.path() +
            QStringLiteral(": HTTP ") + QString::number(response.statusCode));

        ABDEBUG(
            "network::AuthenticatedRequestClient",
            error.nonLocalizedString());

        throw ProviderError{
            response.statusCode, std::move(response.body), std::move(error)};
    }

    if (apiRequest.responseKind == ResponseKind::Json &&
        response.hasJsonContent())
    {
        response.body = normalizeResponseBody(
            std::move(response.body), m_responseNormalization);
    }

    return response;
}

QUrl AuthenticatedRequestClient::resolveUrl(const ApiRequest & request) const
{
    QUrl url;

    const QUrl endpointUrl{request.endpoint};
    const QString scheme = endpointUrl.scheme().toLower();
    if (endpointUrl.isValid() &&
        (scheme == QStringLiteral("http") || scheme == QStringLiteral("https")))
    {
        url = endpointUrl;
    }
    else {
        QString base = m_apiBaseUrl.toString();
        while (base.endsWith(QChar::fromLatin1('/'))) {
            base.chop(1);
        }

        QString endpoint = request.endpoint;
        if (!endpoint.startsWith(QChar::fromLatin1('/'))) {
            endpoint.prepend(QChar::fromLatin1('/'));
        }

        url = QUrl{base + endpoint};
    }

    if (!request.query.isEmpty()) {
        QUrlQuery query{url};
        for (const auto & [key, value]: request.query.queryItems()) {
            query.addQueryItem(key, value);
        }
        url.setQuery(query);
    }

    return url;
}

} // namespace assetbridge::network
