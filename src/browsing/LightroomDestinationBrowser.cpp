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

#include "LightroomDestinationBrowser.h"
#include "Utils.h"

#include <network/JsonUtils.h>

#include <assetbridge/exception/InvalidArgument.h>
#include <assetbridge/exception/NotFound.h>
#include <assetbridge/exception/RuntimeError.h>
#include <assetbridge/logging/AssetBridgeLogger.h>
#include <assetbridge/network/IRequestClient.h>
#include <assetbridge/utility/DateTime.h>

#include <QJsonArray>

namespace assetbridge::browsing {

namespace {

[[nodiscard]] QString baseUrlString(const QUrl & apiBaseUrl)
{
    QString base = apiBaseUrl.toString();
    while (base.endsWith(QChar::fromLatin1('/'))) {
        base.chop(1);
    }
    return base;
}

[[nodiscard]] DestinationContainer parseDestinationContainer(
    const QJsonObject & object)
{
    DestinationContainer container;
    container.id = object.value(QStringLiteral("id")).toString();

    const auto payload = object.value(QStringLiteral("payload")).toObject();
    const QString name = payload.value(QStringLiteral("name")).toString();
    if (!name.isEmpty()) {
        container.name = name;
    }

    container.createdAt = fromIsoDateTimeString(
        object.value(QStringLiteral("created")).toString());
    container.updatedAt = fromIsoDateTimeString(
        object.value(QStringLiteral("updated")).toString());

    container.kind = object.value(QStringLiteral("subtype")).toString();
    if (container.kind.isEmpty()) {
        container.kind = payload.value(QStringLiteral("subtype")).toString();
    }

    return container;
}

} // namespace

LightroomDestinationBrowser::LightroomDestinationBrowser(
    network::IRequestClientPtr requestClient, QUrl apiBaseUrl,
    const int pageSize) :
    m_requestClient{std::move(requestClient)},
    m_apiBaseUrl{std::move(apiBaseUrl)}, m_pageSize{pageSize}
{
    if (Q_UNLIKELY(!m_requestClient)) {
        throw InvalidArgument{ErrorString{QStringLiteral(
            "LightroomDestinationBrowser ctor: request client is null")}};
    }

    if (Q_UNLIKELY(!m_apiBaseUrl.isValid())) {
        throw InvalidArgument{ErrorString{QStringLiteral(
            "LightroomDestinationBrowser ctor: API base URL is invalid")}};
    }

    if (Q_UNLIKELY(m_pageSize <= 0)) {
        throw InvalidArgument{ErrorString{QStringLiteral(
            "LightroomDestinationBrowser ctor: page size must be positive")}};
    }
}

QString LightroomDestinationBrowser::composeNextLink(
    const QUrl & apiBaseUrl, const QString & catalogId, const QString & href)
{
    const QUrl hrefUrl{href};
    if (hrefUrl.isValid() && !hrefUrl.isRelative()) {
        return href;
    }

    const QString base = baseUrlString(apiBaseUrl);
    if (href.startsWith(QChar::fromLatin1('/'))) {
        return base + href;
    }

    return base + QStringLiteral("/v2/catalogs/") +
        encodePathSegment(catalogId) + QStringLiteral("/") + href;
}

Page<DestinationContainer> LightroomDestinationBrowser::listPage(
    const QString & catalogRef, const std::optional<PageCursor> & cursor)
{
    return listPageAt(catalogRef, 0, m_pageSize, cursor);
}

QString LightroomDestinationBrowser::resolveScope()
{
    ABDEBUG("browsing::LightroomDestinationBrowser", "Resolving catalog");

    network::ApiRequest request;
    request.endpoint = QStringLiteral("/v2/catalog");

    const auto response = executeBrowsingRequest(
        *m_requestClient, request, NotFoundHandling::ThrowNotFound);

    const QString id = network::parseJsonObject(response)
                           .value(QStringLiteral("id"))
                           .toString();
    if (id.isEmpty()) {
        throw NotFound{ErrorString{QT_TRANSLATE_NOOP(
            "browsing", "Account has no destination catalog")}};
    }

    ABINFO("browsing::LightroomDestinationBrowser", "Resolved catalog " << id);

    m_catalogId = id;
    return id;
}

std::optional<QString> LightroomDestinationBrowser::catalogId() const
{
    return m_catalogId;
}

Page<DestinationContainer> LightroomDestinationBrowser::listPageAt(
    const QString & catalogRef, const int offset, const int limit,
    const std::optional<PageCursor> & cursor)
{
    if (Q_UNLIKELY(!m_catalogId)) {
        throw RuntimeError{ErrorString{QT_TRANSLATE_NOOP(
            "browsing",
            "Destination catalog must be resolved before listing albums")}};
    }

    const QString catalog = catalogRef.isEmpty() ? *m_catalogId : catalogRef;

    network::ApiRequest request;
    if (cursor && cursor->kind() == PageCursor::Kind::LinkBased) {
        request.endpoint = cursor->link();
    }
    else {
        int effectiveOffset = offset;
        int effectiveLimit = limit;
        if (cursor) {
            effectiveOffset = cursor->offset();
            effectiveLimit = cursor->limit();
        }

        if (Q_UNLIKELY(effectiveOffset < 0 || effectiveLimit <= 0)) {
            throw InvalidArgument{ErrorString{QT_TRANSLATE_NOOP(
                "browsing",
                "Album listing needs non-negative offset and positive "
                "limit")}};
        }

        request.endpoint = QStringLiteral("/v2/catalogs/") +
            encodePathSegment(catalog) + QStringLiteral("/albums");
        request.query.addQueryItem(
            QStringLiteral("limit"), QString::number(effectiveLimit));
        if (effectiveOffset > 0) {
            request.query.addQueryItem(
                QStringLiteral("offset"), QString::number(effectiveOffset));
        }
    }

    ABDEBUG(
        "browsing::LightroomDestinationBrowser",
        "Listing albums: " << request);

    const auto response = executeBrowsingRequest(*m_requestClient, request);
    const auto object = network::parseJsonObject(response);

    Page<DestinationContainer> page;
    const auto resources = object.value(QStringLiteral("resources")).toArray();
    for (const auto & resource: resources) {
        auto container = parseDestinationContainer(resource.toObject());
        if (container.id.isEmpty()) {
            ABDEBUG(
                "browsing::LightroomDestinationBrowser",
                "Skipping album without id");
            continue;
        }
        page.items << container;
    }

    const QString href = object.value(QStringLiteral("links"))
                             .toObject()
                             .value(QStringLiteral("next"))
                             .toObject()
                             .value(QStringLiteral("href"))
                             .toString();
    if (!href.isEmpty()) {
        page.nextCursor =
            PageCursor::linkBased(composeNextLink(m_apiBaseUrl, catalog, href));
    }

    return page;
}

AccountInfo LightroomDestinationBrowser::accountInfo()
{
    network::ApiRequest request;
    request.endpoint = QStringLiteral("/v2/account");

    const auto response = executeBrowsingRequest(*m_requestClient, request);
    const auto object = network::parseJsonObject(response);

    AccountInfo info;
    info.id = object.value(QStringLiteral("id")).toString();
    info.displayName = object.value(QStringLiteral("full_name")).toString();
    info.email = object.value(QStringLiteral("email")).toString();
    return info;
}

} // namespace assetbridge::browsing
