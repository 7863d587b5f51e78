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

#include "DriveSourceBrowser.h"
#include "Utils.h"

#include <network/JsonUtils.h>

#include <assetbridge/exception/InvalidArgument.h>
#include <assetbridge/exception/RequestFailure.h>
#include <assetbridge/logging/AssetBridgeLogger.h>
#include <assetbridge/network/IRequestClient.h>

#include <QJsonArray>
#include <QSet>

namespace assetbridge::browsing {

namespace {

const QString gFilesEndpoint = QStringLiteral("/drive/v3/files");
const QString gRootDisplayName = QStringLiteral("My Drive");
const QString gPathSeparator = QStringLiteral(" / ");

[[nodiscard]] QString escapeQueryLiteral(QString value)
{
    value.replace(QStringLiteral("\\"), QStringLiteral("\\\\"));
    value.replace(QStringLiteral("'"), QStringLiteral("\\'"));
    return value;
}

[[nodiscard]] QString unknownPath(const QString & containerRef)
{
    return QStringLiteral("Unknown Path (") + containerRef +
        QStringLiteral(")");
}

[[nodiscard]] bool isRoot(const QString & containerRef)
{
    return containerRef.isEmpty() ||
        containerRef == QString::fromUtf8(gSourceRootContainerId);
}

[[nodiscard]] SourceEntry parseSourceEntry(
    const QJsonObject & object, const QString & defaultParentId = {})
{
    SourceEntry entry;
    entry.id = object.value(QStringLiteral("id")).toString();
    entry.displayName = object.value(QStringLiteral("name")).toString();
    entry.contentType = object.value(QStringLiteral("mimeType")).toString();

    // Drive reports int64 values as strings
    const auto size = object.value(QStringLiteral("size"));
    if (size.isString()) {
        bool conversionResult = false;
        const qint64 value = size.toString().toLongLong(&conversionResult);
        if (conversionResult) {
            entry.sizeBytes = value;
        }
    }
    else if (size.isDouble()) {
        entry.sizeBytes = static_cast<qint64>(size.toDouble());
    }

    const auto parents = object.value(QStringLiteral("parents")).toArray();
    entry.parentId =
        parents.isEmpty() ? defaultParentId : parents.first().toString();

    return entry;
}

} // namespace

DriveSourceBrowser::DriveSourceBrowser(
    network::IRequestClientPtr requestClient, const int pageSize,
    const int maxPathDepth) :
    m_requestClient{std::move(requestClient)},
    m_pageSize{pageSize}, m_maxPathDepth{maxPathDepth}
{
    if (Q_UNLIKELY(!m_requestClient)) {
        throw InvalidArgument{ErrorString{QStringLiteral(
            "DriveSourceBrowser ctor: request client is null")}};
    }

    if (Q_UNLIKELY(m_pageSize <= 0)) {
        throw InvalidArgument{ErrorString{QStringLiteral(
            "DriveSourceBrowser ctor: page size must be positive")}};
    }

    if (Q_UNLIKELY(m_maxPathDepth <= 0)) {
        throw InvalidArgument{ErrorString{QStringLiteral(
            "DriveSourceBrowser ctor: max path depth must be positive")}};
    }
}

Page<SourceEntry> DriveSourceBrowser::listPage(
    const QString & containerRef,
    [[maybe_unused]] const std::optional<PageCursor> & cursor)
{
    ABDEBUG(
        "browsing::DriveSourceBrowser",
        "Listing child containers of " << containerRef);

    network::ApiRequest request;
    request.endpoint = gFilesEndpoint;
    request.query = childrenQuery(
        containerRef, true,
        QStringLiteral("nextPageToken,files(id,name,mimeType,size)"));

    const auto response = executeBrowsingRequest(*m_requestClient, request);
    const auto object = network::parseJsonObject(response);

    const QString parentId = isRoot(containerRef)
        ? QString::fromUtf8(gSourceRootContainerId)
        : containerRef;

    Page<SourceEntry> page;
    const auto files = object.value(QStringLiteral("files")).toArray();
    for (const auto & file: files) {
        page.items << parseSourceEntry(file.toObject(), parentId);
    }

    if (!object.value(QStringLiteral("nextPageToken")).toString().isEmpty()) {
        ABINFO(
            "browsing::DriveSourceBrowser",
            "Listing of " << containerRef << " was truncated at "
                          << page.items.size() << " containers");
    }

    return page;
}

QList<SourceEntry> DriveSourceBrowser::listEntries(
    const QString & containerRef)
{
    ABDEBUG(
        "browsing::DriveSourceBrowser",
        "Listing entries of " << containerRef);

    const QString parentId = isRoot(containerRef)
        ? QString::fromUtf8(gSourceRootContainerId)
        : containerRef;

    QList<SourceEntry> entries;
    QString pageToken;
    do {
        network::ApiRequest request;
        request.endpoint = gFilesEndpoint;
        request.query = childrenQuery(
            containerRef, false,
            QStringLiteral(
                "nextPageToken,files(id,name,mimeType,size,parents)"));

        if (!pageToken.isEmpty()) {
            request.query.addQueryItem(QStringLiteral("pageToken"), pageToken);
        }

        const auto response =
            executeBrowsingRequest(*m_requestClient, request);
        const auto object = network::parseJsonObject(response);

        const auto files = object.value(QStringLiteral("files")).toArray();
        for (const auto & file: files) {
            entries << parseSourceEntry(file.toObject(), parentId);
        }

        pageToken = object.value(QStringLiteral("nextPageToken")).toString();
    } while (!pageToken.isEmpty());

    ABDEBUG(
        "browsing::DriveSourceBrowser",
        "Listed " << entries.size() << " entries of " << containerRef);

    return entries;
}

SourceEntry DriveSourceBrowser::describe(const QString & id)
{
    network::ApiRequest request;
    request.endpoint =
        gFilesEndpoint + QStringLiteral("/") + encodePathSegment(id);
    request.query.addQueryItem(
        QStringLiteral("fields"),
        QStringLiteral("id,name,mimeType,size,parents"));

    const auto response = executeBrowsingRequest(*m_requestClient, request);
    return parseSourceEntry(network::parseJsonObject(response));
}

std::optional<QString> DriveSourceBrowser::parentOf(const QString & id)
{
    if (isRoot(id)) {
        return std::nullopt;
    }

    const auto entry = describe(id);
    if (entry.parentId.isEmpty()) {
        return std::nullopt;
    }

    return entry.parentId;
}

QString DriveSourceBrowser::resolvePath(const QString & containerRef)
{
    if (isRoot(containerRef)) {
        return gRootDisplayName;
    }

    QStringList names;
    QSet<QString> visitedIds;
    QString currentId = containerRef;

    for (int depth = 0;; ++depth) {
        if (depth >= m_maxPathDepth) {
            ABWARNING(
                "browsing::DriveSourceBrowser",
                "Path of " << containerRef << " is deeper than "
                           << m_maxPathDepth << " levels");
            return unknownPath(containerRef);
        }

        if (visitedIds.contains(currentId)) {
            ABWARNING(
                "browsing::DriveSourceBrowser",
                "Cyclic parent reference in path of " << containerRef
                                                      << " at " << currentId);
            return unknownPath(containerRef);
        }
        visitedIds.insert(currentId);

        SourceEntry entry;
        try {
            entry = describe(currentId);
        }
        catch (const RequestFailure & e) {
            ABWARNING(
                "browsing::DriveSourceBrowser",
                "Failed to resolve path of "
                    << containerRef << " at " << currentId << ": "
                    << e.nonLocalizedErrorMessage());
            return unknownPath(containerRef);
        }

        names.prepend(entry.displayName);

        if (entry.parentId.isEmpty()) {
            break;
        }

        if (isRoot(entry.parentId)) {
            names.prepend(gRootDisplayName);
            break;
        }

        currentId = entry.parentId;
    }

    return names.join(gPathSeparator);
}

AccountInfo DriveSourceBrowser::accountInfo()
{
    network::ApiRequest request;
    request.endpoint = QStringLiteral("/drive/v3/about");
    request.query.addQueryItem(QStringLiteral("fields"), QStringLiteral("user"));

    const auto response = executeBrowsingRequest(*m_requestClient, request);
    const auto user = network::parseJsonObject(response)
                          .value(QStringLiteral("user"))
                          .toObject();

    AccountInfo info;
    info.id = user.value(QStringLiteral("permissionId")).toString();
    info.displayName = user.value(QStringLiteral("displayName")).toString();
    info.email = user.value(QStringLiteral("emailAddress")).toString();
    return info;
}

QUrlQuery DriveSourceBrowser::childrenQuery(
    const QString & containerRef, const bool containersOnly,
    const QString & fields) const
{
    const QString parentId = isRoot(containerRef)
        ? QString::fromUtf8(gSourceRootContainerId)
        : containerRef;

    QString q = QStringLiteral("'") + escapeQueryLiteral(parentId) +
        QStringLiteral("' in parents and trashed=false");

    if (containersOnly) {
        q += QStringLiteral(" and mimeType='") +
            QString::fromUtf8(gSourceContainerContentType) +
            QStringLiteral("'");
    }

    QUrlQuery query;
    query.addQueryItem(QStringLiteral("q"), q);
    query.addQueryItem(QStringLiteral("fields"), fields);
    query.addQueryItem(
        QStringLiteral("pageSize"), QString::number(m_pageSize));
    query.addQueryItem(QStringLiteral("orderBy"), QStringLiteral("folder,name"));
    return query;
}

} // namespace assetbridge::browsing
