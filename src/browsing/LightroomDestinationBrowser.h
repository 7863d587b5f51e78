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

#include <assetbridge/browsing/IDestinationBrowser.h>
#include <assetbridge/network/Fwd.h>

#include <QUrl>

namespace assetbridge::browsing {

class LightroomDestinationBrowser final : public IDestinationBrowser
{
public:
    LightroomDestinationBrowser(
        network::IRequestClientPtr requestClient, QUrl apiBaseUrl,
        int pageSize);

    /**
     * Resolves the "next" link returned by the provider against
     * <apiBaseUrl>/v2/catalogs/<catalogId>/
     */
    [[nodiscard]] static QString composeNextLink(
        const QUrl & apiBaseUrl, const QString & catalogId,
        const QString & href);

public: // IPaginatedBrowser
    [[nodiscard]] Page<DestinationContainer> listPage(
        const QString & catalogRef,
        const std::optional<PageCursor> & cursor) override;

public: // IDestinationBrowser
    [[nodiscard]] QString resolveScope() override;
    [[nodiscard]] std::optional<QString> catalogId() const override;

    [[nodiscard]] Page<DestinationContainer> listPageAt(
        const QString & catalogRef, int offset, int limit,
        const std::optional<PageCursor> & cursor) override;

    [[nodiscard]] AccountInfo accountInfo() override;

private:
    const network::IRequestClientPtr m_requestClient;
    const QUrl m_apiBaseUrl;
    const int m_pageSize;

    std::optional<QString> m_catalogId;
};

} // namespace assetbridge::browsing
