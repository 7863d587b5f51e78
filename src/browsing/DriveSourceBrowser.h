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

#include <assetbridge/browsing/ISourceBrowser.h>
#include <assetbridge/network/Fwd.h>

#include <QUrlQuery>

namespace assetbridge::browsing {

class DriveSourceBrowser final : public ISourceBrowser
{
public:
    DriveSourceBrowser(
        network::IRequestClientPtr requestClient, int pageSize,
        int maxPathDepth);

public: // IPaginatedBrowser
    [[nodiscard]] Page<SourceEntry> listPage(
        const QString & containerRef,
        const std::optional<PageCursor> & cursor) override;

public: // ISourceBrowser
    [[nodiscard]] QList<SourceEntry> listEntries(
        const QString & containerRef) override;

    [[nodiscard]] SourceEntry describe(const QString & id) override;

    [[nodiscard]] std::optional<QString> parentOf(const QString & id) override;

    [[nodiscard]] QString resolvePath(const QString & containerRef) override;

    [[nodiscard]] AccountInfo accountInfo() override;

private:
    [[nodiscard]] QUrlQuery childrenQuery(
        const QString & containerRef, bool containersOnly,
        const QString & fields) const;

private:
    const network::IRequestClientPtr m_requestClient;
    const int m_pageSize;
    const int m_maxPathDepth;
};

} // namespace assetbridge::browsing
