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

#include <assetbridge/browsing/IPaginatedBrowser.h>
#include <assetbridge/utility/Linkage.h>

namespace assetbridge::browsing {

/**
 * @brief The ISourceBrowser interface navigates the source tree. listPage
 * lists child containers only and returns a single page.
 */
class ASSETBRIDGE_EXPORT ISourceBrowser : public IPaginatedBrowser<SourceEntry>
{
public:
    /**
     * All non-trashed direct children of the container, files and containers
     */
    [[nodiscard]] virtual QList<SourceEntry> listEntries(
        const QString & containerRef) = 0;

    [[nodiscard]] virtual SourceEntry describe(const QString & id) = 0;

    /**
     * @return id of the parent container or std::nullopt for the root and
     *         for entries without a parent
     */
    [[nodiscard]] virtual std::optional<QString> parentOf(
        const QString & id) = 0;

    /**
     * Human readable path of the container, i.e. "My Drive / Photos / 2023".
     * Returns "Unknown Path (<id>)" if the path cannot be resolved.
     */
    [[nodiscard]] virtual QString resolvePath(const QString & containerRef) = 0;

    [[nodiscard]] virtual AccountInfo accountInfo() = 0;
};

} // namespace assetbridge::browsing
