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
 * @brief The IDestinationBrowser interface lists albums of the destination
 * catalog. The catalog has to be resolved once before any listing.
 */
class ASSETBRIDGE_EXPORT IDestinationBrowser :
    public IPaginatedBrowser<DestinationContainer>
{
public:
    /**
     * Resolves and remembers the catalog id
     * @throw NotFound if the account has no catalog
     */
    [[nodiscard]] virtual QString resolveScope() = 0;

    [[nodiscard]] virtual std::optional<QString> catalogId() const = 0;

    /**
     * Lists albums starting from the given offset. If cursor is set, offset
     * and limit are ignored.
     *
     * @throw RuntimeError if the scope has not been resolved
     */
    [[nodiscard]] virtual Page<DestinationContainer> listPageAt(
        const QString & catalogRef, int offset, int limit,
        const std::optional<PageCursor> & cursor = std::nullopt) = 0;

    [[nodiscard]] virtual AccountInfo accountInfo() = 0;
};

} // namespace assetbridge::browsing
