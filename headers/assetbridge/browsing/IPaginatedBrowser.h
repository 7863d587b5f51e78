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

#include <assetbridge/browsing/Types.h>

#include <optional>

namespace assetbridge::browsing {

/**
 * @brief The IPaginatedBrowser interface lists the contents of a container
 * page by page. Listing has no side effects so pages can be requested again
 * in any order.
 */
template <class T>
class IPaginatedBrowser
{
public:
    virtual ~IPaginatedBrowser() = default;

    /**
     * @param containerRef  Container to list
     * @param cursor        Position returned with a previous page or
     *                      std::nullopt for the first page
     */
    [[nodiscard]] virtual Page<T> listPage(
        const QString & containerRef,
        const std::optional<PageCursor> & cursor = std::nullopt) = 0;
};

} // namespace assetbridge::browsing
