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

#include <assetbridge/browsing/Fwd.h>
#include <assetbridge/network/Fwd.h>
#include <assetbridge/utility/Linkage.h>

#include <QUrl>

namespace assetbridge::browsing {

[[nodiscard]] ASSETBRIDGE_EXPORT ISourceBrowserPtr createDriveSourceBrowser(
    network::IRequestClientPtr requestClient, int pageSize, int maxPathDepth);

/**
 * @param apiBaseUrl    Base URL against which relative links returned by
 *                      the provider are resolved
 */
[[nodiscard]] ASSETBRIDGE_EXPORT IDestinationBrowserPtr
    createLightroomDestinationBrowser(
        network::IRequestClientPtr requestClient, QUrl apiBaseUrl,
        int pageSize);

} // namespace assetbridge::browsing
