/*
 * Copyright 2017-2020 Dmitry Ivanov
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

#include <assetbridge/utility/Linkage.h>

#include <QString>

/**
 * Name of the environment variable which can be set to override the default
 * persistence storage path used by assetbridge
 */
#define ASSETBRIDGE_PERSISTENCE_STORAGE_PATH                                   \
    "ASSETBRIDGE_PERSISTENCE_STORAGE_PATH"

namespace assetbridge::utility {

/**
 * applicationPersistentStoragePath returns the path to folder in which
 * the application should store its persistent data: tokens, settings and
 * logs. By default chooses the appropriate system location but that can be
 * overridden by setting ASSETBRIDGE_PERSISTENCE_STORAGE_PATH environment
 * variable. If the standard location is overridden via the environment
 * variable, the bool pointed to by nonStandardLocation (if any) is set to true
 */
[[nodiscard]] QString ASSETBRIDGE_EXPORT
    applicationPersistentStoragePath(bool * nonStandardLocation = nullptr);

/**
 * @return          The path to the directory holding persisted OAuth token
 *                  records by default
 */
[[nodiscard]] QString ASSETBRIDGE_EXPORT defaultTokensStoragePath();

} // namespace assetbridge::utility
