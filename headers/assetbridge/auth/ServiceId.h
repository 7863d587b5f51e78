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

#include <assetbridge/utility/Printable.h>

#include <QList>
#include <QString>

#include <optional>

namespace assetbridge::auth {

/**
 * Remote services assetbridge keeps OAuth sessions with
 */
enum class ServiceId
{
    Google,
    Adobe
};

ASSETBRIDGE_DECLARE_PRINTABLE(ServiceId)

[[nodiscard]] ASSETBRIDGE_EXPORT QList<ServiceId> allServiceIds();

/**
 * Lowercase name of the service used in file names, i.e. "google"
 */
[[nodiscard]] ASSETBRIDGE_EXPORT QString serviceName(ServiceId serviceId);

[[nodiscard]] ASSETBRIDGE_EXPORT std::optional<ServiceId>
    serviceIdFromName(const QString & name);

} // namespace assetbridge::auth
