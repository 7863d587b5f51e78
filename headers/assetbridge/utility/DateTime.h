/*
 * Copyright 2020-2024 Dmitry Ivanov
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

#include <QDateTime>
#include <QString>

namespace assetbridge {

[[nodiscard]] constexpr int secondsToMilliseconds(int seconds) noexcept
{
    return seconds * 1000;
}

/**
 * Converts the passed in timestamp (milliseconds since epoch) into a human
 * readable local datetime string with milliseconds and timezone
 */
[[nodiscard]] QString ASSETBRIDGE_EXPORT
    printableDateTimeFromTimestamp(qint64 timestamp);

/**
 * ISO-8601 representation of the datetime converted to UTC, with milliseconds,
 * i.e. "2024-03-01T12:00:00.000Z"
 */
[[nodiscard]] QString ASSETBRIDGE_EXPORT
    toIsoDateTimeString(const QDateTime & dateTime);

/**
 * Parses ISO-8601 datetime with or without milliseconds and timezone
 * designator. Datetimes without timezone designator are taken as UTC.
 * Returns an invalid QDateTime if the string cannot be parsed.
 */
[[nodiscard]] QDateTime ASSETBRIDGE_EXPORT
    fromIsoDateTimeString(const QString & str);

} // namespace assetbridge
