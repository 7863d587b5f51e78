/*
 * Copyright 2020 Dmitry Ivanov
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

#include <assetbridge/utility/DateTime.h>

#include <QTimeZone>

namespace assetbridge {

QString printableDateTimeFromTimestamp(const qint64 timestamp)
{
    const auto dateTime = QDateTime::fromMSecsSinceEpoch(timestamp);
    return dateTime.toString(QStringLiteral("yyyy-MM-dd hh:mm:ss.zzz t"));
}

QString toIsoDateTimeString(const QDateTime & dateTime)
{
    return dateTime.toUTC().toString(Qt::ISODateWithMs);
}

QDateTime fromIsoDateTimeString(const QString & str)
{
    if (str.isEmpty()) {
        return {};
    }

    auto dateTime = QDateTime::fromString(str, Qt::ISODateWithMs);
    if (!dateTime.isValid()) {
        dateTime = QDateTime::fromString(str, Qt::ISODate);
    }

    if (!dateTime.isValid()) {
        return {};
    }

    if (dateTime.timeSpec() == Qt::LocalTime) {
        dateTime.setTimeSpec(Qt::UTC);
    }

    return dateTime.toUTC();
}

} // namespace assetbridge
