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

#include <assetbridge/auth/ServiceId.h>

namespace assetbridge::auth {

QList<ServiceId> allServiceIds()
{
    return QList<ServiceId>{} << ServiceId::Google << ServiceId::Adobe;
}

QString serviceName(const ServiceId serviceId)
{
    switch (serviceId) {
    case ServiceId::Google:
        return QStringLiteral("google");
    case ServiceId::Adobe:
        return QStringLiteral("adobe");
    }

    return QStringLiteral("unknown");
}

std::optional<ServiceId> serviceIdFromName(const QString & name)
{
    for (const auto serviceId: allServiceIds()) {
        if (serviceName(serviceId).compare(name, Qt::CaseInsensitive) == 0) {
            return serviceId;
        }
    }

    return std::nullopt;
}

QTextStream & operator<<(QTextStream & strm, const ServiceId serviceId)
{
    switch (serviceId) {
    case ServiceId::Google:
        strm << "Google";
        break;
    case ServiceId::Adobe:
        strm << "Adobe";
        break;
    default:
        strm << "Unknown (" << static_cast<qint64>(serviceId) << ")";
        break;
    }

    return strm;
}

} // namespace assetbridge::auth
