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

#include <assetbridge/auth/ServiceId.h>
#include <assetbridge/utility/Printable.h>

#include <QDateTime>
#include <QString>
#include <QStringList>

namespace assetbridge::auth {

/**
 * @brief The Session struct holds live OAuth credential state for one
 * service.
 */
struct ASSETBRIDGE_EXPORT Session : public utility::Printable
{
    QTextStream & print(QTextStream & strm) const override;

    ServiceId serviceId = ServiceId::Google;
    QString accessToken;
    QString refreshToken;

    /**
     * Expiration time of the access token, in UTC
     */
    QDateTime expiresAt;
    QStringList scopes;
    QString tokenType = QStringLiteral("Bearer");
};

ASSETBRIDGE_EXPORT bool operator==(
    const Session & lhs, const Session & rhs) noexcept;

ASSETBRIDGE_EXPORT bool operator!=(
    const Session & lhs, const Session & rhs) noexcept;

/**
 * Access tokens are considered expired this many seconds before their actual
 * expiration so that a token never runs out in the middle of a call
 */
constexpr qint64 gSessionExpirationSkewSeconds = 300;

/**
 * @return true if the session has an access token and
 *         now < expiresAt - gSessionExpirationSkewSeconds
 */
[[nodiscard]] ASSETBRIDGE_EXPORT bool isSessionValid(
    const Session & session, const QDateTime & now);

} // namespace assetbridge::auth
