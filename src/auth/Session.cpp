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

#include <assetbridge/auth/Session.h>

#include <assetbridge/utility/DateTime.h>

namespace assetbridge::auth {

QTextStream & Session::print(QTextStream & strm) const
{
    strm << "Session: service = " << serviceId
         << ", access token: " << (accessToken.isEmpty() ? "<none>" : "<set>")
         << ", refresh token: "
         << (refreshToken.isEmpty() ? "<none>" : "<set>")
         << ", expires at: "
         << (expiresAt.isValid() ? toIsoDateTimeString(expiresAt)
                                 : QStringLiteral("<not set>"))
         << ", token type: " << tokenType
         << ", scopes: " << scopes.join(QStringLiteral(" "));
    return strm;
}

bool operator==(const Session & lhs, const Session & rhs) noexcept
{
    return lhs.serviceId == rhs.serviceId &&
        lhs.accessToken == rhs.accessToken &&
        lhs.refreshToken == rhs.refreshToken &&
        lhs.expiresAt == rhs.expiresAt && lhs.scopes == rhs.scopes &&
        lhs.tokenType == rhs.tokenType;
}

bool operator!=(const Session & lhs, const Session & rhs) noexcept
{
    return !(lhs == rhs);
}

bool isSessionValid(const Session & session, const QDateTime & now)
{
    if (session.accessToken.isEmpty() || !session.expiresAt.isValid()) {
        return false;
    }

    return now < session.expiresAt.addSecs(-gSessionExpirationSkewSeconds);
}

} // namespace assetbridge::auth
