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

#include "Utils.h"

#include <assetbridge/exception/AuthenticationFailure.h>
#include <assetbridge/exception/NotFound.h>
#include <assetbridge/exception/ProviderError.h>

namespace assetbridge::browsing {

network::HttpResponse executeBrowsingRequest(
    network::IRequestClient & requestClient,
    const network::ApiRequest & request,
    const NotFoundHandling notFoundHandling)
{
    try {
        return requestClient.execute(request);
    }
    catch (const ProviderError & e) {
        const int statusCode = e.statusCode();
        if (statusCode == 401 || statusCode == 403) {
            ErrorString error{QT_TRANSLATE_NOOP(
                "browsing", "Provider rejected the session credentials")};
            error.setDetails(
                request.endpoint + QStringLiteral(": HTTP ") +
                QString::number(statusCode));
            throw AuthenticationFailure{std::move(error)};
        }

        if (statusCode == 404 &&
            notFoundHandling == NotFoundHandling::ThrowNotFound)
        {
            ErrorString error{
                QT_TRANSLATE_NOOP("browsing", "Resource was not found")};
            error.setDetails(request.endpoint);
            throw NotFound{std::move(error)};
        }

        throw;
    }
}

QString encodePathSegment(const QString & segment)
{
    return QString::fromUtf8(QUrl::toPercentEncoding(segment));
}

} // namespace assetbridge::browsing
