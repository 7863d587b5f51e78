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

#include <assetbridge/network/HttpTypes.h>
#include <assetbridge/network/IRequestClient.h>

namespace assetbridge::browsing {

enum class NotFoundHandling
{
    KeepProviderError,
    ThrowNotFound
};

/**
 * Executes a browsing request. HTTP 401 and 403 are converted into
 * AuthenticationFailure, HTTP 404 into NotFound if requested. Other
 * failures are propagated as is.
 */
[[nodiscard]] network::HttpResponse executeBrowsingRequest(
    network::IRequestClient & requestClient,
    const network::ApiRequest & request,
    NotFoundHandling notFoundHandling = NotFoundHandling::KeepProviderError);

[[nodiscard]] QString encodePathSegment(const QString & segment);

} // namespace assetbridge::browsing
