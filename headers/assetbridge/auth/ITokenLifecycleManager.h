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
#include <assetbridge/auth/Session.h>
#include <assetbridge/network/HttpTypes.h>
#include <assetbridge/utility/Linkage.h>

namespace assetbridge::auth {

/**
 * @brief The ITokenLifecycleManager interface owns the OAuth session with one
 * service: loads it from the credential store, refreshes it when it is about
 * to expire and falls back to interactive authorization when refresh is not
 * possible.
 */
class ASSETBRIDGE_EXPORT ITokenLifecycleManager
{
public:
    virtual ~ITokenLifecycleManager() = default;

    [[nodiscard]] virtual ServiceId serviceId() const noexcept = 0;

    /**
     * @return session valid for at least gSessionExpirationSkewSeconds more
     *         seconds; it is persisted before being returned
     * @throw AuthenticationFailure if no valid session can be obtained
     */
    [[nodiscard]] virtual Session acquireSession() = 0;

    /**
     * @return true if the session currently held in memory is valid; never
     *         triggers refresh or authorization
     */
    [[nodiscard]] virtual bool isValid() const = 0;

    /**
     * Authorization headers for the current session. Acquires the session
     * first, so the returned token is never a known-expired one.
     * @throw AuthenticationFailure if no valid session can be obtained
     */
    [[nodiscard]] virtual network::HttpHeaders headers() = 0;

    /**
     * Forgets the session both in memory and in the credential store
     */
    virtual void logout() = 0;
};

} // namespace assetbridge::auth
