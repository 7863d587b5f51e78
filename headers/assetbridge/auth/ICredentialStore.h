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
#include <assetbridge/utility/Linkage.h>

#include <QMap>

#include <optional>

namespace assetbridge::auth {

/**
 * @brief The ICredentialStore interface persists one Session per service
 * between application runs.
 */
class ASSETBRIDGE_EXPORT ICredentialStore
{
public:
    virtual ~ICredentialStore() = default;

    /**
     * @return the persisted session or std::nullopt if there is none or the
     *         persisted record cannot be read
     */
    [[nodiscard]] virtual std::optional<Session> load(ServiceId serviceId) = 0;

    /**
     * Replaces the persisted session for session.serviceId
     * @throw RuntimeError if the session cannot be written
     */
    virtual void save(const Session & session) = 0;

    /**
     * Removes the persisted session, does nothing if there is none
     * @throw RuntimeError if the existing record cannot be removed
     */
    virtual void clear(ServiceId serviceId) = 0;

    virtual void clearAll() = 0;

    /**
     * For each known service tells whether a persisted session exists and is
     * still valid
     */
    [[nodiscard]] virtual QMap<ServiceId, bool> authenticationStatus() = 0;
};

} // namespace assetbridge::auth
