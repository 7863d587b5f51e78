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

#include <assetbridge/exception/IAssetBridgeException.h>

namespace assetbridge {

/**
 * Thrown when a session with a remote service cannot be obtained or the
 * service rejects the presented credentials
 */
class ASSETBRIDGE_EXPORT AuthenticationFailure : public IAssetBridgeException
{
public:
    explicit AuthenticationFailure(ErrorString message);

    [[nodiscard]] AuthenticationFailure * clone() const override;
    void raise() const override;

protected:
    [[nodiscard]] QString exceptionDisplayName() const override;
};

} // namespace assetbridge
