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
 * @brief The RequestFailure class is the common base for failures of a single
 * outbound request: either the remote service answered with a non-2xx status
 * (ProviderError) or no answer was received at all (TransportFailure).
 */
class ASSETBRIDGE_EXPORT RequestFailure : public IAssetBridgeException
{
protected:
    explicit RequestFailure(ErrorString message);
};

} // namespace assetbridge
