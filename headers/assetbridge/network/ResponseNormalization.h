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

#include <assetbridge/utility/Linkage.h>

#include <QByteArray>

namespace assetbridge::network {

/**
 * Some providers prepend JSON responses with a text prefix which makes them
 * non-executable as scripts. It has to be removed before parsing.
 */
enum class ResponseNormalization
{
    None,
    StripAntiHijackingPrefix
};

/**
 * The literal prefix stripped by ResponseNormalization::StripAntiHijackingPrefix
 */
[[nodiscard]] ASSETBRIDGE_EXPORT QByteArray antiHijackingPrefix();

/**
 * Removes the anti-hijacking prefix if the data begins with it, otherwise
 * returns the data unchanged
 */
[[nodiscard]] ASSETBRIDGE_EXPORT QByteArray
    stripAntiHijackingPrefix(QByteArray data);

[[nodiscard]] ASSETBRIDGE_EXPORT QByteArray
    normalizeResponseBody(QByteArray data, ResponseNormalization normalization);

} // namespace assetbridge::network
