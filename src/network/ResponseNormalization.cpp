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

#include <assetbridge/network/ResponseNormalization.h>

namespace assetbridge::network {

QByteArray antiHijackingPrefix()
{
    return QByteArrayLiteral("while (1) {}");
}

QByteArray stripAntiHijackingPrefix(QByteArray data)
{
    const QByteArray prefix = antiHijackingPrefix();
    if (data.startsWith(prefix)) {
        data.remove(0, prefix.size());
    }

    return data;
}

QByteArray normalizeResponseBody(
    QByteArray data, const ResponseNormalization normalization)
{
    switch (normalization) {
    case ResponseNormalization::None:
        return data;
    case ResponseNormalization::StripAntiHijackingPrefix:
        return stripAntiHijackingPrefix(std::move(data));
    }

    return data;
}

} // namespace assetbridge::network
