/*
 * Copyright 2021 Dmitry Ivanov
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

#include <assetbridge/exception/InvalidArgument.h>

namespace assetbridge {

InvalidArgument::InvalidArgument(ErrorString message) :
    IAssetBridgeException(std::move(message))
{}

InvalidArgument * InvalidArgument::clone() const
{
    return new InvalidArgument{errorMessage()};
}

void InvalidArgument::raise() const
{
    throw *this;
}

QString InvalidArgument::exceptionDisplayName() const
{
    return QStringLiteral("InvalidArgument");
}

} // namespace assetbridge
