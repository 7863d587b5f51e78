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

#include <assetbridge/exception/TransportFailure.h>

namespace assetbridge {

TransportFailure::TransportFailure(ErrorString message, const bool timedOut) :
    RequestFailure(std::move(message)), m_timedOut{timedOut}
{}

bool TransportFailure::timedOut() const noexcept
{
    return m_timedOut;
}

TransportFailure * TransportFailure::clone() const
{
    return new TransportFailure{errorMessage(), m_timedOut};
}

void TransportFailure::raise() const
{
    throw *this;
}

QString TransportFailure::exceptionDisplayName() const
{
    return QStringLiteral("TransportFailure");
}

} // namespace assetbridge
