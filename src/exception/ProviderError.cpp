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

#include <assetbridge/exception/ProviderError.h>

namespace assetbridge {

ProviderError::ProviderError(
    const int statusCode, QByteArray body, ErrorString message) :
    RequestFailure(std::move(message)),
    m_statusCode{statusCode}, m_body{std::move(body)}
{}

int ProviderError::statusCode() const noexcept
{
    return m_statusCode;
}

const QByteArray & ProviderError::body() const noexcept
{
    return m_body;
}

ProviderError * ProviderError::clone() const
{
    return new ProviderError{m_statusCode, m_body, errorMessage()};
}

void ProviderError::raise() const
{
    throw *this;
}

QTextStream & ProviderError::print(QTextStream & strm) const
{
    RequestFailure::print(strm);
    strm << "\n status code: " << m_statusCode;
    strm << "\n body: " << QString::fromUtf8(m_body);
    return strm;
}

QString ProviderError::exceptionDisplayName() const
{
    return QStringLiteral("ProviderError");
}

} // namespace assetbridge
