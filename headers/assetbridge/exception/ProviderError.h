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

#include <assetbridge/exception/RequestFailure.h>

namespace assetbridge {

/**
 * Non-2xx response from a remote service. Carries the HTTP status code and
 * the raw response body verbatim.
 */
class ASSETBRIDGE_EXPORT ProviderError : public RequestFailure
{
public:
    ProviderError(int statusCode, QByteArray body, ErrorString message);

    [[nodiscard]] int statusCode() const noexcept;
    [[nodiscard]] const QByteArray & body() const noexcept;

    [[nodiscard]] ProviderError * clone() const override;
    void raise() const override;

    QTextStream & print(QTextStream & strm) const override;

protected:
    [[nodiscard]] QString exceptionDisplayName() const override;

private:
    int m_statusCode;
    QByteArray m_body;
};

} // namespace assetbridge
