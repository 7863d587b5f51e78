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

#include <assetbridge/utility/Printable.h>

#include <QByteArray>
#include <QList>
#include <QUrl>

#include <optional>
#include <utility>

namespace assetbridge::network {

enum class HttpMethod
{
    Get,
    Post,
    Put,
    Patch,
    Delete,
    Head
};

ASSETBRIDGE_DECLARE_PRINTABLE(HttpMethod)

[[nodiscard]] ASSETBRIDGE_EXPORT QByteArray httpMethodVerb(HttpMethod method);

using HttpHeader = std::pair<QByteArray, QByteArray>;
using HttpHeaders = QList<HttpHeader>;

/**
 * Value of the first header with the given name, compared case-insensitively
 */
[[nodiscard]] ASSETBRIDGE_EXPORT std::optional<QByteArray> findHeader(
    const HttpHeaders & headers, const QByteArray & name);

/**
 * Replaces all headers with the given name (compared case-insensitively) with
 * a single header having the given value
 */
ASSETBRIDGE_EXPORT void setHeader(
    HttpHeaders & headers, const QByteArray & name, QByteArray value);

/**
 * Headers from overrides replace the same-named headers from base
 */
[[nodiscard]] ASSETBRIDGE_EXPORT HttpHeaders
    mergeHeaders(HttpHeaders base, const HttpHeaders & overrides);

struct ASSETBRIDGE_EXPORT HttpRequest : public utility::Printable
{
    QTextStream & print(QTextStream & strm) const override;

    HttpMethod method = HttpMethod::Get;
    QUrl url;
    HttpHeaders headers;
    QByteArray body;
};

struct ASSETBRIDGE_EXPORT HttpResponse : public utility::Printable
{
    [[nodiscard]] bool isSuccessful() const noexcept;

    [[nodiscard]] std::optional<QByteArray> header(
        const QByteArray & name) const;

    /**
     * @return true if the response declares JSON content via its Content-Type
     */
    [[nodiscard]] bool hasJsonContent() const;

    QTextStream & print(QTextStream & strm) const override;

    int statusCode = 0;
    HttpHeaders headers;
    QByteArray body;
};

} // namespace assetbridge::network
