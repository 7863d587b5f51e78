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

#include <assetbridge/network/HttpTypes.h>

#include <algorithm>

namespace assetbridge::network {

namespace {

// Bodies of binary transfers can be huge, only their beginning goes to logs
constexpr int gMaxPrintedBodySize = 512;

[[nodiscard]] bool headerNameMatches(
    const QByteArray & lhs, const QByteArray & rhs)
{
    return lhs.compare(rhs, Qt::CaseInsensitive) == 0;
}

void printHeaders(QTextStream & strm, const HttpHeaders & headers)
{
    for (const auto & [name, value]: headers) {
        strm << "\n    " << QString::fromUtf8(name) << ": ";
        if (headerNameMatches(name, QByteArrayLiteral("Authorization"))) {
            strm << "<hidden>";
        }
        else {
            strm << QString::fromUtf8(value);
        }
    }
}

void printBody(QTextStream & strm, const QByteArray & body)
{
    strm << "\n  body (" << body.size() << " bytes): ";
    if (body.size() > gMaxPrintedBodySize) {
        strm << QString::fromUtf8(body.left(gMaxPrintedBodySize)) << "...";
    }
    else {
        strm << QString::fromUtf8(body);
    }
}

} // namespace

QByteArray httpMethodVerb(const HttpMethod method)
{
    switch (method) {
    case HttpMethod::Get:
        return QByteArrayLiteral("GET");
    case HttpMethod::Post:
        return QByteArrayLiteral("POST");
    case HttpMethod::Put:
        return QByteArrayLiteral("PUT");
    case HttpMethod::Patch:
        return QByteArrayLiteral("PATCH");
    case HttpMethod::Delete:
        return QByteArrayLiteral("DELETE");
    case HttpMethod::Head:
        return QByteArrayLiteral("HEAD");
    }

    return QByteArrayLiteral("GET");
}

QTextStream & operator<<(QTextStream & strm, const HttpMethod method)
{
    strm << QString::fromUtf8(httpMethodVerb(method));
    return strm;
}

std::optional<QByteArray> findHeader(
    const HttpHeaders & headers, const QByteArray & name)
{
    const auto it = std::find_if(
        headers.constBegin(), headers.constEnd(),
        [&name](const HttpHeader & header) {
            return headerNameMatches(header.first, name);
        });

    if (it == headers.constEnd()) {
        return std::nullopt;
    }

    return it->second;
}

void setHeader(HttpHeaders & headers, const QByteArray & name, QByteArray value)
{
    headers.erase(
        std::remove_if(
            headers.begin(), headers.end(),
            [&name](const HttpHeader & header) {
                return headerNameMatches(header.first, name);
            }),
        headers.end());

    headers << HttpHeader{name, std::move(value)};
}

HttpHeaders mergeHeaders(HttpHeaders base, const HttpHeaders & overrides)
{
    for (const auto & [name, value]: overrides) {
        setHeader(base, name, value);
    }

    return base;
}

QTextStream & HttpRequest::print(QTextStream & strm) const
{
    strm << "HttpRequest: " << method << " "
         << url.toString(QUrl::RemoveUserInfo) << "\n  headers:";
    printHeaders(strm, headers);
    printBody(strm, body);
    return strm;
}

bool HttpResponse::isSuccessful() const noexcept
{
    return statusCode >= 200 && statusCode < 300;
}

std::optional<QByteArray> HttpResponse::header(const QByteArray & name) const
{
    return findHeader(headers, name);
}

bool HttpResponse::hasJsonContent() const
{
    const auto contentType = header(QByteArrayLiteral("Content-Type"));
    return contentType &&
        contentType->toLower().contains(QByteArrayLiteral("application/json"));
}

QTextStream & HttpResponse::print(QTextStream & strm) const
{
    strm << "HttpResponse: status " << statusCode << "\n  headers:";
    printHeaders(strm, headers);
    printBody(strm, body);
    return strm;
}

} // namespace assetbridge::network
