/*
 * Copyright 2017-2024 Dmitry Ivanov
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

#include <assetbridge/types/ErrorString.h>

#include <QCoreApplication>

namespace assetbridge {

namespace {

[[nodiscard]] QString composeString(
    const QString & base, const QStringList & additionalBases,
    const QString & details, const bool localize)
{
    const auto translate = [localize](const QString & str) {
        if (!localize || str.isEmpty()) {
            return str;
        }

        const QByteArray bytes = str.toUtf8();
        return QCoreApplication::translate("assetbridge", bytes.constData());
    };

    QString result = translate(base);
    for (const auto & additionalBase: additionalBases) {
        if (additionalBase.isEmpty()) {
            continue;
        }

        if (!result.isEmpty()) {
            result += QStringLiteral(", ");
        }
        result += translate(additionalBase);
    }

    if (!details.isEmpty()) {
        if (!result.isEmpty()) {
            result += QStringLiteral(": ");
        }
        result += details;
    }

    return result;
}

} // namespace

ErrorString::ErrorString(const char * error) :
    m_base{error ? QString::fromUtf8(error) : QString{}}
{}

ErrorString::ErrorString(QString error) : m_base{std::move(error)} {}

const QString & ErrorString::base() const noexcept
{
    return m_base;
}

QString & ErrorString::base() noexcept
{
    return m_base;
}

const QStringList & ErrorString::additionalBases() const noexcept
{
    return m_additionalBases;
}

QStringList & ErrorString::additionalBases() noexcept
{
    return m_additionalBases;
}

const QString & ErrorString::details() const noexcept
{
    return m_details;
}

QString & ErrorString::details() noexcept
{
    return m_details;
}

void ErrorString::setBase(QString error)
{
    m_base = std::move(error);
}

void ErrorString::appendBase(QString error)
{
    m_additionalBases << std::move(error);
}

void ErrorString::setDetails(QString details)
{
    m_details = std::move(details);
}

bool ErrorString::isEmpty() const noexcept
{
    return m_base.isEmpty() && m_details.isEmpty() &&
        m_additionalBases.isEmpty();
}

void ErrorString::clear()
{
    m_base.clear();
    m_additionalBases.clear();
    m_details.clear();
}

QString ErrorString::localizedString() const
{
    return composeString(m_base, m_additionalBases, m_details, true);
}

QString ErrorString::nonLocalizedString() const
{
    return composeString(m_base, m_additionalBases, m_details, false);
}

QTextStream & ErrorString::print(QTextStream & strm) const
{
    strm << nonLocalizedString();
    return strm;
}

bool operator==(const ErrorString & lhs, const ErrorString & rhs) noexcept
{
    return lhs.m_base == rhs.m_base &&
        lhs.m_additionalBases == rhs.m_additionalBases &&
        lhs.m_details == rhs.m_details;
}

bool operator!=(const ErrorString & lhs, const ErrorString & rhs) noexcept
{
    return !(lhs == rhs);
}

} // namespace assetbridge
