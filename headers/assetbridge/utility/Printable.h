/*
 * Copyright 2016-2025 Dmitry Ivanov
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

#include <QDebug>
#include <QIODevice>
#include <QString>
#include <QTextStream>

namespace assetbridge::utility {

/**
 * @brief The Printable class is the interface for assetbridge's classes
 * which should be able to write themselves into QTextStream and/or convert
 * to QString
 */
class ASSETBRIDGE_EXPORT Printable
{
public:
    virtual ~Printable() noexcept;

    virtual QTextStream & print(QTextStream & strm) const = 0;

    [[nodiscard]] QString toString() const;

    friend ASSETBRIDGE_EXPORT QTextStream & operator<<(
        QTextStream & strm, const Printable & printable);

    friend ASSETBRIDGE_EXPORT QDebug & operator<<(
        QDebug & debug, const Printable & printable);
};

} // namespace assetbridge::utility

// printing helper for types not inheriting from Printable

template <class T>
[[nodiscard]] QString ToString(const T & object)
{
    QString str;
    QTextStream strm(&str, QIODevice::WriteOnly);
    strm << object;
    return str;
}

#define ASSETBRIDGE_DECLARE_PRINTABLE(type, ...)                               \
    ASSETBRIDGE_EXPORT QTextStream & operator<<(                               \
        QTextStream & strm, const type & obj);                                 \
    inline QDebug & operator<<(QDebug & debug, const type & obj)               \
    {                                                                          \
        debug << ToString<type, ##__VA_ARGS__>(obj);                           \
        return debug;                                                          \
    }                                                                          \
    // ASSETBRIDGE_DECLARE_PRINTABLE
