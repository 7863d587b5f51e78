/*
 * Copyright 2017-2020 Dmitry Ivanov
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

#include <QString>
#include <QStringList>

namespace assetbridge {

/**
 * @brief The ErrorString class holds an error description composed of
 * a translatable base string, optional additional translatable bases and
 * a non-translatable details string (typically coming from Qt or from
 * a remote service's response)
 */
class ASSETBRIDGE_EXPORT ErrorString : public utility::Printable
{
public:
    explicit ErrorString(const char * error = nullptr);
    explicit ErrorString(QString error);

    [[nodiscard]] const QString & base() const noexcept;
    [[nodiscard]] QString & base() noexcept;

    [[nodiscard]] const QStringList & additionalBases() const noexcept;
    [[nodiscard]] QStringList & additionalBases() noexcept;

    [[nodiscard]] const QString & details() const noexcept;
    [[nodiscard]] QString & details() noexcept;

    void setBase(QString error);
    void appendBase(QString error);
    void setDetails(QString details);

    [[nodiscard]] bool isEmpty() const noexcept;
    void clear();

    [[nodiscard]] QString localizedString() const;
    [[nodiscard]] QString nonLocalizedString() const;

    QTextStream & print(QTextStream & strm) const override;

    friend bool operator==(
        const ErrorString & lhs, const ErrorString & rhs) noexcept;

    friend bool operator!=(
        const ErrorString & lhs, const ErrorString & rhs) noexcept;

private:
    QString m_base;
    QStringList m_additionalBases;
    QString m_details;
};

} // namespace assetbridge
