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

#include <assetbridge/types/ErrorString.h>
#include <assetbridge/utility/Printable.h>

#include <QByteArray>
#include <QException>

namespace assetbridge {

/**
 * @brief The IAssetBridgeException class is the base class for all exceptions
 * thrown by assetbridge. Every concrete exception is cloneable and raisable
 * so it can be transferred between threads through QException machinery.
 */
class ASSETBRIDGE_EXPORT IAssetBridgeException :
    public utility::Printable,
    public QException
{
public:
    ~IAssetBridgeException() noexcept override;

    [[nodiscard]] ErrorString errorMessage() const;
    [[nodiscard]] QString localizedErrorMessage() const;
    [[nodiscard]] QString nonLocalizedErrorMessage() const;

    // std::exception
    [[nodiscard]] const char * what() const noexcept override;

    // utility::Printable
    QTextStream & print(QTextStream & strm) const override;

protected:
    explicit IAssetBridgeException(ErrorString message);
    IAssetBridgeException(const IAssetBridgeException & other);
    IAssetBridgeException & operator=(const IAssetBridgeException & other);

    [[nodiscard]] virtual QString exceptionDisplayName() const = 0;

private:
    ErrorString m_message;
    QByteArray m_whatMessage;
};

} // namespace assetbridge
