/*
 * Copyright 2016-2024 Dmitry Ivanov
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

#include <assetbridge/exception/IAssetBridgeException.h>

namespace assetbridge {

IAssetBridgeException::IAssetBridgeException(ErrorString message) :
    m_message{std::move(message)},
    m_whatMessage{m_message.nonLocalizedString().toLocal8Bit()}
{}

IAssetBridgeException::~IAssetBridgeException() noexcept = default;

IAssetBridgeException::IAssetBridgeException(
    const IAssetBridgeException & other) :
    QException(other),
    m_message{other.m_message}, m_whatMessage{other.m_whatMessage}
{}

IAssetBridgeException & IAssetBridgeException::operator=(
    const IAssetBridgeException & other)
{
    if (this != &other) {
        m_message = other.m_message;
        m_whatMessage = other.m_whatMessage;
    }

    return *this;
}

ErrorString IAssetBridgeException::errorMessage() const
{
    return m_message;
}

QString IAssetBridgeException::localizedErrorMessage() const
{
    return m_message.localizedString();
}

QString IAssetBridgeException::nonLocalizedErrorMessage() const
{
    return m_message.nonLocalizedString();
}

const char * IAssetBridgeException::what() const noexcept
{
    return m_whatMessage.constData();
}

QTextStream & IAssetBridgeException::print(QTextStream & strm) const
{
    strm << "\n <" << exceptionDisplayName() << ">";
    strm << "\n message: " << m_message.nonLocalizedString();
    return strm;
}

} // namespace assetbridge
