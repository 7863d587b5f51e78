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

#include <assetbridge/auth/IAuthorizationCodeReceiver.h>

#include <optional>

namespace assetbridge::auth {

/**
 * @brief The PastedCodeAuthorizationCodeReceiver class asks the user to paste
 * the authorization code, or the whole URL the browser was redirected to.
 */
class PastedCodeAuthorizationCodeReceiver final :
    public IAuthorizationCodeReceiver
{
public:
    PastedCodeAuthorizationCodeReceiver(
        QUrl redirectUri, UrlOpener urlOpener, LineReader lineReader);

    /**
     * Extracts the authorization code from the pasted text
     * @return the code or empty string if none could be extracted
     */
    [[nodiscard]] static QString extractCode(const QString & input);

    /**
     * Extracts the state parameter if the pasted text carries one
     */
    [[nodiscard]] static std::optional<QString> extractState(
        const QString & input);

public: // IAuthorizationCodeReceiver
    [[nodiscard]] QUrl redirectUri() override;

    [[nodiscard]] QString receiveAuthorizationCode(
        const QUrl & authorizationUrl, const QString & state) override;

private:
    const QUrl m_redirectUri;
    const UrlOpener m_urlOpener;
    const LineReader m_lineReader;
};

} // namespace assetbridge::auth
