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

#include "PastedCodeAuthorizationCodeReceiver.h"

#include <assetbridge/exception/AuthenticationFailure.h>
#include <assetbridge/exception/InvalidArgument.h>
#include <assetbridge/logging/AssetBridgeLogger.h>

#include <QUrlQuery>

namespace assetbridge::auth {

namespace {

constexpr int gMinAuthorizationCodeLength = 10;

} // namespace

PastedCodeAuthorizationCodeReceiver::PastedCodeAuthorizationCodeReceiver(
    QUrl redirectUri, UrlOpener urlOpener, LineReader lineReader) :
    m_redirectUri{std::move(redirectUri)}, m_urlOpener{std::move(urlOpener)},
    m_lineReader{std::move(lineReader)}
{
    if (Q_UNLIKELY(!m_urlOpener)) {
        throw InvalidArgument{ErrorString{QStringLiteral(
            "PastedCodeAuthorizationCodeReceiver ctor: URL opener is null")}};
    }

    if (Q_UNLIKELY(!m_lineReader)) {
        throw InvalidArgument{ErrorString{QStringLiteral(
            "PastedCodeAuthorizationCodeReceiver ctor: line reader is null")}};
    }
}

QString PastedCodeAuthorizationCodeReceiver::extractCode(const QString & input)
{
    const QString trimmed = input.trimmed();

    const QUrl url{trimmed, QUrl::StrictMode};
    if (url.isValid() && !url.scheme().isEmpty() && url.hasQuery()) {
        const QUrlQuery query{url};
        if (query.hasQueryItem(QStringLiteral("code"))) {
            return query
                .queryItemValue(QStringLiteral("code"), QUrl::FullyDecoded)
                .trimmed();
        }
    }

    // The code itself possibly followed by other query parameters
    const auto ampersandIndex = trimmed.indexOf(QChar::fromLatin1('&'));
    if (ampersandIndex >= 0) {
        return trimmed.left(ampersandIndex).trimmed();
    }

    return trimmed;
}

std::optional<QString> PastedCodeAuthorizationCodeReceiver::extractState(
    const QString & input)
{
    const QString trimmed = input.trimmed();

    QUrlQuery query;
    const QUrl url{trimmed, QUrl::StrictMode};
    if (url.isValid() && !url.scheme().isEmpty() && url.hasQuery()) {
        query = QUrlQuery{url};
    }
    else {
        const auto ampersandIndex = trimmed.indexOf(QChar::fromLatin1('&'));
        if (ampersandIndex < 0) {
            return std::nullopt;
        }

        query = QUrlQuery{trimmed.mid(ampersandIndex + 1)};
    }

    if (!query.hasQueryItem(QStringLiteral("state"))) {
        return std::nullopt;
    }

    return query.queryItemValue(QStringLiteral("state"), QUrl::FullyDecoded);
}

QUrl PastedCodeAuthorizationCodeReceiver::redirectUri()
{
    return m_redirectUri;
}

QString PastedCodeAuthorizationCodeReceiver::receiveAuthorizationCode(
    const QUrl & authorizationUrl, const QString & state)
{
    if (!m_urlOpener(authorizationUrl)) {
        ABWARNING(
            "auth::PastedCodeAuthorizationCodeReceiver",
            "Failed to open authorization URL, it has to be opened manually: "
                << authorizationUrl.toString());
    }

    const auto line = m_lineReader();
    if (!line) {
        throw AuthenticationFailure{ErrorString{QT_TRANSLATE_NOOP(
            "auth", "Input was closed before authorization code was entered")}};
    }

    const auto pastedState = extractState(*line);
    if (pastedState && *pastedState != state) {
        ABWARNING(
            "auth::PastedCodeAuthorizationCodeReceiver",
            "State parameter of the pasted redirect does not match");
        throw AuthenticationFailure{ErrorString{QT_TRANSLATE_NOOP(
            "auth", "Pasted redirect belongs to another authorization "
                    "request")}};
    }

    const QString code = extractCode(*line);
    if (code.size() < gMinAuthorizationCodeLength) {
        throw AuthenticationFailure{ErrorString{QT_TRANSLATE_NOOP(
            "auth", "Entered authorization code is too short")}};
    }

    return code;
}

} // namespace assetbridge::auth
