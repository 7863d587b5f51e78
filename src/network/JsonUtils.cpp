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

#include "JsonUtils.h"

#include <assetbridge/exception/ProviderError.h>

#include <QJsonDocument>
#include <QJsonParseError>

namespace assetbridge::network {

QJsonObject parseJsonObject(const HttpResponse & response)
{
    QJsonParseError parseError;
    const auto document = QJsonDocument::fromJson(response.body, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        ErrorString error{
            QT_TRANSLATE_NOOP("network", "Malformed JSON in response")};
        error.setDetails(parseError.errorString());
        throw ProviderError{response.statusCode, response.body, error};
    }

    if (!document.isObject()) {
        throw ProviderError{
            response.statusCode, response.body,
            ErrorString{QT_TRANSLATE_NOOP(
                "network", "Response is not a JSON object")}};
    }

    return document.object();
}

} // namespace assetbridge::network
