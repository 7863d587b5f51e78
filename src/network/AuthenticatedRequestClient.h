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

#include <assetbridge/auth/Fwd.h>
#include <assetbridge/network/Fwd.h>
#include <assetbridge/network/IRequestClient.h>
#include <assetbridge/network/ResponseNormalization.h>

#include <QUrl>

namespace assetbridge::network {

/**
 * @brief The AuthenticatedRequestClient class attaches the provider session's
 * headers to each request, resolves endpoints against the provider's API base
 * URL and turns non-2xx responses into ProviderError.
 */
class AuthenticatedRequestClient final : public IRequestClient
{
public:
    AuthenticatedRequestClient(
        auth::ITokenLifecycleManagerPtr tokenLifecycleManager,
        INetworkTransportPtr networkTransport, QUrl apiBaseUrl,
        ResponseNormalization responseNormalization =
            ResponseNormalization::None);

    using IRequestClient::execute;

    [[nodiscard]] HttpResponse execute(const ApiRequest & request) override;

    [[nodiscard]] QUrl resolveUrl(const ApiRequest & request) const;

private:
    const auth::ITokenLifecycleManagerPtr m_tokenLifecycleManager;
    const INetworkTransportPtr m_networkTransport;
    const QUrl m_apiBaseUrl;
    const ResponseNormalization m_responseNormalization;
};

} // namespace assetbridge::network
