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

#include "DurableRequestClient.h"

#include <assetbridge/exception/InvalidArgument.h>
#include <assetbridge/exception/ProviderError.h>
#include <assetbridge/exception/TransportFailure.h>
#include <assetbridge/logging/AssetBridgeLogger.h>

#include <QEventLoop>
#include <QTimer>

#include <algorithm>

namespace assetbridge::network {

namespace {

[[nodiscard]] bool isRetriableStatusCode(const int statusCode) noexcept
{
    return statusCode == 429 || (statusCode >= 500 && statusCode < 600);
}

void sleepInEventLoop(const std::chrono::milliseconds delay)
{
    QEventLoop loop;
    QTimer::singleShot(
        static_cast<int>(delay.count()), &loop, &QEventLoop::quit);
    loop.exec();
}

} // namespace

DurableRequestClient::DurableRequestClient(
    IRequestClientPtr requestClient, RetryPolicy retryPolicy,
    Sleeper sleeper) :
    m_requestClient{std::move(requestClient)},
    m_retryPolicy{std::move(retryPolicy)},
    m_sleeper{sleeper ? std::move(sleeper) : Sleeper{sleepInEventLoop}}
{
    if (Q_UNLIKELY(!m_requestClient)) {
        throw InvalidArgument{ErrorString{QStringLiteral(
            "DurableRequestClient ctor: request client is null")}};
    }

    if (Q_UNLIKELY(m_retryPolicy.maxAttempts < 1)) {
        throw InvalidArgument{ErrorString{QStringLiteral(
            "DurableRequestClient ctor: max attempts must be positive")}};
    }
}

HttpResponse DurableRequestClient::execute(const ApiRequest & request)
{
    for (int attempt = 1;; ++attempt) {
        try {
            return m_requestClient->execute(request);
        }
        catch (const ProviderError & e) {
            if (!isRetriableStatusCode(e.statusCode()) ||
                attempt >= m_retryPolicy.maxAttempts)
            {
                throw;
            }

            ABWARNING(
                "network::DurableRequestClient",
                "Attempt " << attempt << " of " << request.endpoint
                           << " failed with HTTP " << e.statusCode()
                           << ", retrying");
        }
        catch (const TransportFailure & e) {
            if (attempt >= m_retryPolicy.maxAttempts) {
                throw;
            }

            ABWARNING(
                "network::DurableRequestClient",
                "Attempt " << attempt << " of " << request.endpoint
                           << " failed: " << e.nonLocalizedErrorMessage()
                           << ", retrying");
        }

        m_sleeper(delayBeforeAttempt(attempt + 1));
    }
}

std::chrono::milliseconds DurableRequestClient::delayBeforeAttempt(
    const int attempt) const noexcept
{
    auto delay = m_retryPolicy.initialDelay;
    for (int i = 2; i < attempt && delay < m_retryPolicy.maxDelay; ++i) {
        delay *= 2;
    }

    return std::min(delay, m_retryPolicy.maxDelay);
}

} // namespace assetbridge::network
