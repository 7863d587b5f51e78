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

#include <assetbridge/network/Fwd.h>
#include <assetbridge/network/IRequestClient.h>
#include <assetbridge/network/RetryPolicy.h>

#include <chrono>
#include <functional>

namespace assetbridge::network {

/**
 * @brief The DurableRequestClient class retries requests which failed with
 * a transport failure, HTTP 429 or a 5xx status according to the retry
 * policy. Other failures are passed through immediately.
 */
class DurableRequestClient final : public IRequestClient
{
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    DurableRequestClient(
        IRequestClientPtr requestClient, RetryPolicy retryPolicy,
        Sleeper sleeper = {});

    using IRequestClient::execute;

    [[nodiscard]] HttpResponse execute(const ApiRequest & request) override;

    [[nodiscard]] std::chrono::milliseconds delayBeforeAttempt(
        int attempt) const noexcept;

private:
    const IRequestClientPtr m_requestClient;
    const RetryPolicy m_retryPolicy;
    const Sleeper m_sleeper;
};

} // namespace assetbridge::network
