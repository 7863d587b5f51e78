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

#include <assetbridge/utility/Printable.h>

#include <chrono>

namespace assetbridge::network {

/**
 * Exponential backoff parameters for the durable request client. The delay
 * before attempt n + 1 is initialDelay * 2^(n - 1), capped by maxDelay.
 * maxAttempts == 1 disables retrying.
 */
struct ASSETBRIDGE_EXPORT RetryPolicy : public utility::Printable
{
    QTextStream & print(QTextStream & strm) const override;

    int maxAttempts = 1;
    std::chrono::milliseconds initialDelay{1000};
    std::chrono::milliseconds maxDelay{30000};
};

} // namespace assetbridge::network
