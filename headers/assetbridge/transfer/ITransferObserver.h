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

#include <assetbridge/transfer/Types.h>
#include <assetbridge/utility/Linkage.h>

namespace assetbridge::transfer {

/**
 * @brief The ITransferObserver interface receives progress notifications of
 * a transfer run. Batch indexes are zero based.
 */
class ASSETBRIDGE_EXPORT ITransferObserver
{
public:
    virtual ~ITransferObserver() = default;

    virtual void onRunStarted(int totalItems, int batchCount) = 0;

    virtual void onBatchStarted(
        int batchIndex, int batchCount, int batchSize) = 0;

    virtual void onItemFinished(const TransferOutcome & outcome) = 0;

    virtual void onBatchFinished(
        int batchIndex, const QList<TransferOutcome> & outcomes) = 0;

    virtual void onRunFinished(const TransferSummary & summary) = 0;
};

} // namespace assetbridge::transfer
