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

#include <assetbridge/browsing/Types.h>
#include <assetbridge/transfer/Fwd.h>
#include <assetbridge/transfer/Types.h>
#include <assetbridge/utility/Linkage.h>
#include <assetbridge/utility/cancelers/Fwd.h>

namespace assetbridge::transfer {

/**
 * @brief The ITransferPipeline interface copies source entries into
 * a destination album in batches. Each item is downloaded, created as
 * a destination asset, has its content uploaded and is added to the album.
 * A failure of any step terminates the item but never the run.
 */
class ASSETBRIDGE_EXPORT ITransferPipeline
{
public:
    virtual ~ITransferPipeline() = default;

    /**
     * @param sourceEntries             Entries to transfer
     * @param destinationContainerId    Album to add the assets to
     * @param catalogId                 Destination catalog
     * @param canceler                  Checked before each batch and item,
     *                                  may be null
     * @param observer                  Progress receiver, may be expired
     * @return one outcome per source entry, in input order
     * @throw InvalidArgument if album or catalog id is empty
     * @throw AuthenticationFailure if a provider session cannot be obtained
     * @throw OperationCanceled if the run was canceled
     */
    [[nodiscard]] virtual QList<TransferOutcome> run(
        const QList<browsing::SourceEntry> & sourceEntries,
        const QString & destinationContainerId, const QString & catalogId,
        utility::cancelers::ICancelerPtr canceler = nullptr,
        ITransferObserverWeakPtr observer = {}) = 0;
};

} // namespace assetbridge::transfer
