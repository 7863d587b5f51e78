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
#include <assetbridge/transfer/ITransferPipeline.h>

namespace assetbridge::transfer {

class TransferPipeline final : public ITransferPipeline
{
public:
    TransferPipeline(
        network::IRequestClientPtr sourceRequestClient,
        network::IRequestClientPtr destinationRequestClient,
        TransferOptions options);

    [[nodiscard]] QList<TransferOutcome> run(
        const QList<browsing::SourceEntry> & sourceEntries,
        const QString & destinationContainerId, const QString & catalogId,
        utility::cancelers::ICancelerPtr canceler,
        ITransferObserverWeakPtr observer) override;

private:
    [[nodiscard]] TransferOutcome processItem(
        const browsing::SourceEntry & sourceEntry,
        const QString & destinationContainerId, const QString & catalogId);

    [[nodiscard]] QByteArray download(const browsing::SourceEntry & entry);

    void createAsset(
        const browsing::SourceEntry & entry, const QString & catalogId,
        const QString & assetId);

    void uploadMaster(
        const browsing::SourceEntry & entry, const QString & catalogId,
        const QString & assetId, const QByteArray & content);

    void associate(
        const QString & catalogId, const QString & albumId,
        const QString & assetId);

private:
    const network::IRequestClientPtr m_sourceRequestClient;
    const network::IRequestClientPtr m_destinationRequestClient;
    const TransferOptions m_options;
};

} // namespace assetbridge::transfer
