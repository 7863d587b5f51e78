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
#include <assetbridge/utility/Printable.h>

#include <QDateTime>
#include <QList>
#include <QString>

#include <functional>

namespace assetbridge::transfer {

enum class TransferStatus
{
    Succeeded,
    DownloadFailed,
    CreateFailed,
    UploadFailed,
    AssociateFailed
};

ASSETBRIDGE_DECLARE_PRINTABLE(TransferStatus)

/**
 * @brief The TransferItem struct is the unit of work of a transfer run.
 * generatedAssetId is minted per attempt right before the asset is created
 * and is empty if the item failed before that.
 */
struct ASSETBRIDGE_EXPORT TransferItem : public utility::Printable
{
    QTextStream & print(QTextStream & strm) const override;

    browsing::SourceEntry sourceEntry;
    QString destinationContainerId;
    QString generatedAssetId;
};

struct ASSETBRIDGE_EXPORT TransferOutcome : public utility::Printable
{
    QTextStream & print(QTextStream & strm) const override;

    TransferItem item;
    TransferStatus status = TransferStatus::Succeeded;

    /**
     * Failure description; for a succeeded item a non-empty detail is
     * the warning about failed album association
     */
    QString detail;
};

struct ASSETBRIDGE_EXPORT TransferSummary : public utility::Printable
{
    [[nodiscard]] int total() const noexcept;
    [[nodiscard]] int failed() const noexcept;

    QTextStream & print(QTextStream & strm) const override;

    int succeeded = 0;
    int downloadFailed = 0;
    int createFailed = 0;
    int uploadFailed = 0;
    int associateFailed = 0;

    /**
     * Succeeded items which were not added to the album
     */
    int degraded = 0;
};

[[nodiscard]] ASSETBRIDGE_EXPORT TransferSummary
    summarize(const QList<TransferOutcome> & outcomes);

/**
 * Destination asset subtype for the source content type: "video" for
 * video/*, "image" for everything else
 */
[[nodiscard]] ASSETBRIDGE_EXPORT QString
    assetSubtypeForContentType(const QString & contentType);

/**
 * Unique asset id: 32 lowercase hex digits
 */
[[nodiscard]] ASSETBRIDGE_EXPORT QString generateAssetId();

struct ASSETBRIDGE_EXPORT TransferOptions : public utility::Printable
{
    QTextStream & print(QTextStream & strm) const override;

    int batchSize = 5;

    /**
     * Destination account id recorded as the importer of created assets,
     * normally IDestinationBrowser::accountInfo().id. "Unknown" is recorded
     * if it is empty.
     */
    QString importedBy = QStringLiteral("Unknown");
    QString importedOnDevice = QStringLiteral("Partner API Upload");

    /**
     * If set, failed album association is reported as AssociateFailed
     * instead of a succeeded item with a warning
     */
    bool strictAssociation = false;

    std::function<QString()> assetIdGenerator;
    std::function<QDateTime()> clock;
};

} // namespace assetbridge::transfer
