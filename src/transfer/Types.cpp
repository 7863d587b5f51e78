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

#include <assetbridge/transfer/Types.h>

#include <QUuid>

namespace assetbridge::transfer {

QTextStream & operator<<(QTextStream & strm, const TransferStatus status)
{
    switch (status) {
    case TransferStatus::Succeeded:
        strm << "Succeeded";
        break;
    case TransferStatus::DownloadFailed:
        strm << "DownloadFailed";
        break;
    case TransferStatus::CreateFailed:
        strm << "CreateFailed";
        break;
    case TransferStatus::UploadFailed:
        strm << "UploadFailed";
        break;
    case TransferStatus::AssociateFailed:
        strm << "AssociateFailed";
        break;
    }

    return strm;
}

QTextStream & TransferItem::print(QTextStream & strm) const
{
    strm << "TransferItem: source id = " << sourceEntry.id
         << ", name = " << sourceEntry.displayName
         << ", destination container id = " << destinationContainerId
         << ", generated asset id = "
         << (generatedAssetId.isEmpty() ? QStringLiteral("<none>")
                                        : generatedAssetId);
    return strm;
}

QTextStream & TransferOutcome::print(QTextStream & strm) const
{
    strm << "TransferOutcome: " << status << ", " << item;
    if (!detail.isEmpty()) {
        strm << ", detail: " << detail;
    }
    return strm;
}

int TransferSummary::total() const noexcept
{
    return succeeded + failed();
}

int TransferSummary::failed() const noexcept
{
    return downloadFailed + createFailed + uploadFailed + associateFailed;
}

QTextStream & TransferSummary::print(QTextStream & strm) const
{
    strm << "TransferSummary: total = " << total()
         << ", succeeded = " << succeeded << " (degraded: " << degraded
         << "), download failed = " << downloadFailed
         << ", create failed = " << createFailed
         << ", upload failed = " << uploadFailed
         << ", associate failed = " << associateFailed;
    return strm;
}

TransferSummary summarize(const QList<TransferOutcome> & outcomes)
{
    TransferSummary summary;
    for (const auto & outcome: outcomes) {
        switch (outcome.status) {
        case TransferStatus::Succeeded:
            ++summary.succeeded;
            if (!outcome.detail.isEmpty()) {
                ++summary.degraded;
            }
            break;
        case TransferStatus::DownloadFailed:
            ++summary.downloadFailed;
            break;
        case TransferStatus::CreateFailed:
            ++summary.createFailed;
            break;
        case TransferStatus::UploadFailed:
            ++summary.uploadFailed;
            break;
        case TransferStatus::AssociateFailed:
            ++summary.associateFailed;
            break;
        }
    }

    return summary;
}

QString assetSubtypeForContentType(const QString & contentType)
{
    if (contentType.startsWith(QStringLiteral("video/"), Qt::CaseInsensitive)) {
        return QStringLiteral("video");
    }

    return QStringLiteral("image");
}

QString generateAssetId()
{
    return QUuid::createUuid().toString(QUuid::Id128);
}

QTextStream & TransferOptions::print(QTextStream & strm) const
{
    strm << "TransferOptions: batch size = " << batchSize
         << ", imported by = " << importedBy
         << ", imported on device = " << importedOnDevice
         << ", strict association = "
         << (strictAssociation ? "true" : "false");
    return strm;
}

} // namespace assetbridge::transfer
