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

#include "TransferPipeline.h"

#include <assetbridge/exception/InvalidArgument.h>
#include <assetbridge/exception/OperationCanceled.h>
#include <assetbridge/exception/ProviderError.h>
#include <assetbridge/exception/RequestFailure.h>
#include <assetbridge/logging/AssetBridgeLogger.h>
#include <assetbridge/network/IRequestClient.h>
#include <assetbridge/transfer/ITransferObserver.h>
#include <assetbridge/utility/DateTime.h>
#include <assetbridge/utility/cancelers/ICanceler.h>

#include <QJsonArray>
#include <QJsonObject>

#include <algorithm>

namespace assetbridge::transfer {

namespace {

[[nodiscard]] QString encodePathSegment(const QString & segment)
{
    return QString::fromUtf8(QUrl::toPercentEncoding(segment));
}

[[nodiscard]] QString assetEndpoint(
    const QString & catalogId, const QString & assetId)
{
    return QStringLiteral("/v2/catalogs/") + encodePathSegment(catalogId) +
        QStringLiteral("/assets/") + encodePathSegment(assetId);
}

void checkCanceled(const utility::cancelers::ICancelerPtr & canceler)
{
    if (canceler && canceler->isCanceled()) {
        throw OperationCanceled{ErrorString{
            QT_TRANSLATE_NOOP("transfer", "Transfer was canceled")}};
    }
}

constexpr int gMaxResponseBodyInDetail = 512;

[[nodiscard]] QString failureDetail(
    const QString & prefix, const RequestFailure & e)
{
    QString detail = prefix + e.nonLocalizedErrorMessage();

    const auto * providerError = dynamic_cast<const ProviderError *>(&e);
    if (!providerError) {
        return detail;
    }

    const QString body = QString::fromUtf8(providerError->body()).trimmed();
    if (body.isEmpty()) {
        return detail;
    }

    detail += QStringLiteral(": ");
    if (body.size() > gMaxResponseBodyInDetail) {
        detail += body.left(gMaxResponseBodyInDetail) + QStringLiteral("...");
    }
    else {
        detail += body;
    }

    return detail;
}

[[nodiscard]] TransferOutcome makeOutcome(
    TransferItem item, const TransferStatus status, QString detail = {})
{
    TransferOutcome outcome;
    outcome.item = std::move(item);
    outcome.status = status;
    outcome.detail = std::move(detail);
    return outcome;
}

template <class Func>
void notify(const ITransferObserverWeakPtr & observer, Func && func)
{
    if (const auto strongObserver = observer.lock()) {
        func(*strongObserver);
    }
}

} // namespace

TransferPipeline::TransferPipeline(
    network::IRequestClientPtr sourceRequestClient,
    network::IRequestClientPtr destinationRequestClient,
    TransferOptions options) :
    m_sourceRequestClient{std::move(sourceRequestClient)},
    m_destinationRequestClient{std::move(destinationRequestClient)},
    m_options{[&options] {
        if (!options.assetIdGenerator) {
            options.assetIdGenerator = generateAssetId;
        }
        if (!options.clock) {
            options.clock = [] {
                return QDateTime::currentDateTimeUtc();
            };
        }
        return std::move(options);
    }()}
{
    if (Q_UNLIKELY(!m_sourceRequestClient)) {
        throw InvalidArgument{ErrorString{QStringLiteral(
            "TransferPipeline ctor: source request client is null")}};
    }

    if (Q_UNLIKELY(!m_destinationRequestClient)) {
        throw InvalidArgument{ErrorString{QStringLiteral(
            "TransferPipeline ctor: destination request client is null")}};
    }

    if (Q_UNLIKELY(m_options.batchSize <= 0)) {
        throw InvalidArgument{ErrorString{QStringLiteral(
            "TransferPipeline ctor: batch size must be positive")}};
    }
}

QList<TransferOutcome> TransferPipeline::run(
    const QList<browsing::SourceEntry> & sourceEntries,
    const QString & destinationContainerId, const QString & catalogId,
    utility::cancelers::ICancelerPtr canceler,
    ITransferObserverWeakPtr observer)
{
    if (Q_UNLIKELY(destinationContainerId.isEmpty())) {
        throw InvalidArgument{ErrorString{QT_TRANSLATE_NOOP(
            "transfer", "Destination album id is empty")}};
    }

    if (Q_UNLIKELY(catalogId.isEmpty())) {
        throw InvalidArgument{ErrorString{
            QT_TRANSLATE_NOOP("transfer", "Destination catalog id is empty")}};
    }

    const int totalItems = sourceEntries.size();
    const int batchSize = m_options.batchSize;
    const int batchCount = (totalItems + batchSize - 1) / batchSize;

    ABINFO(
        "transfer::TransferPipeline",
        "Transferring " << totalItems << " items to album "
                        << destinationContainerId << " in " << batchCount
                        << " batches");

    notify(observer, [&](ITransferObserver & o) {
        o.onRunStarted(totalItems, batchCount);
    });

    QList<TransferOutcome> outcomes;
    outcomes.reserve(totalItems);

    for (int batchIndex = 0; batchIndex < batchCount; ++batchIndex) {
        checkCanceled(canceler);

        const int batchStart = batchIndex * batchSize;
        const int currentBatchSize = std::min(batchSize, totalItems - batchStart);

        ABDEBUG(
            "transfer::TransferPipeline",
            "Starting batch " << (batchIndex + 1) << " of " << batchCount
                              << " with " << currentBatchSize << " items");

        notify(observer, [&](ITransferObserver & o) {
            o.onBatchStarted(batchIndex, batchCount, currentBatchSize);
        });

        QList<TransferOutcome> batchOutcomes;
        for (int i = batchStart; i < batchStart + currentBatchSize; ++i) {
            checkCanceled(canceler);

            auto outcome = processItem(
                sourceEntries[i], destinationContainerId, catalogId);

            notify(observer, [&](ITransferObserver & o) {
                o.onItemFinished(outcome);
            });

            batchOutcomes << outcome;
            outcomes << outcome;
        }

        notify(observer, [&](ITransferObserver & o) {
            o.onBatchFinished(batchIndex, batchOutcomes);
        });
    }

    const auto summary = summarize(outcomes);
    ABINFO("transfer::TransferPipeline", summary);

    notify(observer, [&](ITransferObserver & o) { o.onRunFinished(summary); });

    return outcomes;
}

TransferOutcome TransferPipeline::processItem(
    const browsing::SourceEntry & sourceEntry,
    const QString & destinationContainerId, const QString & catalogId)
{
    TransferItem item;
    item.sourceEntry = sourceEntry;
    item.destinationContainerId = destinationContainerId;

    if (sourceEntry.id.isEmpty()) {
        ABWARNING(
            "transfer::TransferPipeline",
            "Skipping source entry without id: " << sourceEntry.displayName);
        return makeOutcome(
            std::move(item), TransferStatus::DownloadFailed,
            QStringLiteral("Missing source id"));
    }

    if (sourceEntry.isContainer()) {
        return makeOutcome(
            std::move(item), TransferStatus::DownloadFailed,
            QStringLiteral("Source entry is a container"));
    }

    QByteArray content;
    try {
        content = download(sourceEntry);
    }
    catch (const RequestFailure & e) {
        ABWARNING(
            "transfer::TransferPipeline",
            "Failed to download " << sourceEntry.id << ": "
                                  << e.nonLocalizedErrorMessage());
        return makeOutcome(
            std::move(item), TransferStatus::DownloadFailed,
            failureDetail(QStringLiteral("Download failed: "), e));
    }

    if (content.isEmpty()) {
        return makeOutcome(
            std::move(item), TransferStatus::DownloadFailed,
            QStringLiteral("Downloaded content is empty"));
    }

    item.generatedAssetId = m_options.assetIdGenerator();

    try {
        createAsset(sourceEntry, catalogId, item.generatedAssetId);
    }
    catch (const RequestFailure & e) {
        ABWARNING(
            "transfer::TransferPipeline",
            "Failed to create asset for " << sourceEntry.id << ": "
                                          << e.nonLocalizedErrorMessage());
        return makeOutcome(
            std::move(item), TransferStatus::CreateFailed,
            failureDetail(QStringLiteral("Asset creation failed: "), e));
    }

    try {
        uploadMaster(sourceEntry, catalogId, item.generatedAssetId, content);
    }
    catch (const RequestFailure & e) {
        ABWARNING(
            "transfer::TransferPipeline",
            "Failed to upload content of "
                << sourceEntry.id << ", asset " << item.generatedAssetId
                << " is left without content: "
                << e.nonLocalizedErrorMessage());
        return makeOutcome(
            std::move(item), TransferStatus::UploadFailed,
            failureDetail(QStringLiteral("Upload failed: "), e));
    }

    try {
        associate(catalogId, destinationContainerId, item.generatedAssetId);
    }
    catch (const RequestFailure & e) {
        const QString detail = failureDetail(
            QStringLiteral("Asset was uploaded but not added to the album: "),
            e);

        ABWARNING(
            "transfer::TransferPipeline",
            "Asset " << item.generatedAssetId << ": " << detail);

        return makeOutcome(
            std::move(item),
            m_options.strictAssociation ? TransferStatus::AssociateFailed
                                        : TransferStatus::Succeeded,
            detail);
    }

    ABDEBUG(
        "transfer::TransferPipeline",
        "Transferred " << sourceEntry.id << " as asset "
                       << item.generatedAssetId);

    return makeOutcome(std::move(item), TransferStatus::Succeeded);
}

QByteArray TransferPipeline::download(const browsing::SourceEntry & entry)
{
    network::ApiRequest request;
    request.endpoint =
        QStringLiteral("/drive/v3/files/") + encodePathSegment(entry.id);
    request.query.addQueryItem(QStringLiteral("alt"), QStringLiteral("media"));
    request.responseKind = network::ResponseKind::Stream;

    return m_sourceRequestClient->execute(request).body;
}

void TransferPipeline::createAsset(
    const browsing::SourceEntry & entry, const QString & catalogId,
    const QString & assetId)
{
    // Capture date of the original is not known, transfer time is used
    const QString now = toIsoDateTimeString(m_options.clock());

    QJsonObject importSource;
    importSource[QStringLiteral("fileName")] = entry.displayName;
    importSource[QStringLiteral("importedOnDevice")] =
        m_options.importedOnDevice;
    importSource[QStringLiteral("importedBy")] = m_options.importedBy.isEmpty()
        ? QStringLiteral("Unknown")
        : m_options.importedBy;
    importSource[QStringLiteral("importTimestamp")] = now;

    QJsonObject payload;
    payload[QStringLiteral("captureDate")] = now;
    payload[QStringLiteral("importSource")] = importSource;

    QJsonObject body;
    body[QStringLiteral("subtype")] =
        assetSubtypeForContentType(entry.contentType);
    body[QStringLiteral("payload")] = payload;

    network::ApiRequest request;
    request.method = network::HttpMethod::Put;
    request.endpoint = assetEndpoint(catalogId, assetId);
    request.body = QJsonDocument{body};
    request.headers << network::HttpHeader{
        QByteArrayLiteral("If-None-Match"), QByteArrayLiteral("*")};

    (void)m_destinationRequestClient->execute(request);
}

void TransferPipeline::uploadMaster(
    const browsing::SourceEntry & entry, const QString & catalogId,
    const QString & assetId, const QByteArray & content)
{
    const QByteArray contentType = entry.contentType.isEmpty()
        ? QByteArrayLiteral("application/octet-stream")
        : entry.contentType.toUtf8();

    network::ApiRequest request;
    request.method = network::HttpMethod::Put;
    request.endpoint =
        assetEndpoint(catalogId, assetId) + QStringLiteral("/master");
    request.rawBody = content;
    request.headers << network::HttpHeader{
        QByteArrayLiteral("Content-Type"), contentType};
    request.headers << network::HttpHeader{
        QByteArrayLiteral("Content-Length"),
        QByteArray::number(content.size())};

    (void)m_destinationRequestClient->execute(request);
}

void TransferPipeline::associate(
    const QString & catalogId, const QString & albumId,
    const QString & assetId)
{
    QJsonObject payload;
    payload[QStringLiteral("cover")] = false;

    QJsonObject resource;
    resource[QStringLiteral("id")] = assetId;
    resource[QStringLiteral("payload")] = payload;

    QJsonObject body;
    body[QStringLiteral("resources")] = QJsonArray{resource};

    network::ApiRequest request;
    request.method = network::HttpMethod::Put;
    request.endpoint = QStringLiteral("/v2/catalogs/") +
        encodePathSegment(catalogId) + QStringLiteral("/albums/") +
        encodePathSegment(albumId) + QStringLiteral("/assets");
    request.body = QJsonDocument{body};

    (void)m_destinationRequestClient->execute(request);
}

} // namespace assetbridge::transfer
