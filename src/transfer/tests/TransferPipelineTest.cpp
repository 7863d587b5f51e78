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

#include <transfer/TransferPipeline.h>
#include <transfer/tests/mocks/MockITransferObserver.h>

#include <network/tests/mocks/MockIRequestClient.h>

#include <assetbridge/exception/AuthenticationFailure.h>
#include <assetbridge/exception/InvalidArgument.h>
#include <assetbridge/exception/OperationCanceled.h>
#include <assetbridge/exception/ProviderError.h>
#include <assetbridge/exception/TransportFailure.h>
#include <assetbridge/network/HttpTypes.h>
#include <assetbridge/utility/cancelers/ManualCanceler.h>

#include <QJsonArray>
#include <QJsonObject>
#include <QRegularExpression>
#include <QSet>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>

namespace assetbridge::transfer::tests {

using testing::_;
using testing::InSequence;
using testing::Invoke;
using testing::NiceMock;
using testing::StrictMock;

namespace {

const QString gCatalogId = QStringLiteral("cat1");
const QString gAlbumId = QStringLiteral("album1");

const QDateTime gNow = QDateTime::fromString(
    QStringLiteral("2024-05-01T12:00:00Z"), Qt::ISODate);

[[nodiscard]] browsing::SourceEntry sourceEntry(
    const QString & id, const QString & contentType = QStringLiteral("image/jpeg"))
{
    browsing::SourceEntry entry;
    entry.id = id;
    entry.displayName = id + QStringLiteral(".bin");
    entry.contentType = contentType;
    entry.parentId = QStringLiteral("folder1");
    return entry;
}

[[nodiscard]] QList<browsing::SourceEntry> sourceEntries(const int count)
{
    QList<browsing::SourceEntry> entries;
    for (int i = 1; i <= count; ++i) {
        entries << sourceEntry(QStringLiteral("file%1").arg(i));
    }
    return entries;
}

[[nodiscard]] network::HttpResponse response(
    const int statusCode, QByteArray body = {})
{
    network::HttpResponse result;
    result.statusCode = statusCode;
    result.body = std::move(body);
    return result;
}

[[nodiscard]] ProviderError providerError(const int statusCode)
{
    return ProviderError{
        statusCode, QByteArrayLiteral("{\"errors\":{}}"),
        ErrorString{"Request failed"}};
}

[[nodiscard]] QString sourceIdFromEndpoint(const QString & endpoint)
{
    return endpoint.section(QChar::fromLatin1('/'), -1);
}

} // namespace

class TransferPipelineTest : public testing::Test
{
protected:
    void SetUp() override
    {
        ON_CALL(*m_mockSourceClient, execute)
            .WillByDefault(Invoke([this](const network::ApiRequest & request) {
                m_sourceRequests << request;
                const QString id = sourceIdFromEndpoint(request.endpoint);
                if (m_failingDownloads.contains(id)) {
                    throw providerError(404);
                }
                return response(200, QByteArrayLiteral("content of ") + id.toUtf8());
            }));

        ON_CALL(*m_mockDestinationClient, execute)
            .WillByDefault(Invoke([this](const network::ApiRequest & request) {
                m_destinationRequests << request;
                if (m_destinationFailure) {
                    m_destinationFailure(request);
                }
                return response(201);
            }));
    }

    [[nodiscard]] ITransferPipelinePtr createPipeline(
        const bool strictAssociation = false)
    {
        TransferOptions options;
        options.importedBy = QStringLiteral("account1");
        options.strictAssociation = strictAssociation;
        options.clock = [] { return gNow; };
        options.assetIdGenerator = [this] {
            return QStringLiteral("asset%1").arg(++m_generatedAssetIds);
        };

        return std::make_shared<TransferPipeline>(
            m_mockSourceClient, m_mockDestinationClient, std::move(options));
    }

    [[nodiscard]] QList<network::ApiRequest> destinationRequestsFor(
        const QString & assetId) const
    {
        QList<network::ApiRequest> result;
        for (const auto & request: m_destinationRequests) {
            if (request.endpoint.contains(assetId)) {
                result << request;
                continue;
            }

            if (!request.body) {
                continue;
            }

            const auto resources = request.body->object()
                                       .value(QStringLiteral("resources"))
                                       .toArray();
            for (const auto & resource: resources) {
                if (resource.toObject().value(QStringLiteral("id")).toString() ==
                    assetId)
                {
                    result << request;
                    break;
                }
            }
        }
        return result;
    }

protected:
    const std::shared_ptr<network::tests::mocks::MockIRequestClient>
        m_mockSourceClient = std::make_shared<
            NiceMock<network::tests::mocks::MockIRequestClient>>();

    const std::shared_ptr<network::tests::mocks::MockIRequestClient>
        m_mockDestinationClient = std::make_shared<
            NiceMock<network::tests::mocks::MockIRequestClient>>();

    QList<network::ApiRequest> m_sourceRequests;
    QList<network::ApiRequest> m_destinationRequests;

    QStringList m_failingDownloads;
    std::function<void(const network::ApiRequest &)> m_destinationFailure;

    int m_generatedAssetIds = 0;
};

TEST_F(TransferPipelineTest, CtorNullSourceClient)
{
    EXPECT_THROW(
        TransferPipeline(nullptr, m_mockDestinationClient, TransferOptions{}),
        InvalidArgument);
}

TEST_F(TransferPipelineTest, CtorNullDestinationClient)
{
    EXPECT_THROW(
        TransferPipeline(m_mockSourceClient, nullptr, TransferOptions{}),
        InvalidArgument);
}

TEST_F(TransferPipelineTest, CtorNonPositiveBatchSize)
{
    TransferOptions options;
    options.batchSize = 0;

    EXPECT_THROW(
        TransferPipeline(
            m_mockSourceClient, m_mockDestinationClient, std::move(options)),
        InvalidArgument);
}

TEST_F(TransferPipelineTest, RejectEmptyAlbumOrCatalogId)
{
    const auto pipeline = createPipeline();

    EXPECT_THROW(
        (void)pipeline->run(sourceEntries(1), QString{}, gCatalogId),
        InvalidArgument);

    EXPECT_THROW(
        (void)pipeline->run(sourceEntries(1), gAlbumId, QString{}),
        InvalidArgument);

    EXPECT_TRUE(m_sourceRequests.isEmpty());
    EXPECT_TRUE(m_destinationRequests.isEmpty());
}

TEST_F(TransferPipelineTest, EmptyRun)
{
    const auto pipeline = createPipeline();

    const auto mockObserver = std::make_shared<StrictMock<mocks::MockITransferObserver>>();
    {
        InSequence s;
        EXPECT_CALL(*mockObserver, onRunStarted(0, 0));
        EXPECT_CALL(*mockObserver, onRunFinished);
    }

    const auto outcomes =
        pipeline->run({}, gAlbumId, gCatalogId, nullptr, mockObserver);
    EXPECT_TRUE(outcomes.isEmpty());
}

TEST_F(TransferPipelineTest, TransferSingleItem)
{
    const auto pipeline = createPipeline();

    const auto outcomes = pipeline->run(
        QList<browsing::SourceEntry>{sourceEntry(QStringLiteral("file1"))},
        gAlbumId, gCatalogId);

    ASSERT_EQ(outcomes.size(), 1);
    EXPECT_EQ(outcomes[0].status, TransferStatus::Succeeded);
    EXPECT_TRUE(outcomes[0].detail.isEmpty());
    EXPECT_EQ(outcomes[0].item.generatedAssetId, QStringLiteral("asset1"));
    EXPECT_EQ(outcomes[0].item.destinationContainerId, gAlbumId);
    EXPECT_EQ(outcomes[0].item.sourceEntry.id, QStringLiteral("file1"));

    ASSERT_EQ(m_sourceRequests.size(), 1);
    EXPECT_EQ(
        m_sourceRequests[0].endpoint, QStringLiteral("/drive/v3/files/file1"));
    EXPECT_EQ(
        m_sourceRequests[0].query.queryItemValue(QStringLiteral("alt")),
        QStringLiteral("media"));
    EXPECT_EQ(m_sourceRequests[0].responseKind, network::ResponseKind::Stream);

    ASSERT_EQ(m_destinationRequests.size(), 3);

    const auto & create = m_destinationRequests[0];
    EXPECT_EQ(create.method, network::HttpMethod::Put);
    EXPECT_EQ(create.endpoint, QStringLiteral("/v2/catalogs/cat1/assets/asset1"));
    EXPECT_EQ(
        network::findHeader(create.headers, QByteArrayLiteral("If-None-Match")),
        QByteArrayLiteral("*"));
    ASSERT_TRUE(create.body);

    const auto createBody = create.body->object();
    EXPECT_EQ(
        createBody.value(QStringLiteral("subtype")).toString(),
        QStringLiteral("image"));

    const auto payload = createBody.value(QStringLiteral("payload")).toObject();
    EXPECT_EQ(
        payload.value(QStringLiteral("captureDate")).toString(),
        QStringLiteral("2024-05-01T12:00:00.000Z"));

    const auto importSource =
        payload.value(QStringLiteral("importSource")).toObject();
    EXPECT_EQ(
        importSource.value(QStringLiteral("fileName")).toString(),
        QStringLiteral("file1.bin"));
    EXPECT_EQ(
        importSource.value(QStringLiteral("importedOnDevice")).toString(),
        QStringLiteral("Partner API Upload"));
    EXPECT_EQ(
        importSource.value(QStringLiteral("importedBy")).toString(),
        QStringLiteral("account1"));
    EXPECT_EQ(
        importSource.value(QStringLiteral("importTimestamp")).toString(),
        QStringLiteral("2024-05-01T12:00:00.000Z"));

    const auto & upload = m_destinationRequests[1];
    EXPECT_EQ(upload.method, network::HttpMethod::Put);
    EXPECT_EQ(
        upload.endpoint, QStringLiteral("/v2/catalogs/cat1/assets/asset1/master"));
    EXPECT_EQ(upload.rawBody, QByteArrayLiteral("content of file1"));
    EXPECT_EQ(
        network::findHeader(upload.headers, QByteArrayLiteral("Content-Type")),
        QByteArrayLiteral("image/jpeg"));
    EXPECT_EQ(
        network::findHeader(upload.headers, QByteArrayLiteral("Content-Length")),
        QByteArrayLiteral("16"));

    const auto & associate = m_destinationRequests[2];
    EXPECT_EQ(associate.method, network::HttpMethod::Put);
    EXPECT_EQ(
        associate.endpoint,
        QStringLiteral("/v2/catalogs/cat1/albums/album1/assets"));
    ASSERT_TRUE(associate.body);

    const auto resources = associate.body->object()
                               .value(QStringLiteral("resources"))
                               .toArray();
    ASSERT_EQ(resources.size(), 1);
    const auto resource = resources[0].toObject();
    EXPECT_EQ(
        resource.value(QStringLiteral("id")).toString(),
        QStringLiteral("asset1"));
    EXPECT_EQ(
        resource.value(QStringLiteral("payload"))
            .toObject()
            .value(QStringLiteral("cover"))
            .toBool(true),
        false);
}

TEST_F(TransferPipelineTest, AssetSubtypeFollowsContentType)
{
    const auto pipeline = createPipeline();

    const auto outcomes = pipeline->run(
        QList<browsing::SourceEntry>{
            sourceEntry(QStringLiteral("v"), QStringLiteral("video/mp4")),
            sourceEntry(QStringLiteral("i"), QStringLiteral("image/heic")),
            sourceEntry(QStringLiteral("u"), QString{})},
        gAlbumId, gCatalogId);

    ASSERT_EQ(outcomes.size(), 3);
    ASSERT_EQ(m_destinationRequests.size(), 9);

    EXPECT_EQ(
        m_destinationRequests[0].body->object().value(QStringLiteral("subtype")).toString(),
        QStringLiteral("video"));
    EXPECT_EQ(
        m_destinationRequests[3].body->object().value(QStringLiteral("subtype")).toString(),
        QStringLiteral("image"));
    EXPECT_EQ(
        m_destinationRequests[6].body->object().value(QStringLiteral("subtype")).toString(),
        QStringLiteral("image"));

    EXPECT_EQ(
        network::findHeader(
            m_destinationRequests[7].headers, QByteArrayLiteral("Content-Type")),
        QByteArrayLiteral("application/octet-stream"));
}

TEST_F(TransferPipelineTest, ProcessItemsInBatches)
{
    const auto pipeline = createPipeline();

    const auto mockObserver =
        std::make_shared<StrictMock<mocks::MockITransferObserver>>();

    {
        InSequence s;
        EXPECT_CALL(*mockObserver, onRunStarted(12, 3));

        EXPECT_CALL(*mockObserver, onBatchStarted(0, 3, 5));
        EXPECT_CALL(*mockObserver, onItemFinished).Times(5);
        EXPECT_CALL(
            *mockObserver, onBatchFinished(0, testing::SizeIs(5)));

        EXPECT_CALL(*mockObserver, onBatchStarted(1, 3, 5));
        EXPECT_CALL(*mockObserver, onItemFinished).Times(5);
        EXPECT_CALL(
            *mockObserver, onBatchFinished(1, testing::SizeIs(5)));

        EXPECT_CALL(*mockObserver, onBatchStarted(2, 3, 2));
        EXPECT_CALL(*mockObserver, onItemFinished).Times(2);
        EXPECT_CALL(
            *mockObserver, onBatchFinished(2, testing::SizeIs(2)));

        EXPECT_CALL(*mockObserver, onRunFinished)
            .WillOnce(Invoke([](const TransferSummary & summary) {
                EXPECT_EQ(summary.total(), 12);
                EXPECT_EQ(summary.succeeded, 12);
                EXPECT_EQ(summary.failed(), 0);
            }));
    }

    const auto entries = sourceEntries(12);
    const auto outcomes =
        pipeline->run(entries, gAlbumId, gCatalogId, nullptr, mockObserver);

    ASSERT_EQ(outcomes.size(), 12);
    QSet<QString> assetIds;
    for (int i = 0; i < outcomes.size(); ++i) {
        EXPECT_EQ(outcomes[i].item.sourceEntry, entries[i]);
        EXPECT_EQ(outcomes[i].status, TransferStatus::Succeeded);
        assetIds.insert(outcomes[i].item.generatedAssetId);
    }
    EXPECT_EQ(assetIds.size(), 12);
}

TEST_F(TransferPipelineTest, DownloadFailureDoesNotStopRun)
{
    const auto pipeline = createPipeline();
    m_failingDownloads << QStringLiteral("file3");

    const auto outcomes = pipeline->run(sourceEntries(5), gAlbumId, gCatalogId);

    ASSERT_EQ(outcomes.size(), 5);
    for (int i = 0; i < outcomes.size(); ++i) {
        if (i == 2) {
            EXPECT_EQ(outcomes[i].status, TransferStatus::DownloadFailed);
            EXPECT_FALSE(outcomes[i].detail.isEmpty());
            EXPECT_TRUE(outcomes[i].item.generatedAssetId.isEmpty());
        }
        else {
            EXPECT_EQ(outcomes[i].status, TransferStatus::Succeeded);
        }
    }

    EXPECT_EQ(m_sourceRequests.size(), 5);
    EXPECT_EQ(m_destinationRequests.size(), 12);

    const auto summary = summarize(outcomes);
    EXPECT_EQ(summary.succeeded, 4);
    EXPECT_EQ(summary.downloadFailed, 1);
}

TEST_F(TransferPipelineTest, EmptyDownloadIsDownloadFailure)
{
    const auto pipeline = createPipeline();

    ON_CALL(*m_mockSourceClient, execute)
        .WillByDefault(Invoke([](const network::ApiRequest &) {
            return response(200);
        }));

    const auto outcomes = pipeline->run(sourceEntries(1), gAlbumId, gCatalogId);

    ASSERT_EQ(outcomes.size(), 1);
    EXPECT_EQ(outcomes[0].status, TransferStatus::DownloadFailed);
    EXPECT_TRUE(m_destinationRequests.isEmpty());
}

TEST_F(TransferPipelineTest, EntriesWithoutIdOrOfContainerTypeAreNotDownloaded)
{
    const auto pipeline = createPipeline();

    const auto outcomes = pipeline->run(
        QList<browsing::SourceEntry>{
            sourceEntry(QString{}),
            sourceEntry(
                QStringLiteral("folder2"),
                QString::fromUtf8(browsing::gSourceContainerContentType))},
        gAlbumId, gCatalogId);

    ASSERT_EQ(outcomes.size(), 2);
    EXPECT_EQ(outcomes[0].status, TransferStatus::DownloadFailed);
    EXPECT_EQ(outcomes[0].detail, QStringLiteral("Missing source id"));
    EXPECT_EQ(outcomes[1].status, TransferStatus::DownloadFailed);

    EXPECT_TRUE(m_sourceRequests.isEmpty());
    EXPECT_TRUE(m_destinationRequests.isEmpty());
}

TEST_F(TransferPipelineTest, ExistingAssetIsCreateFailure)
{
    const auto pipeline = createPipeline();

    m_destinationFailure = [](const network::ApiRequest & request) {
        if (request.endpoint == QStringLiteral("/v2/catalogs/cat1/assets/asset2"))
        {
            throw providerError(412);
        }
    };

    const auto outcomes = pipeline->run(sourceEntries(3), gAlbumId, gCatalogId);

    ASSERT_EQ(outcomes.size(), 3);
    EXPECT_EQ(outcomes[0].status, TransferStatus::Succeeded);
    EXPECT_EQ(outcomes[1].status, TransferStatus::CreateFailed);
    EXPECT_EQ(outcomes[1].item.generatedAssetId, QStringLiteral("asset2"));
    EXPECT_EQ(outcomes[2].status, TransferStatus::Succeeded);

    // Neither upload nor association happens for the failed item
    const auto requests = destinationRequestsFor(QStringLiteral("asset2"));
    ASSERT_EQ(requests.size(), 1);
    EXPECT_EQ(
        requests[0].endpoint, QStringLiteral("/v2/catalogs/cat1/assets/asset2"));
}

TEST_F(TransferPipelineTest, UnknownImporterWithoutAccountId)
{
    TransferOptions options;
    EXPECT_EQ(options.importedBy, QStringLiteral("Unknown"));

    options.importedBy.clear();
    options.clock = [] { return gNow; };

    const auto pipeline = std::make_shared<TransferPipeline>(
        m_mockSourceClient, m_mockDestinationClient, std::move(options));

    const auto outcomes = pipeline->run(
        QList<browsing::SourceEntry>{sourceEntry(QStringLiteral("file1"))},
        gAlbumId, gCatalogId);

    ASSERT_EQ(outcomes.size(), 1);
    EXPECT_EQ(outcomes[0].status, TransferStatus::Succeeded);

    ASSERT_FALSE(m_destinationRequests.isEmpty());
    const auto & create = m_destinationRequests[0];
    ASSERT_TRUE(create.body);

    const auto importSource = create.body->object()
                                  .value(QStringLiteral("payload"))
                                  .toObject()
                                  .value(QStringLiteral("importSource"))
                                  .toObject();
    EXPECT_EQ(
        importSource.value(QStringLiteral("importedBy")).toString(),
        QStringLiteral("Unknown"));
}

TEST_F(TransferPipelineTest, FailureDetailIncludesProviderResponse)
{
    const auto pipeline = createPipeline();

    m_destinationFailure = [](const network::ApiRequest & request) {
        if (request.endpoint == QStringLiteral("/v2/catalogs/cat1/assets/asset1"))
        {
            throw ProviderError{
                412,
                QByteArrayLiteral(
                    "{\"code\":1004,\"description\":\"Asset already exists\"}"),
                ErrorString{"Request failed"}};
        }

        if (request.endpoint.endsWith(QStringLiteral("/asset2/master"))) {
            throw ProviderError{
                500, QByteArray(2000, 'e'), ErrorString{"Request failed"}};
        }
    };

    const auto outcomes = pipeline->run(sourceEntries(3), gAlbumId, gCatalogId);

    ASSERT_EQ(outcomes.size(), 3);

    EXPECT_EQ(outcomes[0].status, TransferStatus::CreateFailed);
    EXPECT_TRUE(outcomes[0].detail.contains(QStringLiteral("Asset already exists")))
        << outcomes[0].detail.toStdString();

    EXPECT_EQ(outcomes[1].status, TransferStatus::UploadFailed);
    EXPECT_TRUE(outcomes[1].detail.endsWith(QStringLiteral("eee...")));
    EXPECT_LT(outcomes[1].detail.size(), 1000);

    EXPECT_EQ(outcomes[2].status, TransferStatus::Succeeded);
    EXPECT_TRUE(outcomes[2].detail.isEmpty());
}

TEST_F(TransferPipelineTest, UploadFailure)
{
    const auto pipeline = createPipeline();

    m_destinationFailure = [](const network::ApiRequest & request) {
        if (request.endpoint.endsWith(QStringLiteral("/master"))) {
            throw TransportFailure{ErrorString{"Timed out"}, true};
        }
    };

    const auto outcomes = pipeline->run(sourceEntries(2), gAlbumId, gCatalogId);

    ASSERT_EQ(outcomes.size(), 2);
    for (const auto & outcome: outcomes) {
        EXPECT_EQ(outcome.status, TransferStatus::UploadFailed);
        EXPECT_FALSE(outcome.item.generatedAssetId.isEmpty());
    }

    // create + upload per item, no association
    EXPECT_EQ(m_destinationRequests.size(), 4);
}

TEST_F(TransferPipelineTest, AssociationFailureDegradesItem)
{
    const auto pipeline = createPipeline();

    m_destinationFailure = [](const network::ApiRequest & request) {
        if (request.endpoint.endsWith(QStringLiteral("/albums/album1/assets"))) {
            throw providerError(500);
        }
    };

    const auto outcomes = pipeline->run(sourceEntries(2), gAlbumId, gCatalogId);

    ASSERT_EQ(outcomes.size(), 2);
    for (const auto & outcome: outcomes) {
        EXPECT_EQ(outcome.status, TransferStatus::Succeeded);
        EXPECT_TRUE(outcome.detail.startsWith(
            QStringLiteral("Asset was uploaded but not added to the album")));
    }

    const auto summary = summarize(outcomes);
    EXPECT_EQ(summary.succeeded, 2);
    EXPECT_EQ(summary.degraded, 2);
    EXPECT_EQ(summary.failed(), 0);
}

TEST_F(TransferPipelineTest, StrictAssociation)
{
    const auto pipeline = createPipeline(true);

    m_destinationFailure = [](const network::ApiRequest & request) {
        if (request.endpoint.endsWith(QStringLiteral("/albums/album1/assets"))) {
            throw providerError(500);
        }
    };

    const auto outcomes = pipeline->run(sourceEntries(1), gAlbumId, gCatalogId);

    ASSERT_EQ(outcomes.size(), 1);
    EXPECT_EQ(outcomes[0].status, TransferStatus::AssociateFailed);
    EXPECT_EQ(summarize(outcomes).associateFailed, 1);
}

TEST_F(TransferPipelineTest, RejectedCredentialsFailOnlyTheItem)
{
    const auto pipeline = createPipeline();

    m_destinationFailure = [](const network::ApiRequest & request) {
        if (request.endpoint == QStringLiteral("/v2/catalogs/cat1/assets/asset1"))
        {
            throw providerError(403);
        }
    };

    const auto outcomes = pipeline->run(sourceEntries(2), gAlbumId, gCatalogId);

    ASSERT_EQ(outcomes.size(), 2);
    EXPECT_EQ(outcomes[0].status, TransferStatus::CreateFailed);
    EXPECT_EQ(outcomes[1].status, TransferStatus::Succeeded);
}

TEST_F(TransferPipelineTest, AuthenticationFailureAbortsRun)
{
    const auto pipeline = createPipeline();

    m_destinationFailure = [](const network::ApiRequest &) {
        throw AuthenticationFailure{ErrorString{"No session"}};
    };

    EXPECT_THROW(
        (void)pipeline->run(sourceEntries(3), gAlbumId, gCatalogId),
        AuthenticationFailure);

    EXPECT_EQ(m_destinationRequests.size(), 1);
}

TEST_F(TransferPipelineTest, Cancel)
{
    const auto pipeline = createPipeline();
    const auto canceler =
        std::make_shared<utility::cancelers::ManualCanceler>();

    const auto mockObserver =
        std::make_shared<NiceMock<mocks::MockITransferObserver>>();

    int finishedItems = 0;
    ON_CALL(*mockObserver, onItemFinished)
        .WillByDefault(Invoke([&](const TransferOutcome &) {
            if (++finishedItems == 7) {
                canceler->cancel();
            }
        }));

    EXPECT_CALL(*mockObserver, onRunFinished).Times(0);

    EXPECT_THROW(
        (void)pipeline->run(
            sourceEntries(12), gAlbumId, gCatalogId, canceler, mockObserver),
        OperationCanceled);

    EXPECT_EQ(finishedItems, 7);
    EXPECT_EQ(m_sourceRequests.size(), 7);
}

TEST_F(TransferPipelineTest, ExpiredObserverIsIgnored)
{
    const auto pipeline = createPipeline();

    ITransferObserverWeakPtr observer;
    {
        const auto mockObserver =
            std::make_shared<StrictMock<mocks::MockITransferObserver>>();
        observer = mockObserver;
    }

    const auto outcomes = pipeline->run(
        sourceEntries(2), gAlbumId, gCatalogId, nullptr, observer);
    EXPECT_EQ(outcomes.size(), 2);
}

TEST(TransferTypesTest, AssetSubtypeForContentType)
{
    EXPECT_EQ(
        assetSubtypeForContentType(QStringLiteral("video/quicktime")),
        QStringLiteral("video"));
    EXPECT_EQ(
        assetSubtypeForContentType(QStringLiteral("VIDEO/MP4")),
        QStringLiteral("video"));
    EXPECT_EQ(
        assetSubtypeForContentType(QStringLiteral("image/png")),
        QStringLiteral("image"));
    EXPECT_EQ(
        assetSubtypeForContentType(QStringLiteral("application/pdf")),
        QStringLiteral("image"));
    EXPECT_EQ(assetSubtypeForContentType(QString{}), QStringLiteral("image"));
}

TEST(TransferTypesTest, GenerateAssetId)
{
    const QRegularExpression re{QStringLiteral("^[0-9a-f]{32}$")};

    const QString first = generateAssetId();
    const QString second = generateAssetId();

    EXPECT_TRUE(re.match(first).hasMatch()) << first.toStdString();
    EXPECT_TRUE(re.match(second).hasMatch()) << second.toStdString();
    EXPECT_NE(first, second);
}

TEST(TransferTypesTest, Summarize)
{
    QList<TransferOutcome> outcomes;

    const auto add = [&](const TransferStatus status, QString detail = {}) {
        TransferOutcome outcome;
        outcome.status = status;
        outcome.detail = std::move(detail);
        outcomes << outcome;
    };

    add(TransferStatus::Succeeded);
    add(TransferStatus::Succeeded, QStringLiteral("not added to album"));
    add(TransferStatus::DownloadFailed, QStringLiteral("x"));
    add(TransferStatus::CreateFailed, QStringLiteral("x"));
    add(TransferStatus::UploadFailed, QStringLiteral("x"));
    add(TransferStatus::AssociateFailed, QStringLiteral("x"));

    const auto summary = summarize(outcomes);
    EXPECT_EQ(summary.succeeded, 2);
    EXPECT_EQ(summary.degraded, 1);
    EXPECT_EQ(summary.downloadFailed, 1);
    EXPECT_EQ(summary.createFailed, 1);
    EXPECT_EQ(summary.uploadFailed, 1);
    EXPECT_EQ(summary.associateFailed, 1);
    EXPECT_EQ(summary.total(), 6);
    EXPECT_EQ(summary.failed(), 4);
}

} // namespace assetbridge::transfer::tests
