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

#include <browsing/DriveSourceBrowser.h>

#include <network/tests/mocks/MockIRequestClient.h>

#include <assetbridge/exception/AuthenticationFailure.h>
#include <assetbridge/exception/InvalidArgument.h>
#include <assetbridge/exception/ProviderError.h>
#include <assetbridge/exception/TransportFailure.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>

namespace assetbridge::browsing::tests {

using testing::_;
using testing::Invoke;
using testing::Return;
using testing::StrictMock;
using testing::Throw;

namespace {

[[nodiscard]] network::HttpResponse jsonResponse(const QByteArray & body)
{
    network::HttpResponse response;
    response.statusCode = 200;
    response.headers << network::HttpHeader{
        QByteArrayLiteral("Content-Type"),
        QByteArrayLiteral("application/json")};
    response.body = body;
    return response;
}

[[nodiscard]] QByteArray folderJson(
    const QString & id, const QString & name, const QString & parentId)
{
    QString json = QStringLiteral(
                       "{\"id\":\"%1\",\"name\":\"%2\",\"mimeType\":"
                       "\"application/vnd.google-apps.folder\"")
                       .arg(id, name);
    if (!parentId.isEmpty()) {
        json += QStringLiteral(",\"parents\":[\"%1\"]").arg(parentId);
    }
    json += QStringLiteral("}");
    return json.toUtf8();
}

[[nodiscard]] ProviderError providerError(const int statusCode)
{
    return ProviderError{
        statusCode, QByteArrayLiteral("{}"), ErrorString{"Request failed"}};
}

} // namespace

class DriveSourceBrowserTest : public testing::Test
{
protected:
    [[nodiscard]] ISourceBrowserPtr createBrowser(const int maxPathDepth = 20)
    {
        return std::make_shared<DriveSourceBrowser>(
            m_mockRequestClient, 100, maxPathDepth);
    }

    void expectDescribe(const QString & id, const QByteArray & json)
    {
        EXPECT_CALL(
            *m_mockRequestClient,
            execute(testing::Field(
                &network::ApiRequest::endpoint,
                QStringLiteral("/drive/v3/files/") + id)))
            .WillOnce(Return(jsonResponse(json)));
    }

protected:
    const std::shared_ptr<network::tests::mocks::MockIRequestClient>
        m_mockRequestClient = std::make_shared<
            StrictMock<network::tests::mocks::MockIRequestClient>>();
};

TEST_F(DriveSourceBrowserTest, CtorNullRequestClient)
{
    EXPECT_THROW(DriveSourceBrowser(nullptr, 100, 20), InvalidArgument);
}

TEST_F(DriveSourceBrowserTest, CtorNonPositivePageSize)
{
    EXPECT_THROW(
        DriveSourceBrowser(m_mockRequestClient, 0, 20), InvalidArgument);
}

TEST_F(DriveSourceBrowserTest, CtorNonPositiveMaxPathDepth)
{
    EXPECT_THROW(
        DriveSourceBrowser(m_mockRequestClient, 100, 0), InvalidArgument);
}

TEST_F(DriveSourceBrowserTest, ListPageOfChildContainers)
{
    const auto browser = createBrowser();

    network::ApiRequest sentRequest;
    EXPECT_CALL(*m_mockRequestClient, execute)
        .WillOnce(Invoke([&](const network::ApiRequest & request) {
            sentRequest = request;
            return jsonResponse(QByteArrayLiteral(
                "{\"files\":["
                "{\"id\":\"f1\",\"name\":\"Photos\",\"mimeType\":"
                "\"application/vnd.google-apps.folder\"},"
                "{\"id\":\"f2\",\"name\":\"Trips\",\"mimeType\":"
                "\"application/vnd.google-apps.folder\"}]}"));
        }));

    const auto page = browser->listPage(QStringLiteral("root"));

    EXPECT_EQ(sentRequest.method, network::HttpMethod::Get);
    EXPECT_EQ(sentRequest.endpoint, QStringLiteral("/drive/v3/files"));
    EXPECT_EQ(
        sentRequest.query.queryItemValue(
            QStringLiteral("q"), QUrl::FullyDecoded),
        QStringLiteral(
            "'root' in parents and trashed=false and "
            "mimeType='application/vnd.google-apps.folder'"));
    EXPECT_EQ(
        sentRequest.query.queryItemValue(QStringLiteral("pageSize")),
        QStringLiteral("100"));
    EXPECT_EQ(
        sentRequest.query.queryItemValue(QStringLiteral("orderBy")),
        QStringLiteral("folder,name"));

    ASSERT_EQ(page.items.size(), 2);
    EXPECT_EQ(page.items[0].id, QStringLiteral("f1"));
    EXPECT_EQ(page.items[0].displayName, QStringLiteral("Photos"));
    EXPECT_TRUE(page.items[0].isContainer());
    EXPECT_EQ(page.items[0].parentId, QStringLiteral("root"));
    EXPECT_EQ(page.items[1].id, QStringLiteral("f2"));
    EXPECT_FALSE(page.nextCursor);
}

TEST_F(DriveSourceBrowserTest, ListPageOfEmptyRefMeansRoot)
{
    const auto browser = createBrowser();

    network::ApiRequest sentRequest;
    EXPECT_CALL(*m_mockRequestClient, execute)
        .WillOnce(Invoke([&](const network::ApiRequest & request) {
            sentRequest = request;
            return jsonResponse(QByteArrayLiteral("{\"files\":[]}"));
        }));

    const auto page = browser->listPage(QString{});
    EXPECT_TRUE(page.items.isEmpty());
    EXPECT_TRUE(sentRequest.query
                    .queryItemValue(QStringLiteral("q"), QUrl::FullyDecoded)
                    .startsWith(QStringLiteral("'root' in parents")));
}

TEST_F(DriveSourceBrowserTest, ListPageEscapesContainerRef)
{
    const auto browser = createBrowser();

    network::ApiRequest sentRequest;
    EXPECT_CALL(*m_mockRequestClient, execute)
        .WillOnce(Invoke([&](const network::ApiRequest & request) {
            sentRequest = request;
            return jsonResponse(QByteArrayLiteral("{\"files\":[]}"));
        }));

    (void)browser->listPage(QStringLiteral("it's"));
    EXPECT_TRUE(sentRequest.query
                    .queryItemValue(QStringLiteral("q"), QUrl::FullyDecoded)
                    .startsWith(QStringLiteral("'it\\'s' in parents")));
}

TEST_F(DriveSourceBrowserTest, ListEntriesFollowsPageTokens)
{
    const auto browser = createBrowser();

    QList<network::ApiRequest> sentRequests;
    EXPECT_CALL(*m_mockRequestClient, execute)
        .WillOnce(Invoke([&](const network::ApiRequest & request) {
            sentRequests << request;
            return jsonResponse(QByteArrayLiteral(
                "{\"nextPageToken\":\"token2\",\"files\":["
                "{\"id\":\"p1\",\"name\":\"a.jpg\",\"mimeType\":\"image/jpeg\","
                "\"size\":\"2048\",\"parents\":[\"f1\"]}]}"));
        }))
        .WillOnce(Invoke([&](const network::ApiRequest & request) {
            sentRequests << request;
            return jsonResponse(QByteArrayLiteral(
                "{\"files\":["
                "{\"id\":\"v1\",\"name\":\"b.mp4\",\"mimeType\":\"video/mp4\","
                "\"size\":1024}]}"));
        }));

    const auto entries = browser->listEntries(QStringLiteral("f1"));

    ASSERT_EQ(sentRequests.size(), 2);
    EXPECT_EQ(
        sentRequests[0].query.queryItemValue(
            QStringLiteral("q"), QUrl::FullyDecoded),
        QStringLiteral("'f1' in parents and trashed=false"));
    EXPECT_FALSE(sentRequests[0].query.hasQueryItem(QStringLiteral("pageToken")));
    EXPECT_EQ(
        sentRequests[1].query.queryItemValue(QStringLiteral("pageToken")),
        QStringLiteral("token2"));

    ASSERT_EQ(entries.size(), 2);
    EXPECT_EQ(entries[0].id, QStringLiteral("p1"));
    EXPECT_EQ(entries[0].contentType, QStringLiteral("image/jpeg"));
    EXPECT_EQ(entries[0].sizeBytes, 2048);
    EXPECT_EQ(entries[0].parentId, QStringLiteral("f1"));
    EXPECT_FALSE(entries[0].isContainer());

    EXPECT_EQ(entries[1].id, QStringLiteral("v1"));
    EXPECT_EQ(entries[1].sizeBytes, 1024);
    EXPECT_EQ(entries[1].parentId, QStringLiteral("f1"));
}

TEST_F(DriveSourceBrowserTest, ListingRejectedCredentials)
{
    const auto browser = createBrowser();

    EXPECT_CALL(*m_mockRequestClient, execute)
        .WillOnce(Throw(providerError(401)))
        .WillOnce(Throw(providerError(403)));

    EXPECT_THROW(
        (void)browser->listPage(QStringLiteral("root")),
        AuthenticationFailure);

    EXPECT_THROW(
        (void)browser->listEntries(QStringLiteral("f1")),
        AuthenticationFailure);
}

TEST_F(DriveSourceBrowserTest, ListingOtherFailure)
{
    const auto browser = createBrowser();

    EXPECT_CALL(*m_mockRequestClient, execute)
        .WillOnce(Throw(providerError(500)));

    EXPECT_THROW(
        (void)browser->listPage(QStringLiteral("root")), ProviderError);
}

TEST_F(DriveSourceBrowserTest, Describe)
{
    const auto browser = createBrowser();

    network::ApiRequest sentRequest;
    EXPECT_CALL(*m_mockRequestClient, execute)
        .WillOnce(Invoke([&](const network::ApiRequest & request) {
            sentRequest = request;
            return jsonResponse(QByteArrayLiteral(
                "{\"id\":\"p/1\",\"name\":\"a.png\",\"mimeType\":\"image/png\","
                "\"size\":\"10\",\"parents\":[\"f1\"]}"));
        }));

    const auto entry = browser->describe(QStringLiteral("p/1"));

    EXPECT_EQ(sentRequest.endpoint, QStringLiteral("/drive/v3/files/p%2F1"));
    EXPECT_EQ(
        sentRequest.query.queryItemValue(QStringLiteral("fields")),
        QStringLiteral("id,name,mimeType,size,parents"));

    EXPECT_EQ(entry.id, QStringLiteral("p/1"));
    EXPECT_EQ(entry.displayName, QStringLiteral("a.png"));
    EXPECT_EQ(entry.sizeBytes, 10);
    EXPECT_EQ(entry.parentId, QStringLiteral("f1"));
}

TEST_F(DriveSourceBrowserTest, ParentOf)
{
    const auto browser = createBrowser();

    EXPECT_FALSE(browser->parentOf(QStringLiteral("root")));

    expectDescribe(
        QStringLiteral("f2"),
        folderJson(
            QStringLiteral("f2"), QStringLiteral("Trips"), QStringLiteral("f1")));
    EXPECT_EQ(browser->parentOf(QStringLiteral("f2")), QStringLiteral("f1"));

    expectDescribe(
        QStringLiteral("shared"),
        folderJson(QStringLiteral("shared"), QStringLiteral("Shared"), {}));
    EXPECT_FALSE(browser->parentOf(QStringLiteral("shared")));
}

TEST_F(DriveSourceBrowserTest, ResolveRootPath)
{
    const auto browser = createBrowser();

    EXPECT_EQ(browser->resolvePath(QStringLiteral("root")), QStringLiteral("My Drive"));
    EXPECT_EQ(browser->resolvePath(QString{}), QStringLiteral("My Drive"));
}

TEST_F(DriveSourceBrowserTest, ResolvePath)
{
    const auto browser = createBrowser();

    expectDescribe(
        QStringLiteral("f3"),
        folderJson(
            QStringLiteral("f3"), QStringLiteral("Summer"),
            QStringLiteral("f2")));
    expectDescribe(
        QStringLiteral("f2"),
        folderJson(
            QStringLiteral("f2"), QStringLiteral("Trips"),
            QStringLiteral("root")));

    EXPECT_EQ(
        browser->resolvePath(QStringLiteral("f3")),
        QStringLiteral("My Drive / Trips / Summer"));
}

TEST_F(DriveSourceBrowserTest, ResolvePathOfContainerOutsideOfRoot)
{
    const auto browser = createBrowser();

    expectDescribe(
        QStringLiteral("f2"),
        folderJson(
            QStringLiteral("f2"), QStringLiteral("Album"),
            QStringLiteral("shared")));
    expectDescribe(
        QStringLiteral("shared"),
        folderJson(QStringLiteral("shared"), QStringLiteral("Shared"), {}));

    EXPECT_EQ(
        browser->resolvePath(QStringLiteral("f2")),
        QStringLiteral("Shared / Album"));
}

TEST_F(DriveSourceBrowserTest, ResolvePathWithCycle)
{
    const auto browser = createBrowser();

    expectDescribe(
        QStringLiteral("a"),
        folderJson(QStringLiteral("a"), QStringLiteral("A"), QStringLiteral("b")));
    expectDescribe(
        QStringLiteral("b"),
        folderJson(QStringLiteral("b"), QStringLiteral("B"), QStringLiteral("a")));

    EXPECT_EQ(
        browser->resolvePath(QStringLiteral("a")),
        QStringLiteral("Unknown Path (a)"));
}

TEST_F(DriveSourceBrowserTest, ResolvePathDeeperThanLimit)
{
    const auto browser = createBrowser(2);

    expectDescribe(
        QStringLiteral("f3"),
        folderJson(QStringLiteral("f3"), QStringLiteral("C"), QStringLiteral("f2")));
    expectDescribe(
        QStringLiteral("f2"),
        folderJson(QStringLiteral("f2"), QStringLiteral("B"), QStringLiteral("f1")));

    EXPECT_EQ(
        browser->resolvePath(QStringLiteral("f3")),
        QStringLiteral("Unknown Path (f3)"));
}

TEST_F(DriveSourceBrowserTest, ResolvePathWithFailedLookup)
{
    const auto browser = createBrowser();

    expectDescribe(
        QStringLiteral("f2"),
        folderJson(QStringLiteral("f2"), QStringLiteral("B"), QStringLiteral("f1")));

    EXPECT_CALL(
        *m_mockRequestClient,
        execute(testing::Field(
            &network::ApiRequest::endpoint,
            QStringLiteral("/drive/v3/files/f1"))))
        .WillOnce(Throw(TransportFailure{ErrorString{"Timed out"}, true}));

    EXPECT_EQ(
        browser->resolvePath(QStringLiteral("f2")),
        QStringLiteral("Unknown Path (f2)"));
}

TEST_F(DriveSourceBrowserTest, ResolvePathWithRejectedCredentials)
{
    const auto browser = createBrowser();

    EXPECT_CALL(*m_mockRequestClient, execute(_))
        .WillOnce(Throw(providerError(401)));

    EXPECT_THROW(
        (void)browser->resolvePath(QStringLiteral("f2")),
        AuthenticationFailure);
}

TEST_F(DriveSourceBrowserTest, AccountInfo)
{
    const auto browser = createBrowser();

    network::ApiRequest sentRequest;
    EXPECT_CALL(*m_mockRequestClient, execute)
        .WillOnce(Invoke([&](const network::ApiRequest & request) {
            sentRequest = request;
            return jsonResponse(QByteArrayLiteral(
                "{\"user\":{\"permissionId\":\"123\",\"displayName\":"
                "\"Jane Doe\",\"emailAddress\":\"jane@example.com\"}}"));
        }));

    const auto info = browser->accountInfo();

    EXPECT_EQ(sentRequest.endpoint, QStringLiteral("/drive/v3/about"));
    EXPECT_EQ(
        sentRequest.query.queryItemValue(QStringLiteral("fields")),
        QStringLiteral("user"));
    EXPECT_EQ(info.id, QStringLiteral("123"));
    EXPECT_EQ(info.displayName, QStringLiteral("Jane Doe"));
    EXPECT_EQ(info.email, QStringLiteral("jane@example.com"));
}

} // namespace assetbridge::browsing::tests
