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

#include <auth/LoopbackAuthorizationCodeReceiver.h>

#include <assetbridge/exception/AuthenticationFailure.h>
#include <assetbridge/exception/InvalidArgument.h>

#include <QHostAddress>
#include <QTcpSocket>
#include <QTimer>

#include <gtest/gtest.h>

#include <memory>

namespace assetbridge::auth::tests {

using namespace std::chrono_literals;

namespace {

const QUrl gAuthorizationUrl{
    QStringLiteral("https://auth.example.com/authorize")};

/**
 * Emulates the browser following the redirect: once the event loop runs
 * sends GET request for the given path and query to the receiver's port
 */
class FakeBrowser
{
public:
    explicit FakeBrowser(QByteArray pathAndQuery = {}) :
        m_pathAndQuery{std::move(pathAndQuery)}
    {}

    void setPort(const quint16 port) noexcept
    {
        m_port = port;
    }

    void setPathAndQuery(QByteArray pathAndQuery)
    {
        m_pathAndQuery = std::move(pathAndQuery);
    }

    [[nodiscard]] UrlOpener urlOpener()
    {
        return [this](const QUrl & url) {
            m_openedUrl = url;
            QTimer::singleShot(0, [this] { sendRequest(); });
            return true;
        };
    }

    [[nodiscard]] const QUrl & openedUrl() const noexcept
    {
        return m_openedUrl;
    }

    [[nodiscard]] const QByteArray & response() const noexcept
    {
        return m_response;
    }

private:
    void sendRequest()
    {
        m_socket = std::make_unique<QTcpSocket>();
        QObject::connect(
            m_socket.get(), &QTcpSocket::connected, m_socket.get(), [this] {
                m_socket->write(
                    QByteArrayLiteral("GET ") + m_pathAndQuery +
                    QByteArrayLiteral(" HTTP/1.1\r\nHost: 127.0.0.1\r\n\r\n"));
            });
        QObject::connect(
            m_socket.get(), &QTcpSocket::readyRead, m_socket.get(),
            [this] { m_response.append(m_socket->readAll()); });
        m_socket->connectToHost(QHostAddress::LocalHost, m_port);
    }

private:
    QByteArray m_pathAndQuery;
    quint16 m_port = 0;
    std::unique_ptr<QTcpSocket> m_socket;
    QByteArray m_response;
    QUrl m_openedUrl;
};

const QUrl gRedirectUri{QStringLiteral("http://127.0.0.1:0/")};

} // namespace

TEST(LoopbackAuthorizationCodeReceiverTest, CtorNullUrlOpener)
{
    EXPECT_THROW(
        LoopbackAuthorizationCodeReceiver(
            gRedirectUri, 1000ms, UrlOpener{}),
        InvalidArgument);
}

TEST(LoopbackAuthorizationCodeReceiverTest, CtorNonPositiveTimeout)
{
    EXPECT_THROW(
        LoopbackAuthorizationCodeReceiver(
            gRedirectUri, 0ms,
            [](const QUrl &) { return true; }),
        InvalidArgument);
}

TEST(LoopbackAuthorizationCodeReceiverTest, RedirectUriHasActualPort)
{
    LoopbackAuthorizationCodeReceiver receiver{
        gRedirectUri, 1000ms,
        [](const QUrl &) { return true; }};

    const auto redirectUri = receiver.redirectUri();
    EXPECT_EQ(redirectUri.host(), QStringLiteral("127.0.0.1"));
    EXPECT_GT(redirectUri.port(), 0);
    EXPECT_EQ(redirectUri.path(), QStringLiteral("/"));

    // Listening continues until the code is received
    EXPECT_EQ(receiver.redirectUri(), redirectUri);
}

TEST(LoopbackAuthorizationCodeReceiverTest, ReceiveCode)
{
    FakeBrowser browser{
        QByteArrayLiteral("/?code=4%2F0Adeu5BW&state=expected_state")};

    LoopbackAuthorizationCodeReceiver receiver{
        gRedirectUri, 10000ms, browser.urlOpener()};

    browser.setPort(static_cast<quint16>(receiver.redirectUri().port()));

    const QString code = receiver.receiveAuthorizationCode(
        gAuthorizationUrl, QStringLiteral("expected_state"));

    EXPECT_EQ(code, QStringLiteral("4/0Adeu5BW"));
    EXPECT_EQ(browser.openedUrl(), gAuthorizationUrl);
}

TEST(LoopbackAuthorizationCodeReceiverTest, DeniedAuthorization)
{
    FakeBrowser browser{
        QByteArrayLiteral("/?error=access_denied&state=expected_state")};

    LoopbackAuthorizationCodeReceiver receiver{
        gRedirectUri, 10000ms, browser.urlOpener()};

    browser.setPort(static_cast<quint16>(receiver.redirectUri().port()));

    EXPECT_THROW(
        (void)receiver.receiveAuthorizationCode(
            gAuthorizationUrl, QStringLiteral("expected_state")),
        AuthenticationFailure);
}

TEST(LoopbackAuthorizationCodeReceiverTest, StateMismatch)
{
    FakeBrowser browser{QByteArrayLiteral("/?code=abc&state=forged_state")};

    LoopbackAuthorizationCodeReceiver receiver{
        gRedirectUri, 10000ms, browser.urlOpener()};

    browser.setPort(static_cast<quint16>(receiver.redirectUri().port()));

    EXPECT_THROW(
        (void)receiver.receiveAuthorizationCode(
            gAuthorizationUrl, QStringLiteral("expected_state")),
        AuthenticationFailure);
}

TEST(LoopbackAuthorizationCodeReceiverTest, MissingCode)
{
    FakeBrowser browser{QByteArrayLiteral("/?state=expected_state")};

    LoopbackAuthorizationCodeReceiver receiver{
        gRedirectUri, 10000ms, browser.urlOpener()};

    browser.setPort(static_cast<quint16>(receiver.redirectUri().port()));

    EXPECT_THROW(
        (void)receiver.receiveAuthorizationCode(
            gAuthorizationUrl, QStringLiteral("expected_state")),
        AuthenticationFailure);
}

TEST(LoopbackAuthorizationCodeReceiverTest, RequestToOtherPathIsIgnored)
{
    FakeBrowser browser{QByteArrayLiteral("/favicon.ico")};

    LoopbackAuthorizationCodeReceiver receiver{
        gRedirectUri, 500ms, browser.urlOpener()};

    browser.setPort(static_cast<quint16>(receiver.redirectUri().port()));

    EXPECT_THROW(
        (void)receiver.receiveAuthorizationCode(
            gAuthorizationUrl, QStringLiteral("expected_state")),
        AuthenticationFailure);

    EXPECT_TRUE(browser.response().startsWith("HTTP/1.1 404"));
}

TEST(LoopbackAuthorizationCodeReceiverTest, Timeout)
{
    LoopbackAuthorizationCodeReceiver receiver{
        gRedirectUri, 100ms, [](const QUrl &) { return false; }};

    EXPECT_THROW(
        (void)receiver.receiveAuthorizationCode(
            gAuthorizationUrl, QStringLiteral("expected_state")),
        AuthenticationFailure);
}

} // namespace assetbridge::auth::tests
