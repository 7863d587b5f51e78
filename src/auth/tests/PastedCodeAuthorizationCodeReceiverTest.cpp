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

#include <auth/PastedCodeAuthorizationCodeReceiver.h>

#include <assetbridge/exception/AuthenticationFailure.h>
#include <assetbridge/exception/InvalidArgument.h>

#include <gtest/gtest.h>

namespace assetbridge::auth::tests {

namespace {

const QUrl gRedirectUri{QStringLiteral("http://localhost:8080/callback")};
const QUrl gAuthorizationUrl{
    QStringLiteral("https://auth.example.com/authorize?state=abc")};

[[nodiscard]] UrlOpener urlOpener(QList<QUrl> & openedUrls)
{
    return [&openedUrls](const QUrl & url) {
        openedUrls << url;
        return true;
    };
}

[[nodiscard]] LineReader lineReader(std::optional<QString> line)
{
    return [line = std::move(line)] { return line; };
}

} // namespace

TEST(PastedCodeAuthorizationCodeReceiverTest, Ctor)
{
    QList<QUrl> openedUrls;
    EXPECT_NO_THROW(PastedCodeAuthorizationCodeReceiver(
        gRedirectUri, urlOpener(openedUrls), lineReader(QString{})));
}

TEST(PastedCodeAuthorizationCodeReceiverTest, CtorNullUrlOpener)
{
    EXPECT_THROW(
        PastedCodeAuthorizationCodeReceiver(
            gRedirectUri, UrlOpener{}, lineReader(QString{})),
        InvalidArgument);
}

TEST(PastedCodeAuthorizationCodeReceiverTest, CtorNullLineReader)
{
    QList<QUrl> openedUrls;
    EXPECT_THROW(
        PastedCodeAuthorizationCodeReceiver(
            gRedirectUri, urlOpener(openedUrls), LineReader{}),
        InvalidArgument);
}

TEST(PastedCodeAuthorizationCodeReceiverTest, RedirectUriIsConfiguredOne)
{
    QList<QUrl> openedUrls;
    PastedCodeAuthorizationCodeReceiver receiver{
        gRedirectUri, urlOpener(openedUrls), lineReader(QString{})};

    EXPECT_EQ(receiver.redirectUri(), gRedirectUri);
}

TEST(PastedCodeAuthorizationCodeReceiverTest, ExtractCode)
{
    using Receiver = PastedCodeAuthorizationCodeReceiver;

    EXPECT_EQ(
        Receiver::extractCode(QStringLiteral("  eyJhbGciOiJSUzI1NiJ9  ")),
        QStringLiteral("eyJhbGciOiJSUzI1NiJ9"));

    EXPECT_EQ(
        Receiver::extractCode(
            QStringLiteral("eyJhbGciOiJSUzI1NiJ9&state=abc")),
        QStringLiteral("eyJhbGciOiJSUzI1NiJ9"));

    EXPECT_EQ(
        Receiver::extractCode(QStringLiteral(
            "http://localhost:8080/callback?code=eyJhbGciOiJSUzI1NiJ9"
            "&state=abc")),
        QStringLiteral("eyJhbGciOiJSUzI1NiJ9"));

    EXPECT_EQ(
        Receiver::extractCode(QStringLiteral(
            "https://localhost/callback?state=abc&code=a%2Bb%2Bc0123456789")),
        QStringLiteral("a+b+c0123456789"));
}

TEST(PastedCodeAuthorizationCodeReceiverTest, ExtractState)
{
    using Receiver = PastedCodeAuthorizationCodeReceiver;

    EXPECT_FALSE(Receiver::extractState(QStringLiteral("eyJhbGciOiJSUzI1NiJ9")));

    EXPECT_FALSE(Receiver::extractState(QStringLiteral(
        "http://localhost:8080/callback?code=eyJhbGciOiJSUzI1NiJ9")));

    EXPECT_EQ(
        Receiver::extractState(
            QStringLiteral("eyJhbGciOiJSUzI1NiJ9&state=abc")),
        QStringLiteral("abc"));

    EXPECT_EQ(
        Receiver::extractState(QStringLiteral(
            "https://localhost/callback?state=a%20b&code=0123456789")),
        QStringLiteral("a b"));
}

TEST(PastedCodeAuthorizationCodeReceiverTest, ReceiveCode)
{
    QList<QUrl> openedUrls;
    PastedCodeAuthorizationCodeReceiver receiver{
        gRedirectUri, urlOpener(openedUrls),
        lineReader(QStringLiteral("0123456789abcdef&state=abc\n"))};

    EXPECT_EQ(
        receiver.receiveAuthorizationCode(
            gAuthorizationUrl, QStringLiteral("abc")),
        QStringLiteral("0123456789abcdef"));

    ASSERT_EQ(openedUrls.size(), 1);
    EXPECT_EQ(openedUrls.first(), gAuthorizationUrl);
}

TEST(PastedCodeAuthorizationCodeReceiverTest, ReceiveCodeWhenUrlCannotBeOpened)
{
    PastedCodeAuthorizationCodeReceiver receiver{
        gRedirectUri, [](const QUrl &) { return false; },
        lineReader(QStringLiteral("0123456789abcdef"))};

    EXPECT_EQ(
        receiver.receiveAuthorizationCode(
            gAuthorizationUrl, QStringLiteral("abc")),
        QStringLiteral("0123456789abcdef"));
}

TEST(PastedCodeAuthorizationCodeReceiverTest, ReceiveCodeFromRedirectUrl)
{
    QList<QUrl> openedUrls;
    PastedCodeAuthorizationCodeReceiver receiver{
        gRedirectUri, urlOpener(openedUrls),
        lineReader(QStringLiteral(
            "http://localhost:8080/callback?code=0123456789abcdef&state=abc"))};

    EXPECT_EQ(
        receiver.receiveAuthorizationCode(
            gAuthorizationUrl, QStringLiteral("abc")),
        QStringLiteral("0123456789abcdef"));
}

TEST(PastedCodeAuthorizationCodeReceiverTest, RejectStateMismatch)
{
    QList<QUrl> openedUrls;
    PastedCodeAuthorizationCodeReceiver receiver{
        gRedirectUri, urlOpener(openedUrls),
        lineReader(QStringLiteral(
            "http://localhost:8080/callback?code=0123456789abcdef"
            "&state=other"))};

    EXPECT_THROW(
        (void)receiver.receiveAuthorizationCode(
            gAuthorizationUrl, QStringLiteral("abc")),
        AuthenticationFailure);
}

TEST(PastedCodeAuthorizationCodeReceiverTest, RejectStateMismatchAfterBareCode)
{
    QList<QUrl> openedUrls;
    PastedCodeAuthorizationCodeReceiver receiver{
        gRedirectUri, urlOpener(openedUrls),
        lineReader(QStringLiteral("0123456789abcdef&state=other"))};

    EXPECT_THROW(
        (void)receiver.receiveAuthorizationCode(
            gAuthorizationUrl, QStringLiteral("abc")),
        AuthenticationFailure);
}

TEST(PastedCodeAuthorizationCodeReceiverTest, RejectShortCode)
{
    QList<QUrl> openedUrls;
    PastedCodeAuthorizationCodeReceiver receiver{
        gRedirectUri, urlOpener(openedUrls),
        lineReader(QStringLiteral("short&state=abc"))};

    EXPECT_THROW(
        (void)receiver.receiveAuthorizationCode(
            gAuthorizationUrl, QStringLiteral("abc")),
        AuthenticationFailure);
}

TEST(PastedCodeAuthorizationCodeReceiverTest, ClosedInput)
{
    QList<QUrl> openedUrls;
    PastedCodeAuthorizationCodeReceiver receiver{
        gRedirectUri, urlOpener(openedUrls), lineReader(std::nullopt)};

    EXPECT_THROW(
        (void)receiver.receiveAuthorizationCode(
            gAuthorizationUrl, QStringLiteral("abc")),
        AuthenticationFailure);
}

} // namespace assetbridge::auth::tests
