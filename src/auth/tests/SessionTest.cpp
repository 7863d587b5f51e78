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

#include <assetbridge/auth/Session.h>

#include <gtest/gtest.h>

namespace assetbridge::auth::tests {

namespace {

[[nodiscard]] Session createSession(const QDateTime & expiresAt)
{
    Session session;
    session.serviceId = ServiceId::Google;
    session.accessToken = QStringLiteral("access");
    session.refreshToken = QStringLiteral("refresh");
    session.expiresAt = expiresAt;
    return session;
}

} // namespace

TEST(SessionTest, ValidWellBeforeExpiration)
{
    const auto now = QDateTime::currentDateTimeUtc();
    EXPECT_TRUE(isSessionValid(createSession(now.addSecs(3600)), now));
}

TEST(SessionTest, InvalidWithinSkewBeforeExpiration)
{
    const auto now = QDateTime::currentDateTimeUtc();
    EXPECT_FALSE(isSessionValid(createSession(now.addSecs(299)), now));
    EXPECT_FALSE(isSessionValid(
        createSession(now.addSecs(gSessionExpirationSkewSeconds)), now));
    EXPECT_TRUE(isSessionValid(
        createSession(now.addSecs(gSessionExpirationSkewSeconds + 1)), now));
}

TEST(SessionTest, InvalidAfterExpiration)
{
    const auto now = QDateTime::currentDateTimeUtc();
    EXPECT_FALSE(isSessionValid(createSession(now.addSecs(-10)), now));
}

TEST(SessionTest, InvalidWithoutAccessToken)
{
    const auto now = QDateTime::currentDateTimeUtc();
    auto session = createSession(now.addSecs(3600));
    session.accessToken.clear();
    EXPECT_FALSE(isSessionValid(session, now));
}

TEST(SessionTest, InvalidWithoutExpiration)
{
    const auto now = QDateTime::currentDateTimeUtc();
    EXPECT_FALSE(isSessionValid(createSession(QDateTime{}), now));
}

TEST(SessionTest, PrintDoesNotRevealTokens)
{
    const auto session =
        createSession(QDateTime::currentDateTimeUtc().addSecs(3600));
    const QString str = session.toString();
    EXPECT_FALSE(str.contains(QStringLiteral("access,")));
    EXPECT_FALSE(str.contains(session.refreshToken + QStringLiteral(",")));
    EXPECT_TRUE(str.contains(QStringLiteral("<set>")));
}

TEST(ServiceIdTest, NamesRoundTrip)
{
    for (const auto serviceId: allServiceIds()) {
        EXPECT_EQ(serviceIdFromName(serviceName(serviceId)), serviceId);
    }

    EXPECT_EQ(serviceName(ServiceId::Google), QStringLiteral("google"));
    EXPECT_EQ(serviceName(ServiceId::Adobe), QStringLiteral("adobe"));
    EXPECT_FALSE(serviceIdFromName(QStringLiteral("dropbox")));
}

} // namespace assetbridge::auth::tests
