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

#include <assetbridge/auth/ITokenLifecycleManager.h>
#include <assetbridge/auth/Session.h>

#include <gmock/gmock.h>

// clazy:excludeall=returning-void-expression

namespace assetbridge::auth::tests::mocks {

class MockITokenLifecycleManager : public ITokenLifecycleManager
{
public:
    MOCK_METHOD(ServiceId, serviceId, (), (const, noexcept, override));
    MOCK_METHOD(Session, acquireSession, (), (override));
    MOCK_METHOD(bool, isValid, (), (const, override));
    MOCK_METHOD(network::HttpHeaders, headers, (), (override));
    MOCK_METHOD(void, logout, (), (override));
};

} // namespace assetbridge::auth::tests::mocks
