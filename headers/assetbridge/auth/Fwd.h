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

#include <memory>

namespace assetbridge::auth {

class IAuthorizationCodeReceiver;
using IAuthorizationCodeReceiverPtr =
    std::shared_ptr<IAuthorizationCodeReceiver>;

class ICredentialStore;
using ICredentialStorePtr = std::shared_ptr<ICredentialStore>;

class ITokenLifecycleManager;
using ITokenLifecycleManagerPtr = std::shared_ptr<ITokenLifecycleManager>;

struct OAuthClientConfig;
struct Session;

enum class ServiceId;

} // namespace assetbridge::auth
