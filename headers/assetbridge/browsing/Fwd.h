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

namespace assetbridge::browsing {

struct AccountInfo;
struct DestinationContainer;
class PageCursor;
struct SourceEntry;

template <class T>
struct Page;

class IDestinationBrowser;
using IDestinationBrowserPtr = std::shared_ptr<IDestinationBrowser>;

class ISourceBrowser;
using ISourceBrowserPtr = std::shared_ptr<ISourceBrowser>;

} // namespace assetbridge::browsing
