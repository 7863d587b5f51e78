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

namespace assetbridge::transfer {

class ITransferObserver;
using ITransferObserverPtr = std::shared_ptr<ITransferObserver>;
using ITransferObserverWeakPtr = std::weak_ptr<ITransferObserver>;

class ITransferPipeline;
using ITransferPipelinePtr = std::shared_ptr<ITransferPipeline>;

struct TransferItem;
struct TransferOptions;
struct TransferOutcome;
struct TransferSummary;

enum class TransferStatus;

} // namespace assetbridge::transfer
