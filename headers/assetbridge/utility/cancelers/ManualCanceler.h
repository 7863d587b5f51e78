/*
 * Copyright 2022 Dmitry Ivanov
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

#include <assetbridge/utility/cancelers/ICanceler.h>

#include <memory>

namespace assetbridge::utility::cancelers {

/**
 * ICanceler which is canceled by an explicit call to cancel method, possibly
 * from another thread
 */
class ASSETBRIDGE_EXPORT ManualCanceler : public ICanceler
{
public:
    ManualCanceler();
    ManualCanceler(ManualCanceler && other) noexcept;
    ManualCanceler & operator=(ManualCanceler && other) noexcept;
    ~ManualCanceler() noexcept override;

    void cancel() noexcept;

    [[nodiscard]] bool isCanceled() const noexcept override;

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace assetbridge::utility::cancelers
