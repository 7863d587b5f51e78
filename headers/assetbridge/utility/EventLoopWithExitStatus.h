/*
 * Copyright 2016-2025 Dmitry Ivanov
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

#include <assetbridge/types/ErrorString.h>
#include <assetbridge/utility/Linkage.h>

#include <QEventLoop>

class QDebug;
class QTextStream;

namespace assetbridge::utility {

/**
 * @brief The EventLoopWithExitStatus class is a QEventLoop which remembers
 * how it was exited. It is used to wait synchronously for an asynchronous Qt
 * operation (a network reply, an incoming connection) with a timeout.
 */
class ASSETBRIDGE_EXPORT EventLoopWithExitStatus : public QEventLoop
{
    Q_OBJECT
public:
    explicit EventLoopWithExitStatus(QObject * parent = nullptr);

    enum class ExitStatus
    {
        Success,
        Failure,
        Timeout
    };

    friend ASSETBRIDGE_EXPORT QDebug & operator<<(
        QDebug & dbg, ExitStatus status);

    friend ASSETBRIDGE_EXPORT QTextStream & operator<<(
        QTextStream & strm, ExitStatus status);

    [[nodiscard]] ExitStatus exitStatus() const noexcept;
    [[nodiscard]] const ErrorString & errorDescription() const noexcept;

public Q_SLOTS:
    void exitAsSuccess();
    void exitAsFailureWithError(QString errorDescription);
    void exitAsTimeout();

private:
    void exitWithStatus(ExitStatus status);

private:
    ExitStatus m_exitStatus = ExitStatus::Success;
    ErrorString m_errorDescription;
};

} // namespace assetbridge::utility
