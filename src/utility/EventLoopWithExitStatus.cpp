/*
 * Copyright 2016-2020 Dmitry Ivanov
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

#include <assetbridge/utility/EventLoopWithExitStatus.h>

#include <QDebug>
#include <QTextStream>

namespace assetbridge::utility {

namespace {

template <class Stream>
void printExitStatus(
    Stream & strm, const EventLoopWithExitStatus::ExitStatus status)
{
    using ExitStatus = EventLoopWithExitStatus::ExitStatus;

    switch (status) {
    case ExitStatus::Success:
        strm << "Success";
        break;
    case ExitStatus::Failure:
        strm << "Failure";
        break;
    case ExitStatus::Timeout:
        strm << "Timeout";
        break;
    default:
        strm << "Unknown (" << static_cast<qint64>(status) << ")";
        break;
    }
}

} // namespace

EventLoopWithExitStatus::EventLoopWithExitStatus(QObject * parent) :
    QEventLoop(parent)
{}

EventLoopWithExitStatus::ExitStatus EventLoopWithExitStatus::exitStatus()
    const noexcept
{
    return m_exitStatus;
}

const ErrorString & EventLoopWithExitStatus::errorDescription() const noexcept
{
    return m_errorDescription;
}

void EventLoopWithExitStatus::exitAsSuccess()
{
    exitWithStatus(ExitStatus::Success);
}

void EventLoopWithExitStatus::exitAsFailureWithError(QString errorDescription)
{
    m_errorDescription = ErrorString{std::move(errorDescription)};
    exitWithStatus(ExitStatus::Failure);
}

void EventLoopWithExitStatus::exitAsTimeout()
{
    exitWithStatus(ExitStatus::Timeout);
}

void EventLoopWithExitStatus::exitWithStatus(const ExitStatus status)
{
    m_exitStatus = status;
    QEventLoop::exit(static_cast<int>(m_exitStatus));
}

QDebug & operator<<(
    QDebug & dbg, const EventLoopWithExitStatus::ExitStatus status)
{
    printExitStatus(dbg, status);
    return dbg;
}

QTextStream & operator<<(
    QTextStream & strm, const EventLoopWithExitStatus::ExitStatus status)
{
    printExitStatus(strm, status);
    return strm;
}

} // namespace assetbridge::utility
