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

#include <assetbridge/logging/AssetBridgeLogger.h>

#include "AssetBridgeLogger_p.h"

#include <assetbridge/utility/Printable.h>

namespace assetbridge {

void AssetBridgeInitializeLogging()
{
    Q_UNUSED(AssetBridgeLogger::instance())
}

void AssetBridgeAddLogEntry(
    const QString & sourceFileName, const int sourceFileLineNumber,
    const QString & component, const QString & message, const LogLevel logLevel)
{
    const auto componentFilter = AssetBridgeLogComponentFilter();
    if (componentFilter.isValid() && !componentFilter.pattern().isEmpty() &&
        !component.isEmpty() && !componentFilter.match(component).hasMatch())
    {
        return;
    }

    // Cut the build machine specific part of the source file path
    QString relativeSourceFileName = sourceFileName;
    const int prefixIndex = relativeSourceFileName.lastIndexOf(
        QStringLiteral("/src/"), -1, Qt::CaseInsensitive);
    if (prefixIndex >= 0) {
        relativeSourceFileName.remove(0, prefixIndex + 1);
    }

    QString logEntry;
    QTextStream strm{&logEntry};
    strm << relativeSourceFileName << ":" << sourceFileLineNumber << " ["
         << logLevel << "] [" << component << "]: " << message;
    strm.flush();

    AssetBridgeLogger::instance().write(std::move(logEntry));
}

LogLevel AssetBridgeMinLogLevel()
{
    return AssetBridgeLogger::instance().minLogLevel();
}

void AssetBridgeSetMinLogLevel(const LogLevel logLevel)
{
    AssetBridgeLogger::instance().setMinLogLevel(logLevel);
}

bool AssetBridgeIsLogLevelActive(const LogLevel logLevel)
{
    return AssetBridgeLogger::instance().minLogLevel() <= logLevel;
}

void AssetBridgeAddStdErrLogDestination()
{
    AssetBridgeLogger::instance().addLogWriter(new ConsoleLogWriter);
}

QString AssetBridgeLogFilesDirPath()
{
    return AssetBridgeLogger::logFilesDirPath();
}

QRegularExpression AssetBridgeLogComponentFilter()
{
    return AssetBridgeLogger::instance().componentFilterRegex();
}

void AssetBridgeSetLogComponentFilter(const QRegularExpression & filter)
{
    AssetBridgeLogger::instance().setComponentFilterRegex(filter);
}

QDebug & operator<<(QDebug & dbg, const LogLevel logLevel)
{
    dbg << ToString(logLevel);
    return dbg;
}

QTextStream & operator<<(QTextStream & strm, const LogLevel logLevel)
{
    switch (logLevel) {
    case LogLevel::Trace:
        strm << "Trace";
        break;
    case LogLevel::Debug:
        strm << "Debug";
        break;
    case LogLevel::Info:
        strm << "Info";
        break;
    case LogLevel::Warning:
        strm << "Warn";
        break;
    case LogLevel::Error:
        strm << "Error";
        break;
    default:
        strm << "Unknown (" << static_cast<qint64>(logLevel) << ")";
        break;
    }

    return strm;
}

} // namespace assetbridge
