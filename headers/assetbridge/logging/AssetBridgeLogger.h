/*
 * Copyright 2016-2024 Dmitry Ivanov
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

#include <assetbridge/utility/Linkage.h>

#include <QDebug>
#include <QRegularExpression>
#include <QString>
#include <QTextStream>

namespace assetbridge {

/**
 * The LogLevel enumeration defines different levels for log entries which are
 * meant to separate log entries with different importance and meaning
 */
enum class LogLevel
{
    Trace,
    Debug,
    Info,
    Warning,
    Error
};

ASSETBRIDGE_EXPORT QDebug & operator<<(QDebug & dbg, LogLevel logLevel);

ASSETBRIDGE_EXPORT QTextStream & operator<<(
    QTextStream & strm, LogLevel logLevel);

/**
 * This function needs to be called once during a process lifetime before
 * assetbridge is used by the process. It sets up the logger singleton which
 * writes logs to rotated files in the directory returned by
 * AssetBridgeLogFilesDirPath function.
 */
void ASSETBRIDGE_EXPORT AssetBridgeInitializeLogging();

/**
 * Adds a new log entry to logs written by assetbridge
 */
void ASSETBRIDGE_EXPORT AssetBridgeAddLogEntry(
    const QString & sourceFileName, int sourceFileLineNumber,
    const QString & component, const QString & message, LogLevel logLevel);

/**
 * Current minimal log level. By default it is LogLevel::Info which means that
 * Info, Warning and Error logs are being output but Debug and Trace ones are
 * not
 */
[[nodiscard]] LogLevel ASSETBRIDGE_EXPORT AssetBridgeMinLogLevel();

void ASSETBRIDGE_EXPORT AssetBridgeSetMinLogLevel(LogLevel logLevel);

/**
 * Call this function to write logs not only to rotating files but also to
 * stderr
 */
void ASSETBRIDGE_EXPORT AssetBridgeAddStdErrLogDestination();

[[nodiscard]] bool ASSETBRIDGE_EXPORT
    AssetBridgeIsLogLevelActive(LogLevel logLevel);

/**
 * Directory containing rotating log files
 */
[[nodiscard]] QString ASSETBRIDGE_EXPORT AssetBridgeLogFilesDirPath();

/**
 * Only entries from components matching this filter are written. An invalid
 * or empty regular expression lets everything through.
 */
[[nodiscard]] QRegularExpression ASSETBRIDGE_EXPORT
    AssetBridgeLogComponentFilter();

void ASSETBRIDGE_EXPORT
    AssetBridgeSetLogComponentFilter(const QRegularExpression & filter);

} // namespace assetbridge

#define ABLOG_PRIVATE_BASE(component, message, level)                          \
    if (assetbridge::AssetBridgeIsLogLevelActive(                              \
            assetbridge::LogLevel::level)) {                                   \
        QString msg;                                                           \
        QDebug dbg(&msg);                                                      \
        dbg.nospace();                                                         \
        dbg.noquote();                                                         \
        dbg << message;                                                        \
        assetbridge::AssetBridgeAddLogEntry(                                   \
            QStringLiteral(__FILE__), __LINE__, QString::fromUtf8(component),  \
            msg, assetbridge::LogLevel::level);                                \
    }                                                                          \
    // ABLOG_PRIVATE_BASE

#define ABTRACE(component, message)                                            \
    ABLOG_PRIVATE_BASE(component, message, Trace)                              \
    // ABTRACE

#define ABDEBUG(component, message)                                            \
    ABLOG_PRIVATE_BASE(component, message, Debug)                              \
    // ABDEBUG

#define ABINFO(component, message)                                             \
    ABLOG_PRIVATE_BASE(component, message, Info)                               \
    // ABINFO

#define ABWARNING(component, message)                                          \
    ABLOG_PRIVATE_BASE(component, message, Warning)                            \
    // ABWARNING

#define ABERROR(component, message)                                            \
    ABLOG_PRIVATE_BASE(component, message, Error)                              \
    // ABERROR

#define ASSETBRIDGE_SET_MIN_LOG_LEVEL(level)                                   \
    assetbridge::AssetBridgeSetMinLogLevel(assetbridge::LogLevel::level)
// ASSETBRIDGE_SET_MIN_LOG_LEVEL

#define ASSETBRIDGE_INITIALIZE_LOGGING()                                       \
    assetbridge::AssetBridgeInitializeLogging()
// ASSETBRIDGE_INITIALIZE_LOGGING

#define ASSETBRIDGE_ADD_STDERR_LOG_DESTINATION()                               \
    assetbridge::AssetBridgeAddStdErrLogDestination()
// ASSETBRIDGE_ADD_STDERR_LOG_DESTINATION
