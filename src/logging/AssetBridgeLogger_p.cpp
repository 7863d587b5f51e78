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

#include "AssetBridgeLogger_p.h"

#include <assetbridge/utility/DateTime.h>
#include <assetbridge/utility/StandardPaths.h>

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QReadLocker>
#include <QThread>
#include <QWriteLocker>

#include <cstdio>

namespace assetbridge {

namespace {

constexpr qint64 gMaxLogFileSizeBytes = 104857600;
constexpr int gMaxOldLogFilesCount = 5;

void reportLoggerProblem(const QString & problem)
{
    std::fprintf(stderr, "assetbridge logger: %s\n", qPrintable(problem));
    std::fflush(stderr);
}

} // namespace

FileLogWriter::FileLogWriter(
    const qint64 maxSizeBytes, const int maxOldLogFilesCount,
    QObject * parent) :
    ILogWriter(parent),
    m_maxSizeBytes{maxSizeBytes}, m_maxOldLogFilesCount{maxOldLogFilesCount},
    m_logFilesDirPath{AssetBridgeLogger::logFilesDirPath()},
    m_baseName{[] {
        const QString appName = QCoreApplication::applicationName();
        return appName.isEmpty() ? QStringLiteral("assetbridge") : appName;
    }()}
{
    QDir logFilesDir{m_logFilesDirPath};
    if (!logFilesDir.exists() && !logFilesDir.mkpath(QStringLiteral("."))) {
        reportLoggerProblem(
            QStringLiteral("can't create log files dir ") + m_logFilesDirPath);
        return;
    }

    if (openLogFile()) {
        m_currentLogFileSize = m_logFile.size();
    }
}

FileLogWriter::~FileLogWriter() noexcept
{
    if (m_stream) {
        m_stream->flush();
    }
    m_logFile.close();
}

void FileLogWriter::write(QString message)
{
    if (!m_logFile.isOpen()) {
        return;
    }

    message.prepend(
        printableDateTimeFromTimestamp(QDateTime::currentMSecsSinceEpoch()) +
        QStringLiteral(" "));

    m_currentLogFileSize += message.toUtf8().size() + 1;
    if (Q_UNLIKELY(m_currentLogFileSize > m_maxSizeBytes)) {
        rotate();
        if (!m_logFile.isOpen()) {
            return;
        }
        m_currentLogFileSize = message.toUtf8().size() + 1;
    }

    *m_stream << message << "\n";
    m_stream->flush();
}

QString FileLogWriter::logFilePath(const int index) const
{
    QString path = m_logFilesDirPath + QStringLiteral("/") + m_baseName +
        QStringLiteral("-log");

    if (index > 0) {
        path += QStringLiteral(".") + QString::number(index);
    }

    path += QStringLiteral(".txt");
    return path;
}

bool FileLogWriter::openLogFile()
{
    m_logFile.setFileName(logFilePath(0));
    if (!m_logFile.open(
            QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text))
    {
        reportLoggerProblem(
            QStringLiteral("can't open log file ") + m_logFile.fileName() +
            QStringLiteral(": ") + m_logFile.errorString());
        m_stream.reset();
        return false;
    }

    m_stream = std::make_unique<QTextStream>(&m_logFile);
#if QT_VERSION < QT_VERSION_CHECK(6, 0, 0)
    m_stream->setCodec("UTF-8");
#endif
    return true;
}

void FileLogWriter::rotate()
{
    m_stream.reset();
    m_logFile.close();

    // The oldest file falls out of the window, the rest shift by one
    QFile::remove(logFilePath(m_maxOldLogFilesCount));
    for (int i = m_maxOldLogFilesCount - 1; i >= 0; --i) {
        const QString from = logFilePath(i);
        if (!QFile::exists(from)) {
            continue;
        }

        if (!QFile::rename(from, logFilePath(i + 1))) {
            reportLoggerProblem(
                QStringLiteral("can't rename log file ") + from +
                QStringLiteral(" during rotation"));
        }
    }

    Q_UNUSED(openLogFile())
}

ConsoleLogWriter::ConsoleLogWriter(QObject * parent) : ILogWriter(parent) {}

void ConsoleLogWriter::write(QString message)
{
    std::fprintf(stderr, "%s\n", qPrintable(message));
    std::fflush(stderr);
}

AssetBridgeLogger & AssetBridgeLogger::instance()
{
    static AssetBridgeLogger instance;
    return instance;
}

AssetBridgeLogger::AssetBridgeLogger(QObject * parent) :
    QObject(parent), m_minLogLevel{static_cast<int>(LogLevel::Info)},
    m_logWriteThread{new QThread}
{
    m_logWriteThread->setObjectName(QStringLiteral("assetbridge-log-writer"));
    m_logWriteThread->start(QThread::LowPriority);

    addLogWriter(
        new FileLogWriter(gMaxLogFileSizeBytes, gMaxOldLogFilesCount));
}

AssetBridgeLogger::~AssetBridgeLogger()
{
    m_logWriteThread->quit();
    m_logWriteThread->wait();

    for (const auto & logWriter: std::as_const(m_logWriters)) {
        delete logWriter.data();
    }

    delete m_logWriteThread;
}

QString AssetBridgeLogger::logFilesDirPath()
{
    return utility::applicationPersistentStoragePath() +
        QStringLiteral("/logs-assetbridge");
}

void AssetBridgeLogger::addLogWriter(ILogWriter * logWriter)
{
    if (Q_UNLIKELY(!logWriter)) {
        return;
    }

    if (m_logWriters.contains(QPointer<ILogWriter>{logWriter})) {
        return;
    }

    m_logWriters << QPointer<ILogWriter>{logWriter};

    QObject::connect(
        this, &AssetBridgeLogger::sendLogMessage, logWriter,
        &ILogWriter::write, Qt::QueuedConnection);

    logWriter->setParent(nullptr);
    logWriter->moveToThread(m_logWriteThread);
}

void AssetBridgeLogger::write(QString message)
{
    Q_EMIT sendLogMessage(std::move(message));
}

LogLevel AssetBridgeLogger::minLogLevel() const
{
    return static_cast<LogLevel>(m_minLogLevel.loadAcquire());
}

void AssetBridgeLogger::setMinLogLevel(const LogLevel minLogLevel)
{
    m_minLogLevel.storeRelease(static_cast<int>(minLogLevel));
}

QRegularExpression AssetBridgeLogger::componentFilterRegex()
{
    const QReadLocker locker{&m_componentFilterLock};
    return m_componentFilterRegex;
}

void AssetBridgeLogger::setComponentFilterRegex(
    const QRegularExpression & filter)
{
    const QWriteLocker locker{&m_componentFilterLock};
    m_componentFilterRegex = filter;
}

} // namespace assetbridge
