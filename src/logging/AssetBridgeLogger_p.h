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

#include <assetbridge/logging/AssetBridgeLogger.h>

#include <QAtomicInt>
#include <QFile>
#include <QList>
#include <QObject>
#include <QPointer>
#include <QReadWriteLock>
#include <QRegularExpression>
#include <QString>
#include <QTextStream>

#include <memory>

QT_BEGIN_NAMESPACE

class QThread;

QT_END_NAMESPACE

namespace assetbridge {

/**
 * @brief The ILogWriter class is the interface for log destinations. Writers
 * live in the logger's dedicated thread and receive formatted entries through
 * queued connections.
 */
class ILogWriter : public QObject
{
    Q_OBJECT
public:
    explicit ILogWriter(QObject * parent = nullptr) : QObject(parent) {}

public Q_SLOTS:
    virtual void write(QString message) = 0;
};

/**
 * Log writer appending to a file inside AssetBridgeLogFilesDirPath().
 * When the file grows past maxSizeBytes it is renamed to <name>-log.1.txt,
 * older files shift by one and at most maxOldLogFilesCount of them are kept.
 */
class FileLogWriter final : public ILogWriter
{
    Q_OBJECT
public:
    FileLogWriter(
        qint64 maxSizeBytes, int maxOldLogFilesCount,
        QObject * parent = nullptr);

    ~FileLogWriter() noexcept override;

public Q_SLOTS:
    void write(QString message) override;

private:
    [[nodiscard]] QString logFilePath(int index) const;
    [[nodiscard]] bool openLogFile();
    void rotate();

private:
    const qint64 m_maxSizeBytes;
    const int m_maxOldLogFilesCount;
    const QString m_logFilesDirPath;
    const QString m_baseName;

    QFile m_logFile;
    std::unique_ptr<QTextStream> m_stream;
    qint64 m_currentLogFileSize = 0;
};

class ConsoleLogWriter final : public ILogWriter
{
    Q_OBJECT
public:
    explicit ConsoleLogWriter(QObject * parent = nullptr);

public Q_SLOTS:
    void write(QString message) override;
};

class AssetBridgeLogger final : public QObject
{
    Q_OBJECT
public:
    static AssetBridgeLogger & instance();

    ~AssetBridgeLogger() override;

    [[nodiscard]] static QString logFilesDirPath();

    void addLogWriter(ILogWriter * logWriter);

    void write(QString message);

    [[nodiscard]] LogLevel minLogLevel() const;
    void setMinLogLevel(LogLevel minLogLevel);

    [[nodiscard]] QRegularExpression componentFilterRegex();
    void setComponentFilterRegex(const QRegularExpression & filter);

Q_SIGNALS:
    void sendLogMessage(QString message);

private:
    explicit AssetBridgeLogger(QObject * parent = nullptr);
    Q_DISABLE_COPY(AssetBridgeLogger)

private:
    QList<QPointer<ILogWriter>> m_logWriters;
    QAtomicInt m_minLogLevel;
    QThread * m_logWriteThread;

    QReadWriteLock m_componentFilterLock;
    QRegularExpression m_componentFilterRegex;
};

} // namespace assetbridge
