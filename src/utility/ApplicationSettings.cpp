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

#include <assetbridge/utility/ApplicationSettings.h>

#include <assetbridge/exception/RuntimeError.h>
#include <assetbridge/utility/StandardPaths.h>

#include <QCoreApplication>

namespace assetbridge::utility {

namespace {

[[nodiscard]] QString settingsFilePath(const QString & settingsName)
{
    QString storagePath = applicationPersistentStoragePath();
    if (Q_UNLIKELY(storagePath.isEmpty())) {
        throw RuntimeError{ErrorString{QT_TRANSLATE_NOOP(
            "ApplicationSettings",
            "Can't create ApplicationSettings instance: no persistent "
            "storage path")}};
    }

    storagePath += QStringLiteral("/settings/");

    if (!settingsName.isEmpty()) {
        storagePath += settingsName;
    }
    else {
        const QString appName = QCoreApplication::applicationName();
        storagePath +=
            (appName.isEmpty() ? QStringLiteral("assetbridge") : appName);
    }

    if (!storagePath.endsWith(QStringLiteral(".ini"))) {
        storagePath += QStringLiteral(".ini");
    }

    return storagePath;
}

} // namespace

ApplicationSettings::ApplicationSettings(const QString & settingsName) :
    QSettings(settingsFilePath(settingsName), QSettings::IniFormat)
{}

ApplicationSettings::ApplicationSettings(const FilePath & filePath) :
    QSettings(filePath.path, QSettings::IniFormat)
{}

ApplicationSettings::~ApplicationSettings() = default;

} // namespace assetbridge::utility
