/*
 * Copyright 2017-2025 Dmitry Ivanov
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

#include <assetbridge/utility/StandardPaths.h>

#include <QCoreApplication>
#include <QStandardPaths>

namespace assetbridge::utility {

QString applicationPersistentStoragePath(bool * nonStandardLocation)
{
    const QString envOverride =
        qEnvironmentVariable(ASSETBRIDGE_PERSISTENCE_STORAGE_PATH);

    if (!envOverride.isEmpty()) {
        if (nonStandardLocation) {
            *nonStandardLocation = true;
        }

        return envOverride;
    }

    if (nonStandardLocation) {
        *nonStandardLocation = false;
    }

#if defined(Q_OS_MAC) || defined(Q_OS_WIN)
    return QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
#else // Linux, BSD-derivatives etc
    QString appName = QCoreApplication::applicationName().toLower();
    if (appName.isEmpty()) {
        appName = QStringLiteral("assetbridge");
    }

    return QStandardPaths::writableLocation(QStandardPaths::HomeLocation) +
        QStringLiteral("/.") + appName;
#endif
}

QString defaultTokensStoragePath()
{
    return applicationPersistentStoragePath() + QStringLiteral("/tokens");
}

} // namespace assetbridge::utility
