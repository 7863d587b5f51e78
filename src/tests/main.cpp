/*
 * Copyright 2021 Dmitry Ivanov
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
#include <assetbridge/utility/StandardPaths.h>

#include <gtest/gtest.h>

#include <QCoreApplication>
#include <QTemporaryDir>
#include <QTimer>

int main(int argc, char * argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName(QStringLiteral("assetbridge"));
    QCoreApplication::setApplicationName(QStringLiteral("assetbridge_tests"));

    // Keeps settings, tokens and logs of the tests away from the user's ones
    QTemporaryDir storageDir;
    if (storageDir.isValid()) {
        qputenv(
            ASSETBRIDGE_PERSISTENCE_STORAGE_PATH, storageDir.path().toUtf8());
    }

    ASSETBRIDGE_INITIALIZE_LOGGING();
    ASSETBRIDGE_SET_MIN_LOG_LEVEL(Warning);

    QTimer::singleShot(0, [&]() // clazy:exclude=connect-3arg-lambda
    {
        ::testing::InitGoogleTest(&argc, argv); // NOLINT
        auto testResult = RUN_ALL_TESTS();
        QCoreApplication::exit(testResult);
    });

    return QCoreApplication::exec();
}
