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

#include <assetbridge/utility/Linkage.h>

#include <QSettings>

namespace assetbridge::utility {

/**
 * @brief The ApplicationSettings class is QSettings stored in ini format inside
 * the application persistent storage directory
 */
class ASSETBRIDGE_EXPORT ApplicationSettings : public QSettings
{
    Q_OBJECT
public:
    /**
     * Settings stored in <persistent storage>/settings/<settingsName>.ini;
     * if settingsName is empty, the application name is used instead
     */
    explicit ApplicationSettings(const QString & settingsName = {});

    /**
     * Settings stored in the explicitly specified ini file
     */
    struct FilePath
    {
        QString path;
    };

    explicit ApplicationSettings(const FilePath & filePath);

    ~ApplicationSettings() override;

public:
    /**
     * Helper struct for RAII style of ensuring the group once opened would be
     * closed even if exception is thrown after beginning the group
     */
    struct GroupCloser
    {
        explicit GroupCloser(ApplicationSettings & settings) :
            m_settings(settings)
        {}

        ~GroupCloser()
        {
            m_settings.endGroup();
        }

        ApplicationSettings & m_settings;
    };
};

} // namespace assetbridge::utility
