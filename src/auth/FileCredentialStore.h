/*
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

#include <assetbridge/auth/ICredentialStore.h>

#include <QMutex>
#include <QString>

namespace assetbridge::auth {

/**
 * ICredentialStore keeping each service's session in its own JSON file
 * <dir>/<service>_token.json. Writes are atomic (temporary file renamed over
 * the record) and both reads and writes are done under an exclusive lock
 * shared with other processes through a lock file.
 */
class FileCredentialStore final : public ICredentialStore
{
public:
    explicit FileCredentialStore(QString dirPath);

    [[nodiscard]] std::optional<Session> load(ServiceId serviceId) override;
    void save(const Session & session) override;
    void clear(ServiceId serviceId) override;
    void clearAll() override;
    [[nodiscard]] QMap<ServiceId, bool> authenticationStatus() override;

    [[nodiscard]] QString recordFilePath(ServiceId serviceId) const;

private:
    [[nodiscard]] std::optional<Session> loadImpl(ServiceId serviceId);
    void clearImpl(ServiceId serviceId);

private:
    const QString m_dirPath;
    QMutex m_mutex;
};

} // namespace assetbridge::auth
