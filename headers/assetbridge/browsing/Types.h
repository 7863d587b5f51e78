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

#include <assetbridge/utility/Printable.h>

#include <QDateTime>
#include <QList>
#include <QString>

#include <optional>

namespace assetbridge::browsing {

/**
 * Content type which marks source entries as containers (folders)
 */
constexpr const char * gSourceContainerContentType =
    "application/vnd.google-apps.folder";

/**
 * Alias of the source tree's root container
 */
constexpr const char * gSourceRootContainerId = "root";

/**
 * @brief The SourceEntry struct is a node of the source tree: either
 * a container or a transferable file.
 */
struct ASSETBRIDGE_EXPORT SourceEntry : public utility::Printable
{
    [[nodiscard]] bool isContainer() const;

    QTextStream & print(QTextStream & strm) const override;

    QString id;
    QString displayName;
    QString contentType;
    std::optional<qint64> sizeBytes;
    QString parentId;
};

ASSETBRIDGE_EXPORT bool operator==(
    const SourceEntry & lhs, const SourceEntry & rhs) noexcept;

ASSETBRIDGE_EXPORT bool operator!=(
    const SourceEntry & lhs, const SourceEntry & rhs) noexcept;

/**
 * @brief The DestinationContainer struct represents an album within
 * the destination catalog.
 */
struct ASSETBRIDGE_EXPORT DestinationContainer : public utility::Printable
{
    QTextStream & print(QTextStream & strm) const override;

    QString id;
    QString name = QStringLiteral("Unnamed Album");
    QDateTime createdAt;
    QDateTime updatedAt;
    QString kind;
};

struct ASSETBRIDGE_EXPORT AccountInfo : public utility::Printable
{
    QTextStream & print(QTextStream & strm) const override;

    QString id;
    QString displayName;
    QString email;
};

/**
 * @brief The PageCursor class identifies the position of the next page in
 * a listing. An offset based cursor is computed by the caller, a link based
 * one is returned by the provider and must be replayed verbatim.
 */
class ASSETBRIDGE_EXPORT PageCursor : public utility::Printable
{
public:
    enum class Kind
    {
        OffsetBased,
        LinkBased
    };

    [[nodiscard]] static PageCursor offsetBased(int offset, int limit);
    [[nodiscard]] static PageCursor linkBased(QString link);

    [[nodiscard]] Kind kind() const noexcept;
    [[nodiscard]] int offset() const noexcept;
    [[nodiscard]] int limit() const noexcept;
    [[nodiscard]] const QString & link() const noexcept;

    QTextStream & print(QTextStream & strm) const override;

    friend ASSETBRIDGE_EXPORT bool operator==(
        const PageCursor & lhs, const PageCursor & rhs) noexcept;

    friend ASSETBRIDGE_EXPORT bool operator!=(
        const PageCursor & lhs, const PageCursor & rhs) noexcept;

private:
    PageCursor() = default;

private:
    Kind m_kind = Kind::OffsetBased;
    int m_offset = 0;
    int m_limit = 0;
    QString m_link;
};

template <class T>
struct Page
{
    QList<T> items;
    std::optional<PageCursor> nextCursor;
};

} // namespace assetbridge::browsing
