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

#include <assetbridge/browsing/Types.h>

#include <assetbridge/utility/DateTime.h>

namespace assetbridge::browsing {

bool SourceEntry::isContainer() const
{
    return contentType == QString::fromUtf8(gSourceContainerContentType);
}

QTextStream & SourceEntry::print(QTextStream & strm) const
{
    strm << "SourceEntry: id = " << id << ", name = " << displayName
         << ", content type = " << contentType << ", size = ";

    if (sizeBytes) {
        strm << *sizeBytes;
    }
    else {
        strm << "<unknown>";
    }

    strm << ", parent id = " << parentId;
    return strm;
}

bool operator==(const SourceEntry & lhs, const SourceEntry & rhs) noexcept
{
    return lhs.id == rhs.id && lhs.displayName == rhs.displayName &&
        lhs.contentType == rhs.contentType && lhs.sizeBytes == rhs.sizeBytes &&
        lhs.parentId == rhs.parentId;
}

bool operator!=(const SourceEntry & lhs, const SourceEntry & rhs) noexcept
{
    return !(lhs == rhs);
}

QTextStream & DestinationContainer::print(QTextStream & strm) const
{
    strm << "DestinationContainer: id = " << id << ", name = " << name
         << ", kind = " << kind << ", created at = "
         << (createdAt.isValid() ? toIsoDateTimeString(createdAt)
                                 : QStringLiteral("<unknown>"))
         << ", updated at = "
         << (updatedAt.isValid() ? toIsoDateTimeString(updatedAt)
                                 : QStringLiteral("<unknown>"));
    return strm;
}

QTextStream & AccountInfo::print(QTextStream & strm) const
{
    strm << "AccountInfo: id = " << id << ", display name = " << displayName
         << ", email = " << email;
    return strm;
}

PageCursor PageCursor::offsetBased(const int offset, const int limit)
{
    PageCursor cursor;
    cursor.m_kind = Kind::OffsetBased;
    cursor.m_offset = offset;
    cursor.m_limit = limit;
    return cursor;
}

PageCursor PageCursor::linkBased(QString link)
{
    PageCursor cursor;
    cursor.m_kind = Kind::LinkBased;
    cursor.m_link = std::move(link);
    return cursor;
}

PageCursor::Kind PageCursor::kind() const noexcept
{
    return m_kind;
}

int PageCursor::offset() const noexcept
{
    return m_offset;
}

int PageCursor::limit() const noexcept
{
    return m_limit;
}

const QString & PageCursor::link() const noexcept
{
    return m_link;
}

QTextStream & PageCursor::print(QTextStream & strm) const
{
    switch (m_kind) {
    case Kind::OffsetBased:
        strm << "PageCursor: offset = " << m_offset << ", limit = " << m_limit;
        break;
    case Kind::LinkBased:
        strm << "PageCursor: link = " << m_link;
        break;
    }

    return strm;
}

bool operator==(const PageCursor & lhs, const PageCursor & rhs) noexcept
{
    return lhs.m_kind == rhs.m_kind && lhs.m_offset == rhs.m_offset &&
        lhs.m_limit == rhs.m_limit && lhs.m_link == rhs.m_link;
}

bool operator!=(const PageCursor & lhs, const PageCursor & rhs) noexcept
{
    return !(lhs == rhs);
}

} // namespace assetbridge::browsing
