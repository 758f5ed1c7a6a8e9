/*
 * Copyright (C) 2026 The libtftpstream developers
 *
 * This file is part of libtftpstream
 *
 * libtftpstream is free software; you can redistribute it and/or modify it
 * under the terms of the GNU General Public License as published
 * by the Free Software Foundation, either version 2 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program. If not, see <http://www.gnu.org/licenses/>.
 */
#include <tftpstream/ByteStream.hpp>
#include <cstring>
#include <cerrno>


namespace tftpstream {


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    BufferSource::BufferSource (const void* buf, size_t size)
        : pos {static_cast<const uint8_t*>(buf)},
          end {static_cast<const uint8_t*>(buf) + size}
    {
        if (!buf)
            end = pos;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    ssize_t BufferSource::read (void* buf, size_t size)
    {
        if (!buf && size) {
            errno = EINVAL;
            return -1;
        }
        if (size > remaining())
            size = remaining ();
        if (size) {
            memcpy (buf, pos, size);
            pos += size;
        }
        return static_cast<ssize_t> (size);
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    ssize_t BufferSink::write (const void* buf, size_t size)
    {
        if (!buf && size) {
            errno = EINVAL;
            return -1;
        }
        auto first = static_cast<const uint8_t*> (buf);
        this->buf.insert (this->buf.end(), first, first+size);
        return static_cast<ssize_t> (size);
    }


}
