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
#ifndef TFTPSTREAM_BYTESTREAM_HPP
#define TFTPSTREAM_BYTESTREAM_HPP

#include <vector>
#include <cstdint>
#include <cstddef>
#include <unistd.h>


namespace tftpstream {


    /**
     * Something bytes can be read from.
     * The packet decoder reads its input from a ByteSource.
     */
    class ByteSource {
    public:
        virtual ~ByteSource () = default;

        /**
         * Read at most <code>size</code> bytes into <code>buf</code>.
         * @return The number of bytes read, 0 at the end of input,
         *         or -1 on error with <code>errno</code> set.
         */
        virtual ssize_t read (void* buf, size_t size) = 0;
    };


    /**
     * Something bytes can be written to.
     * The packet encoder writes its output to a ByteSink.
     */
    class ByteSink {
    public:
        virtual ~ByteSink () = default;

        /**
         * Write <code>size</code> bytes from <code>buf</code>.
         * @return The number of bytes written,
         *         or -1 on error with <code>errno</code> set.
         */
        virtual ssize_t write (const void* buf, size_t size) = 0;
    };


    /**
     * A ByteSource reading from a memory buffer, for instance a received datagram.
     * The buffer is not copied and must outlive the source.
     */
    class BufferSource : public ByteSource {
    public:
        BufferSource (const void* buf, size_t size);

        explicit BufferSource (const std::vector<uint8_t>& buf)
            : BufferSource (buf.data(), buf.size())
        {
        }

        explicit BufferSource (std::vector<uint8_t>&& buf) = delete;

        virtual ssize_t read (void* buf, size_t size) override;

        /**
         * Number of bytes not yet read.
         */
        size_t remaining () const {
            return end - pos;
        }

    private:
        const uint8_t* pos;
        const uint8_t* end;
    };


    /**
     * A ByteSink appending everything written to a byte vector.
     */
    class BufferSink : public ByteSink {
    public:
        BufferSink () = default;

        virtual ssize_t write (const void* buf, size_t size) override;

        const std::vector<uint8_t>& data () const {
            return buf;
        }

        std::vector<uint8_t>& data () {
            return buf;
        }

        void clear () {
            buf.clear ();
        }

    private:
        std::vector<uint8_t> buf;
    };


}
#endif
