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
#ifndef TFTPSTREAM_TYPES_HPP
#define TFTPSTREAM_TYPES_HPP

#include <cstdint>
#include <cstddef>


namespace tftpstream {


    static constexpr size_t   data_block_size = 512; /**< Size of a full DATA payload. */
    static constexpr uint16_t default_port    = 69;  /**< Well-known TFTP server port. */
    static constexpr size_t   min_packet_size = sizeof(uint16_t) + sizeof(uint16_t);
    static constexpr size_t   max_packet_size = min_packet_size + data_block_size;


    /**
     * TFTP operation codes (RFC 1350).
     */
    enum opcode_t : uint16_t {
        op_rrq   = 1, /**< Read request. */
        op_wrq   = 2, /**< Write request. */
        op_data  = 3, /**< Data block. */
        op_ack   = 4, /**< Acknowledgment. */
        op_error = 5  /**< Error. */
    };


    /**
     * TFTP error codes carried in ERROR packets.
     */
    enum error_code_t : uint16_t {
        err_undefined           = 0, /**< Not defined, see error message. */
        err_file_not_found      = 1, /**< File not found. */
        err_access_violation    = 2, /**< Access violation. */
        err_disk_full           = 3, /**< Disk full or allocation exceeded. */
        err_illegal_operation   = 4, /**< Illegal TFTP operation. */
        err_unknown_transfer_id = 5, /**< Unknown transfer ID. */
        err_file_exists         = 6, /**< File already exists. */
        err_no_such_user        = 7  /**< No such user. */
    };


    /**
     * Byte order of the 16-bit fields in a TFTP packet.
     * RFC 1350 doesn't specify one, it is detected from
     * the opcode of the first packet in a transfer.
     */
    enum byte_order_t {
        little_endian,
        big_endian
    };


    /**
     * Return a printable name of a byte order.
     */
    inline const char* to_string (byte_order_t order) {
        return order == big_endian ? "big endian" : "little endian";
    }


}
#endif
