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
#ifndef TFTPSTREAM_PACKET_HPP
#define TFTPSTREAM_PACKET_HPP

#include <tftpstream/types.hpp>
#include <tftpstream/ByteStream.hpp>
#include <memory>
#include <string>
#include <vector>
#include <cstdint>
#include <unistd.h>


namespace tftpstream {


    /**
     * Base class for TFTP packets.
     * A packet is immutable once constructed. It is encoded to bytes
     * with a given byte order, and each concrete packet type has a static
     * <code>parse</code> method that reads the fields following the opcode.
     * <br/>
     * Strings (file names, modes, and error messages) are encoded as
     * raw bytes followed by a single NUL byte. A string given to a
     * constructor is cut at its first NUL byte, if any.
     */
    class Packet {
    public:
        virtual ~Packet () = default;

        /**
         * Return the opcode of the packet.
         */
        virtual opcode_t opcode () const = 0;

        /**
         * Encode the packet.
         * The opcode is written first, followed by the packet fields.
         * @param order The byte order of the 16-bit fields.
         * @param sink Where the encoded bytes are written.
         * @return The number of bytes written, or -1 if the sink
         *         failed. In that case <code>errno</code> is
         *         left as set by the sink.
         */
        ssize_t encode (byte_order_t order, ByteSink& sink) const;

        /**
         * Encode the packet into a new byte vector.
         * @param order The byte order of the 16-bit fields.
         * @return The encoded packet.
         */
        std::vector<uint8_t> to_bytes (byte_order_t order) const;

        /**
         * Return a short description of the packet, for log messages.
         */
        virtual std::string to_string () const = 0;

        /**
         * Compare packet type and contents.
         */
        virtual bool equals (const Packet& rhs) const = 0;


    protected:
        Packet () = default;

        virtual ssize_t encode_fields (byte_order_t order, ByteSink& sink) const = 0;
    };


    inline bool operator== (const Packet& lhs, const Packet& rhs) {
        return lhs.equals (rhs);
    }

    inline bool operator!= (const Packet& lhs, const Packet& rhs) {
        return !lhs.equals (rhs);
    }


    /**
     * Common base for read and write requests.
     */
    class RequestPacket : public Packet {
    public:
        const std::string& filename () const {
            return fname;
        }

        const std::string& mode () const {
            return fmode;
        }

        virtual std::string to_string () const override;
        virtual bool equals (const Packet& rhs) const override;


    protected:
        RequestPacket (const std::string& filename, const std::string& mode);

        virtual ssize_t encode_fields (byte_order_t order, ByteSink& sink) const override;

        /**
         * Read the NUL terminated file name and mode.
         * @return 0 on success, -1 on error with <code>errno</code> set.
         */
        static int parse_fields (ByteSource& src, std::string& filename, std::string& mode);

    private:
        const std::string fname;
        const std::string fmode;
    };


    /**
     * RRQ - Read request.
     */
    class ReadRequestPacket : public RequestPacket {
    public:
        ReadRequestPacket (const std::string& filename, const std::string& mode)
            : RequestPacket (filename, mode)
        {
        }

        virtual opcode_t opcode () const override {
            return op_rrq;
        }

        /**
         * Parse the fields following the opcode.
         * @return A new packet, or <code>nullptr</code> with
         *         <code>errno</code> set to <code>EBADMSG</code> if
         *         a string isn't terminated before the end of input.
         */
        static std::shared_ptr<ReadRequestPacket> parse (ByteSource& src, byte_order_t order);
    };


    /**
     * WRQ - Write request.
     */
    class WriteRequestPacket : public RequestPacket {
    public:
        WriteRequestPacket (const std::string& filename, const std::string& mode)
            : RequestPacket (filename, mode)
        {
        }

        virtual opcode_t opcode () const override {
            return op_wrq;
        }

        static std::shared_ptr<WriteRequestPacket> parse (ByteSource& src, byte_order_t order);
    };


    /**
     * DATA - A block of file data.
     */
    class DataPacket : public Packet {
    public:
        /**
         * Create a data packet.
         * @param block The block number.
         * @param payload At most <code>data_block_size</code> bytes of data.
         * @throw std::invalid_argument If the payload is too large.
         */
        DataPacket (uint16_t block, std::vector<uint8_t> payload);

        /**
         * Create a data packet copying <code>size</code> bytes from <code>buf</code>.
         * @throw std::invalid_argument If the payload is too large.
         */
        DataPacket (uint16_t block, const void* buf, size_t size);

        virtual opcode_t opcode () const override {
            return op_data;
        }

        uint16_t block () const {
            return block_num;
        }

        const std::vector<uint8_t>& payload () const {
            return data;
        }

        /**
         * A block shorter than <code>data_block_size</code> ends the transfer.
         */
        bool is_last_block () const {
            return data.size() < data_block_size;
        }

        /**
         * Parse the block number and up to <code>data_block_size</code>
         * bytes of payload. A payload shorter than that is not an error.
         * @return A new packet, or <code>nullptr</code> with
         *         <code>errno</code> set to <code>EBADMSG</code> if the
         *         block number is truncated.
         */
        static std::shared_ptr<DataPacket> parse (ByteSource& src, byte_order_t order);

        virtual std::string to_string () const override;
        virtual bool equals (const Packet& rhs) const override;


    protected:
        virtual ssize_t encode_fields (byte_order_t order, ByteSink& sink) const override;

    private:
        const uint16_t block_num;
        const std::vector<uint8_t> data;
    };


    /**
     * ACK - Acknowledgment of a data block (or of a write request, block 0).
     */
    class AckPacket : public Packet {
    public:
        explicit AckPacket (uint16_t block)
            : block_num {block}
        {
        }

        virtual opcode_t opcode () const override {
            return op_ack;
        }

        uint16_t block () const {
            return block_num;
        }

        static std::shared_ptr<AckPacket> parse (ByteSource& src, byte_order_t order);

        virtual std::string to_string () const override;
        virtual bool equals (const Packet& rhs) const override;


    protected:
        virtual ssize_t encode_fields (byte_order_t order, ByteSink& sink) const override;

    private:
        const uint16_t block_num;
    };


    /**
     * ERROR - Terminates a transfer.
     */
    class ErrorPacket : public Packet {
    public:
        /**
         * Create an error packet.
         * @param code An error code, normally one of error_code_t.
         * @param message An error message.
         * @see default_message
         */
        ErrorPacket (uint16_t code, const std::string& message="");

        virtual opcode_t opcode () const override {
            return op_error;
        }

        uint16_t code () const {
            return err_code;
        }

        const std::string& message () const {
            return msg;
        }

        /**
         * Return the standard RFC 1350 message for an error code.
         */
        static const char* default_message (uint16_t code);

        static std::shared_ptr<ErrorPacket> parse (ByteSource& src, byte_order_t order);

        virtual std::string to_string () const override;
        virtual bool equals (const Packet& rhs) const override;


    protected:
        virtual ssize_t encode_fields (byte_order_t order, ByteSink& sink) const override;

    private:
        const uint16_t err_code;
        const std::string msg;
    };


    /**
     * Recover the opcode and byte order from the first two bytes of a packet.
     * Valid opcodes are 1 to 5, so if the value read as little endian
     * is larger than 5, the packet is in big endian byte order and the
     * opcode is in the high byte.
     * @param raw The first two bytes of the packet read as little endian.
     * @param order Set to the detected byte order.
     * @return The normalized opcode. It is not checked for validity.
     */
    uint16_t normalize_opcode (uint16_t raw, byte_order_t& order);

    /**
     * Decode a TFTP packet.
     * @param src Where to read the packet from.
     * @param order Set to the detected byte order of the packet.
     * @return The decoded packet, or <code>nullptr</code> on error with
     *         <code>errno</code> set to:
     *         <dl>
     *           <dt>EBADMSG</dt><dd>A field is truncated or unterminated.</dd>
     *           <dt>ENOMSG</dt><dd>Unknown opcode.</dd>
     *         </dl>
     *         If the source itself fails, its <code>errno</code> is kept.
     */
    std::shared_ptr<Packet> decode_packet (ByteSource& src, byte_order_t& order);

    /**
     * Decode a TFTP packet from a datagram.
     * @see decode_packet(ByteSource&,byte_order_t&)
     */
    std::shared_ptr<Packet> decode_packet (const void* buf, size_t size, byte_order_t& order);

    /**
     * Encode a TFTP packet.
     * @return The number of bytes written, or -1 on error with
     *         <code>errno</code> as set by the sink.
     */
    inline ssize_t encode_packet (const Packet& pkt, byte_order_t order, ByteSink& sink) {
        return pkt.encode (order, sink);
    }


}
#endif
