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
#include <tftpstream/Packet.hpp>
#include <stdexcept>
#include <sstream>
#include <cstring>
#include <cerrno>


namespace tftpstream {


    //--------------------------------------------------------------------------
    // Write all bytes to the sink.
    //--------------------------------------------------------------------------
    static ssize_t write_all (ByteSink& sink, const void* buf, size_t size)
    {
        auto* pos = static_cast<const uint8_t*> (buf);
        size_t left = size;
        while (left) {
            auto result = sink.write (pos, left);
            if (result < 0)
                return -1;
            if (result == 0) {
                errno = EIO;
                return -1;
            }
            pos  += result;
            left -= result;
        }
        return static_cast<ssize_t> (size);
    }


    //--------------------------------------------------------------------------
    // Read until 'size' bytes are read or the source is exhausted.
    //--------------------------------------------------------------------------
    static ssize_t read_all (ByteSource& src, void* buf, size_t size)
    {
        auto* pos = static_cast<uint8_t*> (buf);
        size_t total = 0;
        while (total < size) {
            auto result = src.read (pos+total, size-total);
            if (result < 0)
                return -1;
            if (result == 0)
                break;
            total += result;
        }
        return static_cast<ssize_t> (total);
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    static ssize_t write_u16 (ByteSink& sink, byte_order_t order, uint16_t value)
    {
        uint8_t bytes[2];
        if (order == big_endian) {
            bytes[0] = static_cast<uint8_t> (value >> 8);
            bytes[1] = static_cast<uint8_t> (value & 0xff);
        }else{
            bytes[0] = static_cast<uint8_t> (value & 0xff);
            bytes[1] = static_cast<uint8_t> (value >> 8);
        }
        return write_all (sink, bytes, sizeof(bytes));
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    static int read_u16 (ByteSource& src, byte_order_t order, uint16_t& value)
    {
        uint8_t bytes[2];
        auto result = read_all (src, bytes, sizeof(bytes));
        if (result < 0)
            return -1;
        if (result != sizeof(bytes)) {
            errno = EBADMSG;
            return -1;
        }
        if (order == big_endian)
            value = static_cast<uint16_t> ((bytes[0] << 8) | bytes[1]);
        else
            value = static_cast<uint16_t> ((bytes[1] << 8) | bytes[0]);
        return 0;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    static ssize_t write_string (ByteSink& sink, const std::string& str)
    {
        static const uint8_t nul = 0;
        if (!str.empty() && write_all(sink, str.data(), str.size()) < 0)
            return -1;
        if (write_all(sink, &nul, 1) < 0)
            return -1;
        return static_cast<ssize_t> (str.size() + 1);
    }


    //--------------------------------------------------------------------------
    // Read a NUL terminated string, one byte at a time.
    //--------------------------------------------------------------------------
    static int read_string (ByteSource& src, std::string& str)
    {
        str.clear ();
        for (;;) {
            char ch;
            auto result = src.read (&ch, 1);
            if (result < 0)
                return -1;
            if (result == 0) {
                // End of input before the terminating NUL
                errno = EBADMSG;
                return -1;
            }
            if (ch == '\0')
                return 0;
            str.push_back (ch);
        }
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    static std::string cut_at_nul (const std::string& str)
    {
        auto pos = str.find ('\0');
        return pos == std::string::npos ? str : str.substr (0, pos);
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    ssize_t Packet::encode (byte_order_t order, ByteSink& sink) const
    {
        if (write_u16(sink, order, opcode()) < 0)
            return -1;
        auto result = encode_fields (order, sink);
        if (result < 0)
            return -1;
        return static_cast<ssize_t> (sizeof(uint16_t)) + result;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    std::vector<uint8_t> Packet::to_bytes (byte_order_t order) const
    {
        BufferSink sink;
        encode (order, sink); // A BufferSink never fails
        return std::move (sink.data());
    }



    //
    //  R R Q  /  W R Q
    //


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    RequestPacket::RequestPacket (const std::string& filename, const std::string& mode)
        : fname {cut_at_nul(filename)},
          fmode {cut_at_nul(mode)}
    {
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    ssize_t RequestPacket::encode_fields (byte_order_t order, ByteSink& sink) const
    {
        auto len1 = write_string (sink, fname);
        if (len1 < 0)
            return -1;
        auto len2 = write_string (sink, fmode);
        if (len2 < 0)
            return -1;
        return len1 + len2;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    int RequestPacket::parse_fields (ByteSource& src,
                                     std::string& filename,
                                     std::string& mode)
    {
        if (read_string(src, filename))
            return -1;
        return read_string (src, mode);
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    std::string RequestPacket::to_string () const
    {
        std::stringstream ss;
        ss << (opcode()==op_rrq ? "RRQ" : "WRQ") << " '" << fname << "' (" << fmode << ')';
        return ss.str ();
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    bool RequestPacket::equals (const Packet& rhs) const
    {
        if (rhs.opcode() != opcode())
            return false;
        auto& rq = static_cast<const RequestPacket&> (rhs);
        return fname == rq.fname && fmode == rq.fmode;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    std::shared_ptr<ReadRequestPacket> ReadRequestPacket::parse (ByteSource& src,
                                                                 byte_order_t order)
    {
        std::string filename;
        std::string mode;
        if (parse_fields(src, filename, mode))
            return nullptr;
        return std::make_shared<ReadRequestPacket> (filename, mode);
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    std::shared_ptr<WriteRequestPacket> WriteRequestPacket::parse (ByteSource& src,
                                                                   byte_order_t order)
    {
        std::string filename;
        std::string mode;
        if (parse_fields(src, filename, mode))
            return nullptr;
        return std::make_shared<WriteRequestPacket> (filename, mode);
    }



    //
    //  D A T A
    //


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    DataPacket::DataPacket (uint16_t block, std::vector<uint8_t> payload)
        : block_num {block},
          data {std::move(payload)}
    {
        if (data.size() > data_block_size)
            throw std::invalid_argument ("DATA payload larger than 512 bytes");
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    DataPacket::DataPacket (uint16_t block, const void* buf, size_t size)
        : DataPacket (block,
                      buf ? std::vector<uint8_t> (static_cast<const uint8_t*>(buf),
                                                  static_cast<const uint8_t*>(buf) + size)
                          : std::vector<uint8_t> ())
    {
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    ssize_t DataPacket::encode_fields (byte_order_t order, ByteSink& sink) const
    {
        if (write_u16(sink, order, block_num) < 0)
            return -1;
        if (!data.empty() && write_all(sink, data.data(), data.size()) < 0)
            return -1;
        return static_cast<ssize_t> (sizeof(block_num) + data.size());
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    std::shared_ptr<DataPacket> DataPacket::parse (ByteSource& src, byte_order_t order)
    {
        uint16_t block;
        if (read_u16(src, order, block))
            return nullptr;

        std::vector<uint8_t> payload (data_block_size);
        auto len = read_all (src, payload.data(), payload.size());
        if (len < 0)
            return nullptr;
        payload.resize (len);

        return std::make_shared<DataPacket> (block, std::move(payload));
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    std::string DataPacket::to_string () const
    {
        std::stringstream ss;
        ss << "DATA #" << block_num << " (" << data.size() << " bytes)";
        return ss.str ();
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    bool DataPacket::equals (const Packet& rhs) const
    {
        if (rhs.opcode() != op_data)
            return false;
        auto& dat = static_cast<const DataPacket&> (rhs);
        return block_num == dat.block_num && data == dat.data;
    }



    //
    //  A C K
    //


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    ssize_t AckPacket::encode_fields (byte_order_t order, ByteSink& sink) const
    {
        return write_u16 (sink, order, block_num);
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    std::shared_ptr<AckPacket> AckPacket::parse (ByteSource& src, byte_order_t order)
    {
        uint16_t block;
        if (read_u16(src, order, block))
            return nullptr;
        return std::make_shared<AckPacket> (block);
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    std::string AckPacket::to_string () const
    {
        return std::string ("ACK #") + std::to_string (block_num);
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    bool AckPacket::equals (const Packet& rhs) const
    {
        return rhs.opcode() == op_ack &&
            static_cast<const AckPacket&>(rhs).block_num == block_num;
    }



    //
    //  E R R O R
    //


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    ErrorPacket::ErrorPacket (uint16_t code, const std::string& message)
        : err_code {code},
          msg {cut_at_nul(message)}
    {
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    const char* ErrorPacket::default_message (uint16_t code)
    {
        switch (code) {
        case err_file_not_found:
            return "File not found";
        case err_access_violation:
            return "Access violation";
        case err_disk_full:
            return "Disk full or allocation exceeded";
        case err_illegal_operation:
            return "Illegal TFTP operation";
        case err_unknown_transfer_id:
            return "Unknown transfer ID";
        case err_file_exists:
            return "File already exists";
        case err_no_such_user:
            return "No such user";
        default:
            return "Not defined";
        }
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    ssize_t ErrorPacket::encode_fields (byte_order_t order, ByteSink& sink) const
    {
        if (write_u16(sink, order, err_code) < 0)
            return -1;
        auto len = write_string (sink, msg);
        if (len < 0)
            return -1;
        return static_cast<ssize_t> (sizeof(err_code)) + len;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    std::shared_ptr<ErrorPacket> ErrorPacket::parse (ByteSource& src, byte_order_t order)
    {
        uint16_t code;
        std::string message;
        if (read_u16(src, order, code) || read_string(src, message))
            return nullptr;
        return std::make_shared<ErrorPacket> (code, message);
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    std::string ErrorPacket::to_string () const
    {
        std::stringstream ss;
        ss << "ERROR " << err_code << " (" << msg << ')';
        return ss.str ();
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    bool ErrorPacket::equals (const Packet& rhs) const
    {
        if (rhs.opcode() != op_error)
            return false;
        auto& err = static_cast<const ErrorPacket&> (rhs);
        return err_code == err.err_code && msg == err.msg;
    }



    //
    //  D E C O D E R
    //


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    uint16_t normalize_opcode (uint16_t raw, byte_order_t& order)
    {
        if (raw > op_error) {
            // Wrong guess, the opcode is in the high byte
            order = big_endian;
            return raw >> 8;
        }
        order = little_endian;
        return raw;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    std::shared_ptr<Packet> decode_packet (ByteSource& src, byte_order_t& order)
    {
        uint16_t raw;
        if (read_u16(src, little_endian, raw))
            return nullptr;

        byte_order_t detected_order;
        auto opcode = normalize_opcode (raw, detected_order);

        std::shared_ptr<Packet> pkt;
        switch (opcode) {
        case op_rrq:
            pkt = ReadRequestPacket::parse (src, detected_order);
            break;
        case op_wrq:
            pkt = WriteRequestPacket::parse (src, detected_order);
            break;
        case op_data:
            pkt = DataPacket::parse (src, detected_order);
            break;
        case op_ack:
            pkt = AckPacket::parse (src, detected_order);
            break;
        case op_error:
            pkt = ErrorPacket::parse (src, detected_order);
            break;
        default:
            errno = ENOMSG;
            return nullptr;
        }

        if (pkt)
            order = detected_order;
        return pkt;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    std::shared_ptr<Packet> decode_packet (const void* buf, size_t size, byte_order_t& order)
    {
        BufferSource src (buf, size);
        return decode_packet (src, order);
    }


}
