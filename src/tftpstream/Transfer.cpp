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
#include <tftpstream/Transfer.hpp>
#include <tftpstream/Log.hpp>
#include <algorithm>
#include <stdexcept>
#include <cstring>
#include <cerrno>


namespace tftpstream {


    using steady_clock = std::chrono::steady_clock;


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    Transfer::Transfer (PacketChannel& in,
                        PacketChannel& out,
                        const RequestPacket& request,
                        byte_order_t order,
                        const TransferConfig& cfg,
                        const std::string& id)
        : in {in},
          out {out},
          cfg {cfg},
          block_num {0},
          total_bytes {0},
          rq_filename {request.filename()},
          rq_mode {request.mode()},
          byte_ord {order},
          sess_id {id.empty() ? request.filename() : id},
          errnum {0}
    {
        if (cfg.timeout==0 || cfg.timeout>TransferConfig::max_timeout)
            throw std::invalid_argument ("Invalid transfer timeout");

        if (request.opcode() == op_rrq)
            cur_state = awaiting_ack_or_write;
        else
            cur_state = awaiting_data;

        Log::info ("%s transfer %s, file '%s', mode %s, %s",
                   (request.opcode()==op_rrq ? "RRQ" : "WRQ"),
                   sess_id.c_str(),
                   rq_filename.c_str(),
                   rq_mode.c_str(),
                   to_string(byte_ord));
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    int Transfer::respond_error (uint16_t code, const std::string& message)
    {
        if (check_failed())
            return -1;
        if (cur_state == done) {
            errno = EPIPE;
            return -1;
        }

        std::string msg = message.empty() ? ErrorPacket::default_message(code) : message;
        Log::info ("Transfer %s, abort with error %u (%s)",
                   sess_id.c_str(), (unsigned)code, msg.c_str());

        auto result = out.send (std::make_shared<ErrorPacket>(code, msg));
        auto send_errno = errno;

        cur_state = failed;
        errnum = ECANCELED;

        errno = send_errno;
        return result;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    int Transfer::send_packet (std::shared_ptr<const Packet> pkt)
    {
        if (out.send(pkt)) {
            auto err = errno;
            Log::info ("Transfer %s, unable to send %s: %s",
                       sess_id.c_str(), pkt->to_string().c_str(), strerror(err));
            return fail (err);
        }
        last_sent = std::move (pkt);
        return 0;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    int Transfer::resend_last ()
    {
        if (!last_sent)
            return 0;
        Log::debug ("Transfer %s, resend %s",
                    sess_id.c_str(), last_sent->to_string().c_str());
        return send_packet (last_sent);
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    steady_clock::time_point Transfer::next_deadline (unsigned retry_count) const
    {
        // Increase the timeout with one period for each retry
        unsigned periods = retry_count ? retry_count : 1;
        return steady_clock::now() + std::chrono::milliseconds (
                static_cast<std::chrono::milliseconds::rep>(cfg.timeout) * periods);
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    std::shared_ptr<const Packet> Transfer::receive_until (steady_clock::time_point deadline)
    {
        auto now = steady_clock::now ();
        if (now >= deadline) {
            errno = ETIMEDOUT;
            return nullptr;
        }
        auto left = std::chrono::duration_cast<std::chrono::milliseconds> (deadline - now);
        // Round up so we never wake up just before the deadline.
        // -1 means wait forever, keep below it.
        auto ms = std::min<std::chrono::milliseconds::rep> (left.count() + 1, 0x7fffffff);
        return in.receive (static_cast<unsigned>(ms));
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    int Transfer::fail (int err)
    {
        cur_state = failed;
        errnum = err;
        errno = err;
        return -1;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    int Transfer::send_error_and_fail (uint16_t code, const std::string& message, int err)
    {
        std::string msg = message.empty() ? ErrorPacket::default_message(code) : message;
        if (out.send(std::make_shared<ErrorPacket>(code, msg))) {
            Log::debug ("Transfer %s, unable to send error %u: %s",
                        sess_id.c_str(), (unsigned)code, strerror(errno));
        }
        return fail (err);
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    int Transfer::handle_peer_error (const Packet& pkt)
    {
        Log::info ("Transfer %s, %s received, stop transfer",
                   sess_id.c_str(), pkt.to_string().c_str());
        return fail (ECONNABORTED);
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    int Transfer::check_failed ()
    {
        if (cur_state == failed) {
            errno = errnum;
            return -1;
        }
        return 0;
    }



    //
    //   R R Q
    //


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    ReadTransfer::ReadTransfer (PacketChannel& in,
                                PacketChannel& out,
                                const ReadRequestPacket& request,
                                byte_order_t order,
                                const TransferConfig& cfg,
                                const std::string& id)
        : Transfer (in, out, request, order, cfg, id)
    {
        buf.reserve (data_block_size);
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    ssize_t ReadTransfer::write (const void* data, size_t size)
    {
        if (check_failed())
            return -1;
        if (cur_state == done) {
            errno = EPIPE;
            return -1;
        }
        if (!data && size) {
            errno = EINVAL;
            return -1;
        }

        auto* pos = static_cast<const uint8_t*> (data);
        size_t left = size;
        while (left) {
            auto len = std::min (left, data_block_size - buf.size());
            buf.insert (buf.end(), pos, pos+len);
            pos  += len;
            left -= len;

            if (buf.size() == data_block_size) {
                if (send_block())
                    return -1;
            }
        }
        return static_cast<ssize_t> (size);
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    int ReadTransfer::finish ()
    {
        if (check_failed())
            return -1;
        if (cur_state == done)
            return 0;

        // The buffer always holds less than a full block here
        return send_block ();
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    int ReadTransfer::send_block ()
    {
        ++block_num; // Wraps to 0 after 65535

        cur_state = sending_block;
        auto pkt = std::make_shared<DataPacket> (block_num, std::move(buf));
        buf.clear ();
        buf.reserve (data_block_size);

        if (send_packet(pkt))
            return -1;

        cur_state = awaiting_ack;
        if (wait_for_ack())
            return -1;

        total_bytes += pkt->payload().size ();
        if (pkt->is_last_block()) {
            Log::debug ("Transfer %s done, %lu bytes sent in %u blocks",
                        id().c_str(), (unsigned long)total_bytes, (unsigned)block_num);
            cur_state = done;
        }else{
            cur_state = awaiting_ack_or_write;
        }
        return 0;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    int ReadTransfer::wait_for_ack ()
    {
        unsigned retry_count = 0;

        for (;;) {
            auto deadline = next_deadline (retry_count);

            std::shared_ptr<const Packet> pkt;
            while ((pkt = receive_until(deadline))) {
                if (pkt->opcode() == op_ack) {
                    auto ack_block = static_cast<const AckPacket&>(*pkt).block ();
                    if (ack_block == block_num)
                        return 0;
                    Log::debug ("Transfer %s, ignoring ACK #%u while waiting for ACK #%u",
                                id().c_str(), (unsigned)ack_block, (unsigned)block_num);
                }
                else if (pkt->opcode() == op_error) {
                    return handle_peer_error (*pkt);
                }else{
                    Log::debug ("Transfer %s, ignoring %s while waiting for ACK #%u",
                                id().c_str(), pkt->to_string().c_str(), (unsigned)block_num);
                }
            }

            if (errno != ETIMEDOUT) {
                auto err = errno;
                Log::info ("Transfer %s, error waiting for ACK #%u: %s",
                           id().c_str(), (unsigned)block_num, strerror(err));
                return fail (err);
            }

            if (++retry_count > cfg.max_retries) {
                Log::info ("Transfer %s, timeout waiting for ACK #%u, stop transfer",
                           id().c_str(), (unsigned)block_num);
                return send_error_and_fail (err_undefined, "Transmit timeout", ETIMEDOUT);
            }
            if (resend_last())
                return -1;
        }
    }



    //
    //   W R Q
    //


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    WriteTransfer::WriteTransfer (PacketChannel& in,
                                  PacketChannel& out,
                                  const WriteRequestPacket& request,
                                  byte_order_t order,
                                  const TransferConfig& cfg,
                                  const std::string& id)
        : Transfer (in, out, request, order, cfg, id),
          data_pos {0}
    {
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    int WriteTransfer::accept ()
    {
        if (check_failed())
            return -1;
        if (cur_state!=awaiting_data || block_num!=0) {
            errno = EINVAL;
            return -1;
        }
        return send_packet (std::make_shared<AckPacket>(0));
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    ssize_t WriteTransfer::read (void* buf, size_t size)
    {
        if (check_failed())
            return -1;
        if (!buf && size) {
            errno = EINVAL;
            return -1;
        }

        auto* pos = static_cast<uint8_t*> (buf);
        size_t total = 0;

        while (total < size) {
            if (data_pos == data.size()) {
                data.clear ();
                data_pos = 0;
                if (cur_state == done)
                    break;

                // Only block if nothing is read yet
                auto result = receive_block (total == 0);
                if (result < 0) {
                    if (total)
                        break; // Report the error on the next call
                    return -1;
                }
                if (result == 0)
                    break;
                continue;
            }

            auto len = std::min (size - total, data.size() - data_pos);
            memcpy (pos+total, data.data()+data_pos, len);
            data_pos += len;
            total    += len;
        }

        return static_cast<ssize_t> (total);
    }


    //--------------------------------------------------------------------------
    // Returns 1 if a new block is buffered, 0 if 'wait' is false and no
    // block is waiting in the inbound channel, and -1 on error.
    //--------------------------------------------------------------------------
    int WriteTransfer::receive_block (bool wait)
    {
        if (!wait) {
            std::shared_ptr<const Packet> pkt;
            while ((pkt = in.receive(0))) {
                auto result = handle_packet (*pkt);
                if (result)
                    return result;
            }
            if (errno == ETIMEDOUT)
                return 0;
            return fail (errno);
        }

        unsigned retry_count = 0;
        for (;;) {
            auto deadline = next_deadline (retry_count);

            std::shared_ptr<const Packet> pkt;
            while ((pkt = receive_until(deadline))) {
                auto result = handle_packet (*pkt);
                if (result)
                    return result;
            }

            if (errno != ETIMEDOUT) {
                auto err = errno;
                Log::info ("Transfer %s, error waiting for block #%u: %s",
                           id().c_str(), (unsigned)(uint16_t)(block_num+1), strerror(err));
                return fail (err);
            }

            if (++retry_count > cfg.max_retries) {
                Log::info ("Transfer %s, timeout waiting for block #%u, stop transfer",
                           id().c_str(), (unsigned)(uint16_t)(block_num+1));
                return send_error_and_fail (err_undefined, "Receive timeout", ETIMEDOUT);
            }
            if (resend_last())
                return -1;
        }
    }


    //--------------------------------------------------------------------------
    // Returns 1 if a new block is buffered, 0 if the packet was
    // a stray DATA block, and -1 if the transfer is terminated.
    //--------------------------------------------------------------------------
    int WriteTransfer::handle_packet (const Packet& pkt)
    {
        switch (pkt.opcode()) {
        case op_data:
            break;

        case op_error:
            return handle_peer_error (pkt);

        default:
            Log::info ("Transfer %s, invalid TFTP opcode %d received",
                       id().c_str(), (int)pkt.opcode());
            return send_error_and_fail (err_illegal_operation, "", EPROTO);
        }

        auto& dat = static_cast<const DataPacket&> (pkt);
        uint16_t expected_block = block_num + 1;

        if (dat.block() != expected_block) {
            // Duplicate or out of order, acknowledge the last block we have
            Log::debug ("Transfer %s, got block #%u while expecting #%u, resend ACK #%u",
                        id().c_str(), (unsigned)dat.block(),
                        (unsigned)expected_block, (unsigned)block_num);
            if (send_packet(std::make_shared<AckPacket>(block_num)))
                return -1;
            return 0;
        }

        return handle_new_block (dat) ? -1 : 1;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    int WriteTransfer::handle_new_block (const DataPacket& dat)
    {
        auto& payload = dat.payload ();

        if (cfg.max_size && (total_bytes + payload.size()) > cfg.max_size) {
            Log::info ("Transfer %s, max file size exceeded", id().c_str());
            return send_error_and_fail (err_disk_full, "", EFBIG);
        }

        ++block_num;
        data.insert (data.end(), payload.begin(), payload.end());
        total_bytes += payload.size ();

        if (send_packet(std::make_shared<AckPacket>(block_num)))
            return -1;

        if (dat.is_last_block()) {
            Log::debug ("Transfer %s done, %lu bytes received in %u blocks",
                        id().c_str(), (unsigned long)total_bytes, (unsigned)block_num);
            cur_state = done;
        }else{
            cur_state = ack_sent;
        }
        return 0;
    }


}
