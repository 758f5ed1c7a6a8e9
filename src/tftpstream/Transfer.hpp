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
#ifndef TFTPSTREAM_TRANSFER_HPP
#define TFTPSTREAM_TRANSFER_HPP

#include <tftpstream/types.hpp>
#include <tftpstream/Packet.hpp>
#include <tftpstream/PacketChannel.hpp>
#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <cstdint>
#include <unistd.h>


namespace tftpstream {


    /**
     * Transfer settings.
     */
    struct TransferConfig {
        /**
         * Largest accepted value of <code>timeout</code>.
         */
        static constexpr unsigned max_timeout = 60000;

        /**
         * Time in milliseconds to wait for the expected packet before
         * the last packet is resent. The wait grows with one timeout
         * for each retry. Must be between 1 and <code>max_timeout</code>.
         */
        unsigned timeout {500};

        /**
         * Number of times the last packet is resent before
         * the transfer is given up.
         */
        unsigned max_retries {10};

        /**
         * Maximum number of bytes accepted by a write transfer.
         * 0 means no limit.
         */
        size_t max_size {0};
    };


    /**
     * Base class for a single TFTP transfer.
     * A transfer communicates with the peer only through two packet
     * channels: <code>in</code> delivers the packets received from
     * the peer, and <code>out</code> takes the packets to send to the
     * peer. Packets are exchanged with a window size of one, each DATA
     * block must be acknowledged before the next one is sent.
     * <br/>
     * A transfer is used by a single thread. It holds no locks, the
     * channels are the only objects shared with the outside world.
     * <br/>
     * When a transfer fails it stops using the channels, and every
     * following operation fails with the <code>errno</code> value that
     * ended the transfer:
     * <dl>
     *   <dt>EPROTO</dt><dd>The peer sent an illegal packet.</dd>
     *   <dt>ETIMEDOUT</dt><dd>No answer from the peer after all retries.</dd>
     *   <dt>ECONNABORTED</dt><dd>The peer sent an ERROR packet.</dd>
     *   <dt>ECANCELED</dt><dd>A channel was closed, or the transfer was
     *                         ended by <code>respond_error</code>.</dd>
     *   <dt>EFBIG</dt><dd>The size limit of a write transfer was exceeded.</dd>
     * </dl>
     */
    class Transfer {
    public:
        /**
         * Transfer states.
         */
        enum state_t {
            awaiting_ack_or_write, /**< Read transfer, ready to accept data to send. */
            sending_block,         /**< Read transfer, a DATA block is being sent. */
            awaiting_ack,          /**< Read transfer, waiting for the ACK of the last block. */
            awaiting_data,         /**< Write transfer, waiting for the next DATA block. */
            ack_sent,              /**< Write transfer, the last DATA block is acknowledged. */
            done,                  /**< The last block is sent/received and acknowledged. */
            failed                 /**< The transfer was terminated by an error. */
        };

        virtual ~Transfer () = default;

        /**
         * Send an ERROR packet to the peer and terminate the transfer.
         * The transfer can't be resumed after this.
         * @param code An error code, normally one of error_code_t.
         * @param message An error message. If empty, the standard
         *                message for the error code is used.
         * @return 0 if the ERROR packet was sent, otherwise -1 with
         *         <code>errno</code> set. If the transfer is already
         *         terminated nothing is sent. A failed transfer keeps its
         *         error, a completed transfer fails with EPIPE and stays
         *         done.
         */
        int respond_error (uint16_t code, const std::string& message="");

        const std::string& filename () const {
            return rq_filename;
        }

        const std::string& mode () const {
            return rq_mode;
        }

        /**
         * The byte order of the request, used for all packets in this transfer.
         */
        byte_order_t order () const {
            return byte_ord;
        }

        state_t state () const {
            return cur_state;
        }

        bool is_done () const {
            return cur_state == done;
        }

        bool is_failed () const {
            return cur_state == failed;
        }

        /**
         * The <code>errno</code> value that terminated the transfer, or 0.
         */
        int error () const {
            return errnum;
        }

        /**
         * The number of the last block sent (read transfer)
         * or received (write transfer).
         */
        uint16_t block () const {
            return block_num;
        }

        /**
         * Number of payload bytes acknowledged so far.
         */
        size_t bytes_transferred () const {
            return total_bytes;
        }

        /**
         * A name of the transfer used in log messages.
         */
        const std::string& id () const {
            return sess_id;
        }


    protected:
        Transfer (PacketChannel& in,
                  PacketChannel& out,
                  const RequestPacket& request,
                  byte_order_t order,
                  const TransferConfig& cfg,
                  const std::string& id);

        /**
         * Send a packet and remember it for retransmission.
         * If the channel fails the transfer is terminated.
         */
        int send_packet (std::shared_ptr<const Packet> pkt);

        /**
         * Resend the last packet sent by <code>send_packet</code>, if any.
         */
        int resend_last ();

        /**
         * Wait for the next packet from the peer, but not past the deadline.
         * Returns <code>nullptr</code> with <code>errno</code> set to
         * <code>ETIMEDOUT</code> when the deadline is reached.
         */
        std::shared_ptr<const Packet> receive_until (std::chrono::steady_clock::time_point deadline);

        /**
         * The point in time where waiting for an answer is given up,
         * based on the number of retries so far.
         */
        std::chrono::steady_clock::time_point next_deadline (unsigned retry_count) const;

        /**
         * Terminate the transfer without sending anything to the peer.
         * @return -1, with <code>errno</code> set to <code>err</code>.
         */
        int fail (int err);

        /**
         * Send an ERROR packet and terminate the transfer.
         * @return -1, with <code>errno</code> set to <code>err</code>.
         */
        int send_error_and_fail (uint16_t code, const std::string& message, int err);

        /**
         * Terminate the transfer because the peer sent an ERROR packet.
         */
        int handle_peer_error (const Packet& pkt);

        /**
         * Return -1 with <code>errno</code> set if the transfer is terminated.
         */
        int check_failed ();

        PacketChannel& in;
        PacketChannel& out;
        const TransferConfig cfg;
        state_t cur_state;
        uint16_t block_num;
        size_t total_bytes;


    private:
        const std::string rq_filename;
        const std::string rq_mode;
        const byte_order_t byte_ord;
        const std::string sess_id;
        int errnum;
        std::shared_ptr<const Packet> last_sent;

        Transfer (const Transfer&) = delete;
        Transfer& operator= (const Transfer&) = delete;
    };


    /**
     * A transfer serving a read request (RRQ).
     * The file content is written to the transfer, which sends it to
     * the peer in DATA blocks. <code>write</code> and <code>finish</code>
     * block while waiting for the peer to acknowledge a block.
     */
    class ReadTransfer : public Transfer {
    public:
        /**
         * Create a read transfer. Nothing is sent until data is written.
         * @param in Packets from the peer.
         * @param out Packets to the peer.
         * @param request The read request.
         * @param order The byte order of the read request.
         * @param cfg Transfer settings.
         * @param id A name of the transfer used in log messages.
         *           If empty, the file name is used.
         * @throw std::invalid_argument If <code>cfg.timeout</code> is
         *                              out of range.
         */
        ReadTransfer (PacketChannel& in,
                      PacketChannel& out,
                      const ReadRequestPacket& request,
                      byte_order_t order,
                      const TransferConfig& cfg=TransferConfig(),
                      const std::string& id="");

        /**
         * Write file data to the peer.
         * Data is buffered until a full block can be sent. For every full
         * block the call blocks until the peer has acknowledged it.
         * ACKs for other blocks and other packet types received while
         * waiting are ignored.
         * @param buf The data to send.
         * @param size The number of bytes to send.
         * @return <code>size</code> on success, or -1 on error with
         *         <code>errno</code> set. Writing after <code>finish</code>
         *         fails with <code>errno</code> set to <code>EPIPE</code>.
         */
        ssize_t write (const void* buf, size_t size);

        /**
         * Signal the end of the file.
         * Sends the last, short, block (it is empty if the file size is a
         * multiple of the block size) and waits for it to be acknowledged.
         * @return 0 when the transfer is done, or -1 on error
         *         with <code>errno</code> set.
         */
        int finish ();


    private:
        int send_block ();
        int wait_for_ack ();

        std::vector<uint8_t> buf;
    };


    /**
     * A transfer serving a write request (WRQ).
     * File data received from the peer is read from the transfer.
     * <code>read</code> blocks while waiting for a DATA block.
     */
    class WriteTransfer : public Transfer {
    public:
        /**
         * Create a write transfer.
         * @param in Packets from the peer.
         * @param out Packets to the peer.
         * @param request The write request.
         * @param order The byte order of the write request.
         * @param cfg Transfer settings.
         * @param id A name of the transfer used in log messages.
         *           If empty, the file name is used.
         * @throw std::invalid_argument If <code>cfg.timeout</code> is
         *                              out of range.
         */
        WriteTransfer (PacketChannel& in,
                       PacketChannel& out,
                       const WriteRequestPacket& request,
                       byte_order_t order,
                       const TransferConfig& cfg=TransferConfig(),
                       const std::string& id="");

        /**
         * Accept the write request by sending ACK #0.
         * @return 0 on success, or -1 on error with <code>errno</code> set.
         */
        int accept ();

        /**
         * Read file data sent by the peer.
         * If no data is buffered the call blocks until the next DATA block
         * arrives. Once some data is available the call returns without
         * blocking again, but blocks already waiting in the inbound
         * channel are consumed to fill the buffer.
         * @param buf Where to store the data.
         * @param size The maximum number of bytes to read.
         * @return The number of bytes read, 0 at the end of the file,
         *         or -1 on error with <code>errno</code> set.
         */
        ssize_t read (void* buf, size_t size);


    private:
        int receive_block (bool wait);
        int handle_packet (const Packet& pkt);
        int handle_new_block (const DataPacket& dat);

        std::vector<uint8_t> data;
        size_t data_pos;
    };


}
#endif
