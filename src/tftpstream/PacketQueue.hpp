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
#ifndef TFTPSTREAM_PACKETQUEUE_HPP
#define TFTPSTREAM_PACKETQUEUE_HPP

#include <tftpstream/PacketChannel.hpp>
#include <condition_variable>
#include <mutex>
#include <deque>


namespace tftpstream {


    /**
     * An in-memory packet channel.
     * Packets sent on the queue are received in the same order.
     * Any number of threads may send and receive.
     * <br/>
     * A dispatcher normally owns one queue per direction and
     * transfer: it pushes decoded packets to the inbound queue
     * and pops the transfer's replies from the outbound queue.
     */
    class PacketQueue : public PacketChannel {
    public:
        /**
         * Create an empty, open packet queue.
         * @param capacity Maximum number of queued packets.
         *                 If 0, the queue is unbounded.
         *                 When full, <code>send</code> fails
         *                 with <code>errno</code> set to <code>ENOBUFS</code>.
         */
        explicit PacketQueue (size_t capacity=0);

        virtual ~PacketQueue ();

        virtual int send (std::shared_ptr<const Packet> pkt) override;
        virtual std::shared_ptr<const Packet> receive (unsigned timeout=-1) override;

        /**
         * Close the queue.
         * Packets already queued are discarded.
         */
        virtual void close () override;

        virtual bool is_open () const override;

        /**
         * Return the number of queued packets.
         */
        size_t size () const;


    private:
        const size_t max_size;
        bool open;
        std::deque<std::shared_ptr<const Packet>> packets;
        mutable std::mutex mutex;
        std::condition_variable cond;

        PacketQueue (const PacketQueue&) = delete;
        PacketQueue& operator= (const PacketQueue&) = delete;
    };


}
#endif
