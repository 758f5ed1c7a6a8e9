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
#ifndef TFTPSTREAM_PACKETCHANNEL_HPP
#define TFTPSTREAM_PACKETCHANNEL_HPP

#include <tftpstream/Packet.hpp>
#include <memory>


namespace tftpstream {


    /**
     * A directional channel of TFTP packets.
     * A transfer talks to the outside world through two channels:
     * one where packets from the peer arrive, and one where packets
     * to the peer are sent. The same object may serve as both.
     * <br/>
     * This class can't be instantiated directly.
     */
    class PacketChannel {
    public:
        virtual ~PacketChannel () = default;

        /**
         * Send a packet.
         * @param pkt The packet to send.
         * @return 0 on success, or -1 on error with <code>errno</code> set.
         *         If the channel is closed, <code>errno</code> is
         *         set to <code>ECANCELED</code>.
         */
        virtual int send (std::shared_ptr<const Packet> pkt) = 0;

        /**
         * Wait for a packet.
         * @param timeout A timeout in milliseconds. If -1, no timeout is set.
         * @return The received packet, or <code>nullptr</code> with
         *         <code>errno</code> set to <code>ETIMEDOUT</code> if
         *         the timeout expired, <code>ECANCELED</code> if the
         *         channel is closed, or some other value on error.
         */
        virtual std::shared_ptr<const Packet> receive (unsigned timeout=-1) = 0;

        /**
         * Close the channel.
         * Blocked calls to <code>receive</code> return with
         * <code>errno</code> set to <code>ECANCELED</code>.
         */
        virtual void close () = 0;

        /**
         * Check if the channel is open.
         */
        virtual bool is_open () const = 0;
    };


}
#endif
