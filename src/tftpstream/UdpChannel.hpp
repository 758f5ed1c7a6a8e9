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
#ifndef TFTPSTREAM_UDPCHANNEL_HPP
#define TFTPSTREAM_UDPCHANNEL_HPP

#include <tftpstream/PacketChannel.hpp>
#include <atomic>
#include <string>
#include <cstdint>
#include <netinet/in.h>


namespace tftpstream {


    /**
     * Return an IPv4 socket address as a string, "a.b.c.d:port".
     */
    std::string to_string (const struct sockaddr_in& addr);

    /**
     * Encode a packet and send it in a single datagram.
     * @param sock A datagram socket.
     * @param pkt The packet to send.
     * @param order The byte order to encode the packet with.
     * @param addr The destination.
     * @return The number of bytes sent, or -1 on error with <code>errno</code> set.
     */
    ssize_t send_packet_to (int sock,
                            const Packet& pkt,
                            byte_order_t order,
                            const struct sockaddr_in& addr);


    /**
     * A packet channel talking to one peer over UDP.
     * The channel owns a datagram socket bound to a new local port,
     * the transfer identifier (TID) of the server side of the transfer.
     * Packets are sent to the peer encoded with the byte order given
     * when the channel was created.
     * <br/>
     * Received datagrams are decoded before they are handed to the
     * caller of <code>receive</code>. Datagrams that can't be decoded
     * are logged and dropped. Datagrams from any other address than
     * the peer are answered with ERROR 5 (Unknown transfer ID) and
     * dropped.
     * <br/>
     * The channel is used for both directions of a transfer.
     * <code>close</code> may be called from any thread.
     */
    class UdpChannel : public PacketChannel {
    public:
        /**
         * Open a channel to a peer.
         * @param peer The address of the peer.
         * @param order The byte order of outgoing packets.
         * @param bind_addr Local address to bind the socket to.
         *                  The port is ignored, a free port is chosen.
         * @throw std::system_error If the socket can't be created.
         */
        UdpChannel (const struct sockaddr_in& peer,
                    byte_order_t order,
                    uint32_t bind_addr=INADDR_ANY);

        virtual ~UdpChannel ();

        virtual int send (std::shared_ptr<const Packet> pkt) override;
        virtual std::shared_ptr<const Packet> receive (unsigned timeout=-1) override;
        virtual void close () override;
        virtual bool is_open () const override;

        /**
         * The local address of the socket.
         */
        const struct sockaddr_in& local_addr () const {
            return local;
        }

        const struct sockaddr_in& peer_addr () const {
            return peer;
        }

        byte_order_t order () const {
            return byte_ord;
        }

        /**
         * Number of dropped datagrams, malformed or from an unknown address.
         */
        unsigned dropped () const {
            return num_dropped;
        }


    private:
        int sock;
        int wakeup_fd[2];
        std::atomic_bool open;
        struct sockaddr_in peer;
        struct sockaddr_in local;
        const byte_order_t byte_ord;
        std::atomic_uint num_dropped;

        UdpChannel (const UdpChannel&) = delete;
        UdpChannel& operator= (const UdpChannel&) = delete;
    };


}
#endif
