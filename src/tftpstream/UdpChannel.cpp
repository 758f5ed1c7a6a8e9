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
#include <tftpstream/UdpChannel.hpp>
#include <tftpstream/Log.hpp>
#include <system_error>
#include <sstream>
#include <chrono>
#include <cstring>
#include <cerrno>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/socket.h>
#include <arpa/inet.h>


namespace tftpstream {


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    std::string to_string (const struct sockaddr_in& addr)
    {
        char buf[INET_ADDRSTRLEN];
        if (!inet_ntop(AF_INET, &addr.sin_addr, buf, sizeof(buf)))
            buf[0] = '\0';
        std::stringstream ss;
        ss << buf << ':' << ntohs(addr.sin_port);
        return ss.str ();
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    ssize_t send_packet_to (int sock,
                            const Packet& pkt,
                            byte_order_t order,
                            const struct sockaddr_in& addr)
    {
        auto bytes = pkt.to_bytes (order);
        return sendto (sock, bytes.data(), bytes.size(), 0,
                       reinterpret_cast<const struct sockaddr*>(&addr), sizeof(addr));
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    static bool same_addr (const struct sockaddr_in& lhs, const struct sockaddr_in& rhs)
    {
        return lhs.sin_addr.s_addr == rhs.sin_addr.s_addr &&
            lhs.sin_port == rhs.sin_port;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    UdpChannel::UdpChannel (const struct sockaddr_in& peer_addr,
                            byte_order_t order,
                            uint32_t bind_addr)
        : sock {-1},
          wakeup_fd {-1, -1},
          open {false},
          peer (peer_addr),
          byte_ord {order},
          num_dropped {0}
    {
        memset (&local, 0, sizeof(local));
        local.sin_family      = AF_INET;
        local.sin_addr.s_addr = htonl (bind_addr);
        local.sin_port        = 0;

        sock = socket (AF_INET, SOCK_DGRAM|SOCK_CLOEXEC, 0);
        if (sock < 0)
            throw std::system_error (errno, std::generic_category(), "Unable to create socket");

        socklen_t len = sizeof (local);
        if (bind(sock, reinterpret_cast<struct sockaddr*>(&local), sizeof(local)) ||
            getsockname(sock, reinterpret_cast<struct sockaddr*>(&local), &len) ||
            pipe2(wakeup_fd, O_CLOEXEC|O_NONBLOCK))
        {
            auto err = errno;
            ::close (sock);
            throw std::system_error (err, std::generic_category(), "Unable to bind socket");
        }

        open = true;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    UdpChannel::~UdpChannel ()
    {
        close ();
        ::close (sock);
        ::close (wakeup_fd[0]);
        ::close (wakeup_fd[1]);
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    int UdpChannel::send (std::shared_ptr<const Packet> pkt)
    {
        if (!open) {
            errno = ECANCELED;
            return -1;
        }
        if (!pkt) {
            errno = EINVAL;
            return -1;
        }
        if (send_packet_to(sock, *pkt, byte_ord, peer) < 0)
            return -1;
        return 0;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    std::shared_ptr<const Packet> UdpChannel::receive (unsigned timeout)
    {
        using std::chrono::steady_clock;
        using std::chrono::milliseconds;

        const bool forever = timeout == static_cast<unsigned>(-1);
        auto deadline = steady_clock::now() + milliseconds (forever ? 0 : timeout);
        uint8_t buf[max_packet_size + 1];

        while (open) {
            int wait_ms = -1;
            if (!forever) {
                auto left = std::chrono::duration_cast<milliseconds> (deadline - steady_clock::now());
                wait_ms = left.count() > 0 ? static_cast<int>(left.count()) : 0;
            }

            struct pollfd pfd[2];
            pfd[0].fd = sock;
            pfd[0].events = POLLIN;
            pfd[0].revents = 0;
            pfd[1].fd = wakeup_fd[0];
            pfd[1].events = POLLIN;
            pfd[1].revents = 0;

            auto result = poll (pfd, 2, wait_ms);
            if (result < 0) {
                if (errno == EINTR)
                    continue;
                return nullptr;
            }
            if (pfd[1].revents)
                break; // Closed
            if (result == 0) {
                errno = ETIMEDOUT;
                return nullptr;
            }

            struct sockaddr_in from;
            socklen_t len = sizeof (from);
            auto size = recvfrom (sock, buf, sizeof(buf), 0,
                                  reinterpret_cast<struct sockaddr*>(&from), &len);
            if (size < 0) {
                if (errno==EINTR || errno==EAGAIN)
                    continue;
                return nullptr;
            }

            if (!same_addr(from, peer)) {
                ++num_dropped;
                Log::info ("Datagram from unknown transfer ID %s on port %u, expected %s",
                           to_string(from).c_str(),
                           (unsigned)ntohs(local.sin_port),
                           to_string(peer).c_str());
                ErrorPacket err (err_unknown_transfer_id,
                                 ErrorPacket::default_message(err_unknown_transfer_id));
                if (send_packet_to(sock, err, byte_ord, from) < 0) {
                    Log::debug ("Unable to send error to %s: %s",
                                to_string(from).c_str(), strerror(errno));
                }
                continue;
            }

            byte_order_t order;
            auto pkt = decode_packet (buf, static_cast<size_t>(size), order);
            if (!pkt) {
                ++num_dropped;
                Log::info ("Dropping invalid TFTP packet (%ld bytes) from %s: %s",
                           (long)size, to_string(from).c_str(), strerror(errno));
                continue;
            }
            return pkt;
        }

        errno = ECANCELED;
        return nullptr;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    void UdpChannel::close ()
    {
        if (open.exchange(false)) {
            // Wake up any thread blocked in receive()
            static const char ch = 0;
            if (::write(wakeup_fd[1], &ch, 1) < 0)
                Log::debug ("Unable to wake up UDP channel receiver: %s", strerror(errno));
        }
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    bool UdpChannel::is_open () const
    {
        return open;
    }


}
