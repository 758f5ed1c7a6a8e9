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
#ifndef EXAMPLES_TFTPSTREAMD_FILE_SESSION_HPP
#define EXAMPLES_TFTPSTREAMD_FILE_SESSION_HPP

#include <tftpstream.hpp>
#include <memory>
#include <atomic>
#include <thread>
#include <string>
#include <netinet/in.h>

#include "tftpstreamd-options.hpp"


/**
 * One file transfer between the server root directory and a client.
 * The session owns a UDP channel bound to a new local port and
 * runs the transfer in its own thread.
 */
class file_session_t {
public:
    /**
     * Open the session channel.
     * @throw std::system_error If the channel socket can't be created.
     */
    file_session_t (const appargs_t& opt,
                    std::shared_ptr<const tftpstream::RequestPacket> request,
                    tftpstream::byte_order_t order,
                    const struct sockaddr_in& peer);

    /**
     * Stop the session if it is running and wait for the thread to end.
     */
    ~file_session_t ();

    /**
     * Start the transfer thread.
     */
    void start ();

    /**
     * Abort the transfer. The thread ends without notifying the peer.
     */
    void stop ();

    /**
     * Return true when the transfer thread has nothing more to do.
     */
    bool finished () const {
        return is_finished;
    }


private:
    void run ();
    void serve_rrq ();
    void serve_wrq ();
    int open_file (bool wrq, uint16_t& err_code);

    const appargs_t& opt;
    std::shared_ptr<const tftpstream::RequestPacket> request;
    const tftpstream::byte_order_t order;
    const std::string id;
    tftpstream::UdpChannel chan;
    std::thread thread;
    std::atomic_bool is_finished;

    file_session_t (const file_session_t&) = delete;
    file_session_t& operator= (const file_session_t&) = delete;
};


#endif
