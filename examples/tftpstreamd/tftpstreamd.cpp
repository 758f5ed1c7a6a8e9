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
#include <tftpstream.hpp>
#include <iostream>
#include <list>
#include <memory>
#include <system_error>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <cerrno>
#include <unistd.h>
#include <poll.h>
#include <syslog.h>
#include <sys/types.h>
#include <sys/socket.h>
#include <arpa/inet.h>

#include "tftpstreamd-options.hpp"
#include "file-session.hpp"

using std::cout;
using std::endl;

namespace tftp = tftpstream;


// How often the listener checks for a stop signal
static constexpr int listen_poll_interval = 250; // milliseconds


struct appstate_t {
    appstate_t (const appargs_t& appargs)
        : opt (appargs),
          sock (-1)
    {
    }

    const appargs_t& opt;
    std::string real_tftproot;
    int sock;
    std::list<std::unique_ptr<file_session_t>> sessions;

    static volatile sig_atomic_t server_done;
};
volatile sig_atomic_t appstate_t::server_done = 0;




//------------------------------------------------------------------------------
//------------------------------------------------------------------------------
static void cmd_signal_handler (int sig)
{
    // Signal the TFTP server to stop
    appstate_t::server_done = 1;
}


//------------------------------------------------------------------------------
//------------------------------------------------------------------------------
static void init_signal_handler ()
{
    struct sigaction sa;
    memset (&sa, 0, sizeof(sa));
    sigemptyset (&sa.sa_mask);
    sa.sa_handler = cmd_signal_handler;
    sigaction (SIGINT, &sa, nullptr);
    sigaction (SIGTERM, &sa, nullptr);
}


//------------------------------------------------------------------------------
//------------------------------------------------------------------------------
static void stdout_logger (unsigned prio, const char* msg)
{
    cout << '[' << gettid() << "] ";
    switch (prio) {
    case LOG_EMERG:
        cout << "EMERG: ";
        break;
    case LOG_ALERT:
        cout << "ALERT: ";
        break;
    case LOG_CRIT:
        cout << "CRIT: ";
        break;
    case LOG_ERR:
        cout << "ERROR: ";
        break;
    case LOG_WARNING:
        cout << "WARNING: ";
        break;
    case LOG_NOTICE:
        cout << "NOTICE: ";
        break;
    case LOG_INFO:
        cout << "INFO: ";
        break;
    case LOG_DEBUG:
        cout << "DEBUG: ";
        break;
    }
    cout << msg << endl;
}


//------------------------------------------------------------------------------
//------------------------------------------------------------------------------
static int set_tftproot (appstate_t& app)
{
    // Get the canonical server root path
    //
    auto* path = realpath (app.opt.tftproot.c_str(), nullptr);
    if (path) {
        app.real_tftproot = path;
        app.real_tftproot.append ("/");
        free (path);
    }else{
        return -1;
    }

    return chdir (app.real_tftproot.c_str());
}


//------------------------------------------------------------------------------
//------------------------------------------------------------------------------
static int open_listener (appstate_t& app)
{
    app.sock = socket (AF_INET, SOCK_DGRAM|SOCK_CLOEXEC, 0);
    if (app.sock < 0)
        return -1;

    int on = 1;
    if (setsockopt(app.sock, SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on)) ||
        bind(app.sock, (const struct sockaddr*)&app.opt.bind_addr, sizeof(app.opt.bind_addr)))
    {
        auto err = errno;
        close (app.sock);
        app.sock = -1;
        errno = err;
        return -1;
    }
    return 0;
}


//------------------------------------------------------------------------------
// Join and remove sessions that are done.
//------------------------------------------------------------------------------
static void reap_sessions (appstate_t& app)
{
    for (auto i=app.sessions.begin(); i!=app.sessions.end();) {
        if ((*i)->finished())
            i = app.sessions.erase (i);
        else
            ++i;
    }
}


//------------------------------------------------------------------------------
//------------------------------------------------------------------------------
static void send_error (appstate_t& app,
                        const struct sockaddr_in& addr,
                        tftp::byte_order_t order,
                        uint16_t code,
                        const std::string& message)
{
    tftp::ErrorPacket err (code,
                           message.empty() ? tftp::ErrorPacket::default_message(code) : message);
    if (tftp::send_packet_to(app.sock, err, order, addr) < 0) {
        tftp::Log::debug ("Unable to send error to %s: %s",
                          tftp::to_string(addr).c_str(), strerror(errno));
    }
}


//------------------------------------------------------------------------------
//------------------------------------------------------------------------------
static void handle_rq (appstate_t& app,
                       std::shared_ptr<const tftp::RequestPacket> rq,
                       tftp::byte_order_t order,
                       const struct sockaddr_in& addr)
{
    const char* op_name = rq->opcode()==tftp::op_rrq ? "RRQ" : "WRQ";

    if (app.opt.max_clients  &&  app.sessions.size() >= app.opt.max_clients) {
        tftp::Log::info ("%s from %s - Too many clients",
                         op_name, tftp::to_string(addr).c_str());
        send_error (app, addr, order, tftp::err_undefined, "Server busy");
        return;
    }

    tftp::Log::info ("%s from %s - '%s' (%s, %s)",
                     op_name,
                     tftp::to_string(addr).c_str(),
                     rq->filename().c_str(),
                     rq->mode().c_str(),
                     tftp::to_string(order));
    std::unique_ptr<file_session_t> session;
    try {
        session = std::make_unique<file_session_t> (app.opt, rq, order, addr);
        session->start ();
    }
    catch (std::system_error& e) {
        tftp::Log::error ("%s from %s - Unable to start session: %s",
                          op_name, tftp::to_string(addr).c_str(), e.what());
        send_error (app, addr, order, tftp::err_undefined, "");
        return;
    }
    app.sessions.emplace_back (std::move(session));
}


//------------------------------------------------------------------------------
//------------------------------------------------------------------------------
static void handle_new_request (appstate_t& app,
                                const uint8_t* buf,
                                size_t size,
                                const struct sockaddr_in& addr)
{
    tftp::byte_order_t order;
    auto pkt = tftp::decode_packet (buf, size, order);
    if (!pkt) {
        tftp::Log::info ("Ignoring invalid TFTP request (%lu bytes) from %s: %s",
                         (unsigned long)size, tftp::to_string(addr).c_str(), strerror(errno));
        return;
    }

    switch (pkt->opcode()) {
    case tftp::op_rrq:
        handle_rq (app, std::static_pointer_cast<const tftp::RequestPacket>(pkt), order, addr);
        break;

    case tftp::op_wrq:
        if (app.opt.allow_wrq) {
            handle_rq (app, std::static_pointer_cast<const tftp::RequestPacket>(pkt), order, addr);
        }else{
            tftp::Log::info ("WRQ from %s - Write requests not allowed",
                             tftp::to_string(addr).c_str());
            send_error (app, addr, order, tftp::err_access_violation, "");
        }
        break;

    case tftp::op_error:
        // Never answer an error packet
        tftp::Log::debug ("Ignoring %s from %s",
                          pkt->to_string().c_str(), tftp::to_string(addr).c_str());
        break;

    default:
        tftp::Log::info ("Invalid request (%s) from %s",
                         pkt->to_string().c_str(), tftp::to_string(addr).c_str());
        send_error (app, addr, order, tftp::err_illegal_operation, "");
        break;
    }
}


//------------------------------------------------------------------------------
//------------------------------------------------------------------------------
static int serve (appstate_t& app)
{
    uint8_t buf[tftp::max_packet_size + 1];

    while (!appstate_t::server_done) {
        reap_sessions (app);

        struct pollfd pfd;
        pfd.fd = app.sock;
        pfd.events = POLLIN;
        pfd.revents = 0;
        auto result = poll (&pfd, 1, listen_poll_interval);
        if (result < 0) {
            if (errno == EINTR)
                continue;
            tftp::Log::error ("Error waiting for client requests: %s", strerror(errno));
            return -1;
        }
        if (result == 0)
            continue;

        struct sockaddr_in addr;
        socklen_t addr_len = sizeof (addr);
        auto size = recvfrom (app.sock, buf, sizeof(buf), 0, (struct sockaddr*)&addr, &addr_len);
        if (size < 0) {
            if (errno!=EINTR && errno!=EAGAIN)
                tftp::Log::info ("Error receiving client request: %s", strerror(errno));
            continue;
        }
        handle_new_request (app, buf, static_cast<size_t>(size), addr);
    }
    return 0;
}


//------------------------------------------------------------------------------
//------------------------------------------------------------------------------
int main (int argc, char* argv[])
{
    // Parse arguments
    //
    appargs_t opt;
    auto parse_result = opt.parse_args (argc, argv);
    if (parse_result) {
        return parse_result<0 ? 1 : 0;
    }

    appstate_t app (opt);

    // Configure logging
    //
    if (opt.log_to_stdout) {
        tftp::Log::set_callback (stdout_logger);
    }else{
        openlog ("tftpstreamd", LOG_PID, LOG_DAEMON);
    }
    tftp::Log::priority (opt.verbose ? LOG_DEBUG : LOG_INFO);

    // Change working directory to the tftp root
    //
    if (set_tftproot(app)) {
        tftp::Log::error ("Unable to set working directory: %s", strerror(errno));
        return 1;
    }

    // Exit gracefully on CTRL-C (SIGINT) and SIGTERM
    //
    init_signal_handler ();

    if (open_listener(app)) {
        tftp::Log::error ("Unable to open/bind socket: %s", strerror(errno));
        return 1;
    }

    tftp::Log::info ("Serving files from %s, directory %s",
                     tftp::to_string(opt.bind_addr).c_str(),
                     app.real_tftproot.c_str());
    if (opt.allow_wrq) {
        if (opt.transfer_cfg.max_size)
            tftp::Log::debug ("Allow write requests with a size limit of %lu bytes",
                              (unsigned long)opt.transfer_cfg.max_size);
        else
            tftp::Log::debug ("Allow write requests with no size limit");
    }

    auto result = serve (app);

    // Stop pending sessions
    //
    for (auto& session : app.sessions)
        session->stop ();
    app.sessions.clear ();
    close (app.sock);

    tftp::Log::info ("Stopped");
    return result ? 1 : 0;
}
