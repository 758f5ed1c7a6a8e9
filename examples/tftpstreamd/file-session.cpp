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
#include "file-session.hpp"
#include <vector>
#include <cstring>
#include <cerrno>
#include <unistd.h>
#include <fcntl.h>
#include <sys/types.h>
#include <sys/stat.h>
#include <arpa/inet.h>

namespace tftp = tftpstream;


static constexpr size_t file_buf_size = 8 * tftp::data_block_size;


//------------------------------------------------------------------------------
//------------------------------------------------------------------------------
static std::string make_session_id (const tftp::RequestPacket& rq,
                                    const struct sockaddr_in& peer)
{
    std::string id (rq.opcode()==tftp::op_rrq ? "RRQ" : "WRQ");
    id.append (" from ");
    id.append (tftp::to_string(peer));
    return id;
}


//------------------------------------------------------------------------------
//------------------------------------------------------------------------------
static bool valid_filename (const std::string& filename)
{
    auto len = filename.size ();
    return !(filename.empty() ||                         // Emtpy filename not allowed
             filename[0]=='/' ||                         // Absolute path not allowed
             filename==".." ||                           // Relative path not allowed
             filename.find("../")==0 ||                  // Relative path not allowed
             filename.find("/../")!=std::string::npos || // Relative path not allowed
             (len>=3 && filename.compare(len-3, 3, "/..")==0));
}


//------------------------------------------------------------------------------
//------------------------------------------------------------------------------
file_session_t::file_session_t (const appargs_t& options,
                                std::shared_ptr<const tftp::RequestPacket> rq,
                                tftp::byte_order_t byte_order,
                                const struct sockaddr_in& peer)
    : opt (options),
      request (rq),
      order (byte_order),
      id (make_session_id(*rq, peer)),
      chan (peer, byte_order, ntohl(options.bind_addr.sin_addr.s_addr)),
      is_finished (false)
{
}


//------------------------------------------------------------------------------
//------------------------------------------------------------------------------
file_session_t::~file_session_t ()
{
    stop ();
    if (thread.joinable())
        thread.join ();
}


//------------------------------------------------------------------------------
//------------------------------------------------------------------------------
void file_session_t::start ()
{
    thread = std::thread ([this](){run();});
}


//------------------------------------------------------------------------------
//------------------------------------------------------------------------------
void file_session_t::stop ()
{
    chan.close ();
}


//------------------------------------------------------------------------------
//------------------------------------------------------------------------------
void file_session_t::run ()
{
    tftp::Log::debug ("%s - Session started on port %u",
                      id.c_str(), (unsigned)ntohs(chan.local_addr().sin_port));
    if (request->opcode() == tftp::op_rrq)
        serve_rrq ();
    else
        serve_wrq ();
    is_finished = true;
}


//------------------------------------------------------------------------------
//------------------------------------------------------------------------------
int file_session_t::open_file (bool wrq, uint16_t& err_code)
{
    auto& filename = request->filename ();

    // Sanity check
    //
    if (!valid_filename(filename)) {
        tftp::Log::info ("%s - Illegal file name '%s'", id.c_str(), filename.c_str());
        err_code = tftp::err_access_violation;
        return -1;
    }

    // We only allow regular files to be read/overwritten
    //
    struct stat sb;
    if (stat(filename.c_str(), &sb) == 0) {
        if (!S_ISREG(sb.st_mode)) {
            tftp::Log::info ("%s - Not a regular file '%s'", id.c_str(), filename.c_str());
            err_code = tftp::err_access_violation;
            return -1;
        }
        if (wrq && !opt.allow_overwrite) {
            tftp::Log::info ("%s - File already exists '%s'", id.c_str(), filename.c_str());
            err_code = tftp::err_file_exists;
            return -1;
        }
    }
    else if (!wrq) {
        tftp::Log::info ("%s - Can't open file '%s': %s", id.c_str(), filename.c_str(), strerror(errno));
        err_code = errno==ENOENT ? tftp::err_file_not_found : tftp::err_access_violation;
        return -1;
    }

    int fd;
    if (wrq)
        fd = ::open (filename.c_str(),
                     O_WRONLY|O_CREAT|O_TRUNC|O_CLOEXEC,
                     S_IRUSR|S_IWUSR|S_IRGRP|S_IWGRP);
    else
        fd = ::open (filename.c_str(), O_RDONLY|O_CLOEXEC);
    if (fd < 0) {
        tftp::Log::info ("%s - Can't open file '%s': %s", id.c_str(), filename.c_str(), strerror(errno));
        err_code = errno==ENOSPC ? tftp::err_disk_full : tftp::err_access_violation;
    }
    return fd;
}


//------------------------------------------------------------------------------
//------------------------------------------------------------------------------
void file_session_t::serve_rrq ()
{
    auto& rq = static_cast<const tftp::ReadRequestPacket&> (*request);
    tftp::ReadTransfer transfer (chan, chan, rq, order, opt.transfer_cfg, id);

    uint16_t err_code;
    int fd = open_file (false, err_code);
    if (fd < 0) {
        if (transfer.respond_error(err_code))
            tftp::Log::debug ("%s - Unable to send error: %s", id.c_str(), strerror(errno));
        return;
    }

    std::vector<char> buf (file_buf_size);
    while (!transfer.is_failed()) {
        auto len = ::read (fd, buf.data(), buf.size());
        if (len < 0) {
            if (errno == EINTR)
                continue;
            tftp::Log::warning ("%s - Error reading file '%s': %s",
                                id.c_str(), rq.filename().c_str(), strerror(errno));
            if (transfer.respond_error(tftp::err_undefined, "File read error"))
                tftp::Log::debug ("%s - Unable to send error: %s", id.c_str(), strerror(errno));
            break;
        }
        if (len == 0) {
            if (transfer.finish() == 0)
                tftp::Log::info ("%s - Sent '%s', %lu bytes",
                                 id.c_str(), rq.filename().c_str(),
                                 (unsigned long)transfer.bytes_transferred());
            break;
        }
        if (transfer.write(buf.data(), static_cast<size_t>(len)) < 0)
            break;
    }
    ::close (fd);

    if (transfer.is_failed()) {
        tftp::Log::info ("%s - Transfer of '%s' failed: %s",
                         id.c_str(), rq.filename().c_str(), strerror(transfer.error()));
    }
}


//------------------------------------------------------------------------------
//------------------------------------------------------------------------------
void file_session_t::serve_wrq ()
{
    auto& rq = static_cast<const tftp::WriteRequestPacket&> (*request);
    tftp::WriteTransfer transfer (chan, chan, rq, order, opt.transfer_cfg, id);

    uint16_t err_code;
    int fd = open_file (true, err_code);
    if (fd < 0) {
        if (transfer.respond_error(err_code))
            tftp::Log::debug ("%s - Unable to send error: %s", id.c_str(), strerror(errno));
        return;
    }

    std::vector<char> buf (file_buf_size);
    if (transfer.accept() == 0) {
        while (true) {
            auto len = transfer.read (buf.data(), buf.size());
            if (len <= 0)
                break;
            size_t pos = 0;
            while (pos < static_cast<size_t>(len)) {
                auto result = ::write (fd, buf.data()+pos, len-pos);
                if (result < 0 && errno == EINTR)
                    continue;
                if (result <= 0) {
                    auto err = result<0 ? errno : ENOSPC;
                    tftp::Log::warning ("%s - Error writing file '%s': %s",
                                        id.c_str(), rq.filename().c_str(), strerror(err));
                    if (transfer.respond_error(err==ENOSPC ? tftp::err_disk_full : tftp::err_undefined,
                                               err==ENOSPC ? "" : "File write error"))
                    {
                        tftp::Log::debug ("%s - Unable to send error: %s", id.c_str(), strerror(errno));
                    }
                    break;
                }
                pos += static_cast<size_t> (result);
            }
            if (transfer.is_failed())
                break;
        }
    }

    if (::close(fd)) {
        tftp::Log::warning ("%s - Error closing file '%s': %s",
                            id.c_str(), rq.filename().c_str(), strerror(errno));
    }

    if (transfer.is_done()) {
        tftp::Log::info ("%s - Received '%s', %lu bytes",
                         id.c_str(), rq.filename().c_str(),
                         (unsigned long)transfer.bytes_transferred());
    }else{
        tftp::Log::info ("%s - Transfer of '%s' failed: %s",
                         id.c_str(), rq.filename().c_str(), strerror(transfer.error()));
        // Don't leave a partial file behind
        if (unlink(rq.filename().c_str()))
            tftp::Log::debug ("%s - Unable to remove '%s': %s",
                              id.c_str(), rq.filename().c_str(), strerror(errno));
    }
}
