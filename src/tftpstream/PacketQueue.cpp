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
#include <tftpstream/PacketQueue.hpp>
#include <chrono>
#include <cerrno>


namespace tftpstream {


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    PacketQueue::PacketQueue (size_t capacity)
        : max_size {capacity},
          open {true}
    {
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    PacketQueue::~PacketQueue ()
    {
        close ();
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    int PacketQueue::send (std::shared_ptr<const Packet> pkt)
    {
        if (!pkt) {
            errno = EINVAL;
            return -1;
        }
        {
            std::lock_guard<std::mutex> lock (mutex);
            if (!open) {
                errno = ECANCELED;
                return -1;
            }
            if (max_size && packets.size() >= max_size) {
                errno = ENOBUFS;
                return -1;
            }
            packets.emplace_back (std::move(pkt));
        }
        cond.notify_one ();
        return 0;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    std::shared_ptr<const Packet> PacketQueue::receive (unsigned timeout)
    {
        std::unique_lock<std::mutex> lock (mutex);
        auto ready = [this]{ return !open || !packets.empty(); };

        if (timeout == static_cast<unsigned>(-1)) {
            cond.wait (lock, ready);
        }
        else if (!cond.wait_for(lock, std::chrono::milliseconds(timeout), ready)) {
            errno = ETIMEDOUT;
            return nullptr;
        }

        if (!open) {
            errno = ECANCELED;
            return nullptr;
        }
        auto pkt = packets.front ();
        packets.pop_front ();
        return pkt;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    void PacketQueue::close ()
    {
        {
            std::lock_guard<std::mutex> lock (mutex);
            open = false;
            packets.clear ();
        }
        cond.notify_all ();
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    bool PacketQueue::is_open () const
    {
        std::lock_guard<std::mutex> lock (mutex);
        return open;
    }


    //--------------------------------------------------------------------------
    //--------------------------------------------------------------------------
    size_t PacketQueue::size () const
    {
        std::lock_guard<std::mutex> lock (mutex);
        return packets.size ();
    }


}
