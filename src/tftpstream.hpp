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
#ifndef TFTPSTREAM_HPP
#define TFTPSTREAM_HPP

#include <tftpstream/types.hpp>
#include <tftpstream/Log.hpp>
#include <tftpstream/ByteStream.hpp>
#include <tftpstream/Packet.hpp>
#include <tftpstream/PacketChannel.hpp>
#include <tftpstream/PacketQueue.hpp>
#include <tftpstream/UdpChannel.hpp>
#include <tftpstream/Transfer.hpp>

#endif
