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
#ifndef EXAMPLES_TFTPSTREAMD_OPTIONS_HPP
#define EXAMPLES_TFTPSTREAMD_OPTIONS_HPP

#include <tftpstream.hpp>
#include <string>
#include <ostream>
#include <netinet/in.h>



//------------------------------------------------------------------------------
//  T Y P E S
//------------------------------------------------------------------------------
struct appargs_t {
    appargs_t ();
    int parse_args (int argc, char* argv[]);
    void print_usage (std::ostream& out);

    struct sockaddr_in bind_addr;
    std::string tftproot;
    size_t max_clients;
    tftpstream::TransferConfig transfer_cfg;
    bool log_to_stdout;
    bool allow_wrq;
    bool allow_overwrite;
    bool verbose;
};


#endif
