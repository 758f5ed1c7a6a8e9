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
#include "tftpstreamd-options.hpp"

#include <string>
#include <iostream>
#include <stdexcept>
#include <cstdlib>
#include <cstring>
#include <cerrno>
#include <getopt.h>
#include <arpa/inet.h>


static constexpr const char* default_tftp_root   = "/srv/tftp";
static constexpr const size_t default_max_clients = 0; // 0 == No limit


//------------------------------------------------------------------------------
//------------------------------------------------------------------------------
static size_t parse_file_size (const char* arg)
{
    size_t pos;
    size_t retval = std::stoul (arg, &pos, 10);

    auto arg_len = strlen (arg);
    if (pos != arg_len) {
        if (pos != arg_len-1)
            throw std::invalid_argument ("EINVAL");
        switch (arg[pos]) {
        case 'K':
            retval *= 1024;
            break;

        case 'M':
            retval *= 1024 * 1024;
            break;

        case 'G':
            retval *= 1024UL * 1024 * 1024;
            break;

        default:
            throw std::invalid_argument ("EINVAL");
        }
    }

    return retval;
}


//------------------------------------------------------------------------------
// Parse "a.b.c.d[:port]"
//------------------------------------------------------------------------------
static bool parse_bind_addr (const char* arg, struct sockaddr_in& addr)
{
    std::string str (arg);
    std::string port;

    auto colon = str.find (':');
    if (colon != std::string::npos) {
        port = str.substr (colon+1);
        str.resize (colon);
    }

    if (inet_pton(AF_INET, str.c_str(), &addr.sin_addr) != 1)
        return false;

    if (!port.empty()) {
        try {
            size_t pos;
            auto num = std::stoul (port, &pos, 10);
            if (pos!=port.size() || num==0 || num>65535)
                return false;
            addr.sin_port = htons ((uint16_t)num);
        }
        catch (std::exception& e) {
            return false;
        }
    }
    return true;
}


//------------------------------------------------------------------------------
//------------------------------------------------------------------------------
static bool parse_unsigned (const char* arg, unsigned& value)
{
    try {
        size_t pos;
        auto num = std::stoul (arg, &pos, 10);
        if (pos != strlen(arg) || num > 0xffffffffUL)
            return false;
        value = (unsigned) num;
    }
    catch (std::exception& e) {
        return false;
    }
    return true;
}


//------------------------------------------------------------------------------
//------------------------------------------------------------------------------
void appargs_t::print_usage (std::ostream& out)
{
    out << "TFTP server (RFC 1350)." << std::endl;
    out << std::endl;
    out << "Usage: " << program_invocation_short_name << " [OPTIONS]" << std::endl;
    out << std::endl;
    out << "  -r, --tftproot=<directory>     Serve files from this directory. Default is: " << default_tftp_root << '.' << std::endl;
    out << "  -b, --bind=<address>           Bind the tftp server to this IPv4 address[:port]." << std::endl;
    out << "                                 Default address is 0.0.0.0:" << tftpstream::default_port << '.' << std::endl;
    out << "  -p, --port=<port>              Bind the tftp server to this port number." << std::endl;
    out << "                                 This overrides any port in option --bind." << std::endl;
    out << "  -m, --max-clients=<num>        Maximum number of concurrent transfers." << std::endl;
    out << "                                 A value of 0 means no limit." << " Default is "<< default_max_clients << '.' << std::endl;
    out << "  -s, --stdout                   Log to standard output instead of syslog." << std::endl;
    out << "  -w, --allow-wrq                Allow clients to write files (WRQ requests)." << std::endl;
    out << "                                 Default is to not allow WRQ requests." << std::endl;
    out << "  -o, --allow-overwrite          If WRQ is allowed, allow files to be overwritten." << std::endl;
    out << "  -l, --wrq-size-limit=<size>    Maximum size, in bytes, of files written with WRQ." << std::endl;
    out << "                                 A value of 0 means no limit. Default is no limit. " << std::endl;
    out << "                                 Use postfix 'K', 'M', 'G', for Kilobytes, Megabytes, and Gigabytes. " << std::endl;
    out << "  -t, --timeout=<ms>             Retransmission timeout in milliseconds, 1 to "
        << tftpstream::TransferConfig::max_timeout << ". Default is "
        << tftpstream::TransferConfig().timeout << '.' << std::endl;
    out << "  -n, --retries=<num>            Number of retransmissions before a transfer is aborted. Default is "
        << tftpstream::TransferConfig().max_retries << '.' << std::endl;
    out << "  -v, --verbose                  Verbose logging." << std::endl;
    out << "  -h, --help                     Print this help message." << std::endl;
    out << std::endl;
}



//------------------------------------------------------------------------------
//------------------------------------------------------------------------------
appargs_t::appargs_t ()
    : tftproot (default_tftp_root),
      max_clients (default_max_clients),
      log_to_stdout (false),
      allow_wrq (false),
      allow_overwrite (false),
      verbose (false)
{
    memset (&bind_addr, 0, sizeof(bind_addr));
    bind_addr.sin_family      = AF_INET;
    bind_addr.sin_addr.s_addr = htonl (INADDR_ANY);
    bind_addr.sin_port        = 0;
}


//------------------------------------------------------------------------------
//------------------------------------------------------------------------------
int appargs_t::parse_args (int argc, char* argv[])
{
    static struct option long_options[] = {
        { "tftproot",       required_argument, 0, 'r'},
        { "bind",           required_argument, 0, 'b'},
        { "port",           required_argument, 0, 'p'},
        { "max-clients",    required_argument, 0, 'm'},
        { "stdout",         no_argument,       0, 's'},
        { "allow-wrq",      no_argument,       0, 'w'},
        { "allow-overwrite",no_argument,       0, 'o'},
        { "wrq-size-limit", required_argument, 0, 'l'},
        { "timeout",        required_argument, 0, 't'},
        { "retries",        required_argument, 0, 'n'},
        { "verbose",        no_argument,       0, 'v'},
        { "help",           no_argument,       0, 'h'},
        { 0, 0, 0, 0}
    };
    static const char* arg_format = "r:b:p:m:swol:t:n:vh";
    int bind_port = -1;
    unsigned num;
    size_t len;

    while (1) {
        int c = getopt_long (argc, argv, arg_format, long_options, NULL);
        if (c == -1)
            break;
        switch (c) {
        case 'r':
            len = strlen (optarg);
            // Remove trailing / if not root dir.
            if (len>1 && optarg[len-1]=='/')
                tftproot = std::string (optarg, len-1);
            else
                tftproot = optarg;
            break;

        case 'b':
            if (!parse_bind_addr(optarg, bind_addr)) {
                std::cerr << "Error: Invalid IPv4 address and/or port number to argument '--bind'" << std::endl;
                return -1;
            }
            break;

        case 'p':
            bind_port = atoi (optarg);
            if (bind_port<=0 || bind_port>65535) {
                std::cerr << "Error: Invalid port number to argument '--port'" << std::endl;
                return -1;
            }
            break;

        case 'm':
            if (!parse_unsigned(optarg, num)) {
                std::cerr << "Error: Invalid number of maximum clients to argument '--max-clients'" << std::endl;
                return -1;
            }
            max_clients = num;
            break;

        case 's':
            log_to_stdout = true;
            break;

        case 'w':
            allow_wrq = true;
            break;

        case 'o':
            allow_overwrite = true;
            break;

        case 'l':
            try {
                transfer_cfg.max_size = parse_file_size (optarg);
            }
            catch (std::exception& e) {
                std::cerr << "Error: Invalid value to argument '--wrq-size-limit'" << std::endl;
                return -1;
            }
            break;

        case 't':
            if (!parse_unsigned(optarg, num) || num==0 ||
                num > tftpstream::TransferConfig::max_timeout)
            {
                std::cerr << "Error: Invalid value to argument '--timeout'" << std::endl;
                return -1;
            }
            transfer_cfg.timeout = num;
            break;

        case 'n':
            if (!parse_unsigned(optarg, num)) {
                std::cerr << "Error: Invalid value to argument '--retries'" << std::endl;
                return -1;
            }
            transfer_cfg.max_retries = num;
            break;

        case 'v':
            verbose = true;
            break;

        case 'h':
            print_usage (std::cout);
            return 1;

        default:
            return -1;
        }
    }
    if (optind < argc) {
        std::cerr << "Error: Invalid argument" << std::endl;
        print_usage (std::cerr);
        return -1;
    }

    // Set port number
    //
    if (bind_port != -1)
        bind_addr.sin_port = htons ((uint16_t)bind_port);
    else if (!bind_addr.sin_port)
        bind_addr.sin_port = htons (tftpstream::default_port);

    return 0;
}
