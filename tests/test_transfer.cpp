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
#include <tftpstream/Transfer.hpp>
#include <tftpstream/PacketQueue.hpp>
#include <gtest/gtest.h>
#include <stdexcept>
#include <thread>
#include <vector>
#include <cerrno>

using namespace tftpstream;


namespace {

    std::vector<uint8_t> make_data (size_t size, uint8_t seed=0)
    {
        std::vector<uint8_t> data (size);
        for (size_t i=0; i<size; ++i)
            data[i] = static_cast<uint8_t> (seed + i*7);
        return data;
    }

    std::vector<std::shared_ptr<const Packet>> drain (PacketQueue& q)
    {
        std::vector<std::shared_ptr<const Packet>> packets;
        std::shared_ptr<const Packet> pkt;
        while ((pkt = q.receive(0)))
            packets.push_back (pkt);
        return packets;
    }

    const DataPacket& as_data (const std::shared_ptr<const Packet>& pkt)
    {
        return dynamic_cast<const DataPacket&> (*pkt);
    }

    const ErrorPacket& as_error (const std::shared_ptr<const Packet>& pkt)
    {
        return dynamic_cast<const ErrorPacket&> (*pkt);
    }

    TransferConfig fast_config (unsigned timeout, unsigned retries)
    {
        TransferConfig cfg;
        cfg.timeout = timeout;
        cfg.max_retries = retries;
        return cfg;
    }


    //
    // A peer that acknowledges every DATA block as soon as it is sent.
    // Used both as the inbound and the outbound channel.
    //
    class AckingPeer : public PacketChannel {
    public:
        virtual int send (std::shared_ptr<const Packet> pkt) override {
            if (pkt->opcode() == op_data) {
                auto block = as_data(pkt).block ();
                blocks.push_back (block);
                pending = std::make_shared<AckPacket> (block);
            }
            return 0;
        }

        virtual std::shared_ptr<const Packet> receive (unsigned timeout=-1) override {
            if (!pending) {
                errno = ETIMEDOUT;
                return nullptr;
            }
            std::shared_ptr<const Packet> pkt = pending;
            pending.reset ();
            return pkt;
        }

        virtual void close () override {}
        virtual bool is_open () const override { return true; }

        std::vector<uint16_t> blocks;

    private:
        std::shared_ptr<const Packet> pending;
    };


    //
    // A peer sending a fixed number of full DATA blocks followed by
    // a short one. Every block is available without waiting.
    //
    class DataFeeder : public PacketChannel {
    public:
        DataFeeder (size_t full_blocks, size_t last_size)
            : num_full {full_blocks},
              last_len {last_size},
              num_sent {0},
              payload (data_block_size, 0x5a)
        {
        }

        virtual int send (std::shared_ptr<const Packet> pkt) override {
            if (pkt->opcode() == op_ack)
                acks.push_back (static_cast<const AckPacket&>(*pkt).block());
            return 0;
        }

        virtual std::shared_ptr<const Packet> receive (unsigned timeout=-1) override {
            if (num_sent > num_full) {
                errno = ETIMEDOUT;
                return nullptr;
            }
            ++num_sent;
            auto block = static_cast<uint16_t> (num_sent);
            if (num_sent <= num_full)
                return std::make_shared<DataPacket> (block, payload);
            return std::make_shared<DataPacket> (block, payload.data(), last_len);
        }

        virtual void close () override {}
        virtual bool is_open () const override { return true; }

        std::vector<uint16_t> acks;

    private:
        size_t num_full;
        size_t last_len;
        size_t num_sent;
        std::vector<uint8_t> payload;
    };

}



//
//  R E A D   T R A N S F E R
//


TEST(ReadTransfer, SendsBlocksInLockStep)
{
    PacketQueue in;
    PacketQueue out;
    ReadRequestPacket rrq ("file.bin", "octet");
    ReadTransfer transfer (in, out, rrq, big_endian);

    std::vector<std::shared_ptr<const Packet>> sent;
    std::thread peer ([&](){
        for (;;) {
            auto pkt = out.receive (5000);
            if (!pkt)
                break;
            sent.push_back (pkt);
            if (pkt->opcode() != op_data)
                break;
            auto& dat = as_data (pkt);
            // Nothing more may be sent before this block is acknowledged
            if (out.receive(30) != nullptr)
                break;
            in.send (std::make_shared<AckPacket>(dat.block()));
            if (dat.is_last_block())
                break;
        }
    });

    auto data = make_data (1024);
    EXPECT_EQ (transfer.write(data.data(), data.size()), 1024);
    EXPECT_FALSE (transfer.is_done());
    EXPECT_EQ (transfer.finish(), 0);
    peer.join ();

    EXPECT_TRUE (transfer.is_done());
    EXPECT_EQ (transfer.state(), Transfer::done);
    EXPECT_EQ (transfer.bytes_transferred(), 1024u);
    EXPECT_EQ (transfer.block(), 3);

    ASSERT_EQ (sent.size(), 3u);
    EXPECT_EQ (as_data(sent[0]).block(), 1);
    EXPECT_EQ (as_data(sent[0]).payload().size(), 512u);
    EXPECT_EQ (as_data(sent[1]).block(), 2);
    EXPECT_EQ (as_data(sent[1]).payload().size(), 512u);
    EXPECT_EQ (as_data(sent[2]).block(), 3);
    EXPECT_EQ (as_data(sent[2]).payload().size(), 0u);

    std::vector<uint8_t> received (as_data(sent[0]).payload());
    received.insert (received.end(), as_data(sent[1]).payload().begin(), as_data(sent[1]).payload().end());
    EXPECT_EQ (received, data);
}


TEST(ReadTransfer, BuffersPartialBlocks)
{
    PacketQueue in;
    PacketQueue out;
    ReadRequestPacket rrq ("f", "octet");
    ReadTransfer transfer (in, out, rrq, little_endian);

    in.send (std::make_shared<AckPacket>(1));

    auto data = make_data (700);
    EXPECT_EQ (transfer.write(data.data(), 100), 100);
    EXPECT_EQ (out.size(), 0u);
    EXPECT_EQ (transfer.state(), Transfer::awaiting_ack_or_write);

    // Completes the first block, 188 bytes remain buffered
    EXPECT_EQ (transfer.write(data.data()+100, 600), 600);
    EXPECT_EQ (out.size(), 1u);
    EXPECT_EQ (transfer.bytes_transferred(), 512u);

    in.send (std::make_shared<AckPacket>(2));
    EXPECT_EQ (transfer.finish(), 0);

    auto sent = drain (out);
    ASSERT_EQ (sent.size(), 2u);
    EXPECT_EQ (as_data(sent[1]).block(), 2);
    EXPECT_EQ (as_data(sent[1]).payload().size(), 188u);
    EXPECT_TRUE (transfer.is_done());
    EXPECT_EQ (transfer.bytes_transferred(), 700u);
}


TEST(ReadTransfer, EmptyFile)
{
    PacketQueue in;
    PacketQueue out;
    ReadRequestPacket rrq ("empty", "octet");
    ReadTransfer transfer (in, out, rrq, little_endian);

    in.send (std::make_shared<AckPacket>(1));
    EXPECT_EQ (transfer.finish(), 0);
    EXPECT_TRUE (transfer.is_done());

    auto sent = drain (out);
    ASSERT_EQ (sent.size(), 1u);
    EXPECT_EQ (*sent[0], DataPacket(1, nullptr, 0));

    // Nothing more can be written
    uint8_t byte = 0;
    errno = 0;
    EXPECT_EQ (transfer.write(&byte, 1), -1);
    EXPECT_EQ (errno, EPIPE);
    EXPECT_EQ (transfer.finish(), 0);
}


TEST(ReadTransfer, IgnoresStrayPackets)
{
    PacketQueue in;
    PacketQueue out;
    ReadRequestPacket rrq ("f", "octet");
    ReadTransfer transfer (in, out, rrq, little_endian);

    in.send (std::make_shared<AckPacket>(0));
    in.send (std::make_shared<AckPacket>(5));
    in.send (std::make_shared<DataPacket>(1, make_data(10)));
    in.send (std::make_shared<ReadRequestPacket>("f", "octet"));
    in.send (std::make_shared<AckPacket>(1));

    auto data = make_data (512);
    EXPECT_EQ (transfer.write(data.data(), data.size()), 512);
    EXPECT_FALSE (transfer.is_failed());
    EXPECT_EQ (in.size(), 0u);

    // Only the block itself was sent
    auto sent = drain (out);
    ASSERT_EQ (sent.size(), 1u);
    EXPECT_EQ (as_data(sent[0]).block(), 1);
}


TEST(ReadTransfer, RetransmitsOnTimeout)
{
    PacketQueue in;
    PacketQueue out;
    ReadRequestPacket rrq ("f", "octet");
    ReadTransfer transfer (in, out, rrq, little_endian, fast_config(20, 5));

    std::vector<std::shared_ptr<const Packet>> sent;
    std::thread peer ([&](){
        // Let the first copy go unanswered
        auto first = out.receive (5000);
        auto second = out.receive (5000);
        if (first)
            sent.push_back (first);
        if (second)
            sent.push_back (second);
        in.send (std::make_shared<AckPacket>(1));
    });

    EXPECT_EQ (transfer.finish(), 0);
    peer.join ();

    ASSERT_EQ (sent.size(), 2u);
    EXPECT_EQ (*sent[0], *sent[1]);
    EXPECT_EQ (as_data(sent[0]).block(), 1);
    EXPECT_TRUE (transfer.is_done());
}


TEST(ReadTransfer, GivesUpAfterMaxRetries)
{
    PacketQueue in;
    PacketQueue out;
    ReadRequestPacket rrq ("f", "octet");
    ReadTransfer transfer (in, out, rrq, little_endian, fast_config(10, 2));

    auto data = make_data (512);
    errno = 0;
    EXPECT_EQ (transfer.write(data.data(), data.size()), -1);
    EXPECT_EQ (errno, ETIMEDOUT);
    EXPECT_TRUE (transfer.is_failed());
    EXPECT_EQ (transfer.error(), ETIMEDOUT);

    // The block, two retransmissions, and an error
    auto sent = drain (out);
    ASSERT_EQ (sent.size(), 4u);
    for (size_t i=0; i<3; ++i)
        EXPECT_EQ (as_data(sent[i]).block(), 1);
    EXPECT_EQ (as_error(sent[3]).code(), err_undefined);
    EXPECT_EQ (as_error(sent[3]).message(), "Transmit timeout");

    // The failure is sticky
    errno = 0;
    EXPECT_EQ (transfer.finish(), -1);
    EXPECT_EQ (errno, ETIMEDOUT);
    EXPECT_EQ (out.size(), 0u);
}


TEST(ReadTransfer, PeerError)
{
    PacketQueue in;
    PacketQueue out;
    ReadRequestPacket rrq ("f", "octet");
    ReadTransfer transfer (in, out, rrq, little_endian);

    in.send (std::make_shared<ErrorPacket>(err_disk_full, "Disk full"));

    auto data = make_data (512);
    errno = 0;
    EXPECT_EQ (transfer.write(data.data(), data.size()), -1);
    EXPECT_EQ (errno, ECONNABORTED);
    EXPECT_TRUE (transfer.is_failed());

    // An error is never answered
    auto sent = drain (out);
    ASSERT_EQ (sent.size(), 1u);
    EXPECT_EQ (sent[0]->opcode(), op_data);
}


TEST(ReadTransfer, ClosedChannel)
{
    PacketQueue in;
    PacketQueue out;
    ReadRequestPacket rrq ("f", "octet");
    ReadTransfer transfer (in, out, rrq, little_endian);

    in.close ();
    errno = 0;
    EXPECT_EQ (transfer.finish(), -1);
    EXPECT_EQ (errno, ECANCELED);
    EXPECT_EQ (transfer.error(), ECANCELED);

    PacketQueue in2;
    PacketQueue out2;
    ReadTransfer transfer2 (in2, out2, rrq, little_endian);
    out2.close ();
    errno = 0;
    EXPECT_EQ (transfer2.finish(), -1);
    EXPECT_EQ (errno, ECANCELED);
    EXPECT_TRUE (transfer2.is_failed());
}


TEST(ReadTransfer, RespondError)
{
    PacketQueue in;
    PacketQueue out;
    ReadRequestPacket rrq ("missing", "octet");
    ReadTransfer transfer (in, out, rrq, big_endian);

    EXPECT_EQ (transfer.respond_error(err_file_not_found), 0);
    EXPECT_TRUE (transfer.is_failed());
    EXPECT_EQ (transfer.error(), ECANCELED);

    auto sent = drain (out);
    ASSERT_EQ (sent.size(), 1u);
    EXPECT_EQ (*sent[0], ErrorPacket(err_file_not_found, "File not found"));

    uint8_t byte = 0;
    errno = 0;
    EXPECT_EQ (transfer.write(&byte, 1), -1);
    EXPECT_EQ (errno, ECANCELED);

    // Only one error is sent
    EXPECT_EQ (transfer.respond_error(err_undefined, "again"), -1);
    EXPECT_EQ (out.size(), 0u);
}


TEST(ReadTransfer, RespondErrorAfterDone)
{
    PacketQueue in;
    PacketQueue out;
    ReadRequestPacket rrq ("small", "octet");
    ReadTransfer transfer (in, out, rrq, little_endian);

    in.send (std::make_shared<AckPacket>(1));
    uint8_t byte = 1;
    EXPECT_EQ (transfer.write(&byte, 1), 1);
    EXPECT_EQ (transfer.finish(), 0);
    ASSERT_TRUE (transfer.is_done());
    EXPECT_EQ (drain(out).size(), 1u);

    // Nothing is sent and the transfer stays done
    errno = 0;
    EXPECT_EQ (transfer.respond_error(err_undefined, "late"), -1);
    EXPECT_EQ (errno, EPIPE);
    EXPECT_EQ (out.size(), 0u);
    EXPECT_TRUE (transfer.is_done());
    EXPECT_FALSE (transfer.is_failed());
    EXPECT_EQ (transfer.error(), 0);
}


TEST(Transfer, TimeoutRange)
{
    PacketQueue q;
    ReadRequestPacket rrq ("file", "octet");
    WriteRequestPacket wrq ("file", "octet");
    TransferConfig cfg;

    cfg.timeout = 0;
    EXPECT_THROW (ReadTransfer(q, q, rrq, little_endian, cfg), std::invalid_argument);
    EXPECT_THROW (WriteTransfer(q, q, wrq, little_endian, cfg), std::invalid_argument);

    cfg.timeout = TransferConfig::max_timeout + 1;
    EXPECT_THROW (ReadTransfer(q, q, rrq, little_endian, cfg), std::invalid_argument);
    EXPECT_THROW (WriteTransfer(q, q, wrq, little_endian, cfg), std::invalid_argument);

    cfg.timeout = TransferConfig::max_timeout;
    EXPECT_NO_THROW (ReadTransfer(q, q, rrq, little_endian, cfg));
    EXPECT_NO_THROW (WriteTransfer(q, q, wrq, little_endian, cfg));
}


TEST(ReadTransfer, BlockNumberWrapsAround)
{
    AckingPeer peer;
    ReadRequestPacket rrq ("big", "octet");
    ReadTransfer transfer (peer, peer, rrq, little_endian);

    auto block = make_data (data_block_size);
    for (size_t i=0; i<65536; ++i) {
        ASSERT_EQ (transfer.write(block.data(), block.size()), (ssize_t)block.size());
    }
    EXPECT_EQ (transfer.finish(), 0);
    EXPECT_TRUE (transfer.is_done());

    ASSERT_EQ (peer.blocks.size(), 65537u);
    EXPECT_EQ (peer.blocks[0], 1);
    EXPECT_EQ (peer.blocks[65534], 65535);
    EXPECT_EQ (peer.blocks[65535], 0);
    EXPECT_EQ (peer.blocks[65536], 1);
    EXPECT_EQ (transfer.bytes_transferred(), 65536u * data_block_size);
}



//
//  W R I T E   T R A N S F E R
//


TEST(WriteTransfer, ReceivesTwoBlocks)
{
    PacketQueue in;
    PacketQueue out;
    WriteRequestPacket wrq ("upload", "octet");
    WriteTransfer transfer (in, out, wrq, little_endian);

    auto part1 = make_data (data_block_size, 1);
    auto part2 = make_data (100, 2);
    in.send (std::make_shared<DataPacket>(1, part1));
    in.send (std::make_shared<DataPacket>(2, part2));

    std::vector<uint8_t> buf (data_block_size + 100);
    EXPECT_EQ (transfer.read(buf.data(), buf.size()), (ssize_t)buf.size());
    EXPECT_TRUE (transfer.is_done());

    auto expected = part1;
    expected.insert (expected.end(), part2.begin(), part2.end());
    EXPECT_EQ (buf, expected);

    auto sent = drain (out);
    ASSERT_EQ (sent.size(), 2u);
    EXPECT_EQ (*sent[0], AckPacket(1));
    EXPECT_EQ (*sent[1], AckPacket(2));

    // End of file
    EXPECT_EQ (transfer.read(buf.data(), buf.size()), 0);
    EXPECT_EQ (transfer.bytes_transferred(), buf.size());
}


TEST(WriteTransfer, ShortBlockEndsTransfer)
{
    PacketQueue in;
    PacketQueue out;
    WriteRequestPacket wrq ("upload", "octet");
    WriteTransfer transfer (in, out, wrq, little_endian);

    // A block shorter than 512 bytes is the last one, whatever follows
    auto part1 = make_data (300, 1);
    in.send (std::make_shared<DataPacket>(1, part1));
    in.send (std::make_shared<DataPacket>(2, make_data(100, 2)));

    std::vector<uint8_t> buf (400);
    EXPECT_EQ (transfer.read(buf.data(), buf.size()), 300);
    EXPECT_TRUE (transfer.is_done());
    EXPECT_EQ (std::vector<uint8_t>(buf.begin(), buf.begin()+300), part1);

    // Block #2 is neither read nor acknowledged
    EXPECT_EQ (transfer.read(buf.data(), buf.size()), 0);
    EXPECT_EQ (transfer.bytes_transferred(), 300u);
    EXPECT_EQ (transfer.block(), 1);
    EXPECT_EQ (in.size(), 1u);

    auto sent = drain (out);
    ASSERT_EQ (sent.size(), 1u);
    EXPECT_EQ (*sent[0], AckPacket(1));

    errno = 0;
    EXPECT_EQ (transfer.respond_error(err_disk_full), -1);
    EXPECT_EQ (errno, EPIPE);
    EXPECT_EQ (out.size(), 0u);
    EXPECT_TRUE (transfer.is_done());
}


TEST(WriteTransfer, AcceptSendsAckZero)
{
    PacketQueue in;
    PacketQueue out;
    WriteRequestPacket wrq ("upload", "octet");
    WriteTransfer transfer (in, out, wrq, big_endian);

    EXPECT_EQ (transfer.state(), Transfer::awaiting_data);
    EXPECT_EQ (transfer.accept(), 0);
    auto sent = drain (out);
    ASSERT_EQ (sent.size(), 1u);
    EXPECT_EQ (*sent[0], AckPacket(0));

    in.send (std::make_shared<DataPacket>(1, make_data(10)));
    uint8_t buf[20];
    EXPECT_EQ (transfer.read(buf, sizeof(buf)), 10);

    // Too late to accept again
    errno = 0;
    EXPECT_EQ (transfer.accept(), -1);
    EXPECT_EQ (errno, EINVAL);
}


TEST(WriteTransfer, SmallReads)
{
    PacketQueue in;
    PacketQueue out;
    WriteRequestPacket wrq ("upload", "octet");
    WriteTransfer transfer (in, out, wrq, little_endian);

    auto data = make_data (512);
    in.send (std::make_shared<DataPacket>(1, data));

    uint8_t buf[100];
    size_t total = 0;
    for (int i=0; i<5; ++i) {
        EXPECT_EQ (transfer.read(buf, sizeof(buf)), 100);
        EXPECT_EQ (buf[0], data[total]);
        total += 100;
    }
    EXPECT_EQ (transfer.state(), Transfer::ack_sent);

    // The last 12 bytes are returned without waiting for more
    EXPECT_EQ (transfer.read(buf, sizeof(buf)), 12);

    in.send (std::make_shared<DataPacket>(2, nullptr, 0));
    EXPECT_EQ (transfer.read(buf, sizeof(buf)), 0);
    EXPECT_TRUE (transfer.is_done());
}


TEST(WriteTransfer, DuplicateBlocks)
{
    PacketQueue in;
    PacketQueue out;
    WriteRequestPacket wrq ("upload", "octet");
    WriteTransfer transfer (in, out, wrq, little_endian);

    auto block1 = make_data (512, 1);
    auto block2 = make_data (10, 2);
    in.send (std::make_shared<DataPacket>(1, block1));
    in.send (std::make_shared<DataPacket>(1, block1));
    in.send (std::make_shared<DataPacket>(2, block2));

    std::vector<uint8_t> buf (2000);
    EXPECT_EQ (transfer.read(buf.data(), buf.size()), 522);
    EXPECT_TRUE (transfer.is_done());

    // The duplicate is acknowledged again but not delivered twice
    auto sent = drain (out);
    ASSERT_EQ (sent.size(), 3u);
    EXPECT_EQ (*sent[0], AckPacket(1));
    EXPECT_EQ (*sent[1], AckPacket(1));
    EXPECT_EQ (*sent[2], AckPacket(2));
}


TEST(WriteTransfer, IllegalOperation)
{
    PacketQueue in;
    PacketQueue out;
    WriteRequestPacket wrq ("upload", "octet");
    WriteTransfer transfer (in, out, wrq, little_endian);

    in.send (std::make_shared<AckPacket>(1));

    uint8_t buf[16];
    errno = 0;
    EXPECT_EQ (transfer.read(buf, sizeof(buf)), -1);
    EXPECT_EQ (errno, EPROTO);
    EXPECT_TRUE (transfer.is_failed());
    EXPECT_EQ (transfer.error(), EPROTO);

    auto sent = drain (out);
    ASSERT_EQ (sent.size(), 1u);
    EXPECT_EQ (*sent[0], ErrorPacket(err_illegal_operation, "Illegal TFTP operation"));
}


TEST(WriteTransfer, PeerError)
{
    PacketQueue in;
    PacketQueue out;
    WriteRequestPacket wrq ("upload", "octet");
    WriteTransfer transfer (in, out, wrq, little_endian);

    in.send (std::make_shared<ErrorPacket>(err_undefined, "Cancelled by user"));

    uint8_t buf[16];
    errno = 0;
    EXPECT_EQ (transfer.read(buf, sizeof(buf)), -1);
    EXPECT_EQ (errno, ECONNABORTED);
    EXPECT_EQ (out.size(), 0u);
}


TEST(WriteTransfer, ResendsAckOnTimeout)
{
    PacketQueue in;
    PacketQueue out;
    WriteRequestPacket wrq ("upload", "octet");
    WriteTransfer transfer (in, out, wrq, little_endian, fast_config(10, 1));

    ASSERT_EQ (transfer.accept(), 0);

    uint8_t buf[16];
    errno = 0;
    EXPECT_EQ (transfer.read(buf, sizeof(buf)), -1);
    EXPECT_EQ (errno, ETIMEDOUT);

    auto sent = drain (out);
    ASSERT_EQ (sent.size(), 3u);
    EXPECT_EQ (*sent[0], AckPacket(0));
    EXPECT_EQ (*sent[1], AckPacket(0));
    EXPECT_EQ (*sent[2], ErrorPacket(err_undefined, "Receive timeout"));
}


TEST(WriteTransfer, SizeLimit)
{
    PacketQueue in;
    PacketQueue out;
    WriteRequestPacket wrq ("upload", "octet");
    TransferConfig cfg;
    cfg.max_size = 600;
    WriteTransfer transfer (in, out, wrq, little_endian, cfg);

    in.send (std::make_shared<DataPacket>(1, make_data(512)));
    in.send (std::make_shared<DataPacket>(2, make_data(512)));

    // Data received before the limit is still delivered
    std::vector<uint8_t> buf (2000);
    EXPECT_EQ (transfer.read(buf.data(), buf.size()), 512);
    EXPECT_TRUE (transfer.is_failed());

    errno = 0;
    EXPECT_EQ (transfer.read(buf.data(), buf.size()), -1);
    EXPECT_EQ (errno, EFBIG);

    auto sent = drain (out);
    ASSERT_EQ (sent.size(), 2u);
    EXPECT_EQ (*sent[0], AckPacket(1));
    EXPECT_EQ (as_error(sent[1]).code(), err_disk_full);
}


TEST(WriteTransfer, ChannelClosedWhileWaiting)
{
    PacketQueue in;
    PacketQueue out;
    WriteRequestPacket wrq ("upload", "octet");
    WriteTransfer transfer (in, out, wrq, little_endian);

    std::thread closer ([&in](){
        std::this_thread::sleep_for (std::chrono::milliseconds(20));
        in.close ();
    });

    uint8_t buf[16];
    errno = 0;
    EXPECT_EQ (transfer.read(buf, sizeof(buf)), -1);
    EXPECT_EQ (errno, ECANCELED);
    closer.join ();
}


TEST(WriteTransfer, BlockNumberWrapsAround)
{
    DataFeeder peer (65536, 100);
    WriteRequestPacket wrq ("big", "octet");
    WriteTransfer transfer (peer, peer, wrq, big_endian);

    std::vector<uint8_t> buf (64 * 1024);
    size_t total = 0;
    for (;;) {
        auto len = transfer.read (buf.data(), buf.size());
        ASSERT_GE (len, 0);
        if (len == 0)
            break;
        total += len;
    }

    EXPECT_TRUE (transfer.is_done());
    EXPECT_EQ (total, 65536u * data_block_size + 100);
    ASSERT_EQ (peer.acks.size(), 65537u);
    EXPECT_EQ (peer.acks[65534], 65535);
    EXPECT_EQ (peer.acks[65535], 0);
    EXPECT_EQ (peer.acks[65536], 1);
}
