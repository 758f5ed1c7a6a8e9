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
#include <gtest/gtest.h>
#include <thread>
#include <chrono>
#include <cerrno>

using namespace tftpstream;


TEST(PacketQueue, Fifo)
{
    PacketQueue q;
    ASSERT_EQ (q.send(std::make_shared<AckPacket>(1)), 0);
    ASSERT_EQ (q.send(std::make_shared<AckPacket>(2)), 0);
    EXPECT_EQ (q.size(), 2u);

    auto p1 = q.receive (0);
    auto p2 = q.receive (0);
    ASSERT_NE (p1, nullptr);
    ASSERT_NE (p2, nullptr);
    EXPECT_EQ (*p1, AckPacket(1));
    EXPECT_EQ (*p2, AckPacket(2));
    EXPECT_EQ (q.size(), 0u);
}


TEST(PacketQueue, Timeout)
{
    PacketQueue q;

    errno = 0;
    EXPECT_EQ (q.receive(0), nullptr);
    EXPECT_EQ (errno, ETIMEDOUT);

    auto start = std::chrono::steady_clock::now ();
    errno = 0;
    EXPECT_EQ (q.receive(50), nullptr);
    EXPECT_EQ (errno, ETIMEDOUT);
    EXPECT_GE (std::chrono::steady_clock::now() - start, std::chrono::milliseconds(50));
}


TEST(PacketQueue, Capacity)
{
    PacketQueue q (1);
    EXPECT_EQ (q.send(std::make_shared<AckPacket>(1)), 0);
    errno = 0;
    EXPECT_EQ (q.send(std::make_shared<AckPacket>(2)), -1);
    EXPECT_EQ (errno, ENOBUFS);

    errno = 0;
    EXPECT_EQ (q.send(nullptr), -1);
    EXPECT_EQ (errno, EINVAL);
}


TEST(PacketQueue, CloseWakesReceiver)
{
    PacketQueue q;
    int err = 0;
    std::shared_ptr<const Packet> pkt = std::make_shared<AckPacket> (0);

    std::thread receiver ([&q, &err, &pkt](){
        pkt = q.receive ();
        err = errno;
    });
    std::this_thread::sleep_for (std::chrono::milliseconds(20));
    q.close ();
    receiver.join ();

    EXPECT_EQ (pkt, nullptr);
    EXPECT_EQ (err, ECANCELED);
    EXPECT_FALSE (q.is_open());

    errno = 0;
    EXPECT_EQ (q.send(std::make_shared<AckPacket>(1)), -1);
    EXPECT_EQ (errno, ECANCELED);
}


TEST(PacketQueue, CloseDiscardsQueued)
{
    PacketQueue q;
    ASSERT_EQ (q.send(std::make_shared<AckPacket>(1)), 0);
    q.close ();
    EXPECT_EQ (q.size(), 0u);

    errno = 0;
    EXPECT_EQ (q.receive(0), nullptr);
    EXPECT_EQ (errno, ECANCELED);
}


TEST(PacketQueue, CrossThread)
{
    PacketQueue q;
    std::thread sender ([&q](){
        for (uint16_t i=1; i<=100; ++i)
            q.send (std::make_shared<AckPacket>(i));
    });

    for (uint16_t i=1; i<=100; ++i) {
        auto pkt = q.receive (2000);
        if (!pkt) {
            ADD_FAILURE () << "No packet #" << i;
            break;
        }
        EXPECT_EQ (*pkt, AckPacket(i));
    }
    sender.join ();
}
