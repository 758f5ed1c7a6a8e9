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
#include <tftpstream/ByteStream.hpp>
#include <gtest/gtest.h>
#include <type_traits>
#include <vector>
#include <cerrno>

using namespace tftpstream;


TEST(BufferSource, ReadsUntilEmpty)
{
    std::vector<uint8_t> bytes = {1, 2, 3, 4, 5};
    BufferSource src (bytes);
    uint8_t buf[4];

    EXPECT_EQ (src.remaining(), 5u);
    EXPECT_EQ (src.read(buf, sizeof(buf)), 4);
    EXPECT_EQ (buf[0], 1);
    EXPECT_EQ (buf[3], 4);
    EXPECT_EQ (src.remaining(), 1u);

    EXPECT_EQ (src.read(buf, sizeof(buf)), 1);
    EXPECT_EQ (buf[0], 5);

    // End of input
    EXPECT_EQ (src.read(buf, sizeof(buf)), 0);
    EXPECT_EQ (src.remaining(), 0u);
}


TEST(BufferSource, NullBuffer)
{
    BufferSource empty (nullptr, 10);
    uint8_t buf[2];
    EXPECT_EQ (empty.remaining(), 0u);
    EXPECT_EQ (empty.read(buf, sizeof(buf)), 0);

    std::vector<uint8_t> bytes = {1, 2};
    BufferSource src (bytes);
    errno = 0;
    EXPECT_EQ (src.read(nullptr, 1), -1);
    EXPECT_EQ (errno, EINVAL);
    EXPECT_EQ (src.read(nullptr, 0), 0);
}


TEST(BufferSource, RejectsTemporaryVector)
{
    // The source only refers to the vector, a temporary would dangle
    EXPECT_FALSE ((std::is_constructible<BufferSource, std::vector<uint8_t>&&>::value));
    EXPECT_TRUE ((std::is_constructible<BufferSource, std::vector<uint8_t>&>::value));
}


TEST(BufferSink, Appends)
{
    BufferSink sink;
    uint8_t a[] = {1, 2};
    uint8_t b[] = {3};

    EXPECT_EQ (sink.write(a, sizeof(a)), 2);
    EXPECT_EQ (sink.write(b, sizeof(b)), 1);
    EXPECT_EQ (sink.data(), (std::vector<uint8_t>{1, 2, 3}));

    errno = 0;
    EXPECT_EQ (sink.write(nullptr, 3), -1);
    EXPECT_EQ (errno, EINVAL);

    sink.clear ();
    EXPECT_TRUE (sink.data().empty());
}
