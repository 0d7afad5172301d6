#include <gtest/gtest.h>
#include "io/Pipe.hpp"
#include "io/Reader.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

using namespace dt::io;
using namespace std::chrono_literals;

namespace {

// Spins until pred holds or two seconds pass
template<typename Pred>
bool eventually(Pred&& pred) {
    const auto deadline = std::chrono::steady_clock::now() + 2s;
    while (!pred()) {
        if (std::chrono::steady_clock::now() > deadline) return false;
        std::this_thread::sleep_for(1ms);
    }
    return true;
}

}

TEST(PipeTest, WriteThenReadToEnd) {
    const auto pipe = std::make_shared<Pipe>(64);
    pipe->write("Hello World", 11);
    pipe->closeWrite();

    PipeReader reader(pipe);
    EXPECT_EQ(readAll(reader), "Hello World");

    char c;
    EXPECT_EQ(reader.read(&c, 1), 0u);
}

TEST(PipeTest, WriterBlocksWhileFull) {
    const auto pipe = std::make_shared<Pipe>(4);
    std::atomic<bool> done{false};

    std::thread writer([&] {
        pipe->write("0123456789abcdef", 16);
        pipe->closeWrite();
        done = true;
    });

    ASSERT_TRUE(eventually([&] { return pipe->buffered() == 4; }));
    std::this_thread::sleep_for(20ms);
    EXPECT_FALSE(done);

    PipeReader reader(pipe);
    EXPECT_EQ(readAll(reader), "0123456789abcdef");
    writer.join();
    EXPECT_TRUE(done);
}

TEST(PipeTest, OrderSurvivesWrapAround) {
    const auto pipe = std::make_shared<Pipe>(7);
    std::string expected;
    for (int i = 0; i < 500; ++i) expected += static_cast<char>('a' + i % 26);

    std::thread writer([&] {
        for (size_t off = 0; off < expected.size(); off += 3)
            pipe->write(expected.data() + off, std::min<size_t>(3, expected.size() - off));
        pipe->closeWrite();
    });

    std::string got;
    char buf[5];
    while (const size_t n = pipe->read(buf, sizeof(buf))) got.append(buf, n);
    writer.join();

    EXPECT_EQ(got, expected);
}

TEST(PipeTest, WriterErrorReachesReaderAfterBufferedData) {
    const auto pipe = std::make_shared<Pipe>(16);
    pipe->write("abc", 3);
    pipe->closeWrite(std::make_exception_ptr(std::runtime_error("producer failed")));

    char buf[8];
    ASSERT_EQ(pipe->read(buf, sizeof(buf)), 3u);
    try {
        (void)pipe->read(buf, sizeof(buf));
        FAIL() << "expected the producer error";
    } catch (const std::runtime_error& e) {
        EXPECT_STREQ(e.what(), "producer failed");
    }
}

TEST(PipeTest, CloseReadWakesBlockedWriter) {
    const auto pipe = std::make_shared<Pipe>(2);
    std::string error;

    std::thread writer([&] {
        try {
            pipe->write("0123456789", 10);
        } catch (const std::runtime_error& e) {
            error = e.what();
        }
    });

    ASSERT_TRUE(eventually([&] { return pipe->buffered() == 2; }));
    pipe->closeRead(std::make_exception_ptr(std::runtime_error("upload rejected")));
    writer.join();

    EXPECT_EQ(error, "upload rejected");
    EXPECT_EQ(pipe->buffered(), 0u);
}

TEST(PipeTest, ClosedEndsRejectFurtherUse) {
    auto pipe = std::make_shared<Pipe>(8);
    pipe->closeWrite();
    EXPECT_THROW(pipe->write("x", 1), std::runtime_error);

    pipe = std::make_shared<Pipe>(8);
    pipe->closeRead();
    char c;
    EXPECT_THROW((void)pipe->read(&c, 1), std::runtime_error);
    EXPECT_THROW(pipe->write("x", 1), std::runtime_error);
}

TEST(PipeTest, DroppedReaderClosesReadEnd) {
    const auto pipe = std::make_shared<Pipe>(8);
    {
        PipeReader reader(pipe);
    }
    EXPECT_THROW(pipe->write("x", 1), std::runtime_error);
}

TEST(PipeTest, ReadFullGathersAcrossWrites) {
    const auto pipe = std::make_shared<Pipe>(3);
    std::thread writer([&] {
        pipe->write("abcdefgh", 8);
        pipe->closeWrite();
    });

    PipeReader reader(pipe);
    char buf[6];
    EXPECT_EQ(readFull(reader, buf, sizeof(buf)), 6u);
    EXPECT_EQ(std::string(buf, 6), "abcdef");
    EXPECT_EQ(readFull(reader, buf, sizeof(buf)), 2u);
    writer.join();
}
