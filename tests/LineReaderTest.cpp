#include "ui/LineReader.h"

#include <boost/asio/io_context.hpp>

#include <gtest/gtest.h>

#include <unistd.h>

#include <chrono>
#include <cstdio>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace lanchat;
using namespace std::chrono_literals;

namespace {

class Pipe {
public:
    Pipe() {
        if (::pipe(fds_) != 0) throw std::runtime_error("pipe failed");
    }
    ~Pipe() {
        close_read();
        close_write();
    }

    int read_end() const { return fds_[0]; }

    void write(const std::string& bytes) {
        ASSERT_EQ(::write(fds_[1], bytes.data(), bytes.size()), static_cast<ssize_t>(bytes.size()));
    }

    void close_read() {
        if (fds_[0] >= 0) ::close(fds_[0]);
        fds_[0] = -1;
    }
    void close_write() {
        if (fds_[1] >= 0) ::close(fds_[1]);
        fds_[1] = -1;
    }

private:
    int fds_[2] = {-1, -1};
};

struct Recorder {
    std::vector<std::string> lines;
    bool ended = false;
    std::string stop_at;

    ui::LineReader::OnLine on_line() {
        return [this](const std::string& line) {
            lines.push_back(line);
            return line != stop_at;
        };
    }
    ui::LineReader::OnEnd on_end() {
        return [this] { ended = true; };
    }
};

} // namespace

TEST(LineReader, DeliversLinesThenTheEnd) {
    Pipe pipe;
    boost::asio::io_context ioc;
    Recorder rec;
    ui::LineReader reader(ioc, rec.on_line(), rec.on_end());

    boost::system::error_code ec;
    ASSERT_TRUE(reader.start(pipe.read_end(), ec)) << ec.message();
    pipe.write("hello\nwindows\r\n\nno newline");
    pipe.close_write();

    ioc.run_for(3s);
    EXPECT_TRUE(ioc.stopped());
    EXPECT_EQ(rec.lines, (std::vector<std::string>{"hello", "windows", "", "no newline"}));
    EXPECT_TRUE(rec.ended);
}

TEST(LineReader, CallbackCanStopReading) {
    Pipe pipe;
    boost::asio::io_context ioc;
    Recorder rec;
    rec.stop_at = "/quit";
    ui::LineReader reader(ioc, rec.on_line(), rec.on_end());

    boost::system::error_code ec;
    ASSERT_TRUE(reader.start(pipe.read_end(), ec));
    pipe.write("one\n/quit\ntwo\n");

    ioc.run_for(3s);
    EXPECT_TRUE(ioc.stopped());
    EXPECT_EQ(rec.lines, (std::vector<std::string>{"one", "/quit"}));
    EXPECT_FALSE(rec.ended);
}

TEST(LineReader, StopAbandonsAPendingRead) {
    Pipe pipe;
    boost::asio::io_context ioc;
    Recorder rec;
    ui::LineReader reader(ioc, rec.on_line(), rec.on_end());

    boost::system::error_code ec;
    ASSERT_TRUE(reader.start(pipe.read_end(), ec));

    std::thread io([&ioc] { ioc.run_for(3s); });
    std::this_thread::sleep_for(50ms);
    const auto started = std::chrono::steady_clock::now();
    reader.stop();
    io.join();

    EXPECT_LT(std::chrono::steady_clock::now() - started, 2s);
    EXPECT_TRUE(rec.lines.empty());
    EXPECT_FALSE(rec.ended);
}

TEST(LineReader, RegularFileIsReadToTheEnd) {
    std::FILE* file = std::tmpfile();
    ASSERT_NE(file, nullptr);
    std::fputs("first\nsecond\n", file);
    std::fflush(file);
    std::rewind(file);

    boost::asio::io_context ioc;
    Recorder rec;
    ui::LineReader reader(ioc, rec.on_line(), rec.on_end());
    boost::system::error_code ec;
    ASSERT_TRUE(reader.start(::fileno(file), ec)) << ec.message();

    ioc.run_for(3s);
    std::fclose(file);
    EXPECT_EQ(rec.lines, (std::vector<std::string>{"first", "second"}));
    EXPECT_TRUE(rec.ended);
}

TEST(LineReader, ClosedDescriptorIsRefused) {
    boost::asio::io_context ioc;
    Recorder rec;
    ui::LineReader reader(ioc, rec.on_line(), rec.on_end());
    boost::system::error_code ec;
    EXPECT_FALSE(reader.start(-1, ec));
    EXPECT_TRUE(ec);
}
