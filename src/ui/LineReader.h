#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/system/error_code.hpp>

#include <cstddef>
#include <functional>
#include <string>

namespace lanchat::ui {

// Reads lines from a descriptor on an io_context, so input can be abandoned
// when the session ends instead of blocking in std::getline.
// Must outlive the io_context's handlers.
class LineReader {
public:
    // Return false from OnLine to stop reading.
    using OnLine = std::function<bool(const std::string&)>;
    using OnEnd = std::function<void()>;

    LineReader(boost::asio::io_context& ioc, OnLine on_line, OnEnd on_end);

    LineReader(const LineReader&) = delete;
    LineReader& operator=(const LineReader&) = delete;

    // Reads from a duplicate of `fd`; the caller keeps its own. Returns false
    // if the descriptor cannot be used.
    bool start(int fd, boost::system::error_code& ec);

    // Safe from any thread. OnEnd is not called after a stop.
    void stop();

private:
    void do_read();
    void on_read(boost::system::error_code ec, std::size_t bytes);
    void finish(bool notify);

    boost::asio::posix::stream_descriptor input_;
    std::string pending_;
    OnLine on_line_;
    OnEnd on_end_;
    bool done_ = false;
};

} // namespace lanchat::ui
