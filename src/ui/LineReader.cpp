#include "ui/LineReader.h"

#include "util/Log.h"

#include <boost/asio/post.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/strand.hpp>

#include <unistd.h>

#include <cerrno>
#include <utility>

namespace lanchat::ui {

namespace asio = boost::asio;

namespace {

void strip_newline(std::string& line) {
    if (!line.empty() && line.back() == '\n') line.pop_back();
    if (!line.empty() && line.back() == '\r') line.pop_back();
}

} // namespace

LineReader::LineReader(asio::io_context& ioc, OnLine on_line, OnEnd on_end)
    : input_(asio::make_strand(ioc)), on_line_(std::move(on_line)), on_end_(std::move(on_end)) {}

bool LineReader::start(int fd, boost::system::error_code& ec) {
    const int copy = ::dup(fd);
    if (copy < 0) {
        ec.assign(errno, boost::system::system_category());
        return false;
    }
    input_.assign(copy, ec);
    if (ec) {
        ::close(copy);
        return false;
    }
    asio::post(input_.get_executor(), [this] { do_read(); });
    return true;
}

void LineReader::stop() {
    asio::post(input_.get_executor(), [this] { finish(false); });
}

void LineReader::do_read() {
    if (done_) return;
    asio::async_read_until(input_, asio::dynamic_buffer(pending_), '\n',
                           [this](boost::system::error_code ec, std::size_t bytes) { on_read(ec, bytes); });
}

void LineReader::on_read(boost::system::error_code ec, std::size_t bytes) {
    if (done_) return;

    if (ec) {
        if (ec == asio::error::operation_aborted) return;
        if (ec != asio::error::eof) util::log(util::Level::Warn, "LineReader", "input: " + ec.message());

        // A last line without a newline still counts.
        if (!pending_.empty()) {
            std::string line = std::move(pending_);
            pending_.clear();
            strip_newline(line);
            on_line_(line);
        }
        return finish(true);
    }

    std::string line = pending_.substr(0, bytes);
    pending_.erase(0, bytes);
    strip_newline(line);
    if (!on_line_(line)) return finish(false);
    do_read();
}

void LineReader::finish(bool notify) {
    if (done_) return;
    done_ = true;

    boost::system::error_code ignored;
    input_.close(ignored);
    if (notify && on_end_) on_end_();
}

} // namespace lanchat::ui
