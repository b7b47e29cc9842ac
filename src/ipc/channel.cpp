#include "channel.hpp"
#include <utility>
#include <boost/asio/read.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <fcntl.h>
#include "frame.hpp"

namespace Folio {
namespace Ipc {

namespace net = boost::asio;

namespace {

// Inherited descriptors lose FD_CLOEXEC across dup2; processes we exec must not hold the pipe.
int close_on_exec(int fd) {
    int flags = ::fcntl(fd, F_GETFD);
    if (flags >= 0)
        ::fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
    return fd;
}

}  // namespace

Channel::Channel(net::io_context& ioc, int read_fd, int write_fd)
    : in_(ioc, close_on_exec(read_fd)), out_(ioc, close_on_exec(write_fd)) {
}

net::awaitable<Message> Channel::receive() {
    FrameHeader header;
    co_await net::async_read(in_, net::buffer(header), net::use_awaitable);

    std::string body(decode_frame_length(header), '\0');
    if (!body.empty())
        co_await net::async_read(in_, net::buffer(body), net::use_awaitable);

    co_return decode(body);
}

bool Channel::send(const Message& message, boost::system::error_code& ec) {
    if (!out_.is_open()) {
        ec = net::error::bad_descriptor;
        return false;
    }
    std::string frame = encode_frame(encode(message));
    net::write(out_, net::buffer(frame), ec);
    return !ec;
}

void Channel::close() {
    boost::system::error_code ignored;
    if (in_.is_open())
        in_.close(ignored);
    if (out_.is_open())
        out_.close(ignored);
}

bool Channel::is_open() const {
    return in_.is_open() && out_.is_open();
}

}  // namespace Ipc
}  // namespace Folio
