#pragma once
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/system/error_code.hpp>

#include "protocol.hpp"

namespace Folio {
namespace Ipc {

// Duplex message channel over a pair of pipe descriptors. Takes ownership of both.
class Channel {
public:
    Channel(boost::asio::io_context& ioc, int read_fd, int write_fd);

    Channel(const Channel&)            = delete;
    Channel& operator=(const Channel&) = delete;

    // Next validated message. Throws boost::system::system_error on EOF or a transport
    // failure and Core::ProtocolError on an invalid frame.
    boost::asio::awaitable<Message> receive();

    bool send(const Message& message, boost::system::error_code& ec);

    void close();
    bool is_open() const;

private:
    boost::asio::posix::stream_descriptor in_;
    boost::asio::posix::stream_descriptor out_;
};

}  // namespace Ipc
}  // namespace Folio
