#include "frame.hpp"
#include "../core/types/constants.hpp"
#include "../core/types/errors.hpp"

namespace Folio {
namespace Ipc {

namespace {

void write_uint32_be(std::string& out, uint32_t value) {
    out.push_back(static_cast<char>((value >> 24) & 0xFF));
    out.push_back(static_cast<char>((value >> 16) & 0xFF));
    out.push_back(static_cast<char>((value >> 8) & 0xFF));
    out.push_back(static_cast<char>(value & 0xFF));
}

}  // namespace

std::string encode_frame(const std::string& payload) {
    if (payload.size() > Core::Constants::MAX_FRAME_SIZE)
        throw Core::ProtocolError("frame too large: " + std::to_string(payload.size()));

    std::string frame;
    frame.reserve(FRAME_HEADER_SIZE + payload.size());
    write_uint32_be(frame, static_cast<uint32_t>(payload.size()));
    frame += payload;
    return frame;
}

uint32_t decode_frame_length(const FrameHeader& header) {
    uint32_t length = (static_cast<uint32_t>(header[0]) << 24)
                      | (static_cast<uint32_t>(header[1]) << 16)
                      | (static_cast<uint32_t>(header[2]) << 8) | static_cast<uint32_t>(header[3]);
    if (length > Core::Constants::MAX_FRAME_SIZE)
        throw Core::ProtocolError("frame too large: " + std::to_string(length));
    return length;
}

}  // namespace Ipc
}  // namespace Folio
