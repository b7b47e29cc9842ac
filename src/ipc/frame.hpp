#pragma once
#include <array>
#include <cstdint>
#include <string>

namespace Folio {
namespace Ipc {

// Frames are a 4-byte big-endian length followed by that many bytes of JSON.
constexpr size_t FRAME_HEADER_SIZE = 4;

using FrameHeader = std::array<uint8_t, FRAME_HEADER_SIZE>;

std::string encode_frame(const std::string& payload);

// Throws Core::ProtocolError when the announced length exceeds the frame size cap.
uint32_t decode_frame_length(const FrameHeader& header);

}  // namespace Ipc
}  // namespace Folio
