#include "frame_splitter.hpp"

#include <algorithm>

namespace robomaster {

CanFrame MakeControlFrame(std::span<const uint8_t> bytes) noexcept {
  CanFrame frame;
  frame.len = static_cast<uint8_t>(std::min(bytes.size(), kMaxFrameData));
  std::copy_n(bytes.begin(), frame.len, frame.data.begin());
  return frame;
}

std::vector<CanFrame> SplitIntoFrames(std::span<const uint8_t> bytes) {
  std::vector<CanFrame> frames;
  frames.reserve((bytes.size() + kMaxFrameData - 1) / kMaxFrameData);
  for (size_t offset = 0; offset < bytes.size(); offset += kMaxFrameData) {
    const size_t chunk = std::min(kMaxFrameData, bytes.size() - offset);
    frames.push_back(MakeControlFrame(bytes.subspan(offset, chunk)));
  }
  return frames;
}

}  // namespace robomaster
