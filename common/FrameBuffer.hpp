#pragma once

#include <cstdint>
#include <optional>
#include <vector>
#include "protocol.hpp"

namespace netscout::common
{
    struct Frame
    {
        netscout::protocol::MessageType type;
        std::vector<uint8_t> payload;
    };

    // Accumulates bytes read from a stream and cuts them into frames.
    class FrameBuffer
    {
    private:
        std::vector<uint8_t> m_buffer;
        bool m_corrupt = false;

    public:
        FrameBuffer() = default;

        void Append(const uint8_t *data, size_t size);

        // Returns the next complete frame, or nullopt when more bytes are needed.
        // A bad magic or an oversized length marks the stream corrupt.
        std::optional<Frame> NextFrame();

        bool IsCorrupt() const { return m_corrupt; }
        size_t Size() const { return m_buffer.size(); }
        void Clear();
    };

}
