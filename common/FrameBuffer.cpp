#include "FrameBuffer.hpp"
#include <iterator>

namespace netscout::common
{
    void FrameBuffer::Append(const uint8_t *data, size_t size)
    {
        m_buffer.insert(m_buffer.end(), data, data + size);
    }

    std::optional<Frame> FrameBuffer::NextFrame()
    {
        if (m_corrupt || m_buffer.size() < netscout::protocol::HEADER_SIZE)
            return std::nullopt;

        auto hdr = netscout::protocol::DeserializeHeader(m_buffer.data());

        if (hdr.magic != netscout::protocol::EXPECTED_MAGIC ||
            hdr.payload_length > netscout::protocol::MAX_PAYLOAD_LENGTH)
        {
            m_corrupt = true;
            return std::nullopt;
        }

        const size_t total = netscout::protocol::HEADER_SIZE + hdr.payload_length;
        if (m_buffer.size() < total)
            return std::nullopt;

        Frame frame;
        frame.type = static_cast<netscout::protocol::MessageType>(hdr.msg_type);
        auto start_it = m_buffer.begin() + netscout::protocol::HEADER_SIZE;
        frame.payload.assign(start_it, start_it + hdr.payload_length);

        m_buffer.erase(m_buffer.begin(), m_buffer.begin() + total);
        return frame;
    }

    void FrameBuffer::Clear()
    {
        m_buffer.clear();
        m_corrupt = false;
    }
}
