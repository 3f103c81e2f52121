#pragma once

#include <cstdint>
#include <vector>
#include <cstddef>
#include <algorithm>

namespace netscout::protocol
{

    inline constexpr uint16_t EXPECTED_MAGIC = 0x5C4E;
    inline constexpr uint32_t MAX_PAYLOAD_LENGTH = 10 * 1024 * 1024; // 10MB
    inline constexpr size_t HEADER_SIZE = 8;

    struct Header
    {
        uint16_t magic;
        uint8_t msg_type;
        uint32_t payload_length;
        uint8_t reserved;
    };

    enum class MessageType : std::uint8_t
    {
        ScanStartReq = 0x01,
        ScanStartResp = 0x02,
        ScanStatusReq = 0x03,
        ScanStatusResp = 0x04,
        ScanListReq = 0x05,
        ScanListResp = 0x06,
        ScanDeleteReq = 0x07,
        ScanDeleteResp = 0x08,

        OnboardReq = 0x10,
        OnboardResp = 0x11,

        ErrorResp = 0xFF
    };

    inline bool IsRequest(MessageType type)
    {
        switch (type)
        {
        case MessageType::ScanStartReq:
        case MessageType::ScanStatusReq:
        case MessageType::ScanListReq:
        case MessageType::ScanDeleteReq:
        case MessageType::OnboardReq:
            return true;
        default:
            return false;
        }
    }

    inline Header MakeHeader(MessageType type, uint32_t payload_length)
    {
        Header hdr;
        hdr.magic = EXPECTED_MAGIC;
        hdr.msg_type = static_cast<uint8_t>(type);
        hdr.payload_length = payload_length;
        hdr.reserved = 0;
        return hdr;
    }

    inline void SerializeHeader(const Header& hdr, std::uint8_t* buffer)
    {
        buffer[0] = static_cast<uint8_t>((hdr.magic >> 8) & 0xFF);
        buffer[1] = static_cast<uint8_t>(hdr.magic & 0xFF);

        buffer[2] = hdr.msg_type;

        buffer[3] = static_cast<uint8_t>((hdr.payload_length >> 24) & 0xFF);
        buffer[4] = static_cast<uint8_t>((hdr.payload_length >> 16) & 0xFF);
        buffer[5] = static_cast<uint8_t>((hdr.payload_length >> 8) & 0xFF);
        buffer[6] = static_cast<uint8_t>(hdr.payload_length & 0xFF);

        buffer[7] = hdr.reserved;
    }

    inline Header DeserializeHeader(const std::uint8_t* buffer)
    {
        Header hdr;

        hdr.magic = (static_cast<uint16_t>(buffer[0]) << 8) |
                     static_cast<uint16_t>(buffer[1]);

        hdr.msg_type = buffer[2];

        hdr.payload_length = (static_cast<uint32_t>(buffer[3]) << 24) |
                             (static_cast<uint32_t>(buffer[4]) << 16) |
                             (static_cast<uint32_t>(buffer[5]) << 8)  |
                             static_cast<uint32_t>(buffer[6]);

        hdr.reserved = buffer[7];

        return hdr;
    }

    // Header followed by payload, ready for a single write.
    inline std::vector<std::uint8_t> BuildFrame(MessageType type, const std::vector<std::uint8_t>& payload)
    {
        std::vector<std::uint8_t> frame(HEADER_SIZE + payload.size());
        SerializeHeader(MakeHeader(type, static_cast<uint32_t>(payload.size())), frame.data());
        std::copy(payload.begin(), payload.end(), frame.begin() + HEADER_SIZE);
        return frame;
    }

}
