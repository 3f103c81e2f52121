#pragma once

#include <arpa/inet.h>
#include <cstdint>
#include <cstring>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace netscout::common::wire
{
    inline void append_u8(std::vector<std::uint8_t>& out, std::uint8_t value)
    {
        out.push_back(value);
    }

    inline bool read_u8(const std::vector<std::uint8_t>& in, std::size_t& offset, std::uint8_t& value_out)
    {
        if (offset + 1 > in.size())
            return false;

        value_out = in[offset];
        offset += 1;
        return true;
    }

    inline void append_u32_be(std::vector<std::uint8_t>& out, std::uint32_t value)
    {
        std::uint32_t be = htonl(value);
        const auto* p = reinterpret_cast<const std::uint8_t*>(&be);
        out.insert(out.end(), p, p + 4);
    }

    inline bool read_u32_be(const std::vector<std::uint8_t>& in, std::size_t& offset, std::uint32_t& value_out)
    {
        if (offset + 4 > in.size())
            return false;

        std::uint32_t be = 0;
        std::memcpy(&be, in.data() + offset, 4);
        value_out = ntohl(be);
        offset += 4;
        return true;
    }

    inline void append_u64_be(std::vector<std::uint8_t>& out, std::uint64_t value)
    {
        append_u32_be(out, static_cast<std::uint32_t>(value >> 32));
        append_u32_be(out, static_cast<std::uint32_t>(value & 0xFFFFFFFFu));
    }

    inline bool read_u64_be(const std::vector<std::uint8_t>& in, std::size_t& offset, std::uint64_t& value_out)
    {
        std::size_t tmp = offset;
        std::uint32_t hi = 0;
        std::uint32_t lo = 0;
        if (!read_u32_be(in, tmp, hi) || !read_u32_be(in, tmp, lo))
            return false;

        value_out = (static_cast<std::uint64_t>(hi) << 32) | lo;
        offset = tmp;
        return true;
    }

    inline void append_bool(std::vector<std::uint8_t>& out, bool value)
    {
        append_u8(out, value ? 1 : 0);
    }

    inline bool read_bool(const std::vector<std::uint8_t>& in, std::size_t& offset, bool& value_out)
    {
        std::uint8_t raw = 0;
        if (!read_u8(in, offset, raw))
            return false;
        value_out = raw != 0;
        return true;
    }

    inline void append_string(std::vector<std::uint8_t>& out, std::string_view s)
    {
        append_u32_be(out, static_cast<std::uint32_t>(s.size()));
        out.insert(out.end(), s.begin(), s.end());
    }

    inline bool read_string(const std::vector<std::uint8_t>& in, std::size_t& offset, std::string& out)
    {
        std::size_t tmp = offset;

        std::uint32_t len = 0;
        if (!read_u32_be(in, tmp, len))
            return false;

        if (tmp + len > in.size())
            return false;

        out.assign(reinterpret_cast<const char*>(in.data() + tmp), len);
        tmp += len;

        offset = tmp;
        return true;
    }

    // Presence flag followed by the string when set.
    inline void append_optional_string(std::vector<std::uint8_t>& out, const std::optional<std::string>& s)
    {
        append_bool(out, s.has_value());
        if (s)
            append_string(out, *s);
    }

    inline bool read_optional_string(const std::vector<std::uint8_t>& in, std::size_t& offset, std::optional<std::string>& out)
    {
        std::size_t tmp = offset;
        bool present = false;
        if (!read_bool(in, tmp, present))
            return false;

        if (!present)
        {
            out.reset();
            offset = tmp;
            return true;
        }

        std::string value;
        if (!read_string(in, tmp, value))
            return false;

        out = std::move(value);
        offset = tmp;
        return true;
    }

    inline void append_string_list(std::vector<std::uint8_t>& out, const std::vector<std::string>& items)
    {
        append_u32_be(out, static_cast<std::uint32_t>(items.size()));
        for (const auto& item : items)
            append_string(out, item);
    }

    inline bool read_string_list(const std::vector<std::uint8_t>& in, std::size_t& offset, std::vector<std::string>& out)
    {
        std::size_t tmp = offset;
        std::uint32_t count = 0;
        if (!read_u32_be(in, tmp, count))
            return false;

        // every element costs at least its length prefix
        if (count > (in.size() - tmp) / 4)
            return false;

        std::vector<std::string> items;
        items.reserve(count);
        for (std::uint32_t i = 0; i < count; ++i)
        {
            std::string item;
            if (!read_string(in, tmp, item))
                return false;
            items.push_back(std::move(item));
        }

        out = std::move(items);
        offset = tmp;
        return true;
    }
}
