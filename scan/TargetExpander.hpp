#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace netscout::scan
{
    struct Ipv4Network
    {
        uint32_t network; // host byte order, host bits cleared
        int prefix_length;

        uint32_t Broadcast() const;
        std::vector<uint32_t> Hosts() const;
    };

    // Turns operator CIDR ranges into one ordered, de-duplicated address list.
    class TargetExpander
    {
    public:
        TargetExpander(int min_prefix_length, size_t max_networks);

        // Throws ValidationError on an empty list, too many networks, a
        // malformed CIDR or a network larger than the minimum prefix allows.
        std::vector<std::string> Expand(const std::vector<std::string> &cidrs) const;

        static std::optional<Ipv4Network> ParseCidr(const std::string &cidr);
        static std::string ToDottedQuad(uint32_t address);

    private:
        int m_min_prefix_length;
        size_t m_max_networks;
    };
}
