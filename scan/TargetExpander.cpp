#include "TargetExpander.hpp"
#include "ScanTypes.hpp"

#include <arpa/inet.h>
#include <cctype>
#include <unordered_set>

namespace netscout::scan
{
    uint32_t Ipv4Network::Broadcast() const
    {
        if (prefix_length == 0)
            return 0xFFFFFFFFu;
        uint32_t mask = 0xFFFFFFFFu << (32 - prefix_length);
        return network | ~mask;
    }

    std::vector<uint32_t> Ipv4Network::Hosts() const
    {
        std::vector<uint32_t> hosts;
        uint32_t broadcast = Broadcast();

        // /31 point-to-point and /32 host routes have no network/broadcast pair
        if (prefix_length >= 31)
        {
            for (uint64_t a = network; a <= broadcast; ++a)
                hosts.push_back(static_cast<uint32_t>(a));
            return hosts;
        }

        hosts.reserve(broadcast - network - 1);
        for (uint64_t a = static_cast<uint64_t>(network) + 1; a < broadcast; ++a)
            hosts.push_back(static_cast<uint32_t>(a));
        return hosts;
    }

    TargetExpander::TargetExpander(int min_prefix_length, size_t max_networks)
        : m_min_prefix_length(min_prefix_length), m_max_networks(max_networks)
    {
    }

    std::optional<Ipv4Network> TargetExpander::ParseCidr(const std::string &cidr)
    {
        auto slash = cidr.find('/');
        std::string addr_part = cidr.substr(0, slash);
        int prefix = 32;

        if (slash != std::string::npos)
        {
            std::string prefix_part = cidr.substr(slash + 1);
            if (prefix_part.empty() || prefix_part.size() > 2)
                return std::nullopt;
            for (char c : prefix_part)
            {
                if (!std::isdigit(static_cast<unsigned char>(c)))
                    return std::nullopt;
            }
            prefix = std::stoi(prefix_part);
            if (prefix > 32)
                return std::nullopt;
        }

        in_addr parsed{};
        if (inet_pton(AF_INET, addr_part.c_str(), &parsed) != 1)
            return std::nullopt;

        uint32_t address = ntohl(parsed.s_addr);
        uint32_t mask = prefix == 0 ? 0 : (0xFFFFFFFFu << (32 - prefix));

        Ipv4Network net;
        net.network = address & mask;
        net.prefix_length = prefix;
        return net;
    }

    std::string TargetExpander::ToDottedQuad(uint32_t address)
    {
        in_addr raw{};
        raw.s_addr = htonl(address);
        char buf[INET_ADDRSTRLEN] = {};
        inet_ntop(AF_INET, &raw, buf, sizeof(buf));
        return buf;
    }

    std::vector<std::string> TargetExpander::Expand(const std::vector<std::string> &cidrs) const
    {
        if (cidrs.empty())
            throw ValidationError("At least one CIDR required");

        if (cidrs.size() > m_max_networks)
        {
            throw ValidationError("Too many networks: " + std::to_string(cidrs.size()) +
                                  " given, at most " + std::to_string(m_max_networks) + " allowed");
        }

        // Validate everything before expanding anything.
        std::vector<Ipv4Network> networks;
        networks.reserve(cidrs.size());
        for (const auto &cidr : cidrs)
        {
            auto net = ParseCidr(cidr);
            if (!net)
                throw ValidationError("Invalid CIDR format: " + cidr);

            if (net->prefix_length < m_min_prefix_length)
            {
                throw ValidationError("CIDR too large (minimum /" + std::to_string(m_min_prefix_length) +
                                      "): " + cidr);
            }
            networks.push_back(*net);
        }

        std::vector<std::string> targets;
        std::unordered_set<uint32_t> seen;
        for (const auto &net : networks)
        {
            for (uint32_t host : net.Hosts())
            {
                if (seen.insert(host).second)
                    targets.push_back(ToDottedQuad(host));
            }
        }
        return targets;
    }
}
