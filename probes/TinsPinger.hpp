#pragma once

#include "../scan/Collaborators.hpp"

#include <atomic>
#include <cstdint>

namespace netscout::probes
{
    // One ICMP echo per call through libtins. Needs raw socket privileges;
    // libtins exceptions propagate to the caller.
    class TinsPinger : public scan::Pinger
    {
    public:
        bool Ping(const std::string &address, std::chrono::milliseconds timeout) override;

    private:
        std::atomic<uint16_t> m_next_id{0x4E53};
    };
}
