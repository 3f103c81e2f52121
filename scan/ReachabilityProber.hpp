#pragma once

#include "Collaborators.hpp"

#include <chrono>
#include <string>

namespace netscout::scan
{
    // Cheap alive/unreachable pre-filter run before any login attempt.
    class ReachabilityProber
    {
    public:
        ReachabilityProber(Pinger &pinger, std::chrono::milliseconds timeout);

        bool IsAlive(const std::string &address);

    private:
        Pinger &m_pinger;
        std::chrono::milliseconds m_timeout;
    };
}
