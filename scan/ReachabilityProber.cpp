#include "ReachabilityProber.hpp"

#include <exception>
#include <iostream>

namespace netscout::scan
{
    ReachabilityProber::ReachabilityProber(Pinger &pinger, std::chrono::milliseconds timeout)
        : m_pinger(pinger), m_timeout(timeout)
    {
    }

    bool ReachabilityProber::IsAlive(const std::string &address)
    {
        try
        {
            return m_pinger.Ping(address, m_timeout);
        }
        catch (const std::exception &e)
        {
            std::cerr << "[Probe] Ping " << address << " failed: " << e.what() << "\n";
            return false;
        }
    }
}
