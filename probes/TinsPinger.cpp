#include "TinsPinger.hpp"

#include <memory>
#include <tins/tins.h>

namespace netscout::probes
{
    bool TinsPinger::Ping(const std::string &address, std::chrono::milliseconds timeout)
    {
        Tins::IPv4Address target(address);
        Tins::NetworkInterface iface(target);

        Tins::IP packet = Tins::IP(target) / Tins::ICMP();
        Tins::ICMP &icmp = packet.rfind_pdu<Tins::ICMP>();
        icmp.type(Tins::ICMP::ECHO_REQUEST);
        icmp.id(m_next_id++);
        icmp.sequence(1);

        auto ms = timeout.count() < 1 ? 1 : timeout.count();
        Tins::PacketSender sender(iface,
                                  static_cast<uint32_t>(ms / 1000),
                                  static_cast<uint32_t>((ms % 1000) * 1000));

        std::unique_ptr<Tins::PDU> reply(sender.send_recv(packet, iface));
        if (!reply)
            return false;

        const Tins::ICMP *answer = reply->find_pdu<Tins::ICMP>();
        return answer && answer->type() == Tins::ICMP::ECHO_REPLY;
    }
}
