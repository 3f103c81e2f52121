#pragma once

#include "../publish/NautobotRegistrar.hpp"
#include "../scan/ScanTypes.hpp"

#include <functional>
#include <string>

namespace netscout::server
{
    struct Settings
    {
        int port = 8443;
        std::string cert_path = "certs/server.crt";
        std::string key_path = "certs/server.key";
        std::string data_dir = "data";
        std::string db_path;
        std::string secret_key;
        std::string inventory_dir;
        scan::ScanLimits limits;
        publish::NautobotConfig nautobot;
        bool nautobot_verify_tls = true;

        using Lookup = std::function<const char *(const char *)>;

        // Reads NETSCOUT_* and NAUTOBOT_* variables. Throws std::runtime_error
        // naming the variable when a value is missing or out of range.
        static Settings FromEnvironment(const Lookup &lookup = nullptr);
    };
}
