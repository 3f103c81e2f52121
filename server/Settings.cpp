#include "Settings.hpp"

#include <cstdlib>
#include <stdexcept>

namespace netscout::server
{
    namespace
    {
        std::string Text(const Settings::Lookup &lookup, const char *name, const std::string &fallback)
        {
            const char *value = lookup(name);
            if (!value || !*value)
                return fallback;
            return value;
        }

        long long Number(const Settings::Lookup &lookup, const char *name, long long fallback, long long min, long long max)
        {
            const char *value = lookup(name);
            if (!value || !*value)
                return fallback;

            std::string text(value);
            size_t used = 0;
            long long parsed = 0;
            try
            {
                parsed = std::stoll(text, &used);
            }
            catch (const std::exception &)
            {
                throw std::runtime_error(std::string(name) + " must be an integer, got '" + text + "'");
            }
            if (used != text.size())
                throw std::runtime_error(std::string(name) + " must be an integer, got '" + text + "'");
            if (parsed < min || parsed > max)
                throw std::runtime_error(std::string(name) + " must be between " + std::to_string(min) + " and " +
                                         std::to_string(max) + ", got " + text);
            return parsed;
        }

        bool Flag(const Settings::Lookup &lookup, const char *name, bool fallback)
        {
            std::string text = Text(lookup, name, "");
            if (text.empty())
                return fallback;
            if (text == "1" || text == "true" || text == "yes")
                return true;
            if (text == "0" || text == "false" || text == "no")
                return false;
            throw std::runtime_error(std::string(name) + " must be true or false, got '" + text + "'");
        }
    }

    Settings Settings::FromEnvironment(const Lookup &lookup_in)
    {
        Lookup lookup = lookup_in ? lookup_in : [](const char *name) -> const char *
        { return std::getenv(name); };

        Settings s;
        s.port = static_cast<int>(Number(lookup, "NETSCOUT_PORT", s.port, 1, 65535));
        s.cert_path = Text(lookup, "NETSCOUT_CERT", s.cert_path);
        s.key_path = Text(lookup, "NETSCOUT_KEY", s.key_path);
        s.data_dir = Text(lookup, "NETSCOUT_DATA_DIR", s.data_dir);
        s.db_path = Text(lookup, "NETSCOUT_DB_PATH", s.data_dir + "/settings/netscout.db");
        s.inventory_dir = Text(lookup, "NETSCOUT_INVENTORY_DIR", s.data_dir + "/inventory");

        s.secret_key = Text(lookup, "NETSCOUT_SECRET_KEY", "");
        if (s.secret_key.empty())
            throw std::runtime_error("NETSCOUT_SECRET_KEY is required to encrypt stored credentials");

        scan::ScanLimits &l = s.limits;
        l.min_prefix_length = static_cast<int>(Number(lookup, "NETSCOUT_MIN_PREFIX", l.min_prefix_length, 0, 32));
        l.max_networks = static_cast<size_t>(Number(lookup, "NETSCOUT_MAX_NETWORKS", static_cast<long long>(l.max_networks), 1, 1024));
        l.max_in_flight = static_cast<size_t>(Number(lookup, "NETSCOUT_CONCURRENCY", static_cast<long long>(l.max_in_flight), 1, 1024));
        l.ping_timeout = std::chrono::milliseconds(Number(lookup, "NETSCOUT_PING_TIMEOUT_MS", l.ping_timeout.count(), 1, 60000));
        l.login_timeout = std::chrono::milliseconds(Number(lookup, "NETSCOUT_LOGIN_TIMEOUT_MS", l.login_timeout.count(), 1, 300000));
        l.login_attempts = static_cast<int>(Number(lookup, "NETSCOUT_LOGIN_ATTEMPTS", l.login_attempts, 1, 20));
        l.job_ttl = std::chrono::seconds(Number(lookup, "NETSCOUT_JOB_TTL_SECONDS", l.job_ttl.count(), 1, 365LL * 24 * 3600));

        s.nautobot.url = Text(lookup, "NAUTOBOT_URL", "");
        s.nautobot.token = Text(lookup, "NAUTOBOT_TOKEN", "");
        s.nautobot.job_name = Text(lookup, "NAUTOBOT_ONBOARD_JOB", s.nautobot.job_name);
        s.nautobot_verify_tls = Flag(lookup, "NAUTOBOT_VERIFY_TLS", true);
        return s;
    }
}
