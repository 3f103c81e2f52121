#include "ClientNetwork.hpp"
#include "SelectionFile.hpp"

#include "../common/Messages.hpp"

#include <cstdlib>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using netscout::protocol::MessageType;

namespace
{
    class UsageError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    void Usage()
    {
        std::cerr << "Usage: netscout <host> <port> <command> [args]\n"
                  << "  scan --cidr CIDR [--cidr CIDR ...] --cred ID [--cred ID ...]\n"
                  << "       [--mode full|shell] [--parser-template ID ...]\n"
                  << "  status <job_id>\n"
                  << "  jobs\n"
                  << "  delete <job_id>\n"
                  << "  onboard <job_id> <selection_file> [--template ID] [--artifact NAME]\n"
                  << "          [--commit] [--message MSG] [--push]\n"
                  << "Set NETSCOUT_CA to verify the server certificate.\n";
    }

    int ParseId(const std::string &text, const char *what)
    {
        const std::string error = std::string(what) + " must be an integer, got '" + text + "'";
        size_t used = 0;
        int value = 0;
        try
        {
            value = std::stoi(text, &used);
        }
        catch (const std::exception &)
        {
            throw UsageError(error);
        }
        if (used != text.size())
            throw UsageError(error);
        return value;
    }

    std::string NextValue(const std::vector<std::string> &args, size_t &i)
    {
        if (i + 1 >= args.size())
            throw UsageError(args[i] + " needs a value");
        return args[++i];
    }

    std::string FormatTime(int64_t unix_seconds)
    {
        std::time_t t = static_cast<std::time_t>(unix_seconds);
        std::tm tm{};
        gmtime_r(&t, &tm);
        char buf[32];
        std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%SZ", &tm);
        return buf;
    }

    // Returns false after printing the server's error.
    bool Expect(const netscout::common::Frame &frame, MessageType expected)
    {
        if (frame.type == expected)
            return true;

        std::string message;
        if (frame.type == MessageType::ErrorResp && netscout::common::DecodeError(frame.payload, message))
            std::cerr << "Error: " << message << std::endl;
        else
            std::cerr << "Error: unexpected reply type " << static_cast<int>(frame.type) << std::endl;
        return false;
    }

    std::optional<netscout::common::Frame> Send(netscout::client::ClientNetwork &net, MessageType type,
                                                const std::vector<uint8_t> &payload)
    {
        auto frame = net.Request(type, payload);
        if (!frame)
            std::cerr << "Error: no reply from server" << std::endl;
        return frame;
    }

    int RunScan(netscout::client::ClientNetwork &net, const std::vector<std::string> &args)
    {
        netscout::scan::ScanRequest request;
        for (size_t i = 0; i < args.size(); ++i)
        {
            if (args[i] == "--cidr")
                request.cidrs.push_back(NextValue(args, i));
            else if (args[i] == "--cred")
                request.credential_ids.push_back(ParseId(NextValue(args, i), "--cred"));
            else if (args[i] == "--parser-template")
                request.parser_template_ids.push_back(ParseId(NextValue(args, i), "--parser-template"));
            else if (args[i] == "--mode")
            {
                std::string mode = NextValue(args, i);
                auto parsed = netscout::scan::ParseClassificationMode(mode);
                if (!parsed)
                    throw UsageError("--mode must be full or shell");
                request.mode = *parsed;
            }
            else
                throw UsageError("unknown scan option '" + args[i] + "'");
        }

        auto frame = Send(net, MessageType::ScanStartReq, netscout::common::EncodeScanRequest(request));
        if (!frame || !Expect(*frame, MessageType::ScanStartResp))
            return 1;

        netscout::common::ScanStartResponse response;
        if (!netscout::common::DecodeScanStartResponse(frame->payload, response))
        {
            std::cerr << "Error: malformed reply" << std::endl;
            return 1;
        }

        std::cout << "Job " << response.job_id << " " << netscout::scan::ToString(response.state)
                  << " (" << response.total_targets << " targets)" << std::endl;
        return 0;
    }

    void PrintSnapshot(const netscout::scan::ScanJobSnapshot &s)
    {
        const auto &c = s.counters;
        std::cout << "Job:      " << s.job_id << "\n"
                  << "State:    " << netscout::scan::ToString(s.state) << "\n"
                  << "Created:  " << FormatTime(s.created_unix) << "\n"
                  << "Progress: " << c.scanned << "/" << c.total << " scanned, " << c.alive << " alive, "
                  << c.unreachable << " unreachable, " << c.authenticated << " authenticated, "
                  << c.auth_failed << " auth failed, " << c.driver_not_supported << " driver not supported\n";

        if (!s.results.empty())
        {
            std::cout << "\n"
                      << std::left << std::setw(17) << "ADDRESS"
                      << std::setw(16) << "FAMILY"
                      << std::setw(24) << "HOSTNAME"
                      << std::setw(24) << "PLATFORM"
                      << std::setw(6) << "CRED"
                      << "FAILURE\n";

            for (const auto &r : s.results)
            {
                std::cout << std::left << std::setw(17) << r.address
                          << std::setw(16) << (r.family ? netscout::scan::ToString(*r.family) : "-")
                          << std::setw(24) << (r.hostname.empty() ? "-" : r.hostname)
                          << std::setw(24) << (r.platform.empty() ? "-" : r.platform)
                          << std::setw(6) << (r.credential_id ? std::to_string(*r.credential_id) : "-")
                          << (r.failure == netscout::scan::HostFailure::None ? "" : netscout::scan::ToString(r.failure))
                          << "\n";
            }
        }

        if (!s.errors.empty())
        {
            std::cout << "\nErrors:\n";
            for (const auto &e : s.errors)
                std::cout << "  " << e << "\n";
        }
        std::cout << std::flush;
    }

    int RunStatus(netscout::client::ClientNetwork &net, const std::vector<std::string> &args)
    {
        if (args.size() != 1)
            throw UsageError("status takes a job id");

        auto frame = Send(net, MessageType::ScanStatusReq, netscout::common::EncodeJobId(args[0]));
        if (!frame || !Expect(*frame, MessageType::ScanStatusResp))
            return 1;

        netscout::scan::ScanJobSnapshot snapshot;
        if (!netscout::common::DecodeSnapshot(frame->payload, snapshot))
        {
            std::cerr << "Error: malformed reply" << std::endl;
            return 1;
        }
        PrintSnapshot(snapshot);
        return 0;
    }

    int RunJobs(netscout::client::ClientNetwork &net)
    {
        auto frame = Send(net, MessageType::ScanListReq, {});
        if (!frame || !Expect(*frame, MessageType::ScanListResp))
            return 1;

        std::vector<netscout::scan::ScanJobSummary> jobs;
        if (!netscout::common::DecodeSummaries(frame->payload, jobs))
        {
            std::cerr << "Error: malformed reply" << std::endl;
            return 1;
        }

        if (jobs.empty())
        {
            std::cout << "No jobs." << std::endl;
            return 0;
        }

        std::cout << std::left << std::setw(32) << "JOB"
                  << std::setw(10) << "STATE"
                  << std::setw(22) << "CREATED"
                  << std::setw(8) << "TOTAL"
                  << "AUTHENTICATED\n";
        for (const auto &j : jobs)
        {
            std::cout << std::left << std::setw(32) << j.job_id
                      << std::setw(10) << netscout::scan::ToString(j.state)
                      << std::setw(22) << FormatTime(j.created_unix)
                      << std::setw(8) << j.total
                      << j.authenticated << "\n";
        }
        std::cout << std::flush;
        return 0;
    }

    int RunDelete(netscout::client::ClientNetwork &net, const std::vector<std::string> &args)
    {
        if (args.size() != 1)
            throw UsageError("delete takes a job id");

        auto frame = Send(net, MessageType::ScanDeleteReq, netscout::common::EncodeJobId(args[0]));
        if (!frame || !Expect(*frame, MessageType::ScanDeleteResp))
            return 1;

        std::cout << "Deleted " << args[0] << std::endl;
        return 0;
    }

    int RunOnboard(netscout::client::ClientNetwork &net, const std::vector<std::string> &args)
    {
        if (args.size() < 2)
            throw UsageError("onboard takes a job id and a selection file");

        netscout::onboard::OnboardRequest request;
        request.job_id = args[0];

        std::ifstream in(args[1]);
        if (!in)
        {
            std::cerr << "Error: cannot read " << args[1] << std::endl;
            return 1;
        }
        request.devices = netscout::client::ParseSelections(in);

        for (size_t i = 2; i < args.size(); ++i)
        {
            if (args[i] == "--template")
                request.inventory_template_id = ParseId(NextValue(args, i), "--template");
            else if (args[i] == "--artifact")
                request.artifact_name = NextValue(args, i);
            else if (args[i] == "--commit")
                request.commit.enabled = true;
            else if (args[i] == "--message")
                request.commit.message = NextValue(args, i);
            else if (args[i] == "--push")
            {
                request.commit.enabled = true;
                request.commit.push = true;
            }
            else
                throw UsageError("unknown onboard option '" + args[i] + "'");
        }

        auto frame = Send(net, MessageType::OnboardReq, netscout::common::EncodeOnboardRequest(request));
        if (!frame || !Expect(*frame, MessageType::OnboardResp))
            return 1;

        netscout::onboard::OnboardResult result;
        if (!netscout::common::DecodeOnboardResult(frame->payload, result))
        {
            std::cerr << "Error: malformed reply" << std::endl;
            return 1;
        }

        std::cout << "Accepted:        " << result.accepted << "\n"
                  << "Network queued:  " << result.network_queued << "\n"
                  << "Network failed:  " << result.network_failed << "\n"
                  << "Servers added:   " << result.servers_added << "\n";
        for (const auto &id : result.tracking_ids)
            std::cout << "Tracking id:     " << id << "\n";
        if (result.artifact_path)
            std::cout << "Inventory:       " << *result.artifact_path << "\n";
        if (request.commit.enabled)
            std::cout << "Committed:       " << (result.committed ? "yes" : "no") << "\n";
        if (request.commit.push)
            std::cout << "Pushed:          " << (result.pushed ? "yes" : "no") << "\n";
        for (const auto &e : result.errors)
            std::cout << "Error:           " << e << "\n";
        std::cout << std::flush;

        return result.errors.empty() ? 0 : 3;
    }
}

int main(int argc, char **argv)
{
    if (argc < 4)
    {
        Usage();
        return 2;
    }

    const std::string host = argv[1];
    const std::string command = argv[3];
    std::vector<std::string> args(argv + 4, argv + argc);

    try
    {
        int port = ParseId(argv[2], "port");
        const char *ca = std::getenv("NETSCOUT_CA");

        netscout::client::ClientNetwork net(host, port, ca ? ca : "");
        if (command != "scan" && command != "status" && command != "jobs" && command != "delete" && command != "onboard")
            throw UsageError("unknown command '" + command + "'");

        if (!net.Connect())
            return 1;

        if (command == "scan")
            return RunScan(net, args);
        if (command == "status")
            return RunStatus(net, args);
        if (command == "jobs")
            return RunJobs(net);
        if (command == "delete")
            return RunDelete(net, args);
        return RunOnboard(net, args);
    }
    catch (const UsageError &e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        Usage();
        return 2;
    }
    catch (const netscout::client::SelectionError &e)
    {
        std::cerr << "Selection file: " << e.what() << std::endl;
        return 2;
    }
    catch (const std::exception &e)
    {
        std::cerr << "Fatal Client Error: " << e.what() << std::endl;
        return 1;
    }
}
