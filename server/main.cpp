#include "NetworkCore.hpp"
#include "Settings.hpp"
#include "Worker.hpp"

#include "../onboard/OnboardingDispatcher.hpp"
#include "../probes/SshSession.hpp"
#include "../probes/TinsPinger.hpp"
#include "../publish/GitArtifactStore.hpp"
#include "../publish/HttpClient.hpp"
#include "../publish/InventoryRenderer.hpp"
#include "../publish/NautobotRegistrar.hpp"
#include "../scan/JobRegistry.hpp"
#include "../scan/ScanCoordinator.hpp"
#include "../store/DatabaseManager.hpp"

#include <algorithm>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace
{
    netscout::server::NetworkCore *g_server = nullptr;

    void HandleSignal(int)
    {
        if (g_server)
            g_server->Stop();
    }

    void Usage()
    {
        std::cerr << "Usage:\n"
                  << "  netscoutd                                         run the server\n"
                  << "  netscoutd credential-add <name> <username> <type> [valid_until]\n"
                  << "                                                    password is read from stdin\n"
                  << "  netscoutd credential-list\n"
                  << "  netscoutd template-add <name> <parser|inventory> <file>\n"
                  << "  netscoutd template-list\n";
    }

    void OpenDatabase(netscout::store::DatabaseManager &db, const std::string &path)
    {
        std::filesystem::path parent = std::filesystem::path(path).parent_path();
        if (!parent.empty())
        {
            std::error_code ec;
            std::filesystem::create_directories(parent, ec);
            if (ec)
                throw std::runtime_error("Cannot create " + parent.string() + ": " + ec.message());
        }

        if (!db.Initialize(path))
            throw std::runtime_error("Failed to open settings database " + path);
    }

    int AddCredential(const netscout::server::Settings &settings, const std::vector<std::string> &args)
    {
        if (args.size() < 3 || args.size() > 4)
        {
            Usage();
            return 2;
        }

        std::string password;
        std::getline(std::cin, password);
        if (!password.empty() && password.back() == '\r')
            password.pop_back();
        if (password.empty())
        {
            std::cerr << "A password is required on standard input." << std::endl;
            return 2;
        }

        netscout::store::DatabaseManager db(settings.secret_key);
        OpenDatabase(db, settings.db_path);

        int id = db.CreateCredential(args[0], args[1], args[2], password, args.size() == 4 ? args[3] : "");
        std::fill(password.begin(), password.end(), '\0');
        if (id < 0)
        {
            std::cerr << "Credential was not stored (check type and date)." << std::endl;
            return 1;
        }

        std::cout << id << std::endl;
        return 0;
    }

    int ListCredentials(const netscout::server::Settings &settings)
    {
        netscout::store::DatabaseManager db(settings.secret_key);
        OpenDatabase(db, settings.db_path);

        for (const auto &record : db.ListCredentials())
        {
            std::cout << record.id << "\t" << record.name << "\t" << record.username << "\t" << record.type << "\t"
                      << (record.valid_until.empty() ? "-" : record.valid_until) << "\t" << record.status << "\n";
        }
        return 0;
    }

    int AddTemplate(const netscout::server::Settings &settings, const std::vector<std::string> &args)
    {
        if (args.size() != 3)
        {
            Usage();
            return 2;
        }

        netscout::scan::TemplateCategory category;
        if (args[1] == "parser")
            category = netscout::scan::TemplateCategory::Parser;
        else if (args[1] == "inventory")
            category = netscout::scan::TemplateCategory::Inventory;
        else
        {
            std::cerr << "Category must be 'parser' or 'inventory'." << std::endl;
            return 2;
        }

        std::ifstream in(args[2], std::ios::binary);
        if (!in)
        {
            std::cerr << "Cannot read " << args[2] << std::endl;
            return 1;
        }
        std::stringstream content;
        content << in.rdbuf();

        netscout::store::DatabaseManager db(settings.secret_key);
        OpenDatabase(db, settings.db_path);

        int id = db.CreateTemplate(args[0], category, content.str());
        if (id < 0)
        {
            std::cerr << "Template was not stored." << std::endl;
            return 1;
        }

        std::cout << id << std::endl;
        return 0;
    }

    int ListTemplates(const netscout::server::Settings &settings)
    {
        netscout::store::DatabaseManager db(settings.secret_key);
        OpenDatabase(db, settings.db_path);

        for (const auto &record : db.ListTemplates())
        {
            std::cout << record.id << "\t" << record.name << "\t"
                      << (record.category == netscout::scan::TemplateCategory::Parser ? "parser" : "inventory") << "\n";
        }
        return 0;
    }

    int Serve(const netscout::server::Settings &settings)
    {
        using namespace netscout;

        store::DatabaseManager db(settings.secret_key);
        OpenDatabase(db, settings.db_path);

        scan::JobRegistry registry(settings.limits.job_ttl);
        registry.Start();

        probes::TinsPinger pinger;
        probes::SshSessionFactory sessions;
        scan::ScanCoordinator coordinator(registry, pinger, sessions, db, &db, settings.limits);

        publish::HttpClient http(std::chrono::seconds(30), settings.nautobot_verify_tls);
        publish::NautobotRegistrar registrar(settings.nautobot, http);
        publish::InventoryRenderer renderer;
        publish::GitArtifactStore artifacts(settings.inventory_dir);
        onboard::OnboardingDispatcher dispatcher(registry, registrar, renderer, artifacts, &db);

        if (settings.nautobot.url.empty() || settings.nautobot.token.empty())
            std::cerr << "[Server] NAUTOBOT_URL or NAUTOBOT_TOKEN unset; network device registration will fail" << std::endl;

        server::Worker worker(coordinator, registry, dispatcher);
        server::NetworkCore core(settings.port, settings.cert_path, settings.key_path);
        core.SetWorker(&worker);
        worker.SetNetworkCore(&core);

        core.Init();
        worker.Start();

        g_server = &core;
        std::signal(SIGINT, HandleSignal);
        std::signal(SIGTERM, HandleSignal);
        std::signal(SIGPIPE, SIG_IGN);

        core.Run();

        g_server = nullptr;
        worker.Stop();
        std::cout << "[Server] Waiting for running scans to finish..." << std::endl;
        coordinator.JoinAll();
        registry.Stop();
        db.Shutdown();
        return 0;
    }
}

int main(int argc, char **argv)
{
    std::vector<std::string> args(argv + 1, argv + argc);

    try
    {
        netscout::server::Settings settings = netscout::server::Settings::FromEnvironment();

        if (args.empty() || args[0] == "serve")
            return Serve(settings);

        const std::string command = args[0];
        args.erase(args.begin());

        if (command == "credential-add")
            return AddCredential(settings, args);
        if (command == "credential-list")
            return ListCredentials(settings);
        if (command == "template-add")
            return AddTemplate(settings, args);
        if (command == "template-list")
            return ListTemplates(settings);

        Usage();
        return 2;
    }
    catch (const std::exception &e)
    {
        std::cerr << "Fatal Server Error: " << e.what() << '\n';
        return 1;
    }
}
