#pragma once

#include <thread>
#include <vector>
#include <atomic>
#include <functional>
#include "../common/ThreadSafeQueue.hpp"
#include "../common/protocol.hpp"
#include "../onboard/OnboardingDispatcher.hpp"
#include "../scan/JobRegistry.hpp"
#include "../scan/ScanCoordinator.hpp"

namespace netscout::server
{
    class NetworkCore;

    struct Job
    {
        int client_fd = -1;
        uint64_t connection_id = 0;
        netscout::protocol::MessageType type;
        std::vector<uint8_t> payload;
    };

    struct Reply
    {
        netscout::protocol::MessageType type;
        std::vector<uint8_t> payload;
    };

    // Decodes requests off the event loop, calls into the scan and onboarding
    // layers and queues the encoded reply back to the network core.
    // Onboarding requests run on a second thread; everything else is answered
    // in arrival order on the first.
    class Worker
    {
    public:
        using ReplySink = std::function<void(int client_fd, uint64_t connection_id, const Reply &reply)>;

    private:
        std::thread worker_thread_;
        std::thread onboard_thread_;
        netscout::common::ThreadSafeQueue<Job> job_queue_;
        netscout::common::ThreadSafeQueue<Job> onboard_queue_;
        std::atomic<bool> running_;

        ReplySink reply_sink_;
        scan::ScanCoordinator &coordinator_;
        scan::JobRegistry &registry_;
        onboard::OnboardingDispatcher &dispatcher_;

        void ProcessLoop();
        void OnboardLoop();
        void Deliver(const Job &job, const Reply &reply);

        Reply HandleScanStart(const std::vector<uint8_t> &payload);
        Reply HandleScanStatus(const std::vector<uint8_t> &payload);
        Reply HandleScanList();
        Reply HandleScanDelete(const std::vector<uint8_t> &payload);
        Reply HandleOnboard(const std::vector<uint8_t> &payload);

    public:
        Worker(scan::ScanCoordinator &coordinator, scan::JobRegistry &registry, onboard::OnboardingDispatcher &dispatcher);
        ~Worker();

        void Start();
        void Stop();

        // Both setters must be called before Start().
        void SetNetworkCore(NetworkCore *core);
        void SetReplySink(ReplySink sink) { reply_sink_ = std::move(sink); }

        void AddJob(int client_fd, uint64_t connection_id, netscout::protocol::MessageType type, std::vector<uint8_t> payload);

        // Synchronous dispatch; exposed for tests.
        Reply Handle(netscout::protocol::MessageType type, const std::vector<uint8_t> &payload);
    };
}
