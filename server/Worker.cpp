#include "Worker.hpp"
#include "NetworkCore.hpp"
#include "../common/Messages.hpp"

#include <iostream>

namespace netscout::server
{
    using netscout::protocol::MessageType;

    namespace
    {
        Reply Error(const std::string &message)
        {
            return Reply{MessageType::ErrorResp, common::EncodeError(message)};
        }
    }

    Worker::Worker(scan::ScanCoordinator &coordinator, scan::JobRegistry &registry, onboard::OnboardingDispatcher &dispatcher)
        : running_(false), coordinator_(coordinator), registry_(registry), dispatcher_(dispatcher)
    {
    }

    Worker::~Worker()
    {
        Stop();
    }

    void Worker::Start()
    {
        running_ = true;
        worker_thread_ = std::thread(&Worker::ProcessLoop, this);
        onboard_thread_ = std::thread(&Worker::OnboardLoop, this);
    }

    void Worker::Stop()
    {
        if (!running_)
            return;

        running_ = false;
        job_queue_.Shutdown();

        if (worker_thread_.joinable())
        {
            worker_thread_.join();
        }

        // The request loop may still have handed work over, so this queue closes second.
        onboard_queue_.Shutdown();
        if (onboard_thread_.joinable())
        {
            onboard_thread_.join();
        }
    }

    void Worker::SetNetworkCore(NetworkCore *core)
    {
        reply_sink_ = [core](int client_fd, uint64_t connection_id, const Reply &reply)
        {
            core->QueueResponse(client_fd, connection_id, reply.type, reply.payload);
        };
    }

    void Worker::AddJob(int client_fd, uint64_t connection_id, MessageType type, std::vector<uint8_t> payload)
    {
        if (!job_queue_.Push(Job{client_fd, connection_id, type, std::move(payload)}))
            std::cerr << "[Worker] Dropping request from client " << client_fd << ": worker stopped" << std::endl;
    }

    void Worker::ProcessLoop()
    {
        while (auto job = job_queue_.Pop())
        {
            if (job->type == MessageType::OnboardReq)
            {
                int client_fd = job->client_fd;
                if (!onboard_queue_.Push(std::move(*job)))
                    std::cerr << "[Worker] Dropping onboarding request from client " << client_fd << ": worker stopped" << std::endl;
                continue;
            }
            Deliver(*job, Handle(job->type, job->payload));
        }
    }

    void Worker::OnboardLoop()
    {
        while (auto job = onboard_queue_.Pop())
        {
            Deliver(*job, Handle(job->type, job->payload));
        }
    }

    void Worker::Deliver(const Job &job, const Reply &reply)
    {
        if (reply_sink_)
            reply_sink_(job.client_fd, job.connection_id, reply);
    }

    Reply Worker::Handle(MessageType type, const std::vector<uint8_t> &payload)
    {
        try
        {
            switch (type)
            {
            case MessageType::ScanStartReq:
                return HandleScanStart(payload);
            case MessageType::ScanStatusReq:
                return HandleScanStatus(payload);
            case MessageType::ScanListReq:
                return HandleScanList();
            case MessageType::ScanDeleteReq:
                return HandleScanDelete(payload);
            case MessageType::OnboardReq:
                return HandleOnboard(payload);
            default:
                return Error("Unsupported message type");
            }
        }
        catch (const scan::ValidationError &e)
        {
            return Error(e.what());
        }
        catch (const std::exception &e)
        {
            std::cerr << "[Worker] Request type " << static_cast<int>(type) << " failed: " << e.what() << std::endl;
            return Error(std::string("Internal error: ") + e.what());
        }
    }

    Reply Worker::HandleScanStart(const std::vector<uint8_t> &payload)
    {
        scan::ScanRequest request;
        if (!common::DecodeScanRequest(payload, request))
            return Error("Malformed scan request");

        auto job = coordinator_.Submit(request);

        common::ScanStartResponse response;
        response.job_id = job->Id();
        response.total_targets = job->Counters().total;
        response.state = job->State();
        return Reply{MessageType::ScanStartResp, common::EncodeScanStartResponse(response)};
    }

    Reply Worker::HandleScanStatus(const std::vector<uint8_t> &payload)
    {
        std::string job_id;
        if (!common::DecodeJobId(payload, job_id))
            return Error("Malformed status request");

        auto snapshot = registry_.Snapshot(job_id);
        if (!snapshot)
            return Error("NOT_FOUND");
        return Reply{MessageType::ScanStatusResp, common::EncodeSnapshot(*snapshot)};
    }

    Reply Worker::HandleScanList()
    {
        return Reply{MessageType::ScanListResp, common::EncodeSummaries(registry_.List())};
    }

    Reply Worker::HandleScanDelete(const std::vector<uint8_t> &payload)
    {
        std::string job_id;
        if (!common::DecodeJobId(payload, job_id))
            return Error("Malformed delete request");

        if (!registry_.Remove(job_id))
            return Error("NOT_FOUND");

        std::cout << "[Worker] Job " << job_id << " deleted" << std::endl;
        return Reply{MessageType::ScanDeleteResp, common::EncodeJobId(job_id)};
    }

    Reply Worker::HandleOnboard(const std::vector<uint8_t> &payload)
    {
        onboard::OnboardRequest request;
        if (!common::DecodeOnboardRequest(payload, request))
            return Error("Malformed onboarding request");

        auto result = dispatcher_.Dispatch(request);
        if (!result)
            return Error("NOT_FOUND");
        return Reply{MessageType::OnboardResp, common::EncodeOnboardResult(*result)};
    }
}
