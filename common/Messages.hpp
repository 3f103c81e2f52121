#pragma once

#include "../onboard/OnboardTypes.hpp"
#include "../scan/ScanTypes.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace netscout::common
{
    struct ScanStartResponse
    {
        std::string job_id;
        uint32_t total_targets = 0;
        scan::JobState state = scan::JobState::Running;
    };

    // Payload codecs for the framed protocol. Decoders return false on a
    // truncated or malformed payload and leave the output unspecified.

    std::vector<uint8_t> EncodeScanRequest(const scan::ScanRequest &request);
    bool DecodeScanRequest(const std::vector<uint8_t> &payload, scan::ScanRequest &out);

    std::vector<uint8_t> EncodeScanStartResponse(const ScanStartResponse &response);
    bool DecodeScanStartResponse(const std::vector<uint8_t> &payload, ScanStartResponse &out);

    // Status and delete requests, and the delete response, carry a bare job id.
    std::vector<uint8_t> EncodeJobId(const std::string &job_id);
    bool DecodeJobId(const std::vector<uint8_t> &payload, std::string &out);

    std::vector<uint8_t> EncodeSnapshot(const scan::ScanJobSnapshot &snapshot);
    bool DecodeSnapshot(const std::vector<uint8_t> &payload, scan::ScanJobSnapshot &out);

    std::vector<uint8_t> EncodeSummaries(const std::vector<scan::ScanJobSummary> &summaries);
    bool DecodeSummaries(const std::vector<uint8_t> &payload, std::vector<scan::ScanJobSummary> &out);

    std::vector<uint8_t> EncodeOnboardRequest(const onboard::OnboardRequest &request);
    bool DecodeOnboardRequest(const std::vector<uint8_t> &payload, onboard::OnboardRequest &out);

    std::vector<uint8_t> EncodeOnboardResult(const onboard::OnboardResult &result);
    bool DecodeOnboardResult(const std::vector<uint8_t> &payload, onboard::OnboardResult &out);

    std::vector<uint8_t> EncodeError(const std::string &message);
    bool DecodeError(const std::vector<uint8_t> &payload, std::string &out);
}
