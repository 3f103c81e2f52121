#include "common/FrameBuffer.hpp"
#include "common/Messages.hpp"
#include "common/protocol.hpp"

#include <gtest/gtest.h>

using namespace netscout;
using netscout::protocol::MessageType;

TEST(ProtocolTest, HeaderLayoutIsBigEndian)
{
    auto frame = protocol::BuildFrame(MessageType::ScanStatusReq, {0xAA, 0xBB, 0xCC});

    ASSERT_EQ(frame.size(), protocol::HEADER_SIZE + 3);
    EXPECT_EQ(frame[0], 0x5C);
    EXPECT_EQ(frame[1], 0x4E);
    EXPECT_EQ(frame[2], 0x03);
    EXPECT_EQ(frame[3], 0x00);
    EXPECT_EQ(frame[6], 0x03);
    EXPECT_EQ(frame[7], 0x00);
    EXPECT_EQ(frame[8], 0xAA);
}

TEST(ProtocolTest, OnlyRequestTypesAreAccepted)
{
    EXPECT_TRUE(protocol::IsRequest(MessageType::ScanStartReq));
    EXPECT_TRUE(protocol::IsRequest(MessageType::OnboardReq));
    EXPECT_FALSE(protocol::IsRequest(MessageType::ScanStartResp));
    EXPECT_FALSE(protocol::IsRequest(MessageType::ErrorResp));
    EXPECT_FALSE(protocol::IsRequest(static_cast<MessageType>(0x00)));
}

TEST(FrameBufferTest, ReassemblesFramesSplitAcrossReads)
{
    auto first = protocol::BuildFrame(MessageType::ScanListReq, {});
    auto second = protocol::BuildFrame(MessageType::ScanDeleteReq, common::EncodeJobId("scan_1_1"));

    std::vector<uint8_t> stream(first);
    stream.insert(stream.end(), second.begin(), second.end());

    common::FrameBuffer buffer;
    buffer.Append(stream.data(), 5);
    EXPECT_FALSE(buffer.NextFrame().has_value());

    buffer.Append(stream.data() + 5, stream.size() - 5 - 2);
    auto a = buffer.NextFrame();
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(a->type, MessageType::ScanListReq);
    EXPECT_TRUE(a->payload.empty());
    EXPECT_FALSE(buffer.NextFrame().has_value());

    buffer.Append(stream.data() + stream.size() - 2, 2);
    auto b = buffer.NextFrame();
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(b->type, MessageType::ScanDeleteReq);

    std::string id;
    ASSERT_TRUE(common::DecodeJobId(b->payload, id));
    EXPECT_EQ(id, "scan_1_1");
    EXPECT_EQ(buffer.Size(), 0u);
}

TEST(FrameBufferTest, BadMagicMarksStreamCorrupt)
{
    std::vector<uint8_t> junk = {0x47, 0x45, 0x54, 0x20, 0x2F, 0x20, 0x48, 0x54};

    common::FrameBuffer buffer;
    buffer.Append(junk.data(), junk.size());

    EXPECT_FALSE(buffer.NextFrame().has_value());
    EXPECT_TRUE(buffer.IsCorrupt());

    buffer.Clear();
    EXPECT_FALSE(buffer.IsCorrupt());
}

TEST(FrameBufferTest, OversizedPayloadMarksStreamCorrupt)
{
    uint8_t header[protocol::HEADER_SIZE];
    protocol::SerializeHeader(protocol::MakeHeader(MessageType::ScanStartReq, protocol::MAX_PAYLOAD_LENGTH + 1), header);

    common::FrameBuffer buffer;
    buffer.Append(header, sizeof(header));

    EXPECT_FALSE(buffer.NextFrame().has_value());
    EXPECT_TRUE(buffer.IsCorrupt());
}

TEST(MessagesTest, ScanRequestSurvivesTheWire)
{
    scan::ScanRequest request;
    request.cidrs = {"10.0.0.0/24", "192.168.1.7"};
    request.credential_ids = {3, -1};
    request.mode = scan::ClassificationMode::Shell;
    request.parser_template_ids = {9};

    scan::ScanRequest decoded;
    ASSERT_TRUE(common::DecodeScanRequest(common::EncodeScanRequest(request), decoded));

    EXPECT_EQ(decoded.cidrs, request.cidrs);
    EXPECT_EQ(decoded.credential_ids, request.credential_ids);
    EXPECT_EQ(decoded.mode, scan::ClassificationMode::Shell);
    EXPECT_EQ(decoded.parser_template_ids, request.parser_template_ids);
}

TEST(MessagesTest, SnapshotKeepsOptionalFieldsDistinct)
{
    scan::ScanJobSnapshot snapshot;
    snapshot.job_id = "scan_1700000000000_4";
    snapshot.state = scan::JobState::Finished;
    snapshot.created_unix = 1700000000;
    snapshot.counters.total = 3;
    snapshot.counters.auth_failed = 1;

    scan::ScanResult denied;
    denied.address = "10.0.0.2";
    denied.failure = scan::HostFailure::AuthFailed;

    scan::ScanResult server;
    server.address = "10.0.0.3";
    server.credential_id = 0;
    server.family = scan::DeviceFamily::GeneralServer;
    server.hostname = "web01";
    server.platform = "Linux";

    snapshot.results = {denied, server};
    snapshot.errors = {"10.0.0.4: boom"};

    scan::ScanJobSnapshot decoded;
    ASSERT_TRUE(common::DecodeSnapshot(common::EncodeSnapshot(snapshot), decoded));

    EXPECT_EQ(decoded.job_id, snapshot.job_id);
    EXPECT_EQ(decoded.state, scan::JobState::Finished);
    EXPECT_EQ(decoded.created_unix, 1700000000);
    EXPECT_EQ(decoded.counters.total, 3u);
    EXPECT_EQ(decoded.counters.auth_failed, 1u);
    ASSERT_EQ(decoded.results.size(), 2u);
    EXPECT_FALSE(decoded.results[0].credential_id.has_value());
    EXPECT_FALSE(decoded.results[0].family.has_value());
    EXPECT_EQ(decoded.results[0].failure, scan::HostFailure::AuthFailed);
    EXPECT_EQ(decoded.results[1].credential_id, 0);
    EXPECT_EQ(decoded.results[1].family, scan::DeviceFamily::GeneralServer);
    EXPECT_EQ(decoded.errors, snapshot.errors);
}

TEST(MessagesTest, OnboardRequestCarriesMetadataAndCommitOptions)
{
    onboard::OnboardRequest request;
    request.job_id = "scan_1_1";
    onboard::DeviceSelection device;
    device.address = "10.0.0.1";
    device.metadata.location = "DC1";
    device.metadata.platform = "detect";
    device.metadata.tags = {"edge", "lab"};
    request.devices.push_back(device);
    request.inventory_template_id = 2;
    request.commit.enabled = true;
    request.commit.push = true;

    onboard::OnboardRequest decoded;
    ASSERT_TRUE(common::DecodeOnboardRequest(common::EncodeOnboardRequest(request), decoded));

    ASSERT_EQ(decoded.devices.size(), 1u);
    EXPECT_EQ(decoded.devices[0].metadata.location, "DC1");
    EXPECT_EQ(decoded.devices[0].metadata.platform, "detect");
    EXPECT_FALSE(decoded.devices[0].metadata.name.has_value());
    EXPECT_EQ(decoded.devices[0].metadata.tags, device.metadata.tags);
    EXPECT_EQ(decoded.inventory_template_id, 2);
    EXPECT_FALSE(decoded.artifact_name.has_value());
    EXPECT_TRUE(decoded.commit.enabled);
    EXPECT_FALSE(decoded.commit.message.has_value());
    EXPECT_TRUE(decoded.commit.push);
}

TEST(MessagesTest, TruncatedPayloadsAreRejected)
{
    scan::ScanRequest request;
    request.cidrs = {"10.0.0.0/24"};
    request.credential_ids = {1};
    auto payload = common::EncodeScanRequest(request);

    for (size_t cut = 0; cut < payload.size(); ++cut)
    {
        std::vector<uint8_t> truncated(payload.begin(), payload.begin() + cut);
        scan::ScanRequest decoded;
        EXPECT_FALSE(common::DecodeScanRequest(truncated, decoded)) << "cut at " << cut;
    }
}

TEST(MessagesTest, TrailingBytesAreRejected)
{
    auto payload = common::EncodeJobId("scan_1_1");
    payload.push_back(0);

    std::string id;
    EXPECT_FALSE(common::DecodeJobId(payload, id));
}

TEST(MessagesTest, UnknownEnumValuesAreRejected)
{
    auto payload = common::EncodeScanRequest(scan::ScanRequest{});
    // cidr count, credential count, then the mode byte
    payload[8] = 7;

    scan::ScanRequest decoded;
    EXPECT_FALSE(common::DecodeScanRequest(payload, decoded));
}

TEST(MessagesTest, HugeListCountsDoNotAllocate)
{
    std::vector<uint8_t> payload = {0xFF, 0xFF, 0xFF, 0xFF};

    std::vector<scan::ScanJobSummary> summaries;
    EXPECT_FALSE(common::DecodeSummaries(payload, summaries));
}
