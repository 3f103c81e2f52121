#include "Messages.hpp"
#include "Codec.hpp"

namespace netscout::common
{
    using namespace netscout::common::wire;

    namespace
    {
        void append_i32(std::vector<uint8_t> &out, int value)
        {
            append_u32_be(out, static_cast<uint32_t>(value));
        }

        bool read_i32(const std::vector<uint8_t> &in, size_t &offset, int &value_out)
        {
            uint32_t raw = 0;
            if (!read_u32_be(in, offset, raw))
                return false;
            value_out = static_cast<int>(raw);
            return true;
        }

        void append_optional_i32(std::vector<uint8_t> &out, const std::optional<int> &value)
        {
            append_bool(out, value.has_value());
            if (value)
                append_i32(out, *value);
        }

        bool read_optional_i32(const std::vector<uint8_t> &in, size_t &offset, std::optional<int> &value_out)
        {
            bool present = false;
            if (!read_bool(in, offset, present))
                return false;
            if (!present)
            {
                value_out.reset();
                return true;
            }
            int value = 0;
            if (!read_i32(in, offset, value))
                return false;
            value_out = value;
            return true;
        }

        void append_i32_list(std::vector<uint8_t> &out, const std::vector<int> &items)
        {
            append_u32_be(out, static_cast<uint32_t>(items.size()));
            for (int item : items)
                append_i32(out, item);
        }

        bool read_i32_list(const std::vector<uint8_t> &in, size_t &offset, std::vector<int> &out)
        {
            uint32_t count = 0;
            if (!read_u32_be(in, offset, count) || count > (in.size() - offset) / 4)
                return false;

            out.clear();
            out.reserve(count);
            for (uint32_t i = 0; i < count; ++i)
            {
                int item = 0;
                if (!read_i32(in, offset, item))
                    return false;
                out.push_back(item);
            }
            return true;
        }

        // Each entry needs at least min_entry_size bytes; rejects absurd counts.
        bool read_count(const std::vector<uint8_t> &in, size_t &offset, size_t min_entry_size, uint32_t &count)
        {
            if (!read_u32_be(in, offset, count))
                return false;
            return count <= (in.size() - offset) / min_entry_size;
        }

        bool read_state(const std::vector<uint8_t> &in, size_t &offset, scan::JobState &state)
        {
            uint8_t raw = 0;
            if (!read_u8(in, offset, raw) || raw > static_cast<uint8_t>(scan::JobState::Finished))
                return false;
            state = static_cast<scan::JobState>(raw);
            return true;
        }

        void append_i64(std::vector<uint8_t> &out, int64_t value)
        {
            append_u64_be(out, static_cast<uint64_t>(value));
        }

        bool read_i64(const std::vector<uint8_t> &in, size_t &offset, int64_t &value_out)
        {
            uint64_t raw = 0;
            if (!read_u64_be(in, offset, raw))
                return false;
            value_out = static_cast<int64_t>(raw);
            return true;
        }

        bool finished(const std::vector<uint8_t> &in, size_t offset)
        {
            return offset == in.size();
        }
    }

    // ---- scan start ----

    std::vector<uint8_t> EncodeScanRequest(const scan::ScanRequest &request)
    {
        std::vector<uint8_t> out;
        append_string_list(out, request.cidrs);
        append_i32_list(out, request.credential_ids);
        append_u8(out, static_cast<uint8_t>(request.mode));
        append_i32_list(out, request.parser_template_ids);
        return out;
    }

    bool DecodeScanRequest(const std::vector<uint8_t> &payload, scan::ScanRequest &out)
    {
        size_t offset = 0;
        uint8_t mode = 0;
        if (!read_string_list(payload, offset, out.cidrs) ||
            !read_i32_list(payload, offset, out.credential_ids) ||
            !read_u8(payload, offset, mode) ||
            !read_i32_list(payload, offset, out.parser_template_ids))
            return false;

        if (mode > static_cast<uint8_t>(scan::ClassificationMode::Shell))
            return false;
        out.mode = static_cast<scan::ClassificationMode>(mode);
        return finished(payload, offset);
    }

    std::vector<uint8_t> EncodeScanStartResponse(const ScanStartResponse &response)
    {
        std::vector<uint8_t> out;
        append_string(out, response.job_id);
        append_u32_be(out, response.total_targets);
        append_u8(out, static_cast<uint8_t>(response.state));
        return out;
    }

    bool DecodeScanStartResponse(const std::vector<uint8_t> &payload, ScanStartResponse &out)
    {
        size_t offset = 0;
        return read_string(payload, offset, out.job_id) &&
               read_u32_be(payload, offset, out.total_targets) &&
               read_state(payload, offset, out.state) &&
               finished(payload, offset);
    }

    std::vector<uint8_t> EncodeJobId(const std::string &job_id)
    {
        std::vector<uint8_t> out;
        append_string(out, job_id);
        return out;
    }

    bool DecodeJobId(const std::vector<uint8_t> &payload, std::string &out)
    {
        size_t offset = 0;
        return read_string(payload, offset, out) && finished(payload, offset);
    }

    // ---- status ----

    std::vector<uint8_t> EncodeSnapshot(const scan::ScanJobSnapshot &snapshot)
    {
        std::vector<uint8_t> out;
        append_string(out, snapshot.job_id);
        append_u8(out, static_cast<uint8_t>(snapshot.state));
        append_i64(out, snapshot.created_unix);

        const auto &c = snapshot.counters;
        for (uint32_t value : {c.total, c.scanned, c.alive, c.authenticated, c.unreachable, c.auth_failed, c.driver_not_supported})
            append_u32_be(out, value);

        append_u32_be(out, static_cast<uint32_t>(snapshot.results.size()));
        for (const auto &result : snapshot.results)
        {
            append_string(out, result.address);
            append_optional_i32(out, result.credential_id);
            append_bool(out, result.family.has_value());
            if (result.family)
                append_u8(out, static_cast<uint8_t>(*result.family));
            append_string(out, result.hostname);
            append_string(out, result.platform);
            append_u8(out, static_cast<uint8_t>(result.failure));
        }

        append_string_list(out, snapshot.errors);
        return out;
    }

    bool DecodeSnapshot(const std::vector<uint8_t> &payload, scan::ScanJobSnapshot &out)
    {
        size_t offset = 0;
        if (!read_string(payload, offset, out.job_id) ||
            !read_state(payload, offset, out.state) ||
            !read_i64(payload, offset, out.created_unix))
            return false;

        auto &c = out.counters;
        for (uint32_t *field : {&c.total, &c.scanned, &c.alive, &c.authenticated, &c.unreachable, &c.auth_failed, &c.driver_not_supported})
        {
            if (!read_u32_be(payload, offset, *field))
                return false;
        }

        uint32_t count = 0;
        // address, credential flag, family flag, hostname, platform, failure
        if (!read_count(payload, offset, 4 + 1 + 1 + 4 + 4 + 1, count))
            return false;

        out.results.clear();
        out.results.reserve(count);
        for (uint32_t i = 0; i < count; ++i)
        {
            scan::ScanResult result;
            bool has_family = false;
            uint8_t failure = 0;

            if (!read_string(payload, offset, result.address) ||
                !read_optional_i32(payload, offset, result.credential_id) ||
                !read_bool(payload, offset, has_family))
                return false;

            if (has_family)
            {
                uint8_t family = 0;
                if (!read_u8(payload, offset, family) || family > static_cast<uint8_t>(scan::DeviceFamily::GeneralServer))
                    return false;
                result.family = static_cast<scan::DeviceFamily>(family);
            }

            if (!read_string(payload, offset, result.hostname) ||
                !read_string(payload, offset, result.platform) ||
                !read_u8(payload, offset, failure) ||
                failure > static_cast<uint8_t>(scan::HostFailure::DriverNotSupported))
                return false;

            result.failure = static_cast<scan::HostFailure>(failure);
            out.results.push_back(std::move(result));
        }

        return read_string_list(payload, offset, out.errors) && finished(payload, offset);
    }

    // ---- list ----

    std::vector<uint8_t> EncodeSummaries(const std::vector<scan::ScanJobSummary> &summaries)
    {
        std::vector<uint8_t> out;
        append_u32_be(out, static_cast<uint32_t>(summaries.size()));
        for (const auto &summary : summaries)
        {
            append_string(out, summary.job_id);
            append_u8(out, static_cast<uint8_t>(summary.state));
            append_i64(out, summary.created_unix);
            append_u32_be(out, summary.total);
            append_u32_be(out, summary.authenticated);
        }
        return out;
    }

    bool DecodeSummaries(const std::vector<uint8_t> &payload, std::vector<scan::ScanJobSummary> &out)
    {
        size_t offset = 0;
        uint32_t count = 0;
        if (!read_count(payload, offset, 4 + 1 + 8 + 4 + 4, count))
            return false;

        out.clear();
        out.reserve(count);
        for (uint32_t i = 0; i < count; ++i)
        {
            scan::ScanJobSummary summary;
            if (!read_string(payload, offset, summary.job_id) ||
                !read_state(payload, offset, summary.state) ||
                !read_i64(payload, offset, summary.created_unix) ||
                !read_u32_be(payload, offset, summary.total) ||
                !read_u32_be(payload, offset, summary.authenticated))
                return false;
            out.push_back(std::move(summary));
        }
        return finished(payload, offset);
    }

    // ---- onboarding ----

    std::vector<uint8_t> EncodeOnboardRequest(const onboard::OnboardRequest &request)
    {
        std::vector<uint8_t> out;
        append_string(out, request.job_id);

        append_u32_be(out, static_cast<uint32_t>(request.devices.size()));
        for (const auto &device : request.devices)
        {
            const auto &m = device.metadata;
            append_string(out, device.address);
            for (const auto *field : {&m.name, &m.location, &m.role, &m.status, &m.namespace_name,
                                      &m.interface_status, &m.ip_status, &m.platform, &m.secrets_group})
                append_optional_string(out, *field);
            append_string_list(out, m.tags);
        }

        append_optional_i32(out, request.inventory_template_id);
        append_optional_string(out, request.artifact_name);
        append_bool(out, request.commit.enabled);
        append_optional_string(out, request.commit.message);
        append_bool(out, request.commit.push);
        return out;
    }

    bool DecodeOnboardRequest(const std::vector<uint8_t> &payload, onboard::OnboardRequest &out)
    {
        size_t offset = 0;
        uint32_t count = 0;
        if (!read_string(payload, offset, out.job_id) ||
            !read_count(payload, offset, 4 + 9 + 4, count))
            return false;

        out.devices.clear();
        out.devices.reserve(count);
        for (uint32_t i = 0; i < count; ++i)
        {
            onboard::DeviceSelection device;
            auto &m = device.metadata;
            if (!read_string(payload, offset, device.address))
                return false;
            for (auto *field : {&m.name, &m.location, &m.role, &m.status, &m.namespace_name,
                                &m.interface_status, &m.ip_status, &m.platform, &m.secrets_group})
            {
                if (!read_optional_string(payload, offset, *field))
                    return false;
            }
            if (!read_string_list(payload, offset, m.tags))
                return false;
            out.devices.push_back(std::move(device));
        }

        return read_optional_i32(payload, offset, out.inventory_template_id) &&
               read_optional_string(payload, offset, out.artifact_name) &&
               read_bool(payload, offset, out.commit.enabled) &&
               read_optional_string(payload, offset, out.commit.message) &&
               read_bool(payload, offset, out.commit.push) &&
               finished(payload, offset);
    }

    std::vector<uint8_t> EncodeOnboardResult(const onboard::OnboardResult &result)
    {
        std::vector<uint8_t> out;
        append_u32_be(out, result.accepted);
        append_u32_be(out, result.network_queued);
        append_u32_be(out, result.network_failed);
        append_u32_be(out, result.servers_added);
        append_string_list(out, result.tracking_ids);
        append_optional_string(out, result.artifact_path);
        append_bool(out, result.committed);
        append_bool(out, result.pushed);
        append_string_list(out, result.errors);
        return out;
    }

    bool DecodeOnboardResult(const std::vector<uint8_t> &payload, onboard::OnboardResult &out)
    {
        size_t offset = 0;
        return read_u32_be(payload, offset, out.accepted) &&
               read_u32_be(payload, offset, out.network_queued) &&
               read_u32_be(payload, offset, out.network_failed) &&
               read_u32_be(payload, offset, out.servers_added) &&
               read_string_list(payload, offset, out.tracking_ids) &&
               read_optional_string(payload, offset, out.artifact_path) &&
               read_bool(payload, offset, out.committed) &&
               read_bool(payload, offset, out.pushed) &&
               read_string_list(payload, offset, out.errors) &&
               finished(payload, offset);
    }

    // ---- errors ----

    std::vector<uint8_t> EncodeError(const std::string &message)
    {
        return EncodeJobId(message);
    }

    bool DecodeError(const std::vector<uint8_t> &payload, std::string &out)
    {
        return DecodeJobId(payload, out);
    }
}
