#pragma once

#include <chrono>
#include <cstddef>
#include <string>

namespace netscout::probes
{
    // Non-blocking two-stream reader, implemented over an exec channel.
    class StreamSource
    {
    public:
        static constexpr int kStdout = 0;
        static constexpr int kStderr = 1;
        static constexpr long kWouldBlock = -1;

        virtual ~StreamSource() = default;

        // Bytes read, 0 when the stream has nothing more, or kWouldBlock.
        // Transport errors are thrown.
        virtual long Read(int stream, char *buf, size_t len) = 0;
        virtual bool AtEof() = 0;
        // False once the deadline has passed without the source becoming ready.
        virtual bool Wait(std::chrono::steady_clock::time_point deadline) = 0;
    };

    struct DrainedOutput
    {
        std::string out;
        std::string err;
        bool truncated = false;
    };

    // Reads stdout and stderr together until EOF or until max_bytes have been
    // collected across both. Throws std::runtime_error on timeout.
    DrainedOutput DrainStreams(StreamSource &source, size_t max_bytes,
                               std::chrono::steady_clock::time_point deadline);
}
