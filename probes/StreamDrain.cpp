#include "StreamDrain.hpp"

#include <algorithm>
#include <stdexcept>

namespace netscout::probes
{
    DrainedOutput DrainStreams(StreamSource &source, size_t max_bytes,
                               std::chrono::steady_clock::time_point deadline)
    {
        DrainedOutput result;
        char buf[4096];

        for (;;)
        {
            bool progressed = false;
            for (int stream : {StreamSource::kStdout, StreamSource::kStderr})
            {
                std::string &sink = stream == StreamSource::kStdout ? result.out : result.err;
                long n;
                while ((n = source.Read(stream, buf, sizeof(buf))) > 0)
                {
                    size_t room = max_bytes - (result.out.size() + result.err.size());
                    sink.append(buf, std::min(room, static_cast<size_t>(n)));
                    progressed = true;
                    if (result.out.size() + result.err.size() >= max_bytes)
                    {
                        result.truncated = true;
                        return result;
                    }
                }
            }

            if (source.AtEof())
                return result;

            if (!progressed && !source.Wait(deadline))
                throw std::runtime_error("read timed out");
        }
    }
}
