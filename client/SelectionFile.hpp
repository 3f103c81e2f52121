#pragma once

#include "../onboard/OnboardTypes.hpp"

#include <istream>
#include <stdexcept>
#include <string>
#include <vector>

namespace netscout::client
{
    class SelectionError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    // One device per line: `address key=value ...`. Values may be double
    // quoted; tags are comma separated. Blank lines and '#' comments are
    // skipped. Throws SelectionError naming the line.
    std::vector<onboard::DeviceSelection> ParseSelections(std::istream &in);
}
