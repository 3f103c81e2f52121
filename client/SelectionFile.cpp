#include "SelectionFile.hpp"

#include <cctype>

namespace netscout::client
{
    namespace
    {
        std::vector<std::string> SplitFields(const std::string &line, int line_no)
        {
            std::vector<std::string> fields;
            std::string current;
            bool quoted = false;
            bool have_field = false;

            for (char c : line)
            {
                if (c == '"')
                {
                    quoted = !quoted;
                    have_field = true;
                    continue;
                }
                if (!quoted && std::isspace(static_cast<unsigned char>(c)))
                {
                    if (have_field)
                        fields.push_back(current);
                    current.clear();
                    have_field = false;
                    continue;
                }
                current += c;
                have_field = true;
            }

            if (quoted)
                throw SelectionError("line " + std::to_string(line_no) + ": unterminated quote");
            if (have_field)
                fields.push_back(current);
            return fields;
        }

        std::vector<std::string> SplitTags(const std::string &value)
        {
            std::vector<std::string> tags;
            size_t start = 0;
            while (start <= value.size())
            {
                size_t comma = value.find(',', start);
                std::string tag = value.substr(start, comma == std::string::npos ? std::string::npos : comma - start);
                size_t first = tag.find_first_not_of(' ');
                size_t last = tag.find_last_not_of(' ');
                if (first != std::string::npos)
                    tags.push_back(tag.substr(first, last - first + 1));
                if (comma == std::string::npos)
                    break;
                start = comma + 1;
            }
            return tags;
        }
    }

    std::vector<onboard::DeviceSelection> ParseSelections(std::istream &in)
    {
        std::vector<onboard::DeviceSelection> selections;
        std::string line;
        int line_no = 0;

        while (std::getline(in, line))
        {
            ++line_no;
            if (!line.empty() && line.back() == '\r')
                line.pop_back();

            size_t first = line.find_first_not_of(" \t");
            if (first == std::string::npos || line[first] == '#')
                continue;

            std::vector<std::string> fields = SplitFields(line, line_no);
            onboard::DeviceSelection selection;
            selection.address = fields[0];

            for (size_t i = 1; i < fields.size(); ++i)
            {
                size_t eq = fields[i].find('=');
                if (eq == std::string::npos || eq == 0)
                    throw SelectionError("line " + std::to_string(line_no) + ": expected key=value, got '" + fields[i] + "'");

                std::string key = fields[i].substr(0, eq);
                std::string value = fields[i].substr(eq + 1);
                onboard::DeviceMetadata &m = selection.metadata;

                if (key == "name")
                    m.name = value;
                else if (key == "location")
                    m.location = value;
                else if (key == "role")
                    m.role = value;
                else if (key == "status")
                    m.status = value;
                else if (key == "namespace")
                    m.namespace_name = value;
                else if (key == "interface_status")
                    m.interface_status = value;
                else if (key == "ip_status")
                    m.ip_status = value;
                else if (key == "platform")
                    m.platform = value;
                else if (key == "secrets_group")
                    m.secrets_group = value;
                else if (key == "tags")
                    m.tags = SplitTags(value);
                else
                    throw SelectionError("line " + std::to_string(line_no) + ": unknown key '" + key + "'");
            }

            selections.push_back(std::move(selection));
        }

        return selections;
    }
}
