#include "TextFsm.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace netscout::scan
{
    namespace
    {
        std::string Trim(const std::string &s)
        {
            size_t start = 0;
            while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start])))
                ++start;
            size_t end = s.size();
            while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1])))
                --end;
            return s.substr(start, end - start);
        }

        std::vector<std::string> SplitLines(const std::string &text)
        {
            std::vector<std::string> lines;
            std::istringstream in(text);
            std::string line;
            while (std::getline(in, line))
            {
                if (!line.empty() && line.back() == '\r')
                    line.pop_back();
                lines.push_back(line);
            }
            return lines;
        }

        std::string ToLower(std::string s)
        {
            std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            return s;
        }

        bool IsIdentifier(const std::string &s)
        {
            if (s.empty() || !(std::isalpha(static_cast<unsigned char>(s[0])) || s[0] == '_'))
                return false;
            return std::all_of(s.begin(), s.end(), [](unsigned char c)
                               { return std::isalnum(c) || c == '_'; });
        }

        // Capturing groups opened in a pattern; escapes and character classes skipped.
        int CountGroups(const std::string &pattern)
        {
            int count = 0;
            bool in_class = false;
            for (size_t i = 0; i < pattern.size(); ++i)
            {
                char c = pattern[i];
                if (c == '\\')
                {
                    ++i;
                    continue;
                }
                if (in_class)
                {
                    if (c == ']')
                        in_class = false;
                    continue;
                }
                if (c == '[')
                {
                    in_class = true;
                    continue;
                }
                if (c == '(' && !(i + 1 < pattern.size() && pattern[i + 1] == '?'))
                    ++count;
            }
            return count;
        }
    }

    TextFsmTemplate TextFsmTemplate::Parse(const std::string &text)
    {
        TextFsmTemplate tmpl;
        auto lines = SplitLines(text);
        size_t i = 0;

        for (; i < lines.size(); ++i)
        {
            const std::string &line = lines[i];
            if (!line.empty() && line[0] == '#')
                continue;
            if (Trim(line).empty())
                break;
            if (line.rfind("Value ", 0) != 0)
                throw TextFsmError("Expected 'Value' definition, got: " + line);
            tmpl.ParseValueLine(line);
        }

        if (tmpl.m_values.empty())
            throw TextFsmError("Template has no Value definitions");

        std::string current;
        for (; i < lines.size(); ++i)
        {
            const std::string &line = lines[i];
            std::string trimmed = Trim(line);

            if (trimmed.empty())
            {
                current.clear();
                continue;
            }
            if (trimmed[0] == '#')
                continue;

            if (!std::isspace(static_cast<unsigned char>(line[0])))
            {
                if (!IsIdentifier(trimmed))
                    throw TextFsmError("Invalid state name: " + trimmed);
                if (tmpl.m_states.count(trimmed))
                    throw TextFsmError("Duplicate state: " + trimmed);
                tmpl.m_states[trimmed] = {};
                current = trimmed;
                continue;
            }

            if (current.empty())
                throw TextFsmError("Rule outside of a state: " + trimmed);
            if (trimmed[0] != '^')
                throw TextFsmError("Rule must start with '^': " + trimmed);

            tmpl.m_states[current].push_back(tmpl.ParseRuleLine(trimmed));
        }

        if (!tmpl.m_states.count("Start"))
            throw TextFsmError("Template has no Start state");

        for (const auto &state : tmpl.m_states)
        {
            for (const auto &rule : state.second)
            {
                const auto &target = rule.new_state;
                if (!target.empty() && target != "End" && target != "EOF" && !tmpl.m_states.count(target))
                    throw TextFsmError("Rule '" + rule.source + "' jumps to unknown state " + target);
            }
        }

        return tmpl;
    }

    void TextFsmTemplate::ParseValueLine(const std::string &line)
    {
        std::istringstream in(line.substr(6));
        std::string first;
        std::string second;
        in >> first >> second;

        ValueDef def;
        std::string pattern;

        auto after = [&line](const std::string &token)
        {
            return Trim(line.substr(line.find(token, 6) + token.size()));
        };

        if (!second.empty() && second[0] == '(')
        {
            def.name = first;
            pattern = Trim(line.substr(line.find(second, 6)));
        }
        else
        {
            std::stringstream options(first);
            std::string option;
            while (std::getline(options, option, ','))
            {
                if (option == "Required")
                    def.required = true;
                else if (option == "Filldown")
                    def.filldown = true;
                else if (option == "List")
                    def.list = true;
                else if (option != "Key" && option != "Fillup")
                    throw TextFsmError("Unknown Value option: " + option);
            }
            def.name = second;
            pattern = after(second);
        }

        if (!IsIdentifier(def.name))
            throw TextFsmError("Invalid Value name in: " + line);
        if (pattern.size() < 2 || pattern.front() != '(' || pattern.back() != ')')
            throw TextFsmError("Value regex must be enclosed in parentheses: " + line);

        for (const auto &existing : m_values)
        {
            if (existing.name == def.name)
                throw TextFsmError("Duplicate Value: " + def.name);
        }

        def.pattern = pattern;
        def.group_count = CountGroups(pattern);
        m_values.push_back(def);
        m_header.push_back(def.name);
    }

    TextFsmTemplate::Rule TextFsmTemplate::ParseRuleLine(const std::string &line) const
    {
        Rule rule;
        rule.source = line;

        std::string raw = line;
        auto arrow = line.rfind(" ->");
        if (arrow != std::string::npos)
        {
            raw = Trim(line.substr(0, arrow));
            ParseAction(Trim(line.substr(arrow + 3)), rule);
        }

        std::string expanded = ExpandRuleRegex(raw, rule.captures);
        try
        {
            rule.regex = std::regex(expanded);
        }
        catch (const std::regex_error &e)
        {
            throw TextFsmError("Bad rule regex '" + raw + "': " + e.what());
        }
        return rule;
    }

    void TextFsmTemplate::ParseAction(const std::string &action, Rule &rule) const
    {
        if (action.rfind("Error", 0) == 0)
        {
            rule.line_op = LineOp::Error;
            std::string message = Trim(action.substr(5));
            if (message.size() >= 2 && message.front() == '"' && message.back() == '"')
                message = message.substr(1, message.size() - 2);
            rule.error_message = message;
            return;
        }

        std::istringstream in(action);
        std::string first;
        std::string second;
        in >> first >> second;

        auto apply_line_op = [&rule](const std::string &op)
        {
            if (op == "Next")
                rule.line_op = LineOp::Next;
            else if (op == "Continue")
                rule.line_op = LineOp::Continue;
            else
                return false;
            return true;
        };
        auto apply_record_op = [&rule](const std::string &op)
        {
            if (op == "Record")
                rule.record_op = RecordOp::Record;
            else if (op == "NoRecord")
                rule.record_op = RecordOp::NoRecord;
            else if (op == "Clear")
                rule.record_op = RecordOp::Clear;
            else if (op == "Clearall")
                rule.record_op = RecordOp::Clearall;
            else
                return false;
            return true;
        };

        bool first_is_op = true;
        auto dot = first.find('.');
        if (dot != std::string::npos)
        {
            if (!apply_line_op(first.substr(0, dot)) || !apply_record_op(first.substr(dot + 1)))
                throw TextFsmError("Unknown action: " + first);
        }
        else if (!apply_line_op(first) && !apply_record_op(first))
        {
            first_is_op = false;
            rule.new_state = first;
        }

        if (first_is_op && !second.empty())
            rule.new_state = second;

        if (rule.line_op == LineOp::Continue && !rule.new_state.empty())
            throw TextFsmError("Continue cannot change state: " + action);
    }

    std::string TextFsmTemplate::ExpandRuleRegex(const std::string &raw, std::vector<std::pair<size_t, size_t>> &captures) const
    {
        std::string out;
        size_t group = 0;
        bool in_class = false;

        auto substitute = [&](const std::string &name)
        {
            for (size_t idx = 0; idx < m_values.size(); ++idx)
            {
                if (m_values[idx].name == name)
                {
                    captures.emplace_back(group + 1, idx);
                    out += m_values[idx].pattern;
                    group += static_cast<size_t>(m_values[idx].group_count);
                    return;
                }
            }
            throw TextFsmError("Rule references unknown Value " + name + ": " + raw);
        };

        for (size_t i = 0; i < raw.size(); ++i)
        {
            char c = raw[i];

            if (c == '\\')
            {
                out += c;
                if (i + 1 < raw.size())
                    out += raw[++i];
                continue;
            }

            if (c == '$' && !in_class)
            {
                if (i + 1 < raw.size() && raw[i + 1] == '$')
                {
                    out += '$';
                    ++i;
                    continue;
                }
                if (i + 1 < raw.size() && raw[i + 1] == '{')
                {
                    auto close = raw.find('}', i + 2);
                    if (close == std::string::npos)
                        throw TextFsmError("Unterminated ${ in rule: " + raw);
                    substitute(raw.substr(i + 2, close - i - 2));
                    i = close;
                    continue;
                }
                size_t j = i + 1;
                while (j < raw.size() && (std::isalnum(static_cast<unsigned char>(raw[j])) || raw[j] == '_'))
                    ++j;
                if (j > i + 1)
                {
                    substitute(raw.substr(i + 1, j - i - 1));
                    i = j - 1;
                    continue;
                }
                out += c;
                continue;
            }

            if (in_class)
            {
                if (c == ']')
                    in_class = false;
            }
            else if (c == '[')
            {
                in_class = true;
            }
            else if (c == '(' && !(i + 1 < raw.size() && raw[i + 1] == '?'))
            {
                ++group;
            }
            out += c;
        }
        return out;
    }

    void TextFsmTemplate::ClearRow(Row &row, bool all) const
    {
        for (size_t idx = 0; idx < m_values.size(); ++idx)
        {
            if (all || !m_values[idx].filldown)
            {
                row.values[idx].clear();
                row.lists[idx].clear();
            }
        }
    }

    bool TextFsmTemplate::AppendRecord(Row &row, std::vector<std::vector<std::string>> &out) const
    {
        bool any = false;
        for (size_t idx = 0; idx < m_values.size(); ++idx)
        {
            if (!row.values[idx].empty() || !row.lists[idx].empty())
            {
                any = true;
                break;
            }
        }
        if (!any)
            return false;

        for (size_t idx = 0; idx < m_values.size(); ++idx)
        {
            bool empty = m_values[idx].list ? row.lists[idx].empty() : row.values[idx].empty();
            if (m_values[idx].required && empty)
            {
                ClearRow(row, false);
                return false;
            }
        }

        std::vector<std::string> record;
        record.reserve(m_values.size());
        for (size_t idx = 0; idx < m_values.size(); ++idx)
        {
            if (!m_values[idx].list)
            {
                record.push_back(row.values[idx]);
                continue;
            }
            std::string joined;
            for (const auto &item : row.lists[idx])
            {
                if (!joined.empty())
                    joined += ", ";
                joined += item;
            }
            record.push_back(joined);
        }
        out.push_back(std::move(record));
        ClearRow(row, false);
        return true;
    }

    std::vector<std::vector<std::string>> TextFsmTemplate::ParseText(const std::string &input) const
    {
        std::vector<std::vector<std::string>> out;
        Row row;
        row.values.assign(m_values.size(), "");
        row.lists.assign(m_values.size(), {});

        std::string state = "Start";

        for (auto &line : SplitLines(input))
        {
            if (line.size() > kMaxLineLength)
                line.resize(kMaxLineLength);

            const auto &rules = m_states.at(state);
            for (const auto &rule : rules)
            {
                std::smatch match;
                if (!std::regex_search(line, match, rule.regex, std::regex_constants::match_continuous))
                    continue;

                for (const auto &capture : rule.captures)
                {
                    if (capture.first >= match.size() || !match[capture.first].matched)
                        continue;
                    if (m_values[capture.second].list)
                        row.lists[capture.second].push_back(match[capture.first].str());
                    else
                        row.values[capture.second] = match[capture.first].str();
                }

                if (rule.line_op == LineOp::Error)
                {
                    throw TextFsmError(rule.error_message.empty()
                                           ? "Error action raised by rule: " + rule.source
                                           : rule.error_message);
                }

                if (rule.record_op == RecordOp::Record)
                    AppendRecord(row, out);
                else if (rule.record_op == RecordOp::Clear)
                    ClearRow(row, false);
                else if (rule.record_op == RecordOp::Clearall)
                    ClearRow(row, true);

                if (!rule.new_state.empty())
                    state = rule.new_state;

                if (rule.line_op != LineOp::Continue)
                    break;
            }

            if (state == "End" || state == "EOF")
                break;
        }

        if (state != "End")
            AppendRecord(row, out);

        return out;
    }

    std::vector<TextFsmTemplate::Record> TextFsmTemplate::ParseRecords(const std::string &input) const
    {
        std::vector<Record> records;
        for (const auto &row : ParseText(input))
        {
            Record record;
            for (size_t idx = 0; idx < m_header.size() && idx < row.size(); ++idx)
                record[ToLower(m_header[idx])] = row[idx];
            records.push_back(std::move(record));
        }
        return records;
    }
}
