#pragma once

#include <map>
#include <regex>
#include <stdexcept>
#include <string>
#include <vector>

namespace netscout::scan
{
    class TextFsmError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    // Subset of the TextFSM template language used to pull fields out of
    // CLI output: Value definitions, named states, ^rule -> Action lines.
    class TextFsmTemplate
    {
    public:
        using Record = std::map<std::string, std::string>;

        // Input lines are cut to this length before matching; std::regex
        // recurses per character and a single huge line exhausts the stack.
        static constexpr size_t kMaxLineLength = 4096;

        // Throws TextFsmError on a malformed template.
        static TextFsmTemplate Parse(const std::string &text);

        // Throws TextFsmError when an Error action fires.
        std::vector<std::vector<std::string>> ParseText(const std::string &input) const;

        // Rows keyed by lower-cased value name.
        std::vector<Record> ParseRecords(const std::string &input) const;

        const std::vector<std::string> &Header() const { return m_header; }

    private:
        enum class LineOp
        {
            Next,
            Continue,
            Error
        };

        enum class RecordOp
        {
            NoRecord,
            Record,
            Clear,
            Clearall
        };

        struct ValueDef
        {
            std::string name;
            std::string pattern;
            int group_count = 0;
            bool required = false;
            bool filldown = false;
            bool list = false;
        };

        struct Rule
        {
            std::string source;
            std::regex regex;
            std::vector<std::pair<size_t, size_t>> captures; // (regex group, value index)
            LineOp line_op = LineOp::Next;
            RecordOp record_op = RecordOp::NoRecord;
            std::string new_state;
            std::string error_message;
        };

        struct Row
        {
            std::vector<std::string> values;
            std::vector<std::vector<std::string>> lists;
        };

        void ParseValueLine(const std::string &line);
        Rule ParseRuleLine(const std::string &line) const;
        void ParseAction(const std::string &action, Rule &rule) const;
        std::string ExpandRuleRegex(const std::string &raw, std::vector<std::pair<size_t, size_t>> &captures) const;

        bool AppendRecord(Row &row, std::vector<std::vector<std::string>> &out) const;
        void ClearRow(Row &row, bool all) const;

        std::vector<ValueDef> m_values;
        std::vector<std::string> m_header;
        std::map<std::string, std::vector<Rule>> m_states;
    };
}
