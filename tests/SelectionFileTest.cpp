#include "client/SelectionFile.hpp"

#include <gtest/gtest.h>

#include <sstream>

using netscout::client::ParseSelections;
using netscout::client::SelectionError;

namespace
{
    std::vector<netscout::onboard::DeviceSelection> Parse(const std::string &text)
    {
        std::istringstream in(text);
        return ParseSelections(in);
    }

    std::string ErrorOf(const std::string &text)
    {
        try
        {
            Parse(text);
        }
        catch (const SelectionError &e)
        {
            return e.what();
        }
        return "";
    }
}

TEST(SelectionFileTest, BareAddressesSelectWithDefaults)
{
    auto selections = Parse("10.0.0.1\n10.0.0.2\n");

    ASSERT_EQ(selections.size(), 2u);
    EXPECT_EQ(selections[0].address, "10.0.0.1");
    EXPECT_FALSE(selections[0].metadata.name.has_value());
    EXPECT_TRUE(selections[0].metadata.tags.empty());
}

TEST(SelectionFileTest, KeyValuePairsFillMetadata)
{
    auto selections = Parse(
        "10.0.0.1 name=edge-1 location=\"DC 1\" role=access platform=detect secrets_group=ssh\n"
        "10.0.0.10 namespace=Lab status=Planned interface_status=Active ip_status=Reserved\r\n");

    ASSERT_EQ(selections.size(), 2u);
    const auto &a = selections[0].metadata;
    EXPECT_EQ(a.name, "edge-1");
    EXPECT_EQ(a.location, "DC 1");
    EXPECT_EQ(a.role, "access");
    EXPECT_EQ(a.platform, "detect");
    EXPECT_EQ(a.secrets_group, "ssh");

    const auto &b = selections[1].metadata;
    EXPECT_EQ(b.namespace_name, "Lab");
    EXPECT_EQ(b.status, "Planned");
    EXPECT_EQ(b.interface_status, "Active");
    EXPECT_EQ(b.ip_status, "Reserved");
}

TEST(SelectionFileTest, QuotedTagsAreSplitAndTrimmed)
{
    auto selections = Parse("10.0.0.10 tags=\"web, prod ,, linux\"\n");

    ASSERT_EQ(selections.size(), 1u);
    EXPECT_EQ(selections[0].metadata.tags, (std::vector<std::string>{"web", "prod", "linux"}));
}

TEST(SelectionFileTest, CommentsAndBlankLinesAreSkipped)
{
    auto selections = Parse("# picked from scan_1_1\n\n   \n  # indented comment\n10.0.0.5\n");

    ASSERT_EQ(selections.size(), 1u);
    EXPECT_EQ(selections[0].address, "10.0.0.5");
}

TEST(SelectionFileTest, ErrorsNameTheLine)
{
    EXPECT_EQ(ErrorOf("10.0.0.1\n10.0.0.2 colour=blue\n"), "line 2: unknown key 'colour'");
    EXPECT_EQ(ErrorOf("10.0.0.1 DC1\n"), "line 1: expected key=value, got 'DC1'");
    EXPECT_EQ(ErrorOf("10.0.0.1 =x\n"), "line 1: expected key=value, got '=x'");
    EXPECT_EQ(ErrorOf("\n10.0.0.1 name=\"open\n"), "line 2: unterminated quote");
}
