#include "publish/InventoryRenderer.hpp"

#include <gtest/gtest.h>

using netscout::onboard::InventoryDevice;
using netscout::onboard::TemplateError;
using netscout::publish::InventoryRenderer;

namespace
{
    InventoryDevice Server(const std::string &address, const std::string &name)
    {
        InventoryDevice device;
        device.address = address;
        device.name = name;
        device.hostname = name;
        device.credential_id = 3;
        device.platform = "linux";
        device.role = "server";
        device.status = "Active";
        device.namespace_name = "Global";
        return device;
    }
}

TEST(InventoryRendererTest, DefaultLayoutIsAnsibleStyleYaml)
{
    auto web = Server("10.0.0.10", "web01");
    web.tags = {"web", "prod"};
    auto db = Server("10.0.0.11", "db01");
    db.location = "DC1";

    InventoryRenderer renderer;
    std::string out = renderer.Render(std::nullopt, {web, db});

    EXPECT_EQ(out,
              "all:\n"
              "  hosts:\n"
              "    web01:\n"
              "      ansible_host: 10.0.0.10\n"
              "      platform: linux\n"
              "      role: server\n"
              "      status: Active\n"
              "      namespace: Global\n"
              "      credential_id: 3\n"
              "      tags: [web, prod]\n"
              "    db01:\n"
              "      ansible_host: 10.0.0.11\n"
              "      platform: linux\n"
              "      location: DC1\n"
              "      role: server\n"
              "      status: Active\n"
              "      namespace: Global\n"
              "      credential_id: 3\n");
}

TEST(InventoryRendererTest, ContextIsKeyedByAddress)
{
    auto context = InventoryRenderer::BuildContext({Server("10.0.0.20", "b"), Server("10.0.0.3", "a")});

    const auto &all = context.at("all_devices");
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all.at("10.0.0.20").at("name"), "b");
    EXPECT_EQ(all.at("10.0.0.3").at("name"), "a");
    EXPECT_EQ(all.at("10.0.0.3").at("credential_id"), 3);
    EXPECT_EQ(all.at("10.0.0.3").at("namespace"), "Global");
    EXPECT_TRUE(all.at("10.0.0.3").at("tags").is_array());
}

TEST(InventoryRendererTest, CustomTemplateSeesSameContext)
{
    InventoryRenderer renderer;
    std::string out = renderer.Render(std::string("{% for a, d in all_devices %}{{ d.name }} {{ a }}\n{% endfor %}"),
                                      {Server("10.0.0.10", "web01")});

    EXPECT_EQ(out, "web01 10.0.0.10\n");
}

TEST(InventoryRendererTest, LoopAndFunctionsOverDeviceFields)
{
    auto web = Server("10.0.0.10", "web01");
    web.tags = {"web", "prod"};

    InventoryRenderer renderer;
    std::string out = renderer.Render(std::string("{% for a, d in all_devices %}\n"
                                                  "{{ upper(d.name) }}={{ length(d.tags) }}\n"
                                                  "{% endfor %}\n"),
                                      {web});

    EXPECT_EQ(out, "WEB01=2\n");
}

TEST(InventoryRendererTest, BrokenTemplateRaisesTemplateError)
{
    InventoryRenderer renderer;
    EXPECT_THROW(renderer.Render(std::string("{% for d in all_devices %}"), {Server("10.0.0.10", "web01")}),
                 TemplateError);
}

TEST(InventoryRendererTest, UnknownVariableRaisesTemplateError)
{
    InventoryRenderer renderer;
    try
    {
        renderer.Render(std::string("all:\n{{ inventory_owner }}\n"), {Server("10.0.0.10", "web01")});
        FAIL() << "expected TemplateError";
    }
    catch (const TemplateError &e)
    {
        EXPECT_NE(std::string(e.what()).find("inventory_owner"), std::string::npos);
    }
}

TEST(InventoryRendererTest, IncludesCannotReadFiles)
{
    InventoryRenderer renderer;
    EXPECT_THROW(renderer.Render(std::string("{% include \"/etc/hostname\" %}"), {Server("10.0.0.10", "web01")}),
                 TemplateError);
}
