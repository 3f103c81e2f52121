#include "InventoryRenderer.hpp"

#include <inja/inja.hpp>

namespace netscout::publish
{
    namespace
    {
        const std::string kDefaultInventory =
            "all:\n"
            "  hosts:\n"
            "{% for address, device in all_devices %}\n"
            "    {{ device.name }}:\n"
            "      ansible_host: {{ address }}\n"
            "      platform: {{ device.platform }}\n"
            "{% if device.location != \"\" %}\n"
            "      location: {{ device.location }}\n"
            "{% endif %}\n"
            "      role: {{ device.role }}\n"
            "      status: {{ device.status }}\n"
            "      namespace: {{ device.namespace }}\n"
            "      credential_id: {{ device.credential_id }}\n"
            "{% if length(device.tags) > 0 %}\n"
            "      tags: [{{ join(device.tags, \", \") }}]\n"
            "{% endif %}\n"
            "{% endfor %}\n";

        std::string Describe(const inja::InjaError &e)
        {
            if (e.location.line == 0)
                return "template " + e.type + ": " + e.message;
            return "template " + e.type + " at line " + std::to_string(e.location.line) + ": " + e.message;
        }
    }

    const std::string &InventoryRenderer::DefaultTemplate()
    {
        return kDefaultInventory;
    }

    nlohmann::json InventoryRenderer::BuildContext(const std::vector<onboard::InventoryDevice> &devices)
    {
        nlohmann::json all_devices = nlohmann::json::object();
        for (const auto &device : devices)
        {
            all_devices[device.address] = {
                {"name", device.name},
                {"address", device.address},
                {"credential_id", device.credential_id},
                {"hostname", device.hostname},
                {"platform", device.platform},
                {"location", device.location},
                {"role", device.role},
                {"status", device.status},
                {"namespace", device.namespace_name},
                {"tags", device.tags},
            };
        }

        nlohmann::json context = nlohmann::json::object();
        context["all_devices"] = std::move(all_devices);
        return context;
    }

    std::string InventoryRenderer::Render(const std::optional<std::string> &template_text,
                                          const std::vector<onboard::InventoryDevice> &devices)
    {
        inja::Environment env;
        env.set_trim_blocks(true);
        env.set_lstrip_blocks(true);
        // Stored templates must not pull files off the daemon's disk.
        env.set_search_included_templates_in_files(false);

        try
        {
            inja::Template tmpl = env.parse(template_text ? *template_text : kDefaultInventory);
            return env.render(tmpl, BuildContext(devices));
        }
        catch (const inja::InjaError &e)
        {
            throw onboard::TemplateError(Describe(e));
        }
    }
}
