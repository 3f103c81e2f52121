#pragma once

#include "../onboard/Collaborators.hpp"

#include <nlohmann/json.hpp>

namespace netscout::publish
{
    // Renders general-server inventory through inja. Devices are exposed as
    // all_devices, an object keyed by address.
    class InventoryRenderer : public onboard::TemplateEngine
    {
    public:
        std::string Render(const std::optional<std::string> &template_text,
                           const std::vector<onboard::InventoryDevice> &devices) override;

        static nlohmann::json BuildContext(const std::vector<onboard::InventoryDevice> &devices);
        static const std::string &DefaultTemplate();
    };
}
