#include <flow_catalog/capability_source.hpp>
#include <nlohmann/json.hpp>

namespace flow_catalog {

CatalogSnapshot demo_catalog() {
    CatalogSnapshot out;

    auto arg = [](const char* name, const char* type, bool required = true) {
        nlohmann::json a = { { "name", name }, { "type", type } };
        if (required) a["required"] = true;
        return a;
    };
    auto cap = [](const char* id, const char* uri, const char* title, const char* title_formatted,
                   std::initializer_list<nlohmann::json> args = {})
    {
        flow_model::Capability c;
        c.id = id;
        c.uri = uri;
        c.title = title;
        c.title_formatted = title_formatted;
        c.args = nlohmann::json::array();
        for (const auto& a : args)
            c.args.push_back(a);
        return c;
    };

    nlohmann::json sensor = arg("device", "device", false);
    sensor["filter"] = "class=sensor";

    out.triggers = {
        cap("time_schedule", "homey:app:com.athom.scheduler", "Time Schedule", "When the time is {{time}}",
            { arg("time", "time") }),
        cap("device_turned_on", "homey:manager:device", "Device turned on", "When {{device}} is turned on",
            { arg("device", "device") }),
        cap("sunset", "homey:app:com.athom.sun", "Sunset", "When the sun sets"),
        cap("motion_detected", "homey:device:sensor", "Motion detected", "When {{device}} detects motion",
            { sensor }),
    };

    out.conditions = {
        cap("time_between", "homey:app:com.athom.time", "Time is between", "Time is between {{from}} and {{to}}",
            { arg("from", "time"), arg("to", "time") }),
        cap("device_is_on", "homey:manager:device", "Device is on", "{{device}} is turned on",
            { arg("device", "device") }),
        cap("presence_home", "homey:app:com.athom.presence", "Someone is home", "Someone is home"),
    };

    nlohmann::json temperature = arg("temperature", "number");
    temperature["min"] = 5;
    temperature["max"] = 35;
    nlohmann::json thermostat = arg("device", "device");
    thermostat["filter"] = "class=thermostat";

    out.actions = {
        cap("turn_on_device", "homey:manager:device", "Turn device on", "Turn {{device}} on",
            { arg("device", "device") }),
        cap("turn_off_device", "homey:manager:device", "Turn device off", "Turn {{device}} off",
            { arg("device", "device") }),
        cap("send_notification", "homey:app:com.athom.notifications", "Send notification",
            "Send notification: {{message}}", { arg("message", "text") }),
        cap("set_thermostat", "homey:device:thermostat", "Set thermostat temperature",
            "Set {{device}} to {{temperature}}\xC2\xB0" "C", { thermostat, temperature }),
    };

    return out;
}

} // namespace flow_catalog
