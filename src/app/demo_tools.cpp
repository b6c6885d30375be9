#include "app/demo_tools.hpp"
#include <chrono>
#include <ctime>
#include <string>
#include <utility>
#include <nlohmann/json.hpp>

namespace agentloop::app {

    using agentloop::core::errors::Result;
    using nlohmann::json;

    namespace {

        json object_schema(json properties, json required) {
            return json{{"type", "object"},
                        {"properties", std::move(properties)},
                        {"required", std::move(required)}};
        }

        Result<std::string> echo(const json& arguments) {
            return arguments.at("text").get<std::string>();
        }

        Result<std::string> add_numbers(const json& arguments) {
            const double sum = arguments.at("a").get<double>() + arguments.at("b").get<double>();
            return json(sum).dump();
        }

        Result<std::string> utc_time(const json&) {
            const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
            std::tm utc{};
            if (gmtime_r(&now, &utc) == nullptr) {
                return agentloop::core::errors::tool_failure("Clock unavailable", "clock_error");
            }
            char buffer[32];
            const size_t written = std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc);
            return std::string(buffer, written);
        }

    } // namespace

    Result<std::shared_ptr<agentloop::tools::FunctionToolProvider>> make_demo_tools() {
        auto provider = std::make_shared<agentloop::tools::FunctionToolProvider>();

        auto added = provider->add(
            "echo", std::string("Returns the given text unchanged"),
            object_schema(json{{"text", {{"type", "string"}}}}, json::array({"text"})), echo);
        if (agentloop::core::errors::is_error(added)) {
            return agentloop::core::errors::get_error(added);
        }

        added = provider->add(
            "add_numbers", std::string("Adds two numbers"),
            object_schema(json{{"a", {{"type", "number"}}}, {"b", {{"type", "number"}}}},
                          json::array({"a", "b"})),
            add_numbers);
        if (agentloop::core::errors::is_error(added)) {
            return agentloop::core::errors::get_error(added);
        }

        added = provider->add("utc_time", std::string("Current UTC time in ISO 8601"),
                              object_schema(json::object(), json::array()), utc_time);
        if (agentloop::core::errors::is_error(added)) {
            return agentloop::core::errors::get_error(added);
        }

        return provider;
    }

} // namespace agentloop::app
