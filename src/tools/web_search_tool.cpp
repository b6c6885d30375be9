#include "tools/web_search_tool.hpp"

#include "core/logging/logger.hpp"

namespace agentloop::tools {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

core::errors::Result<std::string> string_field(const json& item, const char* key) {
    if (!item.is_object() || !item.contains(key) || !item[key].is_string()) {
        return core::errors::tool_failure(
            std::string("Web search result field '") + key + "' is not a string",
            "invalid_search_results");
    }
    return item[key].get<std::string>();
}

}  // namespace

json web_search_schema() {
    return {{"type", "object"},
            {"properties",
             {{"query",
               {{"description",
                 "The search terms or keywords to be used by the search engine for "
                 "retrieving relevant results"},
                {"type", "string"}}}}},
            {"required", json::array({"query"})}};
}

HttpGetRequest web_search_request(const std::string& api_key, const std::string& query) {
    HttpGetRequest request;
    request.url = kBraveSearchUrl;
    request.query = {{"q", query}, {"count", kWebSearchResultCount}, {"result_filter", "web"}};
    request.headers = {{"Accept", "application/json"}, {"X-Subscription-Token", api_key}};
    return request;
}

core::errors::Result<std::string> format_search_results(const json& payload) {
    const json* results = nullptr;
    if (payload.is_object() && payload.contains("web") && payload["web"].is_object() &&
        payload["web"].contains("results")) {
        results = &payload["web"]["results"];
    }
    if (results == nullptr || !results->is_array()) {
        return core::errors::tool_failure("Web search results are not an array",
                                          "invalid_search_results");
    }

    std::string out;
    for (const auto& item : *results) {
        auto title = string_field(item, "title");
        if (core::errors::is_error(title)) {
            return core::errors::get_error(title);
        }
        auto description = string_field(item, "description");
        if (core::errors::is_error(description)) {
            return core::errors::get_error(description);
        }
        auto url = string_field(item, "url");
        if (core::errors::is_error(url)) {
            return core::errors::get_error(url);
        }

        if (!out.empty()) {
            out += "\n\n";
        }
        out += "Title: " + core::errors::get_value(title) +
               "\nDescription: " + core::errors::get_value(description) +
               "\nURL: " + core::errors::get_value(url);
    }
    return out;
}

core::errors::Result<std::shared_ptr<FunctionToolProvider>> make_web_search_provider(
    std::shared_ptr<HttpGetter> http, std::string api_key) {
    if (!http) {
        return AgentError{ErrorCategory::Input, "HTTP client is null.", "missing_http_client"};
    }

    auto provider = std::make_shared<FunctionToolProvider>();
    auto added = provider->add(
        kWebSearchToolName,
        std::string("A tool that performs web searches using a specified query parameter to "
                    "retrieve relevant results from a search engine. As the result you will "
                    "receive list of websites with description"),
        web_search_schema(),
        [http, api_key](const json& arguments) -> core::errors::Result<std::string> {
            const auto query = arguments.at("query").get<std::string>();
            LOG_DEBUG("WebSearch: query '" + query + "'");

            auto body = http->get(web_search_request(api_key, query));
            if (core::errors::is_error(body)) {
                const auto& err = core::errors::get_error(body);
                return core::errors::tool_failure("Web search failed: " + err.message,
                                                  "web_search_failed");
            }

            const json payload = json::parse(core::errors::get_value(body), nullptr, false);
            if (payload.is_discarded()) {
                return core::errors::tool_failure("Web search response is not valid JSON",
                                                  "invalid_search_results");
            }
            return format_search_results(payload);
        });
    if (core::errors::is_error(added)) {
        return core::errors::get_error(added);
    }
    return provider;
}

}  // namespace agentloop::tools
