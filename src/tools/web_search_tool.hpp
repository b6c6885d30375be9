#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/agent_errors.hpp"
#include "tools/function_tool_provider.hpp"

namespace agentloop::tools {

struct HttpGetRequest {
    std::string url;
    std::vector<std::pair<std::string, std::string>> query;
    std::vector<std::pair<std::string, std::string>> headers;
};

// One HTTP GET returning the response body. The implementation owns the
// connection; network failures and non-2xx statuses must be errors.
class HttpGetter {
public:
    virtual ~HttpGetter() = default;

    virtual core::errors::Result<std::string> get(const HttpGetRequest& request) = 0;
};

constexpr const char* kWebSearchToolName = "Web_Search";
constexpr const char* kBraveSearchUrl = "https://api.search.brave.com/res/v1/web/search";
constexpr const char* kWebSearchResultCount = "5";

nlohmann::json web_search_schema();

// Brave web search query: q, count=5, result_filter=web, key in
// X-Subscription-Token.
HttpGetRequest web_search_request(const std::string& api_key, const std::string& query);

// {"web":{"results":[{"title","description","url"}, ...]}} rendered as
// "Title/Description/URL" blocks separated by a blank line.
core::errors::Result<std::string> format_search_results(const nlohmann::json& payload);

// A provider exposing the single Web_Search tool. Every failure, transport
// included, is reported back to the model as a tool failure.
core::errors::Result<std::shared_ptr<FunctionToolProvider>> make_web_search_provider(
    std::shared_ptr<HttpGetter> http, std::string api_key);

}  // namespace agentloop::tools
