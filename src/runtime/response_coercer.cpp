#include "runtime/response_coercer.hpp"

#include <utility>

namespace agentloop::runtime {

using core::errors::AgentError;
using core::errors::ErrorCategory;

namespace {

constexpr std::size_t kMaxQuotedTextLength = 200;

std::string quote_for_error(const std::string& text) {
    if (text.size() <= kMaxQuotedTextLength) {
        return text;
    }
    return text.substr(0, kMaxQuotedTextLength) + "...";
}

}  // namespace

nlohmann::json ResponseCoercer::strip_schema_metadata(nlohmann::json schema) {
    if (schema.is_object()) {
        schema.erase("$schema");
        schema.erase("title");
    }
    return schema;
}

protocol::ResponseFormat ResponseCoercer::response_format(nlohmann::json schema) {
    protocol::ResponseFormat format;
    format.name = "ResponseFormat";
    format.schema = strip_schema_metadata(std::move(schema));
    return format;
}

core::errors::Result<nlohmann::json> ResponseCoercer::parse_strict(const std::string& text) {
    nlohmann::json parsed = nlohmann::json::parse(text, nullptr, false);
    if (parsed.is_discarded()) {
        return decode_error(text, "not valid JSON");
    }
    return parsed;
}

AgentError ResponseCoercer::decode_error(const std::string& text,
                                         const std::string& reason) {
    return AgentError{ErrorCategory::Decode,
                      "Unable to decode answer (" + reason + "): " + quote_for_error(text),
                      "decode_failed"};
}

}  // namespace agentloop::runtime
