#include "server/result_serializer.hpp"
#include "core/utils.hpp"

#include <format>

namespace anonymizer {

std::string ResultSerializer::serialize(const EngineResult& result) {
    std::string out;
    out.reserve(result.text.size() + 64 * result.items.size() + 32);

    out += std::format(R"({{"text":"{}","items":[)", utils::escape_json(result.text));
    for (size_t i = 0; i < result.items.size(); ++i) {
        const auto& item = result.items[i];
        if (i > 0) out += ',';
        out += std::format(
            R"({{"entity_type":"{}","start":{},"end":{},"operator":"{}","text":"{}"}})",
            utils::escape_json(item.entity_type), item.start, item.end,
            utils::escape_json(item.operator_name), utils::escape_json(item.text));
    }
    out += "]}";
    return out;
}

std::string ResultSerializer::serialize_descriptors(const std::vector<OperatorDescriptor>& descriptors) {
    std::string out = "[";
    for (size_t i = 0; i < descriptors.size(); ++i) {
        if (i > 0) out += ',';
        out += std::format(R"("{}")", utils::escape_json(descriptors[i].name));
    }
    out += ']';
    return out;
}

} // namespace anonymizer
