#include "translator/request_translator.hpp"

#include <format>

namespace anonymizer {

namespace {

// Largest integer a JSON double represents exactly
constexpr double kMaxOffset = 9007199254740991.0;

std::string supported_names(const OperatorRegistry& registry) {
    std::string names;
    for (const auto& d : registry.descriptors()) {
        if (!names.empty()) names += ", ";
        names += d.name;
    }
    return names;
}

} // anonymous namespace

// ============================================================================
// Entity spans
// ============================================================================

Result<size_t> RequestTranslator::parse_offset(
    const JsonValue& item, std::string_view name, std::string_view collection, size_t index) {

    if (!item.contains(name)) {
        return invalid_param<size_t>(std::format(
            "Invalid input, {}[{}] is missing required field '{}'", collection, index, name));
    }
    const auto v = item[name];
    if (!v.is_number_integer() || v.get<double>() < 0 || v.get<double>() > kMaxOffset) {
        return invalid_param<size_t>(std::format(
            "Invalid input, {}[{}].{} must be a non-negative integer, got {}",
            collection, index, name, v.type_name()));
    }
    return Result<size_t>::ok(v.get<size_t>());
}

Result<RequestTranslator::Span> RequestTranslator::parse_span(
    const JsonValue& item, std::string_view collection, size_t index) {

    if (!item.is_object()) {
        return invalid_param<Span>(std::format(
            "Invalid input, {}[{}] must be an object, got {}", collection, index, item.type_name()));
    }

    if (!item.contains(field::kEntityType)) {
        return invalid_param<Span>(std::format(
            "Invalid input, {}[{}] is missing required field '{}'", collection, index, field::kEntityType));
    }
    const auto type = item[field::kEntityType];
    if (!type.is_string() || type.get<std::string>().empty()) {
        return invalid_param<Span>(std::format(
            "Invalid input, {}[{}].{} must be a non-empty string", collection, index, field::kEntityType));
    }

    const auto start = parse_offset(item, field::kStart, collection, index);
    if (start.is_error()) return Result<Span>::error_from(start);
    const auto end = parse_offset(item, field::kEnd, collection, index);
    if (end.is_error()) return Result<Span>::error_from(end);

    if (start.value() >= end.value()) {
        return invalid_param<Span>(std::format(
            "Invalid input, {}[{}] start index '{}' must be smaller than end index '{}'",
            collection, index, start.value(), end.value()));
    }

    return Result<Span>::ok(Span{type.get<std::string>(), start.value(), end.value()});
}

Result<std::vector<DetectedEntity>> RequestTranslator::parse_entities(const JsonValue& raw) {
    using R = Result<std::vector<DetectedEntity>>;
    std::vector<DetectedEntity> entities;

    if (raw.is_null()) return R::ok(std::move(entities));
    if (!raw.is_array()) {
        return invalid_param<std::vector<DetectedEntity>>(std::format(
            "Invalid input, {} must be an array, got {}", field::kAnalyzerResults, raw.type_name()));
    }

    entities.reserve(raw.size());
    for (size_t i = 0; i < raw.size(); ++i) {
        const auto item = raw[i];
        auto span = parse_span(item, field::kAnalyzerResults, i);
        if (span.is_error()) return R::error_from(span);

        double score = 0.0;
        if (item.contains(field::kScore)) {
            const auto s = item[field::kScore];
            if (!s.is_number() || s.get<double>() < 0.0 || s.get<double>() > 1.0) {
                return invalid_param<std::vector<DetectedEntity>>(std::format(
                    "Invalid input, {}[{}].{} must be a number between 0 and 1",
                    field::kAnalyzerResults, i, field::kScore));
            }
            score = s.get<double>();
        }

        auto& sp = span.value();
        entities.emplace_back(std::move(sp.entity_type), sp.start, sp.end, score);
    }
    return R::ok(std::move(entities));
}

// ============================================================================
// Operator rules
// ============================================================================

Result<ParamValue> RequestTranslator::parse_param(
    std::string_view name, const JsonValue& raw, std::string_view owner) {

    if (raw.is_string()) return Result<ParamValue>::ok(ParamValue{raw.get<std::string>()});
    if (raw.is_boolean()) return Result<ParamValue>::ok(ParamValue{raw.get<bool>()});
    if (raw.is_number_integer()) return Result<ParamValue>::ok(ParamValue{raw.get<int64_t>()});
    if (raw.is_number()) return Result<ParamValue>::ok(ParamValue{raw.get<double>()});

    return invalid_param<ParamValue>(std::format(
        "Invalid input, parameter '{}' of {} must be a string, number or boolean, got {}",
        name, owner, raw.type_name()));
}

Result<OperatorConfig> RequestTranslator::parse_rule(
    std::string key, const JsonValue& raw, const OperatorRegistry& registry) {

    const std::string owner = std::format("{} for '{}'", registry.role(), key);

    if (key.empty()) {
        return invalid_param<OperatorConfig>(std::format(
            "Invalid input, {} entity type key must not be empty", registry.role()));
    }
    if (!raw.is_object()) {
        return invalid_param<OperatorConfig>(std::format(
            "Invalid input, {} must be an object, got {}", owner, raw.type_name()));
    }
    if (!raw.contains(field::kType)) {
        return invalid_param<OperatorConfig>(std::format(
            "Invalid input, {} is missing required field '{}'", owner, field::kType));
    }
    const auto type = raw[field::kType];
    if (!type.is_string()) {
        return invalid_param<OperatorConfig>(std::format(
            "Invalid input, {}.{} must be a string, got {}", owner, field::kType, type.type_name()));
    }

    const auto name = type.get<std::string>();
    if (!registry.contains(name)) {
        return invalid_param<OperatorConfig>(std::format(
            "Invalid {} type '{}' for '{}', supported: {}",
            registry.role(), name, key, supported_names(registry)));
    }

    OperatorConfig config(name, key);
    for (const auto [param_name, value] : raw.items()) {
        if (param_name == field::kType) continue;
        if (param_name == field::kEntityType) {
            if (!value.is_string() || value.get<std::string>() != key) {
                return invalid_param<OperatorConfig>(std::format(
                    "Invalid input, {}.{} does not match its key", owner, field::kEntityType));
            }
            continue;
        }
        auto param = parse_param(param_name, value, owner);
        if (param.is_error()) return Result<OperatorConfig>::error_from(param);
        config.params.emplace(param_name, std::move(param.value()));
    }
    return Result<OperatorConfig>::ok(std::move(config));
}

Result<OperatorConfigMap> RequestTranslator::parse_operator_configs(
    const JsonValue& raw, const OperatorRegistry& registry) {

    using R = Result<OperatorConfigMap>;
    OperatorConfigMap configs;

    // Absent → implicit DEFAULT rule
    if (raw.is_null() || ((raw.is_object() || raw.is_array()) && raw.empty())) {
        const std::string key(kDefaultEntityKey);
        OperatorConfig fallback(std::string(registry.fallback_operator()), key);
        fallback.implicit = true;
        configs.emplace(key, std::move(fallback));
        return R::ok(std::move(configs));
    }

    // Inline rule: key comes from its own entity_type (DEFAULT when absent)
    const auto inline_key = [&](const JsonValue& rule) -> Result<std::string> {
        if (!rule.contains(field::kEntityType)) {
            return Result<std::string>::ok(std::string(kDefaultEntityKey));
        }
        const auto et = rule[field::kEntityType];
        if (!et.is_string()) {
            return invalid_param<std::string>(std::format(
                "Invalid input, {} rule {} must be a string, got {}",
                registry.role(), field::kEntityType, et.type_name()));
        }
        return Result<std::string>::ok(et.get<std::string>());
    };

    if (raw.is_object() && raw[field::kType].is_string()) {
        auto key = inline_key(raw);
        if (key.is_error()) return R::error_from(key);
        auto rule = parse_rule(key.value(), raw, registry);
        if (rule.is_error()) return R::error_from(rule);
        configs.emplace(key.value(), std::move(rule.value()));
        return R::ok(std::move(configs));
    }

    if (raw.is_object()) {
        for (const auto [key, value] : raw.items()) {
            auto rule = parse_rule(key, value, registry);
            if (rule.is_error()) return R::error_from(rule);
            configs.emplace(key, std::move(rule.value()));
        }
        return R::ok(std::move(configs));
    }

    if (raw.is_array()) {
        for (size_t i = 0; i < raw.size(); ++i) {
            const auto item = raw[i];
            if (!item.is_object()) {
                return invalid_param<OperatorConfigMap>(std::format(
                    "Invalid input, {} rule [{}] must be an object, got {}",
                    registry.role(), i, item.type_name()));
            }
            auto key = inline_key(item);
            if (key.is_error()) return R::error_from(key);
            if (configs.contains(key.value())) {
                return invalid_param<OperatorConfigMap>(std::format(
                    "Invalid input, duplicate {} rule for '{}'", registry.role(), key.value()));
            }
            auto rule = parse_rule(key.value(), item, registry);
            if (rule.is_error()) return R::error_from(rule);
            configs.emplace(key.value(), std::move(rule.value()));
        }
        return R::ok(std::move(configs));
    }

    return invalid_param<OperatorConfigMap>(std::format(
        "Invalid input, {}s must be an object, got {}", registry.role(), raw.type_name()));
}

bool RequestTranslator::reject_custom_operator(const OperatorConfigMap& configs) {
    for (const auto& [key, config] : configs) {
        if (config.operator_name == op::kCustom) return true;
    }
    return false;
}

bool RequestTranslator::reject_custom_operator(const JsonValue& raw) {
    const auto is_custom = [](const JsonValue& rule) {
        if (!rule.is_object()) return false;
        const auto type = rule[field::kType];
        return type.is_string() && type.get<std::string>() == op::kCustom;
    };

    if (is_custom(raw)) return true;
    if (raw.is_object() && !raw[field::kType].is_string()) {
        for (const auto [key, value] : raw.items()) {
            if (is_custom(value)) return true;
        }
    }
    if (raw.is_array()) {
        for (size_t i = 0; i < raw.size(); ++i) {
            if (is_custom(raw[i])) return true;
        }
    }
    return false;
}

// ============================================================================
// Deanonymize entities
// ============================================================================

Result<std::vector<PIIEntity>> RequestTranslator::parse_deanonymize_entities(
    const JsonValue& raw, const OperatorConfigMap& rules) {

    using R = Result<std::vector<PIIEntity>>;
    std::vector<PIIEntity> entities;

    if (raw.is_null()) return R::ok(std::move(entities));
    if (!raw.is_array()) {
        return invalid_param<std::vector<PIIEntity>>(std::format(
            "Invalid input, {} must be an array, got {}", field::kAnonymizerResults, raw.type_name()));
    }

    const auto& forward = OperatorRegistry::anonymizers();
    entities.reserve(raw.size());

    for (size_t i = 0; i < raw.size(); ++i) {
        const auto item = raw[i];
        auto span = parse_span(item, field::kAnonymizerResults, i);
        if (span.is_error()) return R::error_from(span);

        PIIEntity entity;
        entity.entity_type = std::move(span.value().entity_type);
        entity.start = span.value().start;
        entity.end = span.value().end;

        // Restoration metadata: the operator that produced this span
        const auto op_name = item[field::kOperator];
        if (!op_name.is_string()) {
            return invalid_param<std::vector<PIIEntity>>(std::format(
                "Invalid input, {}[{}] requires field '{}' naming the anonymizer that produced it",
                field::kAnonymizerResults, i, field::kOperator));
        }
        entity.operator_name = op_name.get<std::string>();

        const auto kind = forward.find(entity.operator_name);
        if (!kind) {
            return invalid_param<std::vector<PIIEntity>>(std::format(
                "Invalid input, {}[{}].{} '{}' is not a known anonymizer",
                field::kAnonymizerResults, i, field::kOperator, entity.operator_name));
        }
        if (!reverse_of(*kind)) {
            return invalid_param<std::vector<PIIEntity>>(std::format(
                "Invalid input, {}[{}] was produced by '{}', which cannot be reversed",
                field::kAnonymizerResults, i, entity.operator_name));
        }

        if (item.contains(field::kKey)) {
            const auto k = item[field::kKey];
            if (!k.is_string() || k.get<std::string>().empty()) {
                return invalid_param<std::vector<PIIEntity>>(std::format(
                    "Invalid input, {}[{}].{} must be a non-empty string", field::kAnonymizerResults, i, field::kKey));
            }
            entity.key = k.get<std::string>();
        }

        if (*kind == OperatorKind::ENCRYPT && !entity.key) {
            if (const auto* rule = select_operator(rules, entity.entity_type)) {
                auto rule_key = rule->param_as<std::string>(field::kKey);
                if (rule_key && !rule_key->empty()) entity.key = std::move(*rule_key);
            }
            if (!entity.key) {
                return invalid_param<std::vector<PIIEntity>>(std::format(
                    "Invalid input, {}[{}] ({}) requires '{}' for operator '{}'",
                    field::kAnonymizerResults, i, entity.entity_type, field::kKey, entity.operator_name));
            }
        }

        entities.push_back(std::move(entity));
    }
    return R::ok(std::move(entities));
}

} // namespace anonymizer
