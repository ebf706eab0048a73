#include "engine/operator_registry.hpp"

namespace anonymizer {

std::string_view operator_kind_to_string(OperatorKind kind) {
    switch (kind) {
        case OperatorKind::REPLACE: return op::kReplace;
        case OperatorKind::REDACT:  return op::kRedact;
        case OperatorKind::MASK:    return op::kMask;
        case OperatorKind::HASH:    return op::kHash;
        case OperatorKind::ENCRYPT: return op::kEncrypt;
        case OperatorKind::KEEP:    return op::kKeep;
        case OperatorKind::CUSTOM:  return op::kCustom;
        case OperatorKind::GENZ:    return op::kGenz;
        case OperatorKind::DECRYPT: return op::kDecrypt;
    }
    return "unknown";
}

std::optional<OperatorKind> reverse_of(OperatorKind forward) {
    switch (forward) {
        case OperatorKind::ENCRYPT: return OperatorKind::DECRYPT;
        case OperatorKind::KEEP:    return OperatorKind::KEEP;
        default:                    return std::nullopt;
    }
}

OperatorRegistry::OperatorRegistry(std::string role,
                                   std::vector<std::pair<std::string, OperatorKind>> entries,
                                   std::string fallback)
    : role_(std::move(role)), entries_(std::move(entries)), fallback_(std::move(fallback)) {
    descriptors_.reserve(entries_.size());
    for (const auto& [name, kind] : entries_) {
        descriptors_.push_back(OperatorDescriptor{name});
    }
}

const OperatorRegistry& OperatorRegistry::anonymizers() {
    static const OperatorRegistry registry(
        "anonymizer",
        {
            {std::string(op::kHash),    OperatorKind::HASH},
            {std::string(op::kMask),    OperatorKind::MASK},
            {std::string(op::kRedact),  OperatorKind::REDACT},
            {std::string(op::kReplace), OperatorKind::REPLACE},
            {std::string(op::kCustom),  OperatorKind::CUSTOM},
            {std::string(op::kKeep),    OperatorKind::KEEP},
            {std::string(op::kEncrypt), OperatorKind::ENCRYPT},
            {std::string(op::kGenz),    OperatorKind::GENZ},
        },
        std::string(op::kReplace));
    return registry;
}

const OperatorRegistry& OperatorRegistry::deanonymizers() {
    static const OperatorRegistry registry(
        "deanonymizer",
        {
            {std::string(op::kDecrypt), OperatorKind::DECRYPT},
            {std::string(op::kKeep),    OperatorKind::KEEP},
        },
        std::string(op::kDecrypt));
    return registry;
}

std::optional<OperatorKind> OperatorRegistry::find(std::string_view name) const {
    for (const auto& [entry_name, kind] : entries_) {
        if (entry_name == name) return kind;
    }
    return std::nullopt;
}

} // namespace anonymizer
