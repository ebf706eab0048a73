#pragma once

#include "engine/ianonymization_engine.hpp"
#include "engine/ideanonymization_engine.hpp"
#include "engine/operator_registry.hpp"

#include <atomic>
#include <string>

namespace anonymizer::testing {

/**
 * @brief Mock anonymization engine: returns a canned result, counts calls
 */
class MockAnonymizationEngine : public IAnonymizationEngine {
public:
    explicit MockAnonymizationEngine(Result<AnonymizationResult> canned =
        Result<AnonymizationResult>::ok(AnonymizationResult{"mock", {}}))
        : canned_(std::move(canned)) {}

    [[nodiscard]] Result<AnonymizationResult> anonymize(
        const std::string& /*text*/,
        const std::vector<DetectedEntity>& /*entities*/,
        const OperatorConfigMap& /*operators*/) const override {
        call_count_.fetch_add(1, std::memory_order_relaxed);
        return canned_;
    }

    [[nodiscard]] std::vector<OperatorDescriptor> get_anonymizers() const override {
        return OperatorRegistry::anonymizers().descriptors();
    }

    [[nodiscard]] uint64_t call_count() const {
        return call_count_.load(std::memory_order_relaxed);
    }

private:
    Result<AnonymizationResult> canned_;
    mutable std::atomic<uint64_t> call_count_{0};
};

class MockDeanonymizationEngine : public IDeanonymizationEngine {
public:
    explicit MockDeanonymizationEngine(Result<DeanonymizationResult> canned =
        Result<DeanonymizationResult>::ok(DeanonymizationResult{"mock", {}}))
        : canned_(std::move(canned)) {}

    [[nodiscard]] Result<DeanonymizationResult> deanonymize(
        const std::string& /*text*/,
        const std::vector<PIIEntity>& /*entities*/,
        const OperatorConfigMap& /*operators*/) const override {
        call_count_.fetch_add(1, std::memory_order_relaxed);
        return canned_;
    }

    [[nodiscard]] std::vector<OperatorDescriptor> get_deanonymizers() const override {
        return OperatorRegistry::deanonymizers().descriptors();
    }

    [[nodiscard]] uint64_t call_count() const {
        return call_count_.load(std::memory_order_relaxed);
    }

private:
    Result<DeanonymizationResult> canned_;
    mutable std::atomic<uint64_t> call_count_{0};
};

} // namespace anonymizer::testing
