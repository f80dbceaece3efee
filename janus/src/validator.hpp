#pragma once

#include "error.hpp"
#include "manifest.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace janus {

struct ValidationIssue {
    std::string field;
    std::string message;
    std::string expected;
    nlohmann::json actual;
    nlohmann::json constraints;
};

struct ValidationReport {
    bool valid = true;
    std::vector<ValidationIssue> issues;
    size_t fields_validated = 0;
};

/**
 * Checks dynamic values against a Manifest.
 *
 * Request validation fails fast and yields the StructuredError that is sent
 * back to the caller. Response validation collects every issue and never
 * throws; callers treat it as advisory.
 */
class Validator {
public:
    /// Longest string, in bytes, that is matched against a pattern; longer
    /// values fail the pattern constraint without being matched.
    static constexpr size_t max_pattern_subject = 4096;

    explicit Validator(std::shared_ptr<const Manifest> manifest);

    /// Empty result means accepted. When `normalized` is given it receives the
    /// argument object with declared defaults filled in.
    std::optional<StructuredError> validate_request(const std::string& command,
                                                    const nlohmann::json& args,
                                                    nlohmann::json* normalized = nullptr) const;

    std::optional<StructuredError> validate_value(const std::string& field,
                                                  const nlohmann::json& value,
                                                  const ArgumentSpec& spec) const;

    ValidationReport validate_response(const std::string& command, const nlohmann::json& result) const;

    const Manifest& manifest() const { return *manifest_; }

private:
    struct Pass;

    bool check_value(Pass& pass, const std::string& field, const nlohmann::json& value, const ArgumentSpec& spec) const;
    bool check_type(Pass& pass, const std::string& field, const nlohmann::json& value, const ArgumentSpec& spec) const;
    bool check_constraints(Pass& pass, const std::string& field, const nlohmann::json& value,
                           const ArgumentSpec& spec, const ValidationConstraints& constraints) const;
    bool check_model(Pass& pass, const std::string& field, const nlohmann::json& value, const ModelSpec& model) const;
    bool check_properties(Pass& pass, const std::string& field, const nlohmann::json& value,
                          const std::map<std::string, ArgumentSpec>& properties,
                          const std::vector<std::string>& required) const;

    std::shared_ptr<const Manifest> manifest_;
};

/// JSON type name of a value as used in validation messages.
const char* json_type_name(const nlohmann::json& value);

} // namespace janus
