#pragma once

#include "error.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace janus {

enum class ValueType {
    string,
    integer,
    number,
    boolean,
    array,
    object,
    null,
    reference,
};

const char* value_type_name(ValueType type);
std::optional<ValueType> value_type_from_string(const std::string& name);

struct ValidationConstraints {
    std::optional<size_t> min_length;
    std::optional<size_t> max_length;
    std::optional<std::string> pattern;
    std::shared_ptr<const std::regex> compiled_pattern;
    std::optional<double> minimum;
    std::optional<double> maximum;
    std::optional<std::vector<nlohmann::json>> enum_values;
};

/**
 * Declared shape of one argument or property.
 *
 * Array element specs are heap nodes so the structure can nest to any depth;
 * model references are resolved by name against Manifest::models when a
 * value is validated.
 */
struct ArgumentSpec {
    ValueType type = ValueType::string;
    bool required = false;
    std::string description;
    std::optional<nlohmann::json> default_value;
    std::optional<ValidationConstraints> validation;
    std::shared_ptr<const ArgumentSpec> items;
    std::string model_ref;
};

struct ModelSpec {
    std::string name;
    std::string description;
    std::map<std::string, ArgumentSpec> properties;
    std::vector<std::string> required;
};

struct ResponseSpec {
    std::optional<ArgumentSpec> shape;   // type / items / model reference
    std::map<std::string, ArgumentSpec> properties;
    std::string description;
};

struct CommandSpec {
    std::string name;
    std::string description;
    std::map<std::string, ArgumentSpec> args;
    std::optional<ResponseSpec> response;
    std::vector<std::string> error_codes;
};

struct Manifest {
    std::string version;
    std::string name;
    std::map<std::string, ModelSpec> models;
    std::map<std::string, CommandSpec> commands;

    const CommandSpec* find_command(const std::string& command) const;
    const ModelSpec* find_model(const std::string& model) const;
};

/// Raised for a structurally invalid or internally inconsistent manifest.
class ManifestError : public JanusError {
public:
    explicit ManifestError(const std::string& details)
        : JanusError(ErrorCode::configuration_error, details) {}
};

Manifest parse_manifest(const nlohmann::json& document);
Manifest parse_manifest_text(const std::string& json_text);

/// Adds the commands and models of `additional` to `base`; duplicates throw.
void merge_manifests(Manifest& base, const Manifest& additional);

nlohmann::json to_json(const Manifest& manifest);
nlohmann::json to_json(const ArgumentSpec& spec);

} // namespace janus
