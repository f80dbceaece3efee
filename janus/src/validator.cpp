#include "validator.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace janus {

struct Validator::Pass {
    bool fail_fast = true;
    std::vector<ValidationIssue> issues;
    size_t fields = 0;

    bool fail(ValidationIssue issue) {
        issues.push_back(std::move(issue));
        return false;
    }
};

namespace {

std::string join_field(const std::string& parent, const std::string& child) {
    return parent.empty() ? child : parent + "." + child;
}

size_t utf8_length(const std::string& text) {
    size_t count = 0;
    for (unsigned char c : text) {
        if ((c & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}

bool is_integral(const nlohmann::json& value) {
    if (value.is_number_integer()) {
        return true;
    }
    if (value.is_number_float()) {
        double d = value.get<double>();
        return std::isfinite(d) && std::floor(d) == d;
    }
    return false;
}

std::string format_number(double value) {
    std::ostringstream out;
    out << value;
    return out.str();
}

// Values decoded from MessagePack may carry strings that are not UTF-8.
std::string printable(const nlohmann::json& value) {
    return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

StructuredError to_error(const ValidationIssue& issue) {
    return StructuredError::validation(ErrorCode::invalid_params, issue.field, issue.actual, issue.message,
                                       issue.constraints);
}

} // namespace

const char* json_type_name(const nlohmann::json& value) {
    switch (value.type()) {
        case nlohmann::json::value_t::null: return "null";
        case nlohmann::json::value_t::boolean: return "boolean";
        case nlohmann::json::value_t::number_integer:
        case nlohmann::json::value_t::number_unsigned: return "integer";
        case nlohmann::json::value_t::number_float: return "number";
        case nlohmann::json::value_t::string: return "string";
        case nlohmann::json::value_t::array: return "array";
        case nlohmann::json::value_t::object: return "object";
        default: return "unknown";
    }
}

Validator::Validator(std::shared_ptr<const Manifest> manifest) : manifest_(std::move(manifest)) {
    if (!manifest_) {
        throw ManifestError("validator requires a manifest");
    }
}

std::optional<StructuredError> Validator::validate_request(const std::string& command,
                                                           const nlohmann::json& args,
                                                           nlohmann::json* normalized) const {
    const CommandSpec* spec = manifest_->find_command(command);
    if (!spec) {
        StructuredError error = StructuredError::make(ErrorCode::method_not_found, "Unknown command: " + command);
        error.data->context = nlohmann::json{{"command", command}};
        return error;
    }

    const nlohmann::json empty = nlohmann::json::object();
    const nlohmann::json& provided = args.is_object() ? args : empty;
    nlohmann::json result = provided;

    Pass pass;
    for (const auto& [name, arg_spec] : spec->args) {
        auto it = provided.find(name);
        bool absent = it == provided.end() || (it->is_null() && arg_spec.type != ValueType::null);

        if (absent) {
            if (arg_spec.required) {
                ValidationIssue issue;
                issue.field = name;
                issue.message = "Missing required argument '" + name + "'";
                issue.expected = value_type_name(arg_spec.type);
                return to_error(issue);
            }
            if (arg_spec.default_value) {
                result[name] = *arg_spec.default_value;
            }
            continue;
        }

        if (!check_value(pass, name, *it, arg_spec)) {
            return to_error(pass.issues.front());
        }
    }

    if (normalized) {
        *normalized = std::move(result);
    }
    return std::nullopt;
}

std::optional<StructuredError> Validator::validate_value(const std::string& field,
                                                         const nlohmann::json& value,
                                                         const ArgumentSpec& spec) const {
    Pass pass;
    if (!check_value(pass, field, value, spec)) {
        return to_error(pass.issues.front());
    }
    return std::nullopt;
}

ValidationReport Validator::validate_response(const std::string& command, const nlohmann::json& result) const {
    ValidationReport report;
    const CommandSpec* spec = manifest_->find_command(command);
    if (!spec || !spec->response) {
        // Nothing declared, nothing to hold the result against.
        return report;
    }

    Pass pass;
    pass.fail_fast = false;
    const ResponseSpec& response = *spec->response;

    bool shape_ok = true;
    if (response.shape) {
        shape_ok = check_value(pass, "", result, *response.shape);
    }
    if (shape_ok && !response.properties.empty()) {
        if (!result.is_object()) {
            ValidationIssue issue;
            issue.message = "Response expected object, got " + std::string(json_type_name(result));
            issue.expected = "object";
            issue.actual = result;
            pass.fail(std::move(issue));
        } else {
            check_properties(pass, "", result, response.properties, {});
        }
    }

    report.issues = std::move(pass.issues);
    report.valid = report.issues.empty();
    report.fields_validated = pass.fields;
    return report;
}

bool Validator::check_value(Pass& pass, const std::string& field, const nlohmann::json& value,
                            const ArgumentSpec& spec) const {
    ++pass.fields;

    if (!check_type(pass, field, value, spec)) {
        return false;
    }

    if (spec.validation && !check_constraints(pass, field, value, spec, *spec.validation)) {
        return false;
    }

    if (spec.type == ValueType::reference) {
        const ModelSpec* model = manifest_->find_model(spec.model_ref);
        if (!model) {
            ValidationIssue issue;
            issue.field = field;
            issue.message = "Model '" + spec.model_ref + "' is not declared";
            issue.expected = spec.model_ref;
            issue.actual = value;
            return pass.fail(std::move(issue));
        }
        if (!check_model(pass, field, value, *model)) {
            return false;
        }
    }

    if (spec.type == ValueType::array && spec.items) {
        bool ok = true;
        for (size_t i = 0; i < value.size(); ++i) {
            if (!check_value(pass, field + "[" + std::to_string(i) + "]", value[i], *spec.items)) {
                ok = false;
                if (pass.fail_fast) {
                    return false;
                }
            }
        }
        return ok;
    }
    return true;
}

bool Validator::check_type(Pass& pass, const std::string& field, const nlohmann::json& value,
                           const ArgumentSpec& spec) const {
    bool ok = false;
    switch (spec.type) {
        case ValueType::string: ok = value.is_string(); break;
        case ValueType::integer: ok = is_integral(value); break;
        case ValueType::number: ok = value.is_number(); break;
        case ValueType::boolean: ok = value.is_boolean(); break;
        case ValueType::array: ok = value.is_array(); break;
        case ValueType::object: ok = value.is_object(); break;
        case ValueType::null: ok = value.is_null(); break;
        case ValueType::reference: ok = value.is_object(); break;
    }
    if (ok) {
        return true;
    }

    std::string expected = spec.type == ValueType::reference ? spec.model_ref : value_type_name(spec.type);
    ValidationIssue issue;
    issue.field = field;
    issue.message = "Argument '" + field + "' expected " + expected + ", got " + json_type_name(value);
    issue.expected = expected;
    issue.actual = value;
    issue.constraints = nlohmann::json{{"type", expected}};
    return pass.fail(std::move(issue));
}

bool Validator::check_constraints(Pass& pass, const std::string& field, const nlohmann::json& value,
                                  const ArgumentSpec& spec, const ValidationConstraints& constraints) const {
    auto violation = [&](std::string message, const char* key, nlohmann::json bound) {
        ValidationIssue issue;
        issue.field = field;
        issue.message = std::move(message);
        issue.expected = key;
        issue.actual = value;
        issue.constraints = nlohmann::json{{key, std::move(bound)}};
        return pass.fail(std::move(issue));
    };

    // Length bounds apply to strings (code points) and arrays (elements).
    if (value.is_string() || value.is_array()) {
        size_t length = value.is_string() ? utf8_length(value.get_ref<const std::string&>()) : value.size();
        if (constraints.min_length && length < *constraints.min_length) {
            return violation("Argument '" + field + "' length " + std::to_string(length) + " is less than minimum " +
                                 std::to_string(*constraints.min_length),
                             "minLength", *constraints.min_length);
        }
        if (constraints.max_length && length > *constraints.max_length) {
            return violation("Argument '" + field + "' length " + std::to_string(length) + " exceeds maximum " +
                                 std::to_string(*constraints.max_length),
                             "maxLength", *constraints.max_length);
        }
    }

    if (value.is_string() && constraints.compiled_pattern) {
        const std::string& text = value.get_ref<const std::string&>();
        // std::regex recurses once per subject character.
        if (text.size() > max_pattern_subject) {
            ValidationIssue issue;
            issue.field = field;
            issue.message = "Argument '" + field + "' is " + std::to_string(text.size()) + " bytes, longer than the " +
                            std::to_string(max_pattern_subject) + " bytes matched against pattern '" +
                            *constraints.pattern + "'";
            issue.expected = "pattern";
            issue.constraints = nlohmann::json{{"pattern", *constraints.pattern}};
            return pass.fail(std::move(issue));
        }
        if (!std::regex_search(text, *constraints.compiled_pattern)) {
            return violation("Argument '" + field + "' does not match pattern '" + *constraints.pattern + "'",
                             "pattern", *constraints.pattern);
        }
    }

    if ((spec.type == ValueType::integer || spec.type == ValueType::number) && value.is_number()) {
        double number = value.get<double>();
        if (constraints.minimum && number < *constraints.minimum) {
            return violation("Argument '" + field + "' value " + format_number(number) + " is less than minimum " +
                                 format_number(*constraints.minimum),
                             "minimum", *constraints.minimum);
        }
        if (constraints.maximum && number > *constraints.maximum) {
            return violation("Argument '" + field + "' value " + format_number(number) + " exceeds maximum " +
                                 format_number(*constraints.maximum),
                             "maximum", *constraints.maximum);
        }
    }

    if (constraints.enum_values && !constraints.enum_values->empty()) {
        const auto& allowed = *constraints.enum_values;
        bool member = std::any_of(allowed.begin(), allowed.end(), [&](const nlohmann::json& candidate) {
            if (candidate.is_number() && value.is_number()) {
                return candidate.get<double>() == value.get<double>();
            }
            return candidate == value;
        });
        if (!member) {
            return violation("Argument '" + field + "' value " + printable(value) + " is not in allowed values " +
                                 printable(nlohmann::json(allowed)),
                             "enum", allowed);
        }
    }
    return true;
}

bool Validator::check_model(Pass& pass, const std::string& field, const nlohmann::json& value,
                            const ModelSpec& model) const {
    return check_properties(pass, field, value, model.properties, model.required);
}

bool Validator::check_properties(Pass& pass, const std::string& field, const nlohmann::json& value,
                                 const std::map<std::string, ArgumentSpec>& properties,
                                 const std::vector<std::string>& required) const {
    bool ok = true;
    for (const auto& name : required) {
        if (!value.contains(name)) {
            ValidationIssue issue;
            issue.field = join_field(field, name);
            issue.message = "Missing required property '" + issue.field + "'";
            auto spec = properties.find(name);
            issue.expected = spec == properties.end() ? "any" : value_type_name(spec->second.type);
            ok = pass.fail(std::move(issue));
            if (pass.fail_fast) {
                return false;
            }
        }
    }

    for (const auto& [name, spec] : properties) {
        auto it = value.find(name);
        if (it == value.end()) {
            bool listed = std::find(required.begin(), required.end(), name) != required.end();
            if (spec.required && !listed) {
                ValidationIssue issue;
                issue.field = join_field(field, name);
                issue.message = "Missing required property '" + issue.field + "'";
                issue.expected = value_type_name(spec.type);
                ok = pass.fail(std::move(issue));
                if (pass.fail_fast) {
                    return false;
                }
            }
            continue;
        }
        if (!check_value(pass, join_field(field, name), *it, spec)) {
            ok = false;
            if (pass.fail_fast) {
                return false;
            }
        }
    }
    return ok;
}

} // namespace janus
