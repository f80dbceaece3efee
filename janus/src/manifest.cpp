#include "manifest.hpp"

#include "logger.hpp"

#include <log4cplus/loggingmacros.h>

#include <cmath>

namespace janus {

namespace {

constexpr const char* kModelRefPrefix = "#/models/";

std::string string_field(const nlohmann::json& j, const char* key, const std::string& context) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return "";
    }
    if (!it->is_string()) {
        throw ManifestError(std::string(key) + " must be a string in " + context);
    }
    return it->get<std::string>();
}

size_t length_field(const nlohmann::json& value, const char* key, const std::string& context) {
    if (!value.is_number_integer() || value.get<int64_t>() < 0) {
        throw ManifestError(std::string(key) + " must be a non-negative integer in " + context);
    }
    return static_cast<size_t>(value.get<int64_t>());
}

double number_field(const nlohmann::json& value, const char* key, const std::string& context) {
    if (!value.is_number() || !std::isfinite(value.get<double>())) {
        throw ManifestError(std::string(key) + " must be a finite number in " + context);
    }
    return value.get<double>();
}

ValidationConstraints parse_constraints(const nlohmann::json& j, const std::string& context) {
    if (!j.is_object()) {
        throw ManifestError("validation must be an object in " + context);
    }

    ValidationConstraints constraints;
    if (auto it = j.find("minLength"); it != j.end() && !it->is_null()) {
        constraints.min_length = length_field(*it, "minLength", context);
    }
    if (auto it = j.find("maxLength"); it != j.end() && !it->is_null()) {
        constraints.max_length = length_field(*it, "maxLength", context);
    }
    if (auto it = j.find("pattern"); it != j.end() && !it->is_null()) {
        if (!it->is_string()) {
            throw ManifestError("pattern must be a string in " + context);
        }
        constraints.pattern = it->get<std::string>();
        try {
            constraints.compiled_pattern = std::make_shared<const std::regex>(*constraints.pattern, std::regex::ECMAScript);
        } catch (const std::regex_error& exc) {
            throw ManifestError("invalid regex pattern '" + *constraints.pattern + "' in " + context + ": " + exc.what());
        }
    }
    if (auto it = j.find("minimum"); it != j.end() && !it->is_null()) {
        constraints.minimum = number_field(*it, "minimum", context);
    }
    if (auto it = j.find("maximum"); it != j.end() && !it->is_null()) {
        constraints.maximum = number_field(*it, "maximum", context);
    }
    if (auto it = j.find("enum"); it != j.end() && !it->is_null()) {
        if (!it->is_array()) {
            throw ManifestError("enum must be an array in " + context);
        }
        constraints.enum_values = it->get<std::vector<nlohmann::json>>();
    }

    if (constraints.min_length && constraints.max_length && *constraints.min_length > *constraints.max_length) {
        throw ManifestError("minLength cannot be greater than maxLength in " + context);
    }
    if (constraints.minimum && constraints.maximum && *constraints.minimum > *constraints.maximum) {
        throw ManifestError("minimum cannot be greater than maximum in " + context);
    }
    return constraints;
}

/// Fills type/model_ref from "$ref", "modelRef" and "type".
void parse_type(const nlohmann::json& j, ArgumentSpec& spec, const std::string& context) {
    std::string ref = string_field(j, "$ref", context);
    if (ref.empty()) {
        ref = string_field(j, "modelRef", context);
    }
    if (!ref.empty()) {
        if (ref.rfind(kModelRefPrefix, 0) == 0) {
            ref = ref.substr(std::char_traits<char>::length(kModelRefPrefix));
        }
        spec.type = ValueType::reference;
        spec.model_ref = ref;
        return;
    }

    std::string type_name = string_field(j, "type", context);
    if (type_name.empty()) {
        throw ManifestError("type is required in " + context);
    }
    if (auto type = value_type_from_string(type_name)) {
        if (*type == ValueType::reference) {
            throw ManifestError("reference type requires modelRef in " + context);
        }
        spec.type = *type;
        return;
    }
    // A bare model name; existence is checked once all models are known.
    spec.type = ValueType::reference;
    spec.model_ref = type_name;
}

ArgumentSpec parse_argument(const nlohmann::json& j, const std::string& context) {
    if (!j.is_object()) {
        throw ManifestError("argument spec must be an object in " + context);
    }

    ArgumentSpec spec;
    parse_type(j, spec, context);

    if (auto it = j.find("required"); it != j.end() && !it->is_null()) {
        if (!it->is_boolean()) {
            throw ManifestError("required must be a boolean in " + context);
        }
        spec.required = it->get<bool>();
    }
    spec.description = string_field(j, "description", context);

    if (auto it = j.find("defaultValue"); it != j.end()) {
        spec.default_value = *it;
    }
    if (auto it = j.find("validation"); it != j.end() && !it->is_null()) {
        spec.validation = parse_constraints(*it, context);
    }
    if (auto it = j.find("items"); it != j.end() && !it->is_null()) {
        if (spec.type != ValueType::array) {
            throw ManifestError("items is only allowed on array types in " + context);
        }
        spec.items = std::make_shared<const ArgumentSpec>(parse_argument(*it, context + " items"));
    }
    return spec;
}

std::map<std::string, ArgumentSpec> parse_properties(const nlohmann::json& j, const std::string& context) {
    std::map<std::string, ArgumentSpec> properties;
    if (j.is_null()) {
        return properties;
    }
    if (!j.is_object()) {
        throw ManifestError("properties must be an object in " + context);
    }
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (it.key().empty()) {
            throw ManifestError("argument name cannot be empty in " + context);
        }
        properties.emplace(it.key(), parse_argument(it.value(), "'" + it.key() + "' of " + context));
    }
    return properties;
}

ModelSpec parse_model(const std::string& name, const nlohmann::json& j) {
    const std::string context = "model '" + name + "'";
    if (!j.is_object()) {
        throw ManifestError(context + " must be an object");
    }
    ModelSpec model;
    model.name = name;
    model.description = string_field(j, "description", context);

    std::string type = string_field(j, "type", context);
    if (!type.empty() && type != "object") {
        throw ManifestError(context + " must be of type object");
    }
    if (auto it = j.find("properties"); it != j.end()) {
        model.properties = parse_properties(*it, context);
    }
    if (auto it = j.find("required"); it != j.end() && !it->is_null()) {
        if (!it->is_array()) {
            throw ManifestError("required must be an array in " + context);
        }
        for (const auto& entry : *it) {
            if (!entry.is_string()) {
                throw ManifestError("required entries must be strings in " + context);
            }
            model.required.push_back(entry.get<std::string>());
        }
    }
    return model;
}

ResponseSpec parse_response(const nlohmann::json& j, const std::string& context) {
    if (!j.is_object()) {
        throw ManifestError("response must be an object in " + context);
    }
    ResponseSpec response;
    response.description = string_field(j, "description", context);
    if (j.contains("type") || j.contains("$ref") || j.contains("modelRef")) {
        ArgumentSpec shape;
        parse_type(j, shape, context);
        if (auto it = j.find("items"); it != j.end() && !it->is_null()) {
            shape.items = std::make_shared<const ArgumentSpec>(parse_argument(*it, context + " items"));
        }
        response.shape = std::move(shape);
    }
    if (auto it = j.find("properties"); it != j.end()) {
        response.properties = parse_properties(*it, context);
    }
    return response;
}

CommandSpec parse_command(const std::string& name, const nlohmann::json& j) {
    const std::string context = "command '" + name + "'";
    if (name.empty()) {
        throw ManifestError("command name cannot be empty");
    }
    if (!j.is_object()) {
        throw ManifestError(context + " must be an object");
    }

    CommandSpec command;
    command.name = name;
    command.description = string_field(j, "description", context);
    if (auto it = j.find("args"); it != j.end()) {
        command.args = parse_properties(*it, context);
    }
    if (auto it = j.find("response"); it != j.end() && !it->is_null()) {
        command.response = parse_response(*it, "response of " + context);
    }
    if (auto it = j.find("errorCodes"); it != j.end() && !it->is_null()) {
        if (!it->is_array()) {
            throw ManifestError("errorCodes must be an array in " + context);
        }
        for (const auto& code : *it) {
            if (!code.is_string() || code.get<std::string>().empty()) {
                throw ManifestError("empty error code in " + context);
            }
            command.error_codes.push_back(code.get<std::string>());
        }
    }
    return command;
}

void add_commands(Manifest& manifest, const nlohmann::json& commands, const std::string& context) {
    if (!commands.is_object()) {
        throw ManifestError("commands must be an object in " + context);
    }
    for (auto it = commands.begin(); it != commands.end(); ++it) {
        if (manifest.commands.count(it.key()) != 0) {
            throw ManifestError("command '" + it.key() + "' is declared more than once");
        }
        manifest.commands.emplace(it.key(), parse_command(it.key(), it.value()));
    }
}

void check_reference(const Manifest& manifest, const ArgumentSpec& spec, const std::string& context) {
    if (spec.type == ValueType::reference && manifest.models.count(spec.model_ref) == 0) {
        throw ManifestError("unknown type or model '" + spec.model_ref + "' in " + context);
    }
    if (spec.items) {
        check_reference(manifest, *spec.items, context + " items");
    }
}

void check_references(const Manifest& manifest) {
    for (const auto& [model_name, model] : manifest.models) {
        for (const auto& [prop_name, prop] : model.properties) {
            check_reference(manifest, prop, "'" + prop_name + "' of model '" + model_name + "'");
        }
    }
    for (const auto& [command_name, command] : manifest.commands) {
        for (const auto& [arg_name, arg] : command.args) {
            check_reference(manifest, arg, "'" + arg_name + "' of command '" + command_name + "'");
        }
        if (command.response) {
            if (command.response->shape) {
                check_reference(manifest, *command.response->shape, "response of command '" + command_name + "'");
            }
            for (const auto& [prop_name, prop] : command.response->properties) {
                check_reference(manifest, prop, "'" + prop_name + "' of response of command '" + command_name + "'");
            }
        }
    }
}

nlohmann::json constraints_to_json(const ValidationConstraints& constraints) {
    nlohmann::json j = nlohmann::json::object();
    if (constraints.min_length) j["minLength"] = *constraints.min_length;
    if (constraints.max_length) j["maxLength"] = *constraints.max_length;
    if (constraints.pattern) j["pattern"] = *constraints.pattern;
    if (constraints.minimum) j["minimum"] = *constraints.minimum;
    if (constraints.maximum) j["maximum"] = *constraints.maximum;
    if (constraints.enum_values) j["enum"] = *constraints.enum_values;
    return j;
}

nlohmann::json properties_to_json(const std::map<std::string, ArgumentSpec>& properties) {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [name, spec] : properties) {
        j[name] = to_json(spec);
    }
    return j;
}

} // namespace

const char* value_type_name(ValueType type) {
    switch (type) {
        case ValueType::string: return "string";
        case ValueType::integer: return "integer";
        case ValueType::number: return "number";
        case ValueType::boolean: return "boolean";
        case ValueType::array: return "array";
        case ValueType::object: return "object";
        case ValueType::null: return "null";
        case ValueType::reference: return "reference";
    }
    return "unknown";
}

std::optional<ValueType> value_type_from_string(const std::string& name) {
    if (name == "string") return ValueType::string;
    if (name == "integer") return ValueType::integer;
    if (name == "number") return ValueType::number;
    if (name == "boolean") return ValueType::boolean;
    if (name == "array") return ValueType::array;
    if (name == "object") return ValueType::object;
    if (name == "null") return ValueType::null;
    if (name == "reference") return ValueType::reference;
    return std::nullopt;
}

const CommandSpec* Manifest::find_command(const std::string& command) const {
    auto it = commands.find(command);
    return it == commands.end() ? nullptr : &it->second;
}

const ModelSpec* Manifest::find_model(const std::string& model) const {
    auto it = models.find(model);
    return it == models.end() ? nullptr : &it->second;
}

Manifest parse_manifest(const nlohmann::json& document) {
    if (!document.is_object()) {
        throw ManifestError("manifest must be an object");
    }

    Manifest manifest;
    manifest.version = string_field(document, "version", "manifest");
    if (manifest.version.empty()) {
        throw ManifestError("manifest version cannot be empty");
    }
    manifest.name = string_field(document, "name", "manifest");

    if (auto it = document.find("models"); it != document.end() && !it->is_null()) {
        if (!it->is_object()) {
            throw ManifestError("models must be an object");
        }
        for (auto model = it->begin(); model != it->end(); ++model) {
            manifest.models.emplace(model.key(), parse_model(model.key(), model.value()));
        }
    }

    if (auto it = document.find("commands"); it != document.end() && !it->is_null()) {
        add_commands(manifest, *it, "manifest");
    }

    // Channel-scoped documents from older peers: commands are flattened.
    if (auto it = document.find("channels"); it != document.end() && !it->is_null()) {
        if (!it->is_object()) {
            throw ManifestError("channels must be an object");
        }
        for (auto channel = it->begin(); channel != it->end(); ++channel) {
            auto commands = channel.value().find("commands");
            if (commands != channel.value().end()) {
                add_commands(manifest, *commands, "channel '" + channel.key() + "'");
            }
        }
        LOG4CPLUS_DEBUG(manifest_logger(), "Flattened " << it->size() << " legacy channel(s) into command table");
    }

    check_references(manifest);

    LOG4CPLUS_DEBUG(manifest_logger(), "Parsed manifest version=" << manifest.version
                    << " commands=" << manifest.commands.size() << " models=" << manifest.models.size());
    return manifest;
}

Manifest parse_manifest_text(const std::string& json_text) {
    nlohmann::json document;
    try {
        document = nlohmann::json::parse(json_text);
    } catch (const nlohmann::json::parse_error& exc) {
        throw ManifestError(std::string("manifest is not valid JSON: ") + exc.what());
    }
    return parse_manifest(document);
}

void merge_manifests(Manifest& base, const Manifest& additional) {
    for (const auto& [name, command] : additional.commands) {
        if (base.commands.count(name) != 0) {
            throw ManifestError("command '" + name + "' already exists in base manifest");
        }
    }
    for (const auto& [name, model] : additional.models) {
        if (base.models.count(name) != 0) {
            throw ManifestError("model '" + name + "' already exists in base manifest");
        }
    }
    for (const auto& [name, command] : additional.commands) {
        base.commands.emplace(name, command);
    }
    for (const auto& [name, model] : additional.models) {
        base.models.emplace(name, model);
    }
    check_references(base);
}

nlohmann::json to_json(const ArgumentSpec& spec) {
    nlohmann::json j = nlohmann::json::object();
    if (spec.type == ValueType::reference) {
        j["type"] = "reference";
        j["modelRef"] = spec.model_ref;
    } else {
        j["type"] = value_type_name(spec.type);
    }
    if (spec.required) j["required"] = true;
    if (!spec.description.empty()) j["description"] = spec.description;
    if (spec.default_value) j["defaultValue"] = *spec.default_value;
    if (spec.validation) j["validation"] = constraints_to_json(*spec.validation);
    if (spec.items) j["items"] = to_json(*spec.items);
    return j;
}

nlohmann::json to_json(const Manifest& manifest) {
    nlohmann::json j = {{"version", manifest.version}};
    if (!manifest.name.empty()) {
        j["name"] = manifest.name;
    }

    nlohmann::json models = nlohmann::json::object();
    for (const auto& [name, model] : manifest.models) {
        nlohmann::json m = {{"type", "object"}, {"properties", properties_to_json(model.properties)}};
        if (!model.required.empty()) m["required"] = model.required;
        if (!model.description.empty()) m["description"] = model.description;
        models[name] = std::move(m);
    }
    j["models"] = std::move(models);

    nlohmann::json commands = nlohmann::json::object();
    for (const auto& [name, command] : manifest.commands) {
        nlohmann::json c = nlohmann::json::object();
        if (!command.description.empty()) c["description"] = command.description;
        if (!command.args.empty()) c["args"] = properties_to_json(command.args);
        if (command.response) {
            nlohmann::json r = command.response->shape ? to_json(*command.response->shape) : nlohmann::json::object();
            if (!command.response->properties.empty()) r["properties"] = properties_to_json(command.response->properties);
            if (!command.response->description.empty()) r["description"] = command.response->description;
            c["response"] = std::move(r);
        }
        if (!command.error_codes.empty()) c["errorCodes"] = command.error_codes;
        commands[name] = std::move(c);
    }
    j["commands"] = std::move(commands);
    return j;
}

} // namespace janus
