#include <gtest/gtest.h>

#include "manifest.hpp"
#include "test_helpers.hpp"

#include <string>

namespace {

void expect_manifest_error(const nlohmann::json& document, const std::string& fragment) {
    try {
        janus::parse_manifest(document);
        FAIL() << "manifest accepted: " << document.dump();
    } catch (const janus::ManifestError& exc) {
        EXPECT_TRUE(exc.error().is(janus::ErrorCode::configuration_error));
        EXPECT_NE(std::string(exc.what()).find(fragment), std::string::npos) << exc.what();
    }
}

} // namespace

TEST(Manifest, ParsesCommandsArgumentsAndModels) {
    auto manifest = sample_manifest();
    EXPECT_EQ(manifest->version, "1.0.0");
    EXPECT_EQ(manifest->name, "Workspace API");
    EXPECT_EQ(manifest->commands.size(), 7u);
    EXPECT_EQ(manifest->models.size(), 2u);

    const auto* create = manifest->find_command("createWorkspace");
    ASSERT_NE(create, nullptr);
    const auto& name = create->args.at("name");
    EXPECT_EQ(name.type, janus::ValueType::string);
    EXPECT_TRUE(name.required);
    ASSERT_TRUE(name.validation.has_value());
    EXPECT_EQ(name.validation->max_length.value_or(0), 100u);
    EXPECT_EQ(name.validation->pattern.value_or(""), "^[a-zA-Z0-9_-]+$");
    EXPECT_NE(name.validation->compiled_pattern, nullptr);

    const auto& visibility = create->args.at("visibility");
    EXPECT_FALSE(visibility.required);
    EXPECT_EQ(visibility.default_value.value_or(nullptr), "private");
    EXPECT_EQ(create->error_codes, std::vector<std::string>{"VALIDATION_FAILED"});

    EXPECT_EQ(manifest->find_command("missing"), nullptr);
}

TEST(Manifest, ResolvesModelReferencesInEveryForm) {
    auto manifest = sample_manifest();

    const auto& member = manifest->find_command("addMember")->args.at("member");
    EXPECT_EQ(member.type, janus::ValueType::reference);
    EXPECT_EQ(member.model_ref, "Person");

    const auto* person = manifest->find_model("Person");
    ASSERT_NE(person, nullptr);
    EXPECT_EQ(person->required, std::vector<std::string>{"name"});
    EXPECT_EQ(person->properties.at("address").model_ref, "Address");

    auto document = sample_manifest_document();
    document["commands"]["addMember"]["args"]["member"] = {{"modelRef", "Person"}};
    auto reparsed = janus::parse_manifest(document);
    EXPECT_EQ(reparsed.find_command("addMember")->args.at("member").model_ref, "Person");
}

TEST(Manifest, ArrayItemsAndResponseShape) {
    auto manifest = sample_manifest();
    const auto& tags = manifest->find_command("tagItems")->args.at("tags");
    EXPECT_EQ(tags.type, janus::ValueType::array);
    ASSERT_NE(tags.items, nullptr);
    EXPECT_EQ(tags.items->type, janus::ValueType::string);

    const auto& response = manifest->find_command("listUsers")->response;
    ASSERT_TRUE(response.has_value());
    ASSERT_TRUE(response->shape.has_value());
    EXPECT_EQ(response->shape->type, janus::ValueType::array);
    ASSERT_NE(response->shape->items, nullptr);
    EXPECT_EQ(response->shape->items->model_ref, "Person");
}

TEST(Manifest, LegacyChannelsAreFlattened) {
    auto manifest = janus::parse_manifest_text(R"({
        "version": "0.9",
        "channels": {
            "library": {"commands": {"getBook": {"args": {"id": {"type": "string", "required": true}}}}},
            "admin": {"commands": {"reindex": {}}}
        }
    })");
    EXPECT_NE(manifest.find_command("getBook"), nullptr);
    EXPECT_NE(manifest.find_command("reindex"), nullptr);
}

TEST(Manifest, RejectsInconsistentDocuments) {
    expect_manifest_error(nlohmann::json::array(), "manifest must be an object");
    expect_manifest_error({{"name", "x"}}, "version");

    auto bounds = sample_manifest_document();
    bounds["commands"]["setLevel"]["args"]["level"]["validation"] = {{"minimum", 10}, {"maximum", 1}};
    expect_manifest_error(bounds, "minimum cannot be greater than maximum");

    auto lengths = sample_manifest_document();
    lengths["commands"]["createWorkspace"]["args"]["name"]["validation"] = {{"minLength", 5}, {"maxLength", 2}};
    expect_manifest_error(lengths, "minLength cannot be greater than maxLength");

    auto regex = sample_manifest_document();
    regex["commands"]["createWorkspace"]["args"]["name"]["validation"] = {{"pattern", "([a-z"}};
    expect_manifest_error(regex, "invalid regex pattern");

    auto unknown = sample_manifest_document();
    unknown["commands"]["addMember"]["args"]["member"]["type"] = "Robot";
    expect_manifest_error(unknown, "unknown type or model 'Robot'");

    auto items = sample_manifest_document();
    items["commands"]["setLevel"]["args"]["note"]["items"] = {{"type", "string"}};
    expect_manifest_error(items, "items is only allowed on array types");

    EXPECT_THROW(janus::parse_manifest_text("{not json"), janus::ManifestError);
}

TEST(Manifest, MergeRejectsDuplicates) {
    janus::Manifest base = janus::parse_manifest(sample_manifest_document());
    auto extra = janus::parse_manifest_text(R"({"version":"1.0.0","commands":{"archive":{}}})");
    janus::merge_manifests(base, extra);
    EXPECT_NE(base.find_command("archive"), nullptr);

    EXPECT_THROW(janus::merge_manifests(base, extra), janus::ManifestError);
}

TEST(Manifest, SerialisedFormParsesBack) {
    auto manifest = sample_manifest();
    auto document = janus::to_json(*manifest);
    EXPECT_EQ(document["commands"]["addMember"]["args"]["member"]["modelRef"], "Person");
    EXPECT_EQ(document["models"]["Person"]["required"][0], "name");

    auto reparsed = janus::parse_manifest(document);
    EXPECT_EQ(reparsed.commands.size(), manifest->commands.size());
    EXPECT_EQ(reparsed.find_command("tagItems")->args.at("tags").items->validation->min_length.value_or(0), 2u);
}
