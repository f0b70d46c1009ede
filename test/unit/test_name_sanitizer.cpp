#include "specir/core/name_sanitizer.hpp"
#include "specir/core/schema_store.hpp"

#include <gtest/gtest.h>

using namespace specir::openapi;

TEST(SanitizeClassName, PascalCasesWords) {
    EXPECT_EQ(sanitize_class_name("user_profile-v2"), "UserProfileV2");
    EXPECT_EQ(sanitize_class_name("Outer_details"), "OuterDetails");
    EXPECT_EQ(sanitize_class_name("pet store"), "PetStore");
    EXPECT_EQ(sanitize_class_name("AlreadyPascal"), "AlreadyPascal");
}

TEST(SanitizeClassName, LeadingDigitAndKeywords) {
    EXPECT_EQ(sanitize_class_name("123abc"), "_123abc");
    EXPECT_EQ(sanitize_class_name("class"), "Class_");
    EXPECT_EQ(sanitize_class_name("none"), "None_");
}

TEST(SanitizeClassName, EmptyFallsBackToModel) {
    EXPECT_EQ(sanitize_class_name(""), "Model");
    EXPECT_EQ(sanitize_class_name("!!!"), "Model");
}

TEST(SanitizeModuleName, SplitsCamelCaseAndAcronyms) {
    EXPECT_EQ(sanitize_module_name("Pet"), "pet");
    EXPECT_EQ(sanitize_module_name("HTTPResponseCode"), "http_response_code");
    EXPECT_EQ(sanitize_module_name("UserProfile"), "user_profile");
    EXPECT_EQ(sanitize_module_name("pet-store"), "pet_store");
}

TEST(SanitizeModuleName, DigitsKeywordsAndEmpty) {
    EXPECT_EQ(sanitize_module_name("2Fast"), "_2_fast");
    EXPECT_EQ(sanitize_module_name("Class"), "class_");
    EXPECT_EQ(sanitize_module_name("---"), "model");
}

TEST(SanitizeMethodName, OperationFallbackIds) {
    EXPECT_EQ(sanitize_method_name("GET_/pets/{id}"), "get_pets_id");
    EXPECT_EQ(sanitize_method_name("listPets"), "list_pets");
    EXPECT_EQ(sanitize_method_name("getHTTPStatus"), "get_http_status");
    EXPECT_EQ(sanitize_method_name("import"), "import_");
    EXPECT_EQ(sanitize_method_name("POST_/"), "post");
}

TEST(NameHelpers, IdentifierAndSnakeCase) {
    EXPECT_EQ(sanitize_identifier("x-rate-limit"), "x_rate_limit");
    EXPECT_EQ(sanitize_identifier("9lives"), "_9lives");
    EXPECT_EQ(to_snake_case("petId"), "pet_id");
    EXPECT_EQ(capitalize_first("kind"), "Kind");
    EXPECT_TRUE(is_reserved_word("lambda"));
    EXPECT_FALSE(is_reserved_word("Lambda"));
}

TEST(FinalizeGenerationNames, AssignsUniqueNamesAndStems) {
    schema_store store;
    ir_schema* upper = store.insert_or_get("Pet");
    ir_schema* lower = store.insert_or_get("pet");
    finalize_generation_names(store);

    EXPECT_EQ(upper->generation_name, "Pet");
    EXPECT_EQ(upper->final_module_stem, "pet");
    EXPECT_EQ(lower->generation_name, "Pet2");
    EXPECT_EQ(lower->final_module_stem, "pet_2");
}

TEST(FinalizeGenerationNames, KeepsExistingAssignments) {
    schema_store store;
    ir_schema* unified = store.insert_or_get("PetKindEnum");
    ASSERT_TRUE(unified->assign_generation_name("PetKindEnum", "pet_kind_enum"));
    ir_schema* other = store.insert_or_get("pet_kind_enum");
    finalize_generation_names(store);

    EXPECT_EQ(unified->generation_name, "PetKindEnum");
    EXPECT_EQ(other->generation_name, "PetKindEnum2");
    EXPECT_NE(other->final_module_stem, unified->final_module_stem);
}

TEST(FinalizeGenerationNames, GenerationNameIsWriteOnce) {
    ir_schema s;
    EXPECT_TRUE(s.assign_generation_name("Pet", "pet"));
    EXPECT_TRUE(s.assign_generation_name("Pet", "other"));
    EXPECT_FALSE(s.assign_generation_name("Dog", "dog"));
    EXPECT_EQ(s.generation_name, "Pet");
    EXPECT_EQ(s.final_module_stem, "pet");
}
