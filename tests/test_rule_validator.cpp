#include <gtest/gtest.h>

#include "fixtures.hpp"
#include "records/SpaceSchemas.hpp"
#include "spacecheck/FieldValidator.hpp"
#include "spacecheck/RuleValidator.hpp"
#include "spacecheck/Validator.hpp"

#include <stdexcept>
#include <string>
#include <type_traits>

using namespace spacecheck;

// Rules are evaluated in isolation here, against fields produced by the field
// phase of a small unconstrained schema.

static TypedFields signal_fields(const nlohmann::json& raw) {
    SchemaBuilder b("signal");
    b.field("contact_id", SemanticType::String).optional()
     .field("contact_type", SemanticType::String).optional()
     .field("is_verified", SemanticType::Boolean).optional()
     .field("witness_count", SemanticType::Integer).optional()
     .field("signal_strength", SemanticType::Float).optional()
     .field("message_received", SemanticType::String).optional();

    SchemaRegistry empty;
    return validate_fields(empty, b.build(), raw).take();
}

TEST(RuleValidatorTest, RequiredPrefix) {
    const BusinessRule r = require_prefix("p", "contact_id", "AC", "must start with AC");

    EXPECT_FALSE(evaluate_rule(r, signal_fields({{"contact_id", "AC_001"}})).has_value());

    auto v = evaluate_rule(r, signal_fields({{"contact_id", "XC_001"}}));
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->kind, ViolationKind::BusinessRuleError);
    EXPECT_EQ(v->path, "contact_id");
    EXPECT_EQ(v->message, "must start with AC");

    // shorter than the prefix
    EXPECT_TRUE(evaluate_rule(r, signal_fields({{"contact_id", "A"}})).has_value());
}

TEST(RuleValidatorTest, FlagRequiredForTag) {
    const BusinessRule r = flag_required_for_tag("v", "contact_type", "physical", "is_verified", "verify");

    EXPECT_FALSE(evaluate_rule(r, signal_fields({{"contact_type", "radio"}, {"is_verified", false}})).has_value());
    EXPECT_TRUE(evaluate_rule(r, signal_fields({{"contact_type", "physical"}, {"is_verified", false}})).has_value());
    EXPECT_TRUE(evaluate_rule(r, signal_fields({{"contact_type", "physical"}})).has_value());
    EXPECT_FALSE(evaluate_rule(r, signal_fields({{"contact_type", "physical"}, {"is_verified", true}})).has_value());
}

TEST(RuleValidatorTest, MinimumForTagBoundary) {
    const BusinessRule r = minimum_for_tag("w", "contact_type", "telepathic", "witness_count", 3, "witnesses");

    EXPECT_TRUE(evaluate_rule(r, signal_fields({{"contact_type", "telepathic"}, {"witness_count", 2}})).has_value());
    EXPECT_FALSE(evaluate_rule(r, signal_fields({{"contact_type", "telepathic"}, {"witness_count", 3}})).has_value());
}

TEST(RuleValidatorTest, TextRequiredAboveIsStrict) {
    const BusinessRule r = text_required_above("s", "signal_strength", 7.0, "message_received", "message");

    EXPECT_FALSE(evaluate_rule(r, signal_fields({{"signal_strength", 7.0}})).has_value());
    EXPECT_TRUE(evaluate_rule(r, signal_fields({{"signal_strength", 7.5}})).has_value());
    EXPECT_TRUE(evaluate_rule(r, signal_fields({{"signal_strength", 7.5}, {"message_received", ""}})).has_value());
    EXPECT_FALSE(evaluate_rule(r, signal_fields({{"signal_strength", 7.5}, {"message_received", "hello"}})).has_value());
}

TEST(RuleValidatorTest, FieldsOfAnotherKindAreRefused) {
    const SchemaRegistry& registry = records::space_registry();

    auto crew = validate_fields(registry, registry.lookup(records::kCrewMemberKind),
                                fixtures::crew_member("C01", "captain", 10));
    ASSERT_TRUE(crew.is_ok());
    EXPECT_THROW(validate_rules(registry.lookup(records::kStationKind), crew.value()), std::logic_error);
}

TEST(RuleValidatorTest, RecordsOnlyComeFromTheFieldPhase) {
    static_assert(!std::is_default_constructible<TypedFields>::value,
                  "typed fields are created by the field phase only");
    static_assert(!std::is_constructible<TypedFields, std::string>::value,
                  "typed fields are created by the field phase only");
    static_assert(!std::is_constructible<ValidatedRecord, std::string, TypedFields>::value,
                  "validated records are created by the rule phase only");
    static_assert(!std::is_copy_assignable<ValidatedRecord>::value, "validated records are immutable");
    static_assert(!std::is_move_assignable<ValidatedRecord>::value, "validated records are immutable");

    // out-of-range and missing fields never reach the rule phase
    nlohmann::json raw = fixtures::valid_station();
    raw["crew_size"] = 999;
    raw["power_level"] = -5.0;
    raw.erase("station_id");
    EXPECT_FALSE(validate(records::space_registry(), records::kStationKind, raw).is_ok());
}

class MissionRuleTest : public ::testing::Test {
protected:
    const SchemaRegistry& registry = records::space_registry();

    ValidationResult run(const nlohmann::json& raw) {
        return validate(registry, records::kMissionKind, raw);
    }
};

TEST_F(MissionRuleTest, ValidMissionPasses) {
    EXPECT_TRUE(run(fixtures::valid_mission()).is_ok());
}

TEST_F(MissionRuleTest, ExperienceShareUsesRealDivision) {
    nlohmann::json raw = fixtures::valid_mission();
    raw["crew"] = nlohmann::json::array({
        fixtures::crew_member("C01", "captain", 10),
        fixtures::crew_member("C02", "officer", 1),
        fixtures::crew_member("C03", "cadet", 0)
    });

    // 1 of 3 experienced: 1 < 1.5
    auto r = run(raw);
    ASSERT_FALSE(r.is_ok());
    ASSERT_EQ(r.error().violations.size(), 1u);
    EXPECT_EQ(r.error().violations[0].message, "long missions require at least 50% experienced crew (5+ years)");

    // 2 of 3 experienced: 2 >= 1.5
    raw["crew"][1]["years_experience"] = 5;
    EXPECT_TRUE(run(raw).is_ok());
}

TEST_F(MissionRuleTest, ExactlyHalfExperiencedPasses) {
    nlohmann::json raw = fixtures::valid_mission();
    raw["crew"] = nlohmann::json::array({
        fixtures::crew_member("C01", "captain", 5),
        fixtures::crew_member("C02", "officer", 4)
    });
    EXPECT_TRUE(run(raw).is_ok());
}

TEST_F(MissionRuleTest, ShortMissionSkipsExperienceRule) {
    nlohmann::json raw = fixtures::valid_mission();
    raw["duration_days"] = 365;
    raw["crew"] = nlohmann::json::array({
        fixtures::crew_member("C01", "captain", 0),
        fixtures::crew_member("C02", "cadet", 0)
    });
    EXPECT_TRUE(run(raw).is_ok());
}

TEST_F(MissionRuleTest, InactiveMemberFailsWholeRecord) {
    nlohmann::json raw = fixtures::valid_mission();
    raw["crew"][1]["is_active"] = false;

    auto r = run(raw);
    ASSERT_FALSE(r.is_ok());
    ASSERT_EQ(r.error().violations.size(), 1u);
    EXPECT_EQ(r.error().violations[0].path, "crew");
    EXPECT_EQ(r.error().violations[0].message, "all crew members must be active");
}

TEST_F(MissionRuleTest, ShortCircuitReportsFirstDeclaredRule) {
    nlohmann::json raw = fixtures::valid_mission();
    raw["mission_id"] = "X2026_BAD";
    raw["crew"] = nlohmann::json::array({
        fixtures::crew_member("C01", "officer", 1, false),
        fixtures::crew_member("C02", "cadet", 0)
    });

    auto r = run(raw);
    ASSERT_FALSE(r.is_ok());
    ASSERT_EQ(r.error().violations.size(), 1u);
    EXPECT_EQ(r.error().violations[0].kind, ViolationKind::BusinessRuleError);
    EXPECT_EQ(r.error().violations[0].path, "mission_id");
    EXPECT_EQ(r.error().violations[0].message, "mission id must start with 'M'");

    // with the id fixed the next rule in line reports
    raw["mission_id"] = "M2026_BAD";
    auto next = run(raw);
    ASSERT_FALSE(next.is_ok());
    EXPECT_EQ(next.error().violations[0].message, "mission must have at least one captain or commander");
}

TEST_F(MissionRuleTest, RulesNeverRunOnFieldFailures) {
    nlohmann::json raw = fixtures::valid_mission();
    raw["mission_id"] = "X2026_BAD";   // rule violation
    raw["budget_millions"] = 0.5;      // field violation

    auto r = run(raw);
    ASSERT_FALSE(r.is_ok());
    ASSERT_EQ(r.error().violations.size(), 1u);
    EXPECT_EQ(r.error().violations[0].kind, ViolationKind::RangeError);
    EXPECT_EQ(r.error().violations[0].path, "budget_millions");
}

TEST(ContactRuleTest, RuleOrder) {
    const SchemaRegistry& registry = records::space_registry();

    nlohmann::json raw = fixtures::valid_contact();
    raw["contact_type"] = "physical";
    raw["is_verified"] = false;
    raw.erase("message_received");  // strong signal without message is also broken

    auto r = validate(registry, records::kContactReportKind, raw);
    ASSERT_FALSE(r.is_ok());
    ASSERT_EQ(r.error().violations.size(), 1u);
    EXPECT_EQ(r.error().violations[0].path, "is_verified");
    EXPECT_EQ(r.error().violations[0].message, "physical contact reports must be verified");

    raw["is_verified"] = true;
    auto next = validate(registry, records::kContactReportKind, raw);
    ASSERT_FALSE(next.is_ok());
    EXPECT_EQ(next.error().violations[0].path, "message_received");
    EXPECT_EQ(next.error().violations[0].message, "strong signals (> 7.0) should include a received message");
}

TEST(ContactRuleTest, ContactIdPrefix) {
    nlohmann::json raw = fixtures::valid_contact();
    raw["contact_id"] = "XX_2024_001";

    auto r = validate(records::space_registry(), records::kContactReportKind, raw);
    ASSERT_FALSE(r.is_ok());
    EXPECT_EQ(r.error().violations[0].message, "contact id must start with 'AC' (alien contact)");
}

TEST(ValidatorTest, UnknownKindFailsFast) {
    const Validator validator(records::space_registry());
    EXPECT_THROW(validator.validate("asteroid", nlohmann::json::object()), UnknownRecordKind);
    // thrown even when the input itself is not an object
    EXPECT_THROW(validator.validate("asteroid", 42), UnknownRecordKind);
}
