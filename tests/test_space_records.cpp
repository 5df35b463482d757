#include <gtest/gtest.h>

#include "fixtures.hpp"
#include "records/SpaceRecords.hpp"
#include "records/SpaceSchemas.hpp"
#include "records/Tags.hpp"
#include "spacecheck/ReportIO.hpp"
#include "spacecheck/Validator.hpp"

#include <stdexcept>

using namespace spacecheck;

class SpaceRecordsTest : public ::testing::Test {
protected:
    Validator validator{records::space_registry()};
};

// Scenario A
TEST_F(SpaceRecordsTest, ValidStation) {
    auto r = validator.validate(records::kStationKind, fixtures::valid_station());
    ASSERT_TRUE(r.is_ok());

    const records::SpaceStation s = records::SpaceStation::from_record(r.value());
    EXPECT_EQ(s.station_id, "ISS001");
    EXPECT_EQ(s.crew_size, 6);
    EXPECT_DOUBLE_EQ(s.power_level, 85.5);
    EXPECT_DOUBLE_EQ(s.oxygen_level, 92.3);
    EXPECT_EQ(s.last_maintenance.to_iso(), "2024-02-01T10:30:00");
    EXPECT_TRUE(s.is_operational);
    ASSERT_TRUE(s.notes.has_value());
    EXPECT_EQ(*s.notes, "All systems nominal.");
}

// Scenario B
TEST_F(SpaceRecordsTest, OvercrowdedStation) {
    nlohmann::json raw = fixtures::valid_station();
    raw["station_id"] = "BAD01";
    raw["crew_size"] = 25;

    auto r = validator.validate(records::kStationKind, raw);
    ASSERT_FALSE(r.is_ok());
    EXPECT_EQ(r.error().record_kind, "station");
    ASSERT_EQ(r.error().violations.size(), 1u);
    EXPECT_EQ(r.error().violations[0].path, "crew_size");
    EXPECT_EQ(r.error().violations[0].kind, ViolationKind::RangeError);
}

TEST_F(SpaceRecordsTest, TwoBadStationFieldsGiveTwoViolations) {
    nlohmann::json raw = fixtures::valid_station();
    raw["crew_size"] = 25;
    raw["power_level"] = 150.0;

    auto r = validator.validate(records::kStationKind, raw);
    ASSERT_FALSE(r.is_ok());
    EXPECT_EQ(r.error().violations.size(), 2u);
}

// Scenario C
TEST_F(SpaceRecordsTest, TelepathicContactNeedsWitnesses) {
    nlohmann::json raw = fixtures::valid_contact();
    raw["contact_id"] = "AC_2024_002";
    raw["contact_type"] = "telepathic";
    raw["signal_strength"] = 6.0;
    raw["witness_count"] = 1;
    raw["message_received"] = nullptr;

    auto r = validator.validate(records::kContactReportKind, raw);
    ASSERT_FALSE(r.is_ok());
    ASSERT_EQ(r.error().violations.size(), 1u);
    EXPECT_EQ(r.error().violations[0].kind, ViolationKind::BusinessRuleError);
    EXPECT_EQ(r.error().violations[0].path, "witness_count");
    EXPECT_EQ(r.error().violations[0].message, "telepathic contact requires at least 3 witnesses");
}

TEST_F(SpaceRecordsTest, ValidContactView) {
    auto r = validator.validate(records::kContactReportKind, fixtures::valid_contact());
    ASSERT_TRUE(r.is_ok());

    const records::ContactReport c = records::ContactReport::from_record(r.value());
    EXPECT_EQ(c.contact_type, records::ContactType::Radio);
    EXPECT_EQ(c.witness_count, 5);
    ASSERT_TRUE(c.message_received.has_value());
    EXPECT_FALSE(c.is_verified);
}

// Scenario D
TEST_F(SpaceRecordsTest, MissionWithoutLeader) {
    nlohmann::json raw = fixtures::valid_mission();
    raw["mission_id"] = "M2026_ERR";
    raw["duration_days"] = 120;
    raw["crew"] = nlohmann::json::array({
        fixtures::crew_member("C01", "officer", 6),
        fixtures::crew_member("C02", "lieutenant", 10)
    });

    auto r = validator.validate(records::kMissionKind, raw);
    ASSERT_FALSE(r.is_ok());
    ASSERT_EQ(r.error().violations.size(), 1u);
    EXPECT_EQ(r.error().violations[0].kind, ViolationKind::BusinessRuleError);
    EXPECT_EQ(r.error().violations[0].message, "mission must have at least one captain or commander");
}

// Scenario E
TEST_F(SpaceRecordsTest, LongMissionNeedsExperiencedCrew) {
    nlohmann::json raw = fixtures::valid_mission();
    raw["duration_days"] = 900;
    raw["crew"] = nlohmann::json::array({
        fixtures::crew_member("C01", "commander", 20),
        fixtures::crew_member("C02", "cadet", 1),
        fixtures::crew_member("C03", "cadet", 2),
        fixtures::crew_member("C04", "officer", 3)
    });

    auto r = validator.validate(records::kMissionKind, raw);
    ASSERT_FALSE(r.is_ok());
    ASSERT_EQ(r.error().violations.size(), 1u);
    EXPECT_EQ(r.error().violations[0].kind, ViolationKind::BusinessRuleError);
    EXPECT_EQ(r.error().violations[0].message, "long missions require at least 50% experienced crew (5+ years)");
}

TEST_F(SpaceRecordsTest, MissionView) {
    auto r = validator.validate(records::kMissionKind, fixtures::valid_mission());
    ASSERT_TRUE(r.is_ok());

    const records::SpaceMission m = records::SpaceMission::from_record(r.value());
    EXPECT_EQ(m.mission_id, "M2026_OK");
    EXPECT_EQ(m.mission_status, "planned");
    EXPECT_EQ(m.launch_date.to_iso(), "2026-03-15T09:00:00Z");
    ASSERT_EQ(m.crew.size(), 2u);
    EXPECT_EQ(m.crew[0].rank, records::Rank::Commander);
    EXPECT_TRUE(records::is_leadership(m.crew[0].rank));
    EXPECT_EQ(m.crew[1].rank, records::Rank::Officer);
    EXPECT_TRUE(m.crew[1].is_active);
}

TEST_F(SpaceRecordsTest, ViewRejectsOtherKinds) {
    auto r = validator.validate(records::kStationKind, fixtures::valid_station());
    ASSERT_TRUE(r.is_ok());
    EXPECT_THROW(records::SpaceMission::from_record(r.value()), std::invalid_argument);
}

TEST_F(SpaceRecordsTest, RecordValuesEqualCoercedInput) {
    const nlohmann::json raw = fixtures::valid_station();
    auto r = validator.validate(records::kStationKind, raw);
    ASSERT_TRUE(r.is_ok());
    const OutputJson out = record_to_json(r.value());
    ASSERT_EQ(out.size(), raw.size());
    for (const auto& item : raw.items()) {
        ASSERT_TRUE(out.contains(item.key())) << item.key();
        EXPECT_EQ(out[item.key()].dump(), item.value().dump()) << item.key();
    }
}

TEST_F(SpaceRecordsTest, RepeatedValidationIsIdentical) {
    nlohmann::json raw = fixtures::valid_mission();
    raw["crew"][0]["age"] = 17;
    raw["crew"][1]["specialization"] = "x";
    raw["budget_millions"] = 0;

    auto first = validator.validate(records::kMissionKind, raw);
    auto second = validator.validate(records::kMissionKind, raw);
    ASSERT_FALSE(first.is_ok());
    ASSERT_FALSE(second.is_ok());
    EXPECT_EQ(first.error().violations, second.error().violations);
    EXPECT_EQ(first.error().violations.size(), 3u);

    auto ok1 = validator.validate(records::kMissionKind, fixtures::valid_mission());
    auto ok2 = validator.validate(records::kMissionKind, fixtures::valid_mission());
    ASSERT_TRUE(ok1.is_ok() && ok2.is_ok());
    EXPECT_EQ(record_to_json(ok1.value()), record_to_json(ok2.value()));
}

TEST(TagsTest, RoundTripAndLeadership) {
    EXPECT_EQ(records::parse_rank("captain"), records::Rank::Captain);
    EXPECT_FALSE(records::parse_rank("Captain").has_value());
    EXPECT_EQ(records::parse_contact_type("telepathic"), records::ContactType::Telepathic);

    const std::vector<std::string> leaders = {"captain", "commander"};
    EXPECT_EQ(records::leadership_tags(), leaders);
    EXPECT_EQ(records::rank_tags().size(), 5u);
    EXPECT_EQ(records::contact_type_tags().size(), 4u);
}
