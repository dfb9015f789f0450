#include "osim/rules/evaluation_report.h"
#include "osim/storage/sqlite/sqlite_db.h"
#include "osim/storage/sqlite/sqlite_evaluation_store.h"

#include <catch2/catch_test_macros.hpp>

using namespace osim;

// Helper: open an in-memory DB with schema v1 applied.
static std::shared_ptr<storage::sqlite::SqliteDb> make_db() {
  auto result = storage::sqlite::SqliteDb::open(":memory:");
  REQUIRE(result.has_value());
  auto db = result.value();
  auto schema = db->ensure_schema_v1();
  REQUIRE(schema.has_value());
  return db;
}

// Helper: construct a record with one failed rule.
static storage::EvaluationRecord make_record(const std::string& evaluation_id) {
  storage::EvaluationRecord r;
  r.evaluation_id = evaluation_id;
  r.source = "image:look.jpg";
  r.created_at = "2026-01-01T00:00:00Z";

  rules::RuleOutcome outcome;
  outcome.rule_name = "forbidden_color_combo";
  outcome.rule_description = "Avoid complementary colors";
  outcome.passed = false;
  outcome.score = 50.0;
  outcome.message = "Forbidden color combination";
  outcome.suggestion = "Add a neutral";
  outcome.severity = rules::Severity::kError;
  outcome.weight = 1.8;
  r.report.results.push_back(outcome);

  r.report.score = 50.0;
  r.report.passed = false;
  r.report.suggestions.push_back(
      rules::ReportSuggestion{"forbidden_color_combo", "Add a neutral", rules::Severity::kError});
  r.report.summary.total_rules = 1;
  r.report.summary.failed_rules = 1;
  r.report.summary.errors = 1;
  return r;
}

TEST_CASE("schema v1 is applied once", "[evaluation-store][sqlite]") {
  auto db = make_db();
  CHECK(db->get_schema_version() == 1);
  CHECK(db->ensure_schema_v1().has_value());
  CHECK(db->get_schema_version() == 1);
}

TEST_CASE("append and get roundtrip", "[evaluation-store][sqlite]") {
  auto db = make_db();
  storage::sqlite::SqliteEvaluationStore store(db);

  REQUIRE(store.append(make_record("eval-001")).has_value());

  auto retrieved = store.get("eval-001");
  REQUIRE(retrieved.has_value());
  CHECK(retrieved->source == "image:look.jpg");
  REQUIRE(retrieved->created_at.has_value());
  CHECK(retrieved->created_at.value() == "2026-01-01T00:00:00Z");

  CHECK(retrieved->report.score == 50.0);
  CHECK_FALSE(retrieved->report.passed);
  REQUIRE(retrieved->report.results.size() == 1);
  CHECK(retrieved->report.results[0].rule_name == "forbidden_color_combo");
  CHECK(retrieved->report.results[0].severity == rules::Severity::kError);
  REQUIRE(retrieved->report.results[0].suggestion.has_value());
  CHECK(retrieved->report.results[0].suggestion.value() == "Add a neutral");
  CHECK(retrieved->report.summary.errors == 1);
}

TEST_CASE("get returns nullopt for missing evaluation", "[evaluation-store][sqlite]") {
  auto db = make_db();
  storage::sqlite::SqliteEvaluationStore store(db);
  CHECK_FALSE(store.get("nonexistent-id").has_value());
}

TEST_CASE("missing created_at is stored as NULL", "[evaluation-store][sqlite]") {
  auto db = make_db();
  storage::sqlite::SqliteEvaluationStore store(db);

  auto rec = make_record("eval-002");
  rec.created_at.reset();
  REQUIRE(store.append(rec).has_value());

  auto retrieved = store.get("eval-002");
  REQUIRE(retrieved.has_value());
  CHECK_FALSE(retrieved->created_at.has_value());
}

TEST_CASE("duplicate evaluation id is rejected", "[evaluation-store][sqlite]") {
  auto db = make_db();
  storage::sqlite::SqliteEvaluationStore store(db);

  REQUIRE(store.append(make_record("eval-dup")).has_value());
  auto second = store.append(make_record("eval-dup"));
  REQUIRE_FALSE(second.has_value());
  CHECK_FALSE(second.error().empty());
}

TEST_CASE("list_recent orders by insertion, newest first", "[evaluation-store][sqlite]") {
  auto db = make_db();
  storage::sqlite::SqliteEvaluationStore store(db);

  // Same created_at for every record: ordering must not depend on it.
  REQUIRE(store.append(make_record("eval-b")).has_value());
  REQUIRE(store.append(make_record("eval-a")).has_value());
  REQUIRE(store.append(make_record("eval-c")).has_value());

  auto recent = store.list_recent(2);
  REQUIRE(recent.size() == 2);
  CHECK(recent[0].evaluation_id == "eval-c");
  CHECK(recent[1].evaluation_id == "eval-a");

  CHECK(store.list_recent(10).size() == 3);
}
