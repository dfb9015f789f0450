#include "osim/storage/evaluation_store.h"

#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace osim;

namespace {

storage::EvaluationRecord make_record(const std::string& id, double score = 90.0) {
  storage::EvaluationRecord r;
  r.evaluation_id = id;
  r.source = "request:" + id + ".json";
  r.created_at = "2026-01-01T00:00:00Z";
  r.report.score = score;
  return r;
}

}  // namespace

TEST_CASE("append and get", "[evaluation-store][inmemory]") {
  storage::InMemoryEvaluationStore store;
  REQUIRE(store.append(make_record("eval-0", 75.5)).has_value());

  const auto found = store.get("eval-0");
  REQUIRE(found.has_value());
  CHECK(found->source == "request:eval-0.json");
  CHECK(found->report.score == 75.5);

  CHECK_FALSE(store.get("eval-missing").has_value());
}

TEST_CASE("duplicate ids are rejected", "[evaluation-store][inmemory]") {
  storage::InMemoryEvaluationStore store;
  REQUIRE(store.append(make_record("eval-0")).has_value());

  const auto again = store.append(make_record("eval-0", 10.0));
  REQUIRE_FALSE(again.has_value());
  CHECK(again.error().find("eval-0") != std::string::npos);
  CHECK(store.get("eval-0")->report.score == 90.0);
}

TEST_CASE("list_recent returns newest first", "[evaluation-store][inmemory]") {
  storage::InMemoryEvaluationStore store;
  for (const char* id : {"eval-a", "eval-b", "eval-c"}) {
    REQUIRE(store.append(make_record(id)).has_value());
  }

  const auto all = store.list_recent(10);
  REQUIRE(all.size() == 3);
  CHECK(all[0].evaluation_id == "eval-c");
  CHECK(all[2].evaluation_id == "eval-a");

  const auto limited = store.list_recent(2);
  REQUIRE(limited.size() == 2);
  CHECK(limited[1].evaluation_id == "eval-b");

  CHECK(store.list_recent(0).empty());
}
