#include <gtest/gtest.h>

#include "harvest_core/types/job_description.hpp"

namespace harvest_core {

TEST(JobDescriptionTest, FromJsonReadsAllSections) {
  auto job = JobDescription::from_json(
      {{"taskType", "search"}, {"params", {{"keyword", "coffee"}}}, {"config", {{"save_path", "/d"}}}});
  EXPECT_EQ(job.kind, "search");
  EXPECT_EQ(job.params["keyword"], "coffee");
  EXPECT_EQ(job.config["save_path"], "/d");
  EXPECT_EQ(job.to_json()["taskType"], "search");
}

TEST(JobDescriptionTest, FromJsonDefaultsMissingSections) {
  auto job = JobDescription::from_json({{"taskType", "user"}});
  EXPECT_TRUE(job.params.is_object());
  EXPECT_TRUE(job.params.empty());
  EXPECT_TRUE(job.config.is_object());
}

TEST(JobDescriptionTest, FromJsonRejectsInvalidInput) {
  EXPECT_THROW(JobDescription::from_json(nlohmann::json::array()), std::invalid_argument);
  EXPECT_THROW(JobDescription::from_json({{"params", {}}}), std::invalid_argument);
  EXPECT_THROW(JobDescription::from_json({{"taskType", ""}}), std::invalid_argument);
  EXPECT_THROW(JobDescription::from_json({{"taskType", 4}}), std::invalid_argument);
  EXPECT_THROW(JobDescription::from_json({{"taskType", "search"}, {"config", "fast"}}),
               std::invalid_argument);
}

TEST(JobDescriptionTest, ConfigSnapshotDropsCookie) {
  JobDescription job;
  job.kind = "search";
  job.config = {{"cookie", "secret"}, {"save_path", "/d"}};

  auto snapshot = job.config_snapshot();
  EXPECT_FALSE(snapshot.contains("cookie"));
  EXPECT_EQ(snapshot["save_path"], "/d");
  EXPECT_TRUE(job.config.contains("cookie"));
}

TEST(JobDescriptionTest, WorkerArgumentFlattensConfig) {
  JobDescription job;
  job.kind = "notes";
  job.params = {{"noteUrls", {"u"}}};
  job.config = {{"cookie", "c"}, {"proxy", "http://p"}};

  auto argument = nlohmann::json::parse(job.to_worker_argument());
  EXPECT_EQ(argument["taskType"], "notes");
  EXPECT_EQ(argument["params"]["noteUrls"][0], "u");
  EXPECT_EQ(argument["cookie"], "c");
  EXPECT_EQ(argument["proxy"], "http://p");
}

}  // namespace harvest_core
