#include <gtest/gtest.h>

#include "harvest_api/routes.hpp"

namespace harvest_api {

using harvest_core::ErrorKind;

TEST(RoutesTest, ConflictKindsMapTo409) {
  EXPECT_EQ(Routes::status_for(ErrorKind::AlreadyRunning), 409);
  EXPECT_EQ(Routes::status_for(ErrorKind::QueueNotRunning), 409);
  EXPECT_EQ(Routes::status_for(ErrorKind::ItemNotRemovable), 409);
}

TEST(RoutesTest, BadInputMapsTo400) {
  EXPECT_EQ(Routes::status_for(ErrorKind::ValidationFailure), 400);
}

TEST(RoutesTest, EngineFailuresMapTo500) {
  EXPECT_EQ(Routes::status_for(ErrorKind::ProcessSpawnError), 500);
  EXPECT_EQ(Routes::status_for(ErrorKind::ProcessExitError), 500);
  EXPECT_EQ(Routes::status_for(ErrorKind::Storage), 500);
}

}  // namespace harvest_api
