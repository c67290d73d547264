#include <gtest/gtest.h>

#include <csignal>
#include <filesystem>
#include <iostream>

namespace {

// Per-test databases live under one scratch directory; whatever a crashed
// or aborted test left there is removed once the run ends.
class ScratchDirectoryEnvironment : public ::testing::Environment {
 public:
  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove_all(std::filesystem::temp_directory_path() / "harvest_tests", ec);
  }
};

}  // namespace

int main(int argc, char **argv) {
  std::cout << "Running Harvest Test Suite..." << std::endl;

  // Bridge tests close pipe read ends while workers may still write.
  std::signal(SIGPIPE, SIG_IGN);

  ::testing::InitGoogleTest(&argc, argv);
  ::testing::AddGlobalTestEnvironment(new ScratchDirectoryEnvironment);

  int result = RUN_ALL_TESTS();
  if (result != 0) {
    std::cout << "Some tests failed. Check output above for details." << std::endl;
  }
  return result;
}
