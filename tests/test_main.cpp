#include <gtest/gtest.h>

#include <filesystem>
#include <iostream>

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);

  // Fixtures create their folders here; set TMPDIR to move them
  std::cout << "SmartScan tests, temp root " << std::filesystem::temp_directory_path().string() << std::endl;

  int result = RUN_ALL_TESTS();
  if (result != 0) {
    std::cout << "Connectivity tests expect nothing listening on 127.0.0.1:1." << std::endl;
  }
  return result;
}
