#include <glog/logging.h>
#include "config.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

class GlobalEnv : public ::testing::Environment {
 public:
  virtual void SetUp() {
    if (const char *isolate = getenv("ISOLATE"))
      grader::ISOLATE_PATH = isolate;
    if (const char *compiler = getenv("COMPILER"))
      grader::COMPILER_PATH = compiler;
    grader::BOX_ID = 17;
  }
  virtual void TearDown() {
    //  Stub
  }
};

int main(int argc, char *argv[]) {
  google::InitGoogleLogging(argv[0]);
  AddGlobalTestEnvironment(new GlobalEnv);
  ::testing::InitGoogleMock(&argc, argv);
  return RUN_ALL_TESTS();
}
