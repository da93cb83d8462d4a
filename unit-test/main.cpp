#include <glog/logging.h>
#include <memory>
#include "common/python.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

class GlobalEnv : public ::testing::Environment {
 public:
  virtual void SetUp() {
    // 语法检查需要内嵌的解释器
    Py_Initialize();
    guard = std::make_unique<grader::PyThread_guard>();
  }
  virtual void TearDown() {
    guard.reset();
  }

 private:
  std::unique_ptr<grader::PyThread_guard> guard;
};

int main(int argc, char *argv[]) {
  google::InitGoogleLogging(argv[0]);
  AddGlobalTestEnvironment(new GlobalEnv);
  ::testing::InitGoogleMock(&argc, argv);
  return RUN_ALL_TESTS();
}
