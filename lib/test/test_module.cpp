#include "Module.h"
#include <gtest/gtest.h>

class TestModule : public lfs::Module {
public:
  explicit TestModule(const std::string &name) : lfs::Module(name) {}
};

TEST(ModuleTest, LogReturnsNamedLogger) {
  TestModule module("test_module");

  EXPECT_NO_THROW({
    module.log().info << "Test message";
    module.log().debug << "Debug message";
    module.log().warning << "Warning message";
  });

  EXPECT_EQ(module.log().getName(), "test_module");
  EXPECT_EQ(module.getLoggerName(), "test_module");
  EXPECT_EQ(module.log(), lfs::logging::getLogger("test_module"));
}

TEST(ModuleTest, LogIsConst) {
  const TestModule module("const_test");
  EXPECT_NO_THROW(module.log().info << "Const test message");
  EXPECT_EQ(module.log().getName(), "const_test");
}

TEST(ModuleTest, HierarchicalName) {
  TestModule module("component.part");
  EXPECT_EQ(module.log().getName(), "part");
  EXPECT_EQ(module.log().getFullName(), "component.part");
}

TEST(ModuleTest, LoggerRedirect) {
  TestModule module("redirect_test");
  module.redirectLogger("redirect_target");
  EXPECT_EQ(module.log().getFullName(), "redirect_target.redirect_test");
  EXPECT_NO_THROW(module.log().info << "Message via redirect");
}
