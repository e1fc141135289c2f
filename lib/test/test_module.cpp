#include "Module.h"
#include "Service.h"
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>

class TestModule : public hc::Module {
public:
    TestModule(const std::string& name) : hc::Module(name) {}
};

TEST(ModuleTest, LogReturnsLoggerReference) {
    TestModule module("test_module");

    EXPECT_NO_THROW({
        module.log().info << "Test message";
        module.log().debug << "Debug message";
        module.log().warning << "Warning message";
    });

    EXPECT_EQ(module.log().getName(), "test_module");
    EXPECT_EQ(module.getLoggerName(), "test_module");
}

TEST(ModuleTest, LogIsConst) {
    const TestModule module("const_test");
    EXPECT_NO_THROW(module.log().info << "Const test message");
    EXPECT_EQ(module.log().getName(), "const_test");
}

TEST(ModuleTest, DottedNameBuildsHierarchy) {
    TestModule module("module_parent.child");
    EXPECT_EQ(module.log().getName(), "child");
    EXPECT_EQ(module.log().getParent(),
              hc::logging::getLogger("module_parent"));
}

TEST(ModuleTest, RedirectLoggerMovesUnderTarget) {
    TestModule module("redirect_test");
    module.redirectLogger("redirect_target");

    EXPECT_EQ(module.log().getParent(),
              hc::logging::getLogger("redirect_target"));
    EXPECT_EQ(module.log().getFullName(), "redirect_target.redirect_test");
    EXPECT_NO_THROW(module.log().info << "Message via redirect");
}

// Service

class CountingService : public hc::Service {
public:
    CountingService() : hc::Service("counting_service") {}
    ~CountingService() override { stop(); }

    std::atomic<int> iterations{ 0 };
    std::atomic<bool> stopped{ false };
    bool failStart{ false };

protected:
    Roe<void> onStart() override {
        if (failStart) {
            return Error(1, "refused");
        }
        return {};
    }

    void onStop() override { stopped = true; }

    void runLoop() override {
        while (!isStopSet()) {
            ++iterations;
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }
};

TEST(ServiceTest, StartRunsLoopUntilStop) {
    CountingService service;
    EXPECT_FALSE(service.isRunning());

    auto result = service.start();
    ASSERT_TRUE(result.isOk()) << result.error().message;
    EXPECT_TRUE(service.isRunning());

    for (int i = 0; i < 1000 && service.iterations == 0; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    EXPECT_GT(service.iterations.load(), 0);

    service.stop();
    EXPECT_FALSE(service.isRunning());
    EXPECT_TRUE(service.stopped.load());
}

TEST(ServiceTest, SecondStartFails) {
    CountingService service;
    ASSERT_TRUE(service.start().isOk());
    auto second = service.start();
    EXPECT_TRUE(second.isError());
    service.stop();
}

TEST(ServiceTest, FailedOnStartLeavesServiceStopped) {
    CountingService service;
    service.failStart = true;
    auto result = service.start();
    ASSERT_TRUE(result.isError());
    EXPECT_NE(result.error().message.find("refused"), std::string::npos);
    EXPECT_FALSE(service.isRunning());
}
