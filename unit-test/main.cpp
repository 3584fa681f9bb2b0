#include <glog/logging.h>
#include <cstdlib>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "config.hpp"
#include "test/environment.hpp"

/**
 * @brief 测试结束后删除临时文件夹，设置环境变量 DEBUG 可以保留这些文件夹
 */
class GlobalEnv : public ::testing::Environment {
public:
    void SetUp() override {
        FLAGS_logtostderr = true;
        if (getenv("DEBUG")) hackjudge::DEBUG = true;
    }

    void TearDown() override {
        if (!hackjudge::DEBUG) hackjudge::cleanup_test_environment();
    }
};

int main(int argc, char *argv[]) {
    google::InitGoogleLogging(argv[0]);
    ::testing::AddGlobalTestEnvironment(new GlobalEnv);
    ::testing::InitGoogleMock(&argc, argv);
    return RUN_ALL_TESTS();
}
