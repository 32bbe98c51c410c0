#include <gtest/gtest.h>

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    // 组件在状态转换时输出 DEBUG 日志，测试中只保留警告以上
    trantor::Logger::setLogLevel(trantor::Logger::kWarn);
    return RUN_ALL_TESTS();
}
