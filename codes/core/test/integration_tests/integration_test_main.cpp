// =============================================================================
//  Stream HTTP Server - Integration Tests Main
//  文件: integration_test_main.cpp
//  描述: 集成测试入口
//  版权: Copyright (c) 2026
// =============================================================================
#include <gtest/gtest.h>

int main(int argc, char **argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}

// 文件结束
