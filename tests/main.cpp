#include <gtest/gtest.h>
#include "common/test_environment.h"

int main(int argc, char* argv[]) {
    ::testing::InitGoogleTest(&argc, argv);

    // Logger setup and a scratch directory shared by every test
    ::testing::AddGlobalTestEnvironment(new ModelBaseTestEnvironment);

    return RUN_ALL_TESTS();
}
