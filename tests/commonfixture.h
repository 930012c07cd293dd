#ifndef FPSERVERAPI_COMMONFIXTURE_H
#define FPSERVERAPI_COMMONFIXTURE_H

#include "gtest/gtest.h"

// Base fixture for every test, routes SDK logging to stderr at the most
// verbose level.
class CommonFixture : public ::testing::Test {
protected:
    void SetUp() override;

    void TearDown() override;
};

#endif //FPSERVERAPI_COMMONFIXTURE_H
