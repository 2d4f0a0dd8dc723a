#include <gtest/gtest.h>
#include "core/grids.hpp"
#include "core/errors.hpp"

using namespace pdfstack;

TEST(UniformGridTest, FarOffsetLinspaceIsUniform) {
    ASSERT_NO_THROW(UniformGrid::Linspace(1e8, 1e8 + 1.0, 1001));
    UniformGrid grid = UniformGrid::Linspace(1e8, 1e8 + 1.0, 1001);
    EXPECT_EQ(grid.size(), 1001);
    EXPECT_NEAR(grid.delta, 1e-3, 1e-7);
    EXPECT_EQ(grid.NearestIndex(1e8 + 0.5), 500);

    std::vector<double> uneven = {1e8, 1e8 + 1.0, 1e8 + 3.0};
    EXPECT_THROW(UniformGrid{uneven}, InvalidGrid);
}

TEST(UniformGridTest, LinspacePointsCorrect) {
    UniformGrid grid = UniformGrid::Linspace(-5.0, 5.0, 11);
    EXPECT_EQ(grid.size(), 11);
    EXPECT_DOUBLE_EQ(grid.delta, 1.0);
    EXPECT_DOUBLE_EQ(grid.min, -5.0);
    EXPECT_DOUBLE_EQ(grid.max, 5.0);
    EXPECT_DOUBLE_EQ(grid[5], 0.0);
}

TEST(UniformGridTest, NearestIndexIsNotClamped) {
    UniformGrid grid = UniformGrid::Linspace(-5.0, 5.0, 11);
    EXPECT_EQ(grid.NearestIndex(-5.0), 0);
    EXPECT_EQ(grid.NearestIndex(0.0), 5);
    EXPECT_EQ(grid.NearestIndex(0.4), 5);
    EXPECT_EQ(grid.NearestIndex(0.6), 6);
    EXPECT_EQ(grid.NearestIndex(-7.0), -2);
    EXPECT_EQ(grid.NearestIndex(100.0), 105);
}

TEST(UniformGridTest, FarOffGridSaturates) {
    UniformGrid grid = UniformGrid::Linspace(0.0, 1.0, 11);
    EXPECT_LT(grid.NearestIndex(-1e300), -1000000);
    EXPECT_GT(grid.NearestIndex(1e300), 1000000);
}

TEST(UniformGridTest, TooFewPointsThrows) {
    EXPECT_THROW(UniformGrid(std::vector<double>{1.0}), InvalidGrid);
    EXPECT_THROW(UniformGrid(std::vector<double>{}), InvalidGrid);
}

TEST(UniformGridTest, NonUniformSpacingThrows) {
    EXPECT_THROW(UniformGrid(std::vector<double>{0.0, 1.0, 3.0}), InvalidGrid);
    EXPECT_THROW(UniformGrid(std::vector<double>{1.0, 0.0, -1.0}), InvalidGrid);
    EXPECT_THROW(UniformGrid(std::vector<double>{0.0, 0.0}), InvalidGrid);
}

TEST(UniformGridTest, InvalidGridIsInvalidArgument) {
    EXPECT_THROW(UniformGrid(std::vector<double>{0.0, 1.0, 3.0}), std::invalid_argument);
}

TEST(SigmaGridTest, NearestIndexClamped) {
    SigmaGrid sigmas(std::vector<double>{0.5, 1.0, 1.5});
    EXPECT_EQ(sigmas.size(), 3);
    EXPECT_DOUBLE_EQ(sigmas.dsigma, 0.5);
    EXPECT_EQ(sigmas.NearestIndex(0.5), 0);
    EXPECT_EQ(sigmas.NearestIndex(1.0), 1);
    EXPECT_EQ(sigmas.NearestIndex(1.5), 2);
    EXPECT_EQ(sigmas.NearestIndex(0.1), 0);   // below the floor
    EXPECT_EQ(sigmas.NearestIndex(10.0), 2);  // above the ceiling
}

TEST(SigmaGridTest, NonPositiveThrows) {
    EXPECT_THROW(SigmaGrid(std::vector<double>{0.0, 0.5}), InvalidSigmaGrid);
    EXPECT_THROW(SigmaGrid(std::vector<double>{-1.0, 0.0, 1.0}), InvalidSigmaGrid);
}

TEST(SigmaGridTest, NonUniformOrShortThrows) {
    EXPECT_THROW(SigmaGrid(std::vector<double>{0.5, 1.0, 2.0}), InvalidSigmaGrid);
    EXPECT_THROW(SigmaGrid(std::vector<double>{0.5}), InvalidSigmaGrid);
    EXPECT_THROW(SigmaGrid(std::vector<double>{1.0, 0.5}), InvalidSigmaGrid);
}

TEST(SigmaGridTest, LinspaceSpacing) {
    SigmaGrid sigmas = SigmaGrid::Linspace(0.2, 1.0, 81);
    EXPECT_EQ(sigmas.size(), 81);
    EXPECT_NEAR(sigmas.dsigma, 0.01, 1e-12);
    EXPECT_EQ(sigmas.NearestIndex(sigmas[40]), 40);
}
