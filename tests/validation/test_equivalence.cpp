#include <gtest/gtest.h>
#include "validation/equivalence.hpp"
#include <random>
#include <sstream>

using namespace pdfstack;

namespace {
    KernelDictionary make_dict() {
        return KernelDictionary(UniformGrid::Linspace(-10.0, 10.0, 401),
                                SigmaGrid::Linspace(0.2, 1.0, 81), 5.0);
    }
}

TEST(EquivalenceTest, ExactSigmasAgreeClosely) {
    KernelDictionary dict = make_dict();
    std::vector<double> values, sigmas;
    for (int k = 0; k < 20; ++k) {
        values.push_back(dict.grid()[120 + 8 * k]);
        sigmas.push_back(dict.sigma_grid()[(k * 7) % dict.Ndict()]);
    }

    EquivalenceResult result = compare_dict_direct(dict, values, sigmas, {}, SelectionPolicy::None());
    EXPECT_EQ(result.n_obs, 20);
    EXPECT_NEAR(result.mass_dict, 20.0, 1e-9);
    EXPECT_NEAR(result.mass_direct, 20.0, 1e-9);
    EXPECT_LT(result.max_abs_diff, 1e-5);
    EXPECT_TRUE(result.pass);
}

TEST(EquivalenceTest, QuantizedSigmasWithinTolerance) {
    KernelDictionary dict = make_dict();
    std::mt19937 rng(12345);
    std::uniform_int_distribution<int> pos(100, 300);
    std::uniform_real_distribution<double> sig(0.2, 1.0);
    std::uniform_real_distribution<double> wt(0.5, 2.0);

    std::vector<double> values, sigmas, weights;
    for (int k = 0; k < 200; ++k) {
        values.push_back(dict.grid()[pos(rng)]);
        sigmas.push_back(sig(rng));
        weights.push_back(wt(rng));
    }

    EquivalenceResult result = compare_dict_direct(dict, values, sigmas, weights,
                                                   SelectionPolicy::None(), 0.05);
    EXPECT_NEAR(result.mass_dict, result.mass_direct, 1e-8 * result.mass_direct);
    EXPECT_TRUE(result.pass);
}

TEST(EquivalenceTest, ReportShowsOverallResult) {
    KernelDictionary dict = make_dict();
    EquivalenceResult result = compare_dict_direct(dict, {0.0}, {0.5}, {}, SelectionPolicy::None());

    std::ostringstream oss;
    generate_equivalence_report(oss, result);
    std::string report = oss.str();
    EXPECT_NE(report.find("OVERALL RESULT"), std::string::npos);
    EXPECT_NE(report.find("PASS"), std::string::npos);
}

TEST(EquivalenceTest, ReportShowsFailure) {
    EquivalenceResult result;
    result.n_obs = 1;
    result.pass = false;

    std::ostringstream oss;
    generate_equivalence_report(oss, result);
    EXPECT_NE(oss.str().find("FAIL"), std::string::npos);
}

TEST(EquivalenceTest, ReportRestoresStreamFormat) {
    EquivalenceResult result;
    result.mass_dict = 1.5;

    std::ostringstream oss;
    oss << std::fixed;
    oss.precision(2);
    generate_equivalence_report(oss, result);

    EXPECT_EQ(oss.flags() & std::ios::floatfield, std::ios::fixed);
    EXPECT_EQ(oss.precision(), 2);
    oss.str("");
    oss << 0.5;
    EXPECT_EQ(oss.str(), "0.50");
}
