#include "test_utils.hpp"
#include "multibar/core/rate_estimator.hpp"
#include <cmath>
#include <limits>

using multibar::core::RateEstimator;

TEST(RateEstimator, first_sample_taken_as_is){
    EXPECT_DOUBLE_EQ(10.0, RateEstimator::update(std::nullopt, 1.0, 10.0, 0.3));
    EXPECT_DOUBLE_EQ(40.0, RateEstimator::update(std::nullopt, 0.25, 10.0, 0.3));
}

TEST(RateEstimator, smoothing_one_tracks_latest_sample){
    EXPECT_DOUBLE_EQ(10.0, RateEstimator::update(3.0, 1.0, 10.0, 1.0));
}

TEST(RateEstimator, blends_with_previous){
    // 0.3 * 10 + 0.7 * 5
    EXPECT_NEAR(6.5, RateEstimator::update(5.0, 1.0, 10.0, 0.3), 1e-12);
}

TEST(RateEstimator, zero_items_decays_rate){
    EXPECT_NEAR(3.5, RateEstimator::update(5.0, 2.0, 0.0, 0.3), 1e-12);
}

TEST(RateEstimator, eta_from_rate_and_remaining){
    auto eta = RateEstimator::eta(10.0, 50);
    ASSERT_TRUE(eta.has_value());
    EXPECT_DOUBLE_EQ(5.0, *eta);
}

TEST(RateEstimator, eta_unknown_without_rate){
    EXPECT_FALSE(RateEstimator::eta(std::nullopt, 50).has_value());
    EXPECT_FALSE(RateEstimator::eta(10.0, std::nullopt).has_value());
}

TEST(RateEstimator, eta_unknown_for_non_positive_rate){
    EXPECT_FALSE(RateEstimator::eta(0.0, 50).has_value());
    EXPECT_FALSE(RateEstimator::eta(-1.0, 50).has_value());
    EXPECT_FALSE(RateEstimator::eta(std::numeric_limits<double>::quiet_NaN(), 50).has_value());
}

TEST(RateEstimator, eta_zero_when_nothing_remains){
    auto eta = RateEstimator::eta(10.0, 0);
    ASSERT_TRUE(eta.has_value());
    EXPECT_DOUBLE_EQ(0.0, *eta);
}

TEST(RateEstimator, smoothing_range){
    EXPECT_TRUE(RateEstimator::isValidSmoothing(1.0));
    EXPECT_TRUE(RateEstimator::isValidSmoothing(0.3));
    EXPECT_TRUE(RateEstimator::isValidSmoothing(1e-9));
    EXPECT_FALSE(RateEstimator::isValidSmoothing(0.0));
    EXPECT_FALSE(RateEstimator::isValidSmoothing(-0.5));
    EXPECT_FALSE(RateEstimator::isValidSmoothing(1.5));
    EXPECT_FALSE(RateEstimator::isValidSmoothing(std::numeric_limits<double>::infinity()));
}
