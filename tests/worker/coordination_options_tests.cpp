#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>

#include "swfcoord/worker/coordinated_activity_adapter.h"
#include "swfcoord/worker/coordinated_activity_worker.h"

using namespace swfcoord::worker;
using namespace std::chrono_literals;

TEST(CoordinatedActivityOptionsTest, Defaults) {
    CoordinatedActivityOptions options;
    EXPECT_EQ(options.heartbeat_interval, 30s);
    EXPECT_EQ(options.tick_min_interval, 1s);
    EXPECT_FALSE(options.max_consecutive_heartbeat_failures.has_value());
    EXPECT_NO_THROW(options.validate());
}

TEST(CoordinatedActivityOptionsTest, RejectsNonPositiveIntervals) {
    CoordinatedActivityOptions options;
    options.heartbeat_interval = 0ms;
    EXPECT_THROW(options.validate(), std::invalid_argument);

    options = {};
    options.tick_min_interval = -5ms;
    EXPECT_THROW(options.validate(), std::invalid_argument);
}

TEST(CoordinatedActivityOptionsTest, RejectsZeroFailureBound) {
    CoordinatedActivityOptions options;
    options.max_consecutive_heartbeat_failures = 0;
    EXPECT_THROW(options.validate(), std::invalid_argument);

    options.max_consecutive_heartbeat_failures = 3;
    EXPECT_NO_THROW(options.validate());
}

TEST(CoordinatedActivityWorkerOptionsTest, Defaults) {
    CoordinatedActivityWorkerOptions options;
    EXPECT_TRUE(options.domain.empty());
    EXPECT_EQ(options.coordination.heartbeat_interval, 30s);
    EXPECT_EQ(options.data_converter, nullptr);
    EXPECT_EQ(options.signaler, nullptr);
    EXPECT_TRUE(options.interceptors.empty());
}

TEST(CoordinatedActivityWorkerOptionsTest, ServiceLimits) {
    EXPECT_EQ(kMaxReasonLength, 256u);
    EXPECT_EQ(kMaxDetailsLength, 32768u);
}
