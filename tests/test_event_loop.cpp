#include <gtest/gtest.h>
#include "driveprof/event_loop.hpp"

#include <stdexcept>
#include <string>
#include <vector>

#include <asio/io_context.hpp>
#include <asio/post.hpp>

using namespace driveprof;

TEST(EventLoopTest, ThrowingHandlerDoesNotStopTheLoop)
{
    asio::io_context ios;
    std::vector<std::string> errors;
    bool has_second_run = false;
    asio::post(ios, [] { throw std::runtime_error("boom"); });
    asio::post(ios, [&has_second_run] { has_second_run = true; });

    run_event_loop(ios, [&errors](const std::exception& e) { errors.push_back(e.what()); });

    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0], "boom");
    EXPECT_TRUE(has_second_run);
    EXPECT_TRUE(ios.stopped());
}

TEST(EventLoopTest, HandlerCanTearDownAfterException)
{
    asio::io_context ios;
    int num_exceptions = 0;
    bool is_torn_down = false;
    asio::post(ios, [] { throw std::logic_error("broken"); });

    run_event_loop(ios, [&](const std::exception&)
        {
            ++num_exceptions;
            asio::post(ios, [&is_torn_down] { is_torn_down = true; });
        });

    EXPECT_EQ(num_exceptions, 1);
    EXPECT_TRUE(is_torn_down);
}

TEST(EventLoopTest, StopEndsTheLoop)
{
    asio::io_context ios;
    bool has_late_run = false;
    asio::post(ios, [] { throw std::runtime_error("fatal"); });
    asio::post(ios, [&has_late_run] { has_late_run = true; });

    run_event_loop(ios, [&ios](const std::exception&) { ios.stop(); });

    EXPECT_FALSE(has_late_run);
}

TEST(EventLoopTest, ReturnsWhenOutOfWork)
{
    asio::io_context ios;
    int num_runs = 0;
    asio::post(ios, [&num_runs] { ++num_runs; });
    run_event_loop(ios, [](const std::exception&) { FAIL(); });
    EXPECT_EQ(num_runs, 1);
}
