#include <gtest/gtest.h>

#include <spdlog/sinks/ostream_sink.h>
#include <sstream>
#include "infra/error_handler/error.hpp"

using smartmig::infra::Error;
using smartmig::infra::ErrorCode;
using smartmig::infra::make_error;

TEST(ErrorTest, FatalCodes)
{
    for (auto code : {ErrorCode::SourceNotFound, ErrorCode::NotADirectory, ErrorCode::InvalidDestination,
                      ErrorCode::StateCorrupted, ErrorCode::PersistenceFailed}) {
        EXPECT_TRUE(make_error(code, "x").is_fatal()) << smartmig::infra::to_string(code);
        EXPECT_FALSE(make_error(code, "x").is_per_file());
    }
    for (auto code : {ErrorCode::ReadFailed, ErrorCode::WriteFailed,
                      ErrorCode::PermissionDenied, ErrorCode::ChecksumMismatch}) {
        EXPECT_FALSE(make_error(code, "x").is_fatal()) << smartmig::infra::to_string(code);
        EXPECT_TRUE(make_error(code, "x").is_per_file());
    }
    EXPECT_FALSE(make_error(ErrorCode::Interrupted, "x").is_fatal());
}

TEST(ErrorTest, ExitCodes)
{
    EXPECT_EQ(make_error(ErrorCode::Interrupted, "stop").to_exit_code(), 130);
    EXPECT_EQ(make_error(ErrorCode::ChecksumMismatch, "bad").to_exit_code(), 1);
    EXPECT_EQ(make_error(ErrorCode::SourceNotFound, "gone").to_exit_code(), 1);
}

TEST(ErrorTest, CapturesCallSite)
{
    const auto err = make_error(ErrorCode::ReadFailed, "cannot read");
    EXPECT_STREQ(err.what(), "cannot read");
    EXPECT_NE(err.file.find("error_test.cpp"), std::string::npos);
    EXPECT_GT(err.line, 0);
}

TEST(ErrorTest, PermissionErrorsAreRecognised)
{
    const auto denied = smartmig::infra::error_from_errc(
        std::make_error_code(std::errc::permission_denied), ErrorCode::ReadFailed, "open a.txt");
    EXPECT_EQ(denied.code, ErrorCode::PermissionDenied);
    EXPECT_EQ(denied.message.rfind("open a.txt: ", 0), 0u);

    const auto full = smartmig::infra::error_from_errc(
        std::make_error_code(std::errc::no_space_on_device), ErrorCode::WriteFailed, "write b.txt");
    EXPECT_EQ(full.code, ErrorCode::WriteFailed);
}

TEST(ErrorTest, LogAndReturnUsesSeverity)
{
    std::ostringstream out;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
    spdlog::logger logger("error-test", sink);
    logger.set_pattern("%l|%v");

    auto fatal = smartmig::infra::log_and_return(logger, make_error(ErrorCode::StateCorrupted, "broken"));
    EXPECT_EQ(fatal.code, ErrorCode::StateCorrupted);
    auto minor = smartmig::infra::log_and_return(logger, make_error(ErrorCode::ReadFailed, "skip"));
    EXPECT_EQ(minor.message, "skip");

    const auto text = out.str();
    EXPECT_NE(text.find("error|"), std::string::npos);
    EXPECT_NE(text.find("state corrupted: broken"), std::string::npos);
    EXPECT_NE(text.find("warning|"), std::string::npos);
}
