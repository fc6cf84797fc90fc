#include <sstream>

#include <gtest/gtest.h>

#include "AppError.h"

TEST(AppError, reasonHasKindPrefix) {
    const AppError err{ErrorKind::ModelNotDownloaded, "Model 'large' is not downloaded"};

    EXPECT_EQ(err.kind(), ErrorKind::ModelNotDownloaded);
    EXPECT_EQ(err.reason(), QString{"ModelNotDownloaded: Model 'large' is not downloaded"});
    EXPECT_STREQ(err.what(), "Model 'large' is not downloaded");
}

TEST(AppError, kindNames) {
    EXPECT_EQ(toString(ErrorKind::DeviceUnavailable), "DeviceUnavailable");
    EXPECT_EQ(toString(ErrorKind::NoActiveModel), "NoActiveModel");
    EXPECT_EQ(toString(ErrorKind::EmptyInput), "EmptyInput");
    EXPECT_EQ(toString(ErrorKind::NoSpeechDetected), "NoSpeechDetected");

    std::ostringstream out;
    out << ErrorKind::DownloadFailure;
    EXPECT_EQ(out.str(), "DownloadFailure");
}

TEST(AppError, formatReason) {
    EXPECT_EQ(formatReason(ErrorKind::NoSpeechDetected, "No speech detected"),
              QString{"NoSpeechDetected: No speech detected"});
}
