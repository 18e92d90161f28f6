#include <cerrno>
#include <string>

#include <gtest/gtest.h>

#include "capsync/core/errors.hpp"

using namespace capsync::core;

TEST(CoreErrors, OkStatusIsOk) {
    EXPECT_TRUE(is_ok(ok_status()));
    EXPECT_FALSE(is_ok(make_status(StatusDomain::Store, StatusCode::Io)));
}

TEST(CoreErrors, MakeStatusCarriesAllFields) {
    const Status s = make_status(StatusDomain::Transport, StatusCode::Throttled, 429);
    EXPECT_EQ(s.domain, StatusDomain::Transport);
    EXPECT_EQ(s.code, StatusCode::Throttled);
    EXPECT_EQ(s.aux, 429u);
}

TEST(CoreErrors, NamesAreStable) {
    EXPECT_STREQ(status_code_name(StatusCode::InsufficientStorage), "InsufficientStorage");
    EXPECT_STREQ(status_code_name(StatusCode::ChecksumMismatch), "ChecksumMismatch");
    EXPECT_STREQ(status_domain_name(StatusDomain::Capture), "Capture");
    EXPECT_STREQ(status_domain_name(StatusDomain::Manifest), "Manifest");
}

TEST(CoreErrors, DescribeIncludesErrnoTextForIo) {
    const std::string d = status_describe(make_status(StatusDomain::Store, StatusCode::Io, ENOSPC));
    EXPECT_EQ(d.rfind("Io/Store (aux=", 0), 0u) << d;
    EXPECT_NE(d.find(':'), std::string::npos);
    EXPECT_EQ(status_describe(make_status(StatusDomain::Upload, StatusCode::Busy)), "Busy/Upload");
    EXPECT_EQ(status_describe(make_status(StatusDomain::Upload, StatusCode::Busy, 3)), "Busy/Upload (aux=3)");
}

TEST(CoreErrors, RetryableClassification) {
    EXPECT_TRUE(status_is_retryable(make_status(StatusDomain::Transport, StatusCode::Network)));
    EXPECT_TRUE(status_is_retryable(make_status(StatusDomain::Transport, StatusCode::Throttled)));
    EXPECT_TRUE(status_is_retryable(make_status(StatusDomain::Transport, StatusCode::Unavailable)));
    EXPECT_TRUE(status_is_retryable(make_status(StatusDomain::Transport, StatusCode::Io, EIO)));

    EXPECT_FALSE(status_is_retryable(make_status(StatusDomain::Store, StatusCode::Io, EIO)));
    EXPECT_FALSE(status_is_retryable(make_status(StatusDomain::Transport, StatusCode::Rejected)));
    EXPECT_FALSE(status_is_retryable(make_status(StatusDomain::Transport, StatusCode::ChecksumMismatch)));
    EXPECT_FALSE(status_is_retryable(make_status(StatusDomain::Upload, StatusCode::NotFound)));
    EXPECT_FALSE(status_is_retryable(make_status(StatusDomain::Transport, StatusCode::PermissionDenied)));
}
