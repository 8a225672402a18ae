#include "gtest/gtest.h"

#include "justdl/detail/curl_utils.hpp"

using namespace justdl;
using justdl::detail::classifyTransfer;

TEST(ClassifyTransferTest, HttpStatus) {
    const auto not_found = classifyTransfer(CURLE_HTTP_RETURNED_ERROR, 404);
    EXPECT_EQ(not_found.kind, ErrorKind::UnresolvableSource);
    EXPECT_FALSE(not_found.retryable);
    EXPECT_EQ(not_found.message, "HTTP 404");

    const auto throttled = classifyTransfer(CURLE_OK, 429);
    EXPECT_EQ(throttled.kind, ErrorKind::Network);
    EXPECT_TRUE(throttled.retryable);

    const auto unavailable = classifyTransfer(CURLE_HTTP_RETURNED_ERROR, 503);
    EXPECT_EQ(unavailable.kind, ErrorKind::Network);
    EXPECT_TRUE(unavailable.retryable);
}

TEST(ClassifyTransferTest, TransportErrors) {
    EXPECT_TRUE(classifyTransfer(CURLE_COULDNT_CONNECT, 0).retryable);
    EXPECT_TRUE(classifyTransfer(CURLE_OPERATION_TIMEDOUT, 0).retryable);
    EXPECT_TRUE(classifyTransfer(CURLE_PARTIAL_FILE, 200).retryable);
    EXPECT_EQ(classifyTransfer(CURLE_ABORTED_BY_CALLBACK, 0).kind, ErrorKind::Cancelled);
    EXPECT_EQ(classifyTransfer(CURLE_WRITE_ERROR, 200).kind, ErrorKind::Filesystem);
    EXPECT_EQ(classifyTransfer(CURLE_UNSUPPORTED_PROTOCOL, 0).kind, ErrorKind::UnresolvableSource);
    EXPECT_FALSE(classifyTransfer(CURLE_URL_MALFORMAT, 0).retryable);
}
