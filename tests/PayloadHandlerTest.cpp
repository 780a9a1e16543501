#include <gtest/gtest.h>

#include <filesystem>
#include <sstream>
#include <string>

#include "PayloadHandler.hpp"
#include "TestSupport.hpp"

using Protocol::TransferRequest;


class PayloadHandlerTest : public ::testing::Test {
protected:
    TempDir downloads;
    std::istringstream input;
    std::ostringstream output;
    MemoryStream control;
    MemoryStream data;

    TransferResult run(const TransferRequest& request) {
        PayloadHandler handler(input, output, downloads.path());
        return handler.handle(request, control, data);
    }
};


TEST_F(PayloadHandlerTest, PrintsDirectoryListing) {
    data.chunks = {"a.txt\nb.txt\n"};

    EXPECT_EQ(run(TransferRequest::list(50000)), TransferResult::LISTED);
    EXPECT_EQ(output.str(), "Directory contents:\na.txt\nb.txt\n");
    EXPECT_EQ(data.read_calls, 1);
    EXPECT_EQ(control.read_calls, 0);
}

TEST_F(PayloadHandlerTest, ListingReadsASingleMessage) {
    data.chunks = {"first\n", "second\n"};

    EXPECT_EQ(run(TransferRequest::list(50000)), TransferResult::LISTED);
    EXPECT_EQ(output.str(), "Directory contents:\nfirst\n");
    EXPECT_EQ(data.read_calls, 1);
}

TEST_F(PayloadHandlerTest, ListingReceiveFailure) {
    data.fail_at_end = true;

    TransferResult result = run(TransferRequest::list(50000));
    EXPECT_EQ(result, TransferResult::RECEIVE_FAILED);
    EXPECT_TRUE(PayloadHandler::isFailure(result));
}

TEST_F(PayloadHandlerTest, GetWritesFileWithoutConflict) {
    control.chunks = {"SENDING"};
    data.chunks = {"1,2,3\n"};

    EXPECT_EQ(run(TransferRequest::get("report.csv", 50000)), TransferResult::SAVED);
    EXPECT_EQ(downloads.readFile("report.csv"), "1,2,3\n");
    EXPECT_NE(output.str().find("Transfer complete: report.csv"), std::string::npos);
    EXPECT_EQ(output.str().find("Overwrite?"), std::string::npos);
}

TEST_F(PayloadHandlerTest, GetStreamsUntilPeerCloses) {
    std::string payload;
    for (int i = 0; i < 5000; ++i)
        payload.push_back(static_cast<char>(i % 256));
    control.chunks = {"SENDING"};
    data.chunks = {payload.substr(0, 3000), payload.substr(3000)};

    EXPECT_EQ(run(TransferRequest::get("blob.bin", 50000)), TransferResult::SAVED);
    EXPECT_EQ(downloads.readFile("blob.bin"), payload);
    EXPECT_GE(data.read_calls, 6);  // 1024-byte reads plus the EOF read
}

TEST_F(PayloadHandlerTest, GetEmptyStatusMeansNoError) {
    data.chunks = {"abc"};

    EXPECT_EQ(run(TransferRequest::get("empty-status.txt", 50000)), TransferResult::SAVED);
    EXPECT_EQ(downloads.readFile("empty-status.txt"), "abc");
}

TEST_F(PayloadHandlerTest, GetDeferredServerError) {
    control.chunks = {"ERROR: missing.txt not found."};
    data.chunks = {"should not be read"};

    EXPECT_EQ(run(TransferRequest::get("missing.txt", 50000)), TransferResult::SERVER_ERROR);
    EXPECT_EQ(output.str(), "Message from server: ERROR: missing.txt not found.\n");
    EXPECT_FALSE(std::filesystem::exists(downloads.path() / "missing.txt"));
    EXPECT_EQ(data.read_calls, 0);
    EXPECT_TRUE(control.closed);
    EXPECT_TRUE(data.closed);
}

TEST_F(PayloadHandlerTest, GetStatusReceiveFailure) {
    control.fail_at_end = true;

    EXPECT_EQ(run(TransferRequest::get("report.csv", 50000)), TransferResult::RECEIVE_FAILED);
    EXPECT_FALSE(std::filesystem::exists(downloads.path() / "report.csv"));
}

TEST_F(PayloadHandlerTest, GetDeclinedOverwriteKeepsLocalFile) {
    downloads.writeFile("report.csv", "old contents");
    input.str("n\n");
    control.chunks = {"SENDING"};
    data.chunks = {"new contents"};

    EXPECT_EQ(run(TransferRequest::get("report.csv", 50000)), TransferResult::ABORTED);
    EXPECT_EQ(downloads.readFile("report.csv"), "old contents");
    EXPECT_NE(output.str().find("report.csv already exists. Overwrite? N = no, anything else = yes"),
              std::string::npos);
    EXPECT_NE(output.str().find("Transfer aborted."), std::string::npos);
    EXPECT_EQ(data.read_calls, 0);
}

TEST_F(PayloadHandlerTest, GetUppercaseNDeclines) {
    downloads.writeFile("report.csv", "old contents");
    input.str("N\n");
    control.chunks = {"SENDING"};
    data.chunks = {"new contents"};

    EXPECT_EQ(run(TransferRequest::get("report.csv", 50000)), TransferResult::ABORTED);
    EXPECT_EQ(downloads.readFile("report.csv"), "old contents");
}

TEST_F(PayloadHandlerTest, GetEmptyAnswerOverwrites) {
    downloads.writeFile("report.csv", "old contents that are longer");
    input.str("\n");
    control.chunks = {"SENDING"};
    data.chunks = {"new"};

    EXPECT_EQ(run(TransferRequest::get("report.csv", 50000)), TransferResult::SAVED);
    EXPECT_EQ(downloads.readFile("report.csv"), "new");
}

TEST_F(PayloadHandlerTest, GetOtherAnswerOverwrites) {
    downloads.writeFile("report.csv", "old");
    input.str("no\n");
    control.chunks = {"SENDING"};
    data.chunks = {"new"};

    EXPECT_EQ(run(TransferRequest::get("report.csv", 50000)), TransferResult::SAVED);
    EXPECT_EQ(downloads.readFile("report.csv"), "new");
}

TEST_F(PayloadHandlerTest, GetClosedInputOverwrites) {
    downloads.writeFile("report.csv", "old");
    control.chunks = {"SENDING"};
    data.chunks = {"new"};

    EXPECT_EQ(run(TransferRequest::get("report.csv", 50000)), TransferResult::SAVED);
    EXPECT_EQ(downloads.readFile("report.csv"), "new");
}

TEST_F(PayloadHandlerTest, GetUnwritableTargetFails) {
    control.chunks = {"SENDING"};
    data.chunks = {"payload"};

    TransferResult result = run(TransferRequest::get("no-such-dir/report.csv", 50000));
    EXPECT_EQ(result, TransferResult::WRITE_FAILED);
    EXPECT_TRUE(PayloadHandler::isFailure(result));
    EXPECT_FALSE(std::filesystem::exists(downloads.path() / "no-such-dir"));
}

TEST_F(PayloadHandlerTest, GetDirectoryWithSameNameIsNotAnOverwrite) {
    std::filesystem::create_directory(downloads.path() / "reports");
    input.str("y\n");
    control.chunks = {"SENDING"};
    data.chunks = {"payload"};

    EXPECT_EQ(run(TransferRequest::get("reports", 50000)), TransferResult::WRITE_FAILED);
    EXPECT_EQ(output.str().find("Overwrite?"), std::string::npos);
    EXPECT_TRUE(std::filesystem::is_directory(downloads.path() / "reports"));
}

TEST_F(PayloadHandlerTest, GetDataFailureRemovesPartialFile) {
    control.chunks = {"SENDING"};
    data.chunks = {"partial"};
    data.fail_at_end = true;

    EXPECT_EQ(run(TransferRequest::get("report.csv", 50000)), TransferResult::RECEIVE_FAILED);
    EXPECT_FALSE(std::filesystem::exists(downloads.path() / "report.csv"));
}

TEST_F(PayloadHandlerTest, UnknownCommandConsumesNothing) {
    data.chunks = {"ignored"};

    EXPECT_EQ(run(TransferRequest::unknown(50000)), TransferResult::IGNORED);
    EXPECT_EQ(data.read_calls, 0);
    EXPECT_EQ(control.read_calls, 0);
    EXPECT_TRUE(output.str().empty());
}

TEST(PayloadHandlerResultTest, ResultNames) {
    EXPECT_EQ(PayloadHandler::resultName(TransferResult::SAVED), "SAVED");
    EXPECT_EQ(PayloadHandler::resultName(TransferResult::ABORTED), "ABORTED");
    EXPECT_FALSE(PayloadHandler::isFailure(TransferResult::ABORTED));
    EXPECT_FALSE(PayloadHandler::isFailure(TransferResult::SERVER_ERROR));
}
