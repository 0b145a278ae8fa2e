#include "Logger.hpp"
#include "HTTPRequestParser.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <regex>
#include <string>
#include <vector>

namespace {

std::vector<std::string> readLines(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

class LoggerTest : public ::testing::Test {
protected:
    std::filesystem::path dir;

    void SetUp() override {
        dir = std::filesystem::temp_directory_path() /
              ("httpmsg_logger_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }
};

} // namespace

TEST_F(LoggerTest, CreatesDirectoryAndAppendsTimestampedLines) {
    std::filesystem::path file = dir / "nested" / "log.txt";
    Logger logger("client-1", file.string());

    logger.logCustomMsg("first");
    logger.logConnectionOpened("127.0.0.1", 5555);

    auto lines = readLines(file);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_TRUE(std::regex_match(lines[0],
        std::regex(R"(\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2} \[client-1\]: first)")));
    EXPECT_NE(lines[1].find("Connection opened from 127.0.0.1:5555"), std::string::npos);
}

TEST_F(LoggerTest, LogsRequestLineAndResponseStatusLine) {
    std::filesystem::path file = dir / "log.txt";
    Logger logger("c", file.string());

    logger.logRequest(HTTPRequestParser::parse("GET /index.html HTTP/1.1\r\nHost: x\r\n\r\n"));
    logger.logResponse("HTTP/1.1 200 OK\r\nContent-Length: 0\r\n\r\n");

    auto lines = readLines(file);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_NE(lines[0].find("Request: GET /index.html HTTP/1.1"), std::string::npos);
    EXPECT_NE(lines[1].find("Response: HTTP/1.1 200 OK"), std::string::npos);
    EXPECT_EQ(lines[1].find("Content-Length"), std::string::npos);
}

TEST_F(LoggerTest, RedactsBasicCredentials) {
    std::filesystem::path file = dir / "log.txt";
    Logger logger("c", file.string());

    logger.logCustomMsg("Authorization: Basic dXNlcjpwYXNz");

    auto lines = readLines(file);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0].find("dXNlcjpwYXNz"), std::string::npos);
    EXPECT_NE(lines[0].find("[REDACTED]"), std::string::npos);
}
