#include "AuditFileSink.hpp"

#include "test_utils/TestUtils.hpp"
#include <filesystem>
#include <fstream>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <iterator>
#include <string>
#include <sys/stat.h>

using ::testing::HasSubstr;

TEST(AuditFileSink, FormatsPipeSeparatedLine)
{
    const passholder::core::AuditEvent event{ .level = passholder::core::AuditLevel::Warning,
                                              .event = "open",
                                              .outcome = "failure",
                                              .message = "master password verification failed" };
    EXPECT_EQ(passholder::ui::cli::formatAuditLine(event, "2024-01-02 03:04:05"),
              "2024-01-02 03:04:05 | WARN | event=open | outcome=failure | master password verification failed\n");
}

TEST(AuditFileSink, FlattensEmbeddedNewlines)
{
    const passholder::core::AuditEvent event{
        .level = passholder::core::AuditLevel::Info, .event = "insert", .outcome = "success", .message = "a\nb\rc"
    };
    const auto line = passholder::ui::cli::formatAuditLine(event, "ts");
    EXPECT_EQ(line, "ts | INFO | event=insert | outcome=success | a b c\n");
}

TEST(AuditFileSink, AppendsToPrivateFile)
{
    const auto dir = passholder::test_utils::makeSecureTempDir("audit_");
    ASSERT_FALSE(dir.empty());
    passholder::test_utils::TempDirGuard guard{ dir };
    const auto logPath = dir / "audit.log";

    auto sink = passholder::ui::cli::makeAuditFileSink(logPath);
    sink({ .level = passholder::core::AuditLevel::Info, .event = "open", .outcome = "success", .message = "one" });
    sink({ .level = passholder::core::AuditLevel::Error, .event = "persist", .outcome = "failure", .message = "two" });

    std::ifstream in{ logPath };
    const std::string content{ std::istreambuf_iterator<char>{ in }, std::istreambuf_iterator<char>{} };
    EXPECT_THAT(content, HasSubstr("| INFO | event=open | outcome=success | one\n"));
    EXPECT_THAT(content, HasSubstr("| ERROR | event=persist | outcome=failure | two\n"));
    EXPECT_LT(content.find("one"), content.find("two"));

    struct stat st{};
    ASSERT_EQ(::stat(logPath.c_str(), &st), 0);
    EXPECT_EQ(static_cast<unsigned>(st.st_mode) & 0777U, 0600U);
}

TEST(AuditFileSink, MissingDirectoryDropsEvents)
{
    const auto dir = passholder::test_utils::makeSecureTempDir("audit_");
    ASSERT_FALSE(dir.empty());
    passholder::test_utils::TempDirGuard guard{ dir };
    const auto logPath = dir / "absent" / "audit.log";

    auto sink = passholder::ui::cli::makeAuditFileSink(logPath);
    EXPECT_NO_THROW(sink({ .level = passholder::core::AuditLevel::Info, .event = "close", .outcome = "success" }));
    EXPECT_FALSE(std::filesystem::exists(logPath));
}
