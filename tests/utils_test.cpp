#include "sandkeep/utils/id_utils.hpp"
#include "sandkeep/utils/mime_types.hpp"
#include "sandkeep/utils/process_runner.hpp"
#include "sandkeep/utils/string_utils.hpp"

#include <gtest/gtest.h>

#include <set>
#include <stdexcept>
#include <string>

using namespace sandkeep::utils;

// ============================================================================
// StringUtils
// ============================================================================

TEST(string_utils, trim_and_case) {
    EXPECT_EQ(StringUtils::Trim("  abc \n\t"), "abc");
    EXPECT_EQ(StringUtils::Trim(" \t "), "");
    EXPECT_EQ(StringUtils::ToLower("PyThOn3"), "python3");
}

TEST(string_utils, split_drops_empty_tokens) {
    auto parts = StringUtils::Split("a,,b,c,", ',');
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(parts[0], "a");
    EXPECT_EQ(parts[2], "c");
    EXPECT_EQ(StringUtils::Join(parts, "/"), "a/b/c");
}

TEST(string_utils, base64_known_vectors) {
    EXPECT_EQ(StringUtils::ToBase64(""), "");
    EXPECT_EQ(StringUtils::ToBase64("f"), "Zg==");
    EXPECT_EQ(StringUtils::ToBase64("foobar"), "Zm9vYmFy");
    EXPECT_EQ(StringUtils::FromBase64("Zm9vYg=="), "foob");
    EXPECT_EQ(StringUtils::FromBase64("Zm9v\nYmFy"), "foobar");
}

TEST(string_utils, base64_binary_bytes_survive) {
    std::string bytes;
    for (int i = 0; i < 256; ++i) {
        bytes.push_back(static_cast<char>(i));
    }
    EXPECT_EQ(StringUtils::FromBase64(StringUtils::ToBase64(bytes)), bytes);
}

TEST(string_utils, base64_rejects_garbage) {
    EXPECT_THROW(StringUtils::FromBase64("abc"), std::invalid_argument);
    EXPECT_THROW(StringUtils::FromBase64("a*c!"), std::invalid_argument);
}

TEST(string_utils, truncate) {
    EXPECT_EQ(StringUtils::Truncate("abcdef", 10), "abcdef");
    EXPECT_EQ(StringUtils::Truncate("abcdefghij", 6), "abc...");
    EXPECT_EQ(StringUtils::Truncate("abcdefghij", 4, ""), "abcd");
}

// ============================================================================
// IdUtils
// ============================================================================

TEST(id_utils, generated_ids_have_external_shape) {
    std::set<std::string> seen;
    for (int i = 0; i < 200; ++i) {
        auto id = IdUtils::GenerateId();
        EXPECT_EQ(id.size(), kExternalIdLength);
        EXPECT_TRUE(IdUtils::IsExternalId(id)) << id;
        seen.insert(id);
    }
    EXPECT_EQ(seen.size(), 200u);
}

TEST(id_utils, external_id_shape) {
    EXPECT_FALSE(IdUtils::IsExternalId(""));
    EXPECT_FALSE(IdUtils::IsExternalId("short"));
    EXPECT_FALSE(IdUtils::IsExternalId("aaaaaaaaaaaaaaaaaaaa/"));
    EXPECT_TRUE(IdUtils::IsExternalId("V1StGXR8_Z5jdHi6B-myT"));
}

TEST(id_utils, sanitize_id_keeps_safe_characters) {
    EXPECT_EQ(IdUtils::SanitizeId("user-42_chat"), "user-42_chat");
    EXPECT_EQ(IdUtils::SanitizeId("../../etc/passwd"), "etcpasswd");
    EXPECT_EQ(IdUtils::SanitizeId("a b;c"), "abc");
    EXPECT_EQ(IdUtils::SanitizeId("/;."), "");
}

TEST(id_utils, sanitize_file_name_strips_directories) {
    EXPECT_EQ(IdUtils::SanitizeFileName("data.csv"), "data.csv");
    EXPECT_EQ(IdUtils::SanitizeFileName("../../secret.txt"), "secret.txt");
    EXPECT_EQ(IdUtils::SanitizeFileName("C:\\Users\\me\\report.pdf"), "report.pdf");
    EXPECT_EQ(IdUtils::SanitizeFileName(".hidden"), "hidden");
    EXPECT_EQ(IdUtils::SanitizeFileName(".."), "");
    EXPECT_EQ(IdUtils::SanitizeFileName("dir/"), "");
}

// ============================================================================
// MimeTypes
// ============================================================================

TEST(mime_types, guesses_by_extension) {
    EXPECT_EQ(MimeTypes::Guess("plot.PNG"), "image/png");
    EXPECT_EQ(MimeTypes::Guess("out/report.pdf"), "application/pdf");
    EXPECT_EQ(MimeTypes::Guess("table.csv"), "text/csv; charset=utf-8");
    EXPECT_EQ(MimeTypes::Guess("blob"), "application/octet-stream");
    EXPECT_EQ(MimeTypes::Guess("weird.xyz"), "application/octet-stream");
}

TEST(mime_types, inline_types) {
    EXPECT_TRUE(MimeTypes::IsInline("image/png"));
    EXPECT_TRUE(MimeTypes::IsInline("application/pdf"));
    EXPECT_FALSE(MimeTypes::IsInline("text/csv; charset=utf-8"));
    EXPECT_FALSE(MimeTypes::IsInline("application/zip"));
}

// ============================================================================
// ProcessRunner
// ============================================================================

TEST(process_runner, captures_output_and_exit_code) {
    auto result = ProcessRunner::Run({"/bin/sh", "-c", "echo out; echo err >&2; exit 3"});
    EXPECT_EQ(result.exit_code, 3);
    EXPECT_EQ(result.stdout_output, "out\n");
    EXPECT_EQ(result.stderr_output, "err\n");
    EXPECT_FALSE(result.timed_out);
}

TEST(process_runner, feeds_stdin) {
    ProcessOptions options;
    options.stdin_data = "hello sandbox";
    auto result = ProcessRunner::Run({"/bin/cat"}, options);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.stdout_output, "hello sandbox");
}

TEST(process_runner, deadline_kills_the_child) {
    ProcessOptions options;
    options.timeout = std::chrono::milliseconds(100);
    options.kill_grace = std::chrono::milliseconds(100);
    auto result = ProcessRunner::Run({"/bin/sh", "-c", "exec sleep 5"}, options);
    EXPECT_TRUE(result.timed_out);
    EXPECT_LT(result.duration, std::chrono::milliseconds(3000));
}

TEST(process_runner, output_cap) {
    ProcessOptions options;
    options.max_output_bytes = 10;
    auto result = ProcessRunner::Run({"/bin/sh", "-c", "printf '%0100d' 0"}, options);
    EXPECT_EQ(result.stdout_output.size(), 10u);
    EXPECT_TRUE(result.output_truncated);
}
