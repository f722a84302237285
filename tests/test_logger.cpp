// ---------------------------------------------------------------------------
// test_logger.cpp
//
// StructuredLogger 단위 테스트
//
// [테스트 범위]
// - to_json: policy_validated / policy_load_failed 필드
// - JSON 문자열 이스케이프
// - log_validation: accepted → info, rejected → warn (min_level 필터)
// - log_load_failure 파일 기록
// - 이동 생성 / 소멸 시 레지스트리 정리
// - parse_log_level
// ---------------------------------------------------------------------------

#include "logger/log_types.hpp"
#include "logger/structured_logger.hpp"

#include <cctype>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// Helper: JSON 라인에서 최상위 필드 값 추출 (단순 구현)
// ---------------------------------------------------------------------------
class JsonLineParser {
public:
    explicit JsonLineParser(const std::string& json_str)
        : parsed_(json_str) {}

    bool has_field(const std::string& field) const {
        return parsed_.find("\"" + field + "\":") != std::string::npos;
    }

    std::string get_field(const std::string& field) const {
        const std::string search_key = "\"" + field + "\":";
        std::size_t       pos        = parsed_.find(search_key);
        if (pos == std::string::npos) {
            return "";
        }
        pos += search_key.length();

        std::ostringstream oss;
        if (pos < parsed_.size() && parsed_[pos] == '"') {
            // 문자열 값 (이스케이프 해제)
            ++pos;
            while (pos < parsed_.size() && parsed_[pos] != '"') {
                if (parsed_[pos] == '\\' && pos + 1 < parsed_.size()) {
                    ++pos;
                }
                oss << parsed_[pos];
                ++pos;
            }
        } else {
            // 숫자 / bool
            while (pos < parsed_.size() &&
                   (std::isalnum(static_cast<unsigned char>(parsed_[pos])) || parsed_[pos] == '-' ||
                    parsed_[pos] == '.')) {
                oss << parsed_[pos];
                ++pos;
            }
        }
        return oss.str();
    }

private:
    std::string parsed_;
};

// ---------------------------------------------------------------------------
// Fixture: 임시 로그 파일
// ---------------------------------------------------------------------------
class StructuredLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        const std::string unique_name =
            std::string(info->test_suite_name()) + "_" + info->name();
        log_dir_  = fs::temp_directory_path() / "polguard_test_logs" / unique_name;
        log_file_ = log_dir_ / "test.log";
        fs::create_directories(log_dir_);
    }

    void TearDown() override {
        fs::remove_all(log_dir_);
    }

    std::vector<std::string> read_log_lines() const {
        std::vector<std::string> lines;
        std::ifstream            file(log_file_);
        if (!file.is_open()) {
            return lines;
        }

        std::string line;
        while (std::getline(file, line)) {
            // 타임스탬프 접두사 제거, JSON 부분만 보관
            const std::size_t json_start = line.find('{');
            if (json_start != std::string::npos) {
                lines.push_back(line.substr(json_start));
            }
        }
        return lines;
    }

    static ValidationLog rejected_entry() {
        ValidationLog entry;
        entry.source    = "policies/bad.yaml";
        entry.policy    = "bad-anchor";
        entry.rules     = 2;
        entry.accepted  = false;
        entry.errors    = {ValidationError{
            .code    = ValidationErrorCode::kAnchorNotOnArray,
            .message = "existing anchor at /spec/containers/^(name) must be of type array, found: string",
            .path    = "/spec/containers/",
            .rule    = "check-containers",
        }};
        entry.timestamp = std::chrono::system_clock::now();
        entry.duration  = std::chrono::microseconds(250);
        return entry;
    }

    fs::path log_dir_;
    fs::path log_file_;
};

// ---------------------------------------------------------------------------
// 1. JSON 직렬화
// ---------------------------------------------------------------------------
TEST_F(StructuredLoggerTest, ValidationLogJsonFields) {
    const std::string json = StructuredLogger::to_json(rejected_entry());

    JsonLineParser parser(json);
    EXPECT_EQ(parser.get_field("event"), "policy_validated");
    EXPECT_EQ(parser.get_field("source"), "policies/bad.yaml");
    EXPECT_EQ(parser.get_field("policy"), "bad-anchor");
    EXPECT_EQ(parser.get_field("rules"), "2");
    EXPECT_EQ(parser.get_field("accepted"), "false");
    EXPECT_EQ(parser.get_field("code"), "AnchorNotOnArray");
    EXPECT_EQ(parser.get_field("rule"), "check-containers");
    EXPECT_EQ(parser.get_field("path"), "/spec/containers/");
    EXPECT_EQ(parser.get_field("duration_us"), "250");
    EXPECT_TRUE(parser.has_field("timestamp"));

    EXPECT_EQ(json.front(), '{');
    EXPECT_EQ(json.back(), '}');
}

TEST_F(StructuredLoggerTest, AcceptedLog_HasEmptyErrorArray) {
    ValidationLog entry;
    entry.source   = "ok.yaml";
    entry.policy   = "ok";
    entry.rules    = 1;
    entry.accepted = true;

    const std::string json = StructuredLogger::to_json(entry);
    EXPECT_NE(json.find(R"("accepted":true,"errors":[])"), std::string::npos) << json;
}

TEST_F(StructuredLoggerTest, TimestampIsIso8601Utc) {
    ValidationLog entry;
    entry.timestamp = std::chrono::system_clock::time_point{std::chrono::milliseconds(1'700'000'000'123)};

    JsonLineParser parser(StructuredLogger::to_json(entry));
    EXPECT_EQ(parser.get_field("timestamp"), "2023-11-14T22:13:20.123Z");
}

TEST_F(StructuredLoggerTest, JsonStringsAreEscaped) {
    LoadFailureLog entry;
    entry.source = "dir\\policy \"x\".yaml";
    entry.reason = "line1\nline2\ttab";

    const std::string json = StructuredLogger::to_json(entry);
    EXPECT_NE(json.find(R"("source":"dir\\policy \"x\".yaml")"), std::string::npos) << json;
    EXPECT_NE(json.find(R"("reason":"line1\nline2\ttab")"), std::string::npos) << json;
    EXPECT_EQ(json.find('\n'), std::string::npos);
}

// ---------------------------------------------------------------------------
// 2. 파일 기록 / 레벨 필터
// ---------------------------------------------------------------------------
TEST_F(StructuredLoggerTest, RejectedValidation_WrittenToFile) {
    {
        StructuredLogger logger(LogLevel::kInfo, log_file_);
        logger.log_validation(rejected_entry());
    }

    const auto lines = read_log_lines();
    ASSERT_EQ(lines.size(), 1u);
    JsonLineParser parser(lines[0]);
    EXPECT_EQ(parser.get_field("event"), "policy_validated");
    EXPECT_EQ(parser.get_field("policy"), "bad-anchor");
}

TEST_F(StructuredLoggerTest, WarnLevel_FiltersAcceptedButKeepsRejected) {
    {
        StructuredLogger logger(LogLevel::kWarn, log_file_);

        ValidationLog accepted;
        accepted.policy   = "fine";
        accepted.accepted = true;
        logger.log_validation(accepted);
        logger.log_validation(rejected_entry());
        logger.info("diagnostic that should be filtered");
    }

    const auto lines = read_log_lines();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(JsonLineParser(lines[0]).get_field("policy"), "bad-anchor");
}

TEST_F(StructuredLoggerTest, LoadFailure_WrittenToFile) {
    {
        StructuredLogger logger(LogLevel::kError, log_file_);

        LoadFailureLog entry;
        entry.source    = "missing.yaml";
        entry.reason    = "policy_loader: cannot resolve policy path 'missing.yaml'";
        entry.timestamp = std::chrono::system_clock::now();
        logger.log_load_failure(entry);
    }

    const auto lines = read_log_lines();
    ASSERT_EQ(lines.size(), 1u);
    JsonLineParser parser(lines[0]);
    EXPECT_EQ(parser.get_field("event"), "policy_load_failed");
    EXPECT_EQ(parser.get_field("source"), "missing.yaml");
}

TEST_F(StructuredLoggerTest, LoggerCanBeRecreatedAfterDestruction) {
    { StructuredLogger first(LogLevel::kInfo, log_file_); }
    EXPECT_NO_THROW({ StructuredLogger second(LogLevel::kInfo, log_file_); });
}

// 레지스트리 이름이 하나뿐이므로 이동 대입은 막혀 있다
static_assert(!std::is_move_assignable_v<StructuredLogger>);
static_assert(std::is_move_constructible_v<StructuredLogger>);

TEST_F(StructuredLoggerTest, MoveConstruction_TransfersRegistryEntry) {
    {
        StructuredLogger first(LogLevel::kInfo, log_file_);
        StructuredLogger moved(std::move(first));
        moved.log_validation(rejected_entry());
    }  // moved 가 drop, first 는 이동된 상태라 아무것도 하지 않음

    const auto lines = read_log_lines();
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(JsonLineParser(lines[0]).get_field("policy"), "bad-anchor");

    EXPECT_NO_THROW({ StructuredLogger again(LogLevel::kInfo, log_file_); });
}

TEST_F(StructuredLoggerTest, DestructionAfterExternalDrop_DoesNotThrow) {
    EXPECT_NO_THROW({
        StructuredLogger logger(LogLevel::kInfo, log_file_);
        spdlog::drop(std::string{StructuredLogger::kLoggerName});
    });
    EXPECT_NO_THROW({ StructuredLogger again(LogLevel::kInfo, log_file_); });
}

// ---------------------------------------------------------------------------
// 3. parse_log_level
// ---------------------------------------------------------------------------
TEST(LogLevelParse, KnownNames) {
    EXPECT_EQ(parse_log_level("debug"), LogLevel::kDebug);
    EXPECT_EQ(parse_log_level("INFO"), LogLevel::kInfo);
    EXPECT_EQ(parse_log_level("warn"), LogLevel::kWarn);
    EXPECT_EQ(parse_log_level("warning"), LogLevel::kWarn);
    EXPECT_EQ(parse_log_level("Error"), LogLevel::kError);
}

TEST(LogLevelParse, UnknownName_Nullopt) {
    EXPECT_FALSE(parse_log_level("verbose").has_value());
    EXPECT_FALSE(parse_log_level("").has_value());
}
