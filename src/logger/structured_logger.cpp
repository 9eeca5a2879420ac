// ---------------------------------------------------------------------------
// structured_logger.cpp
//
// spdlog 기반 구조화 JSON 로거 구현.
// ---------------------------------------------------------------------------

#include "logger/structured_logger.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/common.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

namespace {

// ---------------------------------------------------------------------------
// Helper: ISO8601 timestamp 포맷
// ---------------------------------------------------------------------------
std::string format_iso8601(const std::chrono::system_clock::time_point& tp) {
    const auto duration = tp.time_since_epoch();
    const auto seconds  = std::chrono::duration_cast<std::chrono::seconds>(duration);
    const auto millis   = std::chrono::duration_cast<std::chrono::milliseconds>(duration) - seconds;

    const std::time_t time_t_val = std::chrono::system_clock::to_time_t(tp);
    std::tm           tm_val{};
    gmtime_r(&time_t_val, &tm_val);

    std::ostringstream oss;
    oss << std::put_time(&tm_val, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << millis.count() << 'Z';
    return oss.str();
}

// ---------------------------------------------------------------------------
// Helper: JSON 문자열 이스케이프 (기본적인 구현)
// describe() 출력은 여러 줄이므로 '\n' 이스케이프가 필수이다.
// ---------------------------------------------------------------------------
std::string escape_json_string(const std::string& str) {
    std::string result;
    result.reserve(str.size() + 16);

    for (unsigned char ch : str) {
        switch (ch) {
            case '"':
                result += "\\\"";
                break;
            case '\\':
                result += "\\\\";
                break;
            case '\b':
                result += "\\b";
                break;
            case '\f':
                result += "\\f";
                break;
            case '\n':
                result += "\\n";
                break;
            case '\r':
                result += "\\r";
                break;
            case '\t':
                result += "\\t";
                break;
            default:
                if (ch < 0x20) {
                    char buf[8]{};
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned int>(ch));
                    result += buf;
                } else {
                    result += static_cast<char>(ch);
                }
                break;
        }
    }

    return result;
}

const char* json_bool(bool value) {
    return value ? "true" : "false";
}

spdlog::level::level_enum to_spdlog_level(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug:
            return spdlog::level::debug;
        case LogLevel::kInfo:
            return spdlog::level::info;
        case LogLevel::kWarn:
            return spdlog::level::warn;
        case LogLevel::kError:
            return spdlog::level::err;
        default:
            return spdlog::level::info;
    }
}

}  // namespace

std::optional<LogLevel> parse_log_level(std::string_view level) {
    if (level == "debug") {
        return LogLevel::kDebug;
    }
    if (level == "info") {
        return LogLevel::kInfo;
    }
    if (level == "warn") {
        return LogLevel::kWarn;
    }
    if (level == "error") {
        return LogLevel::kError;
    }
    return std::nullopt;
}

void set_global_log_level(LogLevel level) {
    spdlog::set_level(to_spdlog_level(level));
}

// ---------------------------------------------------------------------------
// StructuredLogger 생성자
// ---------------------------------------------------------------------------
StructuredLogger::StructuredLogger(LogLevel min_level, const std::filesystem::path& log_path)
    : min_level_(min_level)
    , log_path_(log_path)
{
    try {
        if (log_path_.has_parent_path()) {
            std::filesystem::create_directories(log_path_.parent_path());
        }

        // 싱크 생성: stdout + rotating file
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_sink_mt>());

        // Rotating file sink (10MB, 3개 파일 유지)
        const std::size_t max_file_size = 10 * 1024 * 1024;
        const std::size_t max_files     = 3;
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_path_.string(), max_file_size, max_files));

        logger_ = std::make_shared<spdlog::logger>("equivpolicy", sinks.begin(), sinks.end());
        logger_->set_level(to_spdlog_level(min_level));

        // 구조화 로그는 각 메서드에서 JSON 으로 생성하므로 패턴은 타임스탬프만
        logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] %v");
        logger_->flush_on(spdlog::level::trace);

    } catch (const spdlog::spdlog_ex& ex) {
        throw std::runtime_error(std::string("Logger initialization failed: ") + ex.what());
    } catch (const std::filesystem::filesystem_error& ex) {
        throw std::runtime_error(std::string("Logger initialization failed: ") + ex.what());
    }
}

StructuredLogger::~StructuredLogger() = default;

// ---------------------------------------------------------------------------
// log_policy: JSON 직렬화
// ---------------------------------------------------------------------------
void StructuredLogger::log_policy(const PolicyLog& entry) {
    if (!logger_ || !enabled(LogLevel::kInfo)) {
        return;
    }

    std::ostringstream json;
    json << R"({"event":"policy_snapshot","source":")" << escape_json_string(entry.source)
         << R"(","is_recursive":)" << json_bool(entry.is_recursive)
         << R"(,"allow_infinite_recursion":)" << json_bool(entry.allow_infinite_recursion)
         << R"(,"ignore_cyclic_references":)" << json_bool(entry.ignore_cyclic_references)
         << R"(,"enums_by_name":)" << json_bool(entry.enums_by_name)
         << R"(,"use_runtime_typing":)" << json_bool(entry.use_runtime_typing)
         << R"(,"include_properties":)" << json_bool(entry.include_properties)
         << R"(,"selection_rules":)" << entry.selection_rules
         << R"(,"matching_rules":)" << entry.matching_rules
         << R"(,"ordering_rules":)" << entry.ordering_rules
         << R"(,"user_steps":)" << entry.user_steps
         << R"(,"description":")" << escape_json_string(entry.description)
         << R"(","timestamp":")" << format_iso8601(entry.timestamp) << R"("})";

    logger_->info(json.str());
}

// ---------------------------------------------------------------------------
// log_step: JSON 직렬화
// ---------------------------------------------------------------------------
void StructuredLogger::log_step(const StepLog& entry) {
    if (!logger_ || !enabled(LogLevel::kDebug)) {
        return;
    }

    std::ostringstream json;
    json << R"({"event":"equivalency_step","member_path":")" << escape_json_string(entry.member_path)
         << R"(","step":")" << escape_json_string(entry.step)
         << R"(","outcome_raw":)" << static_cast<int>(entry.outcome_raw)
         << R"(,"reason":")" << escape_json_string(entry.reason)
         << R"(","timestamp":")" << format_iso8601(entry.timestamp) << R"("})";

    logger_->debug(json.str());
}

// ---------------------------------------------------------------------------
// log_error: JSON 직렬화
// ---------------------------------------------------------------------------
void StructuredLogger::log_error(const ErrorLog& entry) {
    if (!logger_ || !enabled(LogLevel::kWarn)) {
        return;
    }

    std::ostringstream json;
    json << R"({"event":"comparison_error","code_raw":)" << static_cast<int>(entry.code_raw)
         << R"(,"path":")" << escape_json_string(entry.path)
         << R"(","message":")" << escape_json_string(entry.message)
         << R"(","timestamp":")" << format_iso8601(entry.timestamp) << R"("})";

    logger_->warn(json.str());
}

// ---------------------------------------------------------------------------
// 내부 진단용 spdlog 래퍼
// ---------------------------------------------------------------------------
void StructuredLogger::debug(std::string_view msg) {
    if (logger_) {
        logger_->debug(msg);
    }
}

void StructuredLogger::info(std::string_view msg) {
    if (logger_) {
        logger_->info(msg);
    }
}

void StructuredLogger::warn(std::string_view msg) {
    if (logger_) {
        logger_->warn(msg);
    }
}

void StructuredLogger::error(std::string_view msg) {
    if (logger_) {
        logger_->error(msg);
    }
}
