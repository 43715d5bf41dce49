// ---------------------------------------------------------------------------
// structured_logger.cpp
//
// spdlog 기반 구조화 JSON 로거 구현.
// ---------------------------------------------------------------------------

#include "logger/structured_logger.hpp"

#include <chrono>
#include <ctime>
#include <iterator>
#include <stdexcept>
#include <vector>

#include <fmt/chrono.h>
#include <fmt/format.h>
#include <spdlog/common.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

namespace {

constexpr const char* kLoggerName = "mapperscan";

// ---------------------------------------------------------------------------
// Helper: ISO8601 UTC timestamp (밀리초)
// ---------------------------------------------------------------------------
std::string format_iso8601(const std::chrono::system_clock::time_point& tp) {
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        tp.time_since_epoch()).count() % 1000;

    const std::time_t seconds = std::chrono::system_clock::to_time_t(tp);
    std::tm           utc{};
    gmtime_r(&seconds, &utc);

    return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:03}Z", utc, ms);
}

// ---------------------------------------------------------------------------
// Helper: JSON 문자열 값 기록 (따옴표 포함)
// ---------------------------------------------------------------------------
void append_json_string(fmt::memory_buffer& out, std::string_view str) {
    auto it = std::back_inserter(out);
    *it++ = '"';
    for (const unsigned char ch : str) {
        switch (ch) {
            case '"':  fmt::format_to(it, "\\\""); break;
            case '\\': fmt::format_to(it, "\\\\"); break;
            case '\n': fmt::format_to(it, "\\n"); break;
            case '\r': fmt::format_to(it, "\\r"); break;
            case '\t': fmt::format_to(it, "\\t"); break;
            default:
                if (ch < 0x20) {
                    fmt::format_to(it, "\\u{:04x}", static_cast<unsigned int>(ch));
                } else {
                    *it++ = static_cast<char>(ch);
                }
                break;
        }
    }
    *it++ = '"';
}

// "key":"value"
void append_field(fmt::memory_buffer& out, std::string_view key, std::string_view value) {
    fmt::format_to(std::back_inserter(out), ",\"{}\":", key);
    append_json_string(out, value);
}

}  // namespace

// ---------------------------------------------------------------------------
// Helper: spdlog 로그 레벨 변환
// ---------------------------------------------------------------------------
int StructuredLogger::to_spdlog_level(LogLevel level) const {
    switch (level) {
        case LogLevel::kDebug:
            return static_cast<int>(spdlog::level::debug);
        case LogLevel::kInfo:
            return static_cast<int>(spdlog::level::info);
        case LogLevel::kWarn:
            return static_cast<int>(spdlog::level::warn);
        case LogLevel::kError:
            return static_cast<int>(spdlog::level::err);
        default:
            return static_cast<int>(spdlog::level::info);
    }
}

// ---------------------------------------------------------------------------
// StructuredLogger 생성자
// ---------------------------------------------------------------------------
StructuredLogger::StructuredLogger(LogLevel min_level, const std::filesystem::path& log_path)
    : min_level_(min_level)
    , log_path_(log_path)
{
    try {
        // 로그 디렉터리 생성
        if (log_path_.has_parent_path()) {
            std::filesystem::create_directories(log_path_.parent_path());
        }

        // 싱크 생성: stdout + rotating file
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_sink_mt>());

        // Rotating file sink (100MB, 3개 파일 유지)
        const std::size_t max_file_size = 100 * 1024 * 1024;
        const std::size_t max_files     = 3;
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_path_.string(), max_file_size, max_files));

        logger_ = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
        logger_->set_level(static_cast<spdlog::level::level_enum>(to_spdlog_level(min_level)));

        // 기본 패턴: 타임스탬프만 (구조화 로그는 각 메서드에서 JSON으로 생성)
        logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] %v");
        logger_->flush_on(spdlog::level::trace);

        spdlog::register_logger(logger_);

    } catch (const spdlog::spdlog_ex& ex) {
        throw std::runtime_error(std::string("Logger initialization failed: ") + ex.what());
    } catch (const std::filesystem::filesystem_error& ex) {
        throw std::runtime_error(std::string("Logger initialization failed: ") + ex.what());
    }
}

StructuredLogger::~StructuredLogger() {
    if (logger_) {
        spdlog::drop(kLoggerName);
    }
}

// ---------------------------------------------------------------------------
// log_parse: JSON 직렬화
// ---------------------------------------------------------------------------
void StructuredLogger::log_parse(const ParseLog& entry) {
    const LogLevel level = entry.ok ? LogLevel::kInfo : LogLevel::kError;
    if (!logger_ || static_cast<int>(min_level_) > static_cast<int>(level)) {
        return;
    }

    fmt::memory_buffer json;
    auto               out = std::back_inserter(json);
    fmt::format_to(out, R"({{"event":"parse")");
    append_field(json, "file", entry.file);
    fmt::format_to(out, R"(,"ok":{},"statements":{},"placeholders":{})",
                   entry.ok, entry.statements, entry.placeholders);

    if (!entry.ok) {
        fmt::format_to(out, R"(,"error_code_raw":{})", static_cast<int>(entry.error_code_raw));
        append_field(json, "error_message", entry.error_message);
        fmt::format_to(out, R"(,"line":{})", entry.line);
    }

    append_field(json, "timestamp", format_iso8601(entry.timestamp));
    fmt::format_to(out, R"(,"duration_us":{}}})", entry.duration.count());

    if (entry.ok) {
        logger_->info(fmt::to_string(json));
    } else {
        logger_->error(fmt::to_string(json));
    }
}

// ---------------------------------------------------------------------------
// log_finding: JSON 직렬화
// ---------------------------------------------------------------------------
void StructuredLogger::log_finding(const FindingLog& entry) {
    if (!logger_ || static_cast<int>(min_level_) > static_cast<int>(LogLevel::kWarn)) {
        return;
    }

    fmt::memory_buffer json;
    fmt::format_to(std::back_inserter(json), R"({{"event":"substitution")");
    append_field(json, "file", entry.file);
    append_field(json, "namespace", entry.namespace_id);
    append_field(json, "statement_id", entry.statement_id);
    append_field(json, "expression", entry.expression);
    fmt::format_to(std::back_inserter(json), R"(,"line":{})", entry.line);
    append_field(json, "timestamp", format_iso8601(entry.timestamp));
    json.push_back('}');

    logger_->warn(fmt::to_string(json));
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
