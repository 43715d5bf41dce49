#pragma once

// ---------------------------------------------------------------------------
// log_types.hpp
//
// 로거 서브시스템에서 사용하는 구조화 로그 타입 정의.
//
// [순환 의존성 방지 설계]
// - ParseErrorCode 는 error_code_raw (uint8_t) 로 저장한다.
//   호출자: static_cast<uint8_t>(parse_error.code)
// - AST 헤더를 포함하지 않는다. 필요한 값은 호출자가 문자열/정수로 옮겨 담는다.
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// ---------------------------------------------------------------------------
// LogLevel
//   로거의 최소 출력 레벨. config 에서 주입.
// ---------------------------------------------------------------------------
enum class LogLevel : std::uint8_t {
    kDebug = 0,
    kInfo  = 1,
    kWarn  = 2,
    kError = 3,
};

// "debug"|"info"|"warn"|"error" → LogLevel. 그 외는 std::nullopt.
inline std::optional<LogLevel> parse_log_level(std::string_view name) {
    if (name == "debug") {
        return LogLevel::kDebug;
    }
    if (name == "info") {
        return LogLevel::kInfo;
    }
    if (name == "warn") {
        return LogLevel::kWarn;
    }
    if (name == "error") {
        return LogLevel::kError;
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// ParseLog
//   매퍼 파일 하나의 파싱 결과 로그.
//   ok == true 이면 error_* 필드는 무시된다.
// ---------------------------------------------------------------------------
struct ParseLog {
    std::string                           file{};
    bool                                  ok{false};
    std::size_t                           statements{0};      // Query 노드 수
    std::size_t                           placeholders{0};    // #{} + ${} 전체 수
    std::uint8_t                          error_code_raw{0};  // ParseErrorCode as uint8_t
    std::string                           error_message{};
    std::size_t                           line{0};
    std::chrono::system_clock::time_point timestamp{};
    std::chrono::microseconds             duration{0};        // 파싱 소요 시간
};

// ---------------------------------------------------------------------------
// FindingLog
//   허용되지 않은 ${...} 사용처 로그.
//   expression 은 매퍼 원문 일부이므로 민감 정보가 포함되지 않는다고 가정한다.
// ---------------------------------------------------------------------------
struct FindingLog {
    std::string                           file{};
    std::string                           namespace_id{};
    std::string                           statement_id{};
    std::string                           expression{};
    std::size_t                           line{0};
    std::chrono::system_clock::time_point timestamp{};
};
