#pragma once

// ---------------------------------------------------------------------------
// scan_config.hpp
//
// mapperscan 설정 구조체 정의 (헤더만, 구현 없음).
// yaml-cpp 를 통해 config/mapperscan.yaml 에서 로드된다.
//
// [설계 원칙]
// - 이 헤더는 다른 헤더에 의존하지 않는다 (독립적).
// - 모든 멤버는 기본값을 명시한다. 설정 파일이 없으면 기본값으로 동작한다.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// GlobalConfig
//   log_level: "debug"|"info"|"warn"|"error"
//   log_path : StructuredLogger 회전 파일 경로
// ---------------------------------------------------------------------------
struct GlobalConfig {
    std::string log_level{"info"};
    std::string log_path{"/tmp/mapperscan.log"};
};

// ---------------------------------------------------------------------------
// ParserConfig
//   max_depth: 요소 최대 중첩 깊이. 0 = 제한 없음.
//   악의적으로 깊게 중첩된 문서에서 스택 메모리 사용량 상한을 둔다.
// ---------------------------------------------------------------------------
struct ParserConfig {
    std::uint32_t max_depth{256};
};

// ---------------------------------------------------------------------------
// AuditConfig
//   flag_substitution  : ${...} 사용처를 FindingLog 로 보고할지 여부
//   allowed_expressions: 보고에서 제외할 표현식 정규식 목록
// ---------------------------------------------------------------------------
struct AuditConfig {
    bool                     flag_substitution{true};
    std::vector<std::string> allowed_expressions{};
};

// ---------------------------------------------------------------------------
// ScanConfig
//   ConfigLoader::load 가 반환하는 루트 구조체.
// ---------------------------------------------------------------------------
struct ScanConfig {
    GlobalConfig global{};
    ParserConfig parser{};
    AuditConfig  audit{};
};
