#pragma once

// ---------------------------------------------------------------------------
// substitution_auditor.hpp
//
// ${...} 문자열 치환 플레이스홀더 탐지기.
//
// #{...} 는 드라이버가 파라미터로 바인딩하지만 ${...} 는 SQL 텍스트에 그대로
// 삽입되므로 SQL Injection 경로가 된다. 파싱된 AST 를 순회하여 허용 목록에
// 없는 ${...} 사용처를 모두 보고한다.
//
// [허용 목록]
// - 정규식 문자열 목록 (config audit.allowed_expressions 에서 로드).
// - 표현식 앞뒤 공백을 제거한 뒤 regex_search 로 매칭한다. 대소문자 구분.
// - ORDER BY 컬럼명처럼 바인딩이 불가능한 정상 사용처를 예외 처리하는 용도.
//
// [오탐/미탐 트레이드오프]
// - 허용 패턴을 넓힐수록 (예: ".*") 실제 위험한 치환을 놓친다 (false negative).
// - 표현식 값이 호출자 쪽에서 화이트리스트 검증되는지는 알 수 없으므로
//   허용 목록에 없는 모든 ${...} 는 보고한다 (false positive 감수).
// ---------------------------------------------------------------------------

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "ast/node.hpp"

// ---------------------------------------------------------------------------
// SubstitutionFinding
//   탐지된 ${...} 사용처 하나. namespace_id / statement_id 는 해당 속성이
//   없으면 빈 문자열이다.
// ---------------------------------------------------------------------------
struct SubstitutionFinding {
    std::string namespace_id{};  // 감싸는 <mapper namespace>
    std::string statement_id{};  // 감싸는 <select|insert|update|delete id>
    std::string expression{};    // 중괄호 안 원문
    std::size_t line{0};         // Data 노드 라인
};

class SubstitutionAuditor {
public:
    // 생성자: 허용 패턴을 정규식으로 컴파일한다.
    //   잘못된 패턴은 경고 로그 후 건너뛴다 (나머지 패턴은 계속 적용).
    explicit SubstitutionAuditor(std::vector<std::string> allowed_patterns = {});

    ~SubstitutionAuditor();

    // 복사 금지 (컴파일된 regex 재사용), 이동 허용
    SubstitutionAuditor(const SubstitutionAuditor&)            = delete;
    SubstitutionAuditor& operator=(const SubstitutionAuditor&) = delete;
    SubstitutionAuditor(SubstitutionAuditor&&) noexcept;
    SubstitutionAuditor& operator=(SubstitutionAuditor&&) noexcept;

    // audit
    //   root 이하의 모든 ${...} 중 허용되지 않은 것을 문서 순서로 반환한다.
    [[nodiscard]] std::vector<SubstitutionFinding> audit(const Node& root) const;

    // is_allowed
    //   expression 이 허용 패턴 중 하나와 매칭되면 true.
    [[nodiscard]] bool is_allowed(std::string_view expression) const;

    // 유효하게 컴파일된 패턴 수
    [[nodiscard]] std::size_t pattern_count() const noexcept;

private:
    struct CompiledPattern;
    std::vector<CompiledPattern> compiled_patterns_;
};
