#pragma once

// ---------------------------------------------------------------------------
// data_scanner.hpp
//
// 매퍼 XML 태그 사이 문자 데이터를 리터럴 SQL 과 플레이스홀더로 분리하는
// 단일 패스 스캐너.
//
// [플레이스홀더 문법]
// - #{expr} : 바인드 파라미터 (PlaceholderStyle::kBind)
// - ${expr} : 문자열 치환 (PlaceholderStyle::kSubstitution)
// - 중첩을 지원하지 않는다. 여는 기호 뒤 첫 번째 '}' 에서 닫힌다.
//
// [알려진 한계]
// - 리터럴 구간은 SQL 로 재검증하지 않는다. 문자열 리터럴 안의 "#{" 도
//   플레이스홀더로 인식한다 (MyBatis 와 동일한 동작).
// ---------------------------------------------------------------------------

#include <expected>
#include <string_view>
#include <vector>

#include "ast/node.hpp"      // Segment
#include "common/types.hpp"  // ParseError

// ---------------------------------------------------------------------------
// DataScanner
//   상태 없는 스캐너. 문자 데이터 청크 하나당 scan() 을 한 번 호출한다.
// ---------------------------------------------------------------------------
class DataScanner {
public:
    DataScanner()  = default;
    ~DataScanner() = default;

    DataScanner(const DataScanner&)            = default;
    DataScanner& operator=(const DataScanner&) = default;
    DataScanner(DataScanner&&)                 = default;
    DataScanner& operator=(DataScanner&&)      = default;

    // scan
    //   data: trim 이 끝난 문자 데이터
    //   반환: 문서 순서의 세그먼트 목록 또는
    //         ParseError{kUnterminatedPlaceholder} (닫는 '}' 없음)
    //
    //   - 빈 입력은 빈 목록 (오류 아님)
    //   - 플레이스홀더가 없으면 입력 전체가 Literal 하나
    //   - 인접한 플레이스홀더 사이에 빈 Literal 을 만들지 않는다
    [[nodiscard]] std::expected<std::vector<Segment>, ParseError>
    scan(std::string_view data) const;
};
