#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// ---------------------------------------------------------------------------
// XmlAttribute
//   시작 태그의 속성 하나. 문서에 나타난 순서를 그대로 보존하기 위해
//   map 이 아닌 vector 로 보관한다 (AttributeList).
// ---------------------------------------------------------------------------
struct XmlAttribute {
    std::string name{};   // 속성 이름 (접두사 포함 원문)
    std::string value{};  // 엔티티 디코딩이 끝난 값
};

using AttributeList = std::vector<XmlAttribute>;

// ---------------------------------------------------------------------------
// ParseErrorCode
//   매퍼 XML 파싱 단계에서 발생 가능한 오류 분류.
//   모든 오류는 현재 parse 호출을 즉시 종료시킨다 (재시도 없음).
// ---------------------------------------------------------------------------
enum class ParseErrorCode : std::uint8_t {
    kMalformedXml            = 0,  // 하위 XML 토크나이저가 이벤트를 만들지 못함
    kUnexpectedEndElement    = 1,  // 열린 태그 없이 종료 태그 등장
    kTagMismatch             = 2,  // 종료 태그 이름이 가장 안쪽 열린 태그와 다름
    kUnterminatedElement     = 3,  // 입력 종료 시점에 열린 태그가 남아 있음
    kDataScanError           = 4,  // 문자 데이터 스캔 실패 (cause 에 원인 코드)
    kUnterminatedPlaceholder = 5,  // #{ 또는 ${ 뒤에 닫는 } 가 없음
    kDepthLimitExceeded      = 6,  // 설정된 최대 중첩 깊이 초과
    kInternalError           = 7,  // 빌더 내부 전제 조건 위반
};

// ---------------------------------------------------------------------------
// ParseError
//   파싱 실패 시 반환되는 오류 정보.
//   std::expected<T, ParseError> 패턴과 함께 사용한다.
//
//   line 은 1-based 이며 0 은 위치를 알 수 없음을 뜻한다.
// ---------------------------------------------------------------------------
struct ParseError {
    ParseErrorCode                code{ParseErrorCode::kInternalError};
    std::string                   message{};  // 사람이 읽을 수 있는 오류 설명
    std::string                   context{};  // 오류가 발생한 태그명/입력 단편 (로깅용)
    std::size_t                   line{0};
    std::optional<ParseErrorCode> cause{};    // 감싸진 하위 오류 코드 (kDataScanError 전용)
};

// 로그/리포트 출력용 오류 코드 이름
constexpr std::string_view parse_error_code_name(ParseErrorCode code) noexcept {
    switch (code) {
        case ParseErrorCode::kMalformedXml:            return "MalformedXml";
        case ParseErrorCode::kUnexpectedEndElement:    return "UnexpectedEndElement";
        case ParseErrorCode::kTagMismatch:             return "TagMismatch";
        case ParseErrorCode::kUnterminatedElement:     return "UnterminatedElement";
        case ParseErrorCode::kDataScanError:           return "DataScanError";
        case ParseErrorCode::kUnterminatedPlaceholder: return "UnterminatedPlaceholder";
        case ParseErrorCode::kDepthLimitExceeded:      return "DepthLimitExceeded";
        case ParseErrorCode::kInternalError:           return "InternalError";
    }
    return "Unknown";
}
