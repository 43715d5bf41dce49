#pragma once

// ---------------------------------------------------------------------------
// mapper_parser.hpp
//
// MyBatis 매퍼 XML 문서 → AST 변환 진입점.
//
// [동시성]
// - parse() 는 호출마다 이벤트 소스와 스택을 새로 만들고 공유 상태가 없다.
//   서로 다른 입력을 여러 스레드에서 동시에 파싱해도 잠금이 필요 없다.
//
// [범위 밖]
// - SQL 문법 검증, <include>/<sql> 조각 해석, 스키마 분석, 실행.
// ---------------------------------------------------------------------------

#include <expected>
#include <string_view>

#include "ast/node.hpp"
#include "common/types.hpp"
#include "parser/ast_builder.hpp"  // ParserOptions
#include "parser/xml_event.hpp"

class MapperParser {
public:
    explicit MapperParser(ParserOptions options = {});
    ~MapperParser() = default;

    // 복사/이동 허용 (옵션 외 상태 없음)
    MapperParser(const MapperParser&)            = default;
    MapperParser& operator=(const MapperParser&) = default;
    MapperParser(MapperParser&&)                 = default;
    MapperParser& operator=(MapperParser&&)      = default;

    // parse
    //   xml: 매퍼 문서 전체 (UTF-8)
    //   반환: Root 노드 또는 ParseError (부분 트리는 반환하지 않음)
    [[nodiscard]] std::expected<Node, ParseError> parse(std::string_view xml) const;

    // parse
    //   이미 만들어진 이벤트 소스를 끝까지 소비한다.
    //   소스 오류는 kMalformedXml 로 감싼다.
    [[nodiscard]] std::expected<Node, ParseError> parse(XmlEventSource& source) const;

private:
    ParserOptions options_;
};
