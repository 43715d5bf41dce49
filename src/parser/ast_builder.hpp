#pragma once

// ---------------------------------------------------------------------------
// ast_builder.hpp
//
// XML 구조 이벤트를 하나씩 받아 AST 를 만드는 비재귀 스택 머신.
//
// [스택 불변식]
// - element_stack_: 열려 있는 시작 태그 기록
// - node_stack_   : 만들어지는 중인 노드. index 0 은 항상 Root.
// - 모든 이벤트 처리 직후 node_depth() == element_depth() + 1.
//
// 재귀 하강 파서는 중첩 한 단계마다 네이티브 스택 프레임을 쓰므로,
// 악의적으로 깊게 중첩된 <choose>/<if> 입력에서 스택이 고갈될 수 있다.
// 두 스택 모두 힙에 있으며 크기는 중첩 깊이에 비례한다.
//
// [오류 처리]
// - 모든 오류는 즉시 반환되며 이후 빌더 상태는 사용하지 않는다 (fail-fast).
// ---------------------------------------------------------------------------

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <vector>

#include "ast/node.hpp"
#include "common/types.hpp"
#include "parser/data_scanner.hpp"
#include "parser/xml_event.hpp"

// ---------------------------------------------------------------------------
// ParserOptions
//   max_depth: 허용하는 최대 요소 중첩 깊이. 0 이면 제한 없음.
// ---------------------------------------------------------------------------
struct ParserOptions {
    std::uint32_t max_depth{0};
};

class AstBuilder {
public:
    explicit AstBuilder(ParserOptions options = {});

    ~AstBuilder() = default;

    AstBuilder(const AstBuilder&)            = delete;
    AstBuilder& operator=(const AstBuilder&) = delete;
    AstBuilder(AstBuilder&&)                 = default;
    AstBuilder& operator=(AstBuilder&&)      = default;

    // consume
    //   구조 이벤트 하나를 처리한다 (상태 전이 한 단계).
    //   kEndOfStream 은 finish() 로 처리해야 하며 여기서는 kInternalError.
    [[nodiscard]] std::expected<void, ParseError> consume(XmlEvent event);

    // finish
    //   입력 종료 처리. 열린 요소가 없으면 Root 를 넘겨주고, 남아 있으면
    //   가장 안쪽 요소 이름으로 kUnterminatedElement 를 반환한다.
    //   성공 후 빌더는 비어 있으며 다시 사용할 수 없다.
    [[nodiscard]] std::expected<Node, ParseError> finish();

    [[nodiscard]] std::size_t element_depth() const noexcept { return element_stack_.size(); }
    [[nodiscard]] std::size_t node_depth() const noexcept { return node_stack_.size(); }

    // 문자 데이터/주석에서 관측한 개행 기준 현재 라인 (1-based)
    [[nodiscard]] std::size_t current_line() const noexcept { return current_line_; }

private:
    struct OpenElement {
        std::string name{};  // 로컬 이름
        std::size_t line{0};
    };

    [[nodiscard]] std::expected<void, ParseError> on_start_element(XmlEvent& event);
    [[nodiscard]] std::expected<void, ParseError> on_end_element(const XmlEvent& event);
    [[nodiscard]] std::expected<void, ParseError> on_char_data(const XmlEvent& event);
    void count_newlines(const std::string& raw) noexcept;

    ParserOptions            options_;
    DataScanner              scanner_{};
    std::vector<OpenElement> element_stack_{};
    std::vector<NodePtr>     node_stack_{};
    std::size_t              current_line_{1};
};

// ---------------------------------------------------------------------------
// make_element_node
//   요소 로컬 이름 → 노드 종류 분기표.
//     mapper                       → Mapper
//     select | update | insert | delete → Query
//     if / choose / when / otherwise → 각 동명 노드
//     그 외                         → Empty (부착 시점에 버려짐)
// ---------------------------------------------------------------------------
[[nodiscard]] NodePtr make_element_node(const std::string& name,
                                        AttributeList      attributes,
                                        std::size_t        line);
