#pragma once

// ---------------------------------------------------------------------------
// node.hpp
//
// MyBatis 매퍼 XML AST 노드 정의.
//
// [설계 원칙]
// - 노드 종류는 닫힌 집합이므로 클래스 계층 대신 std::variant 로 표현한다.
//   variant 대안 순서와 NodeKind 열거값 순서가 같아야 하며, node.cpp 에서
//   static_assert 로 검증한다.
// - Data 를 제외한 모든 노드는 자식 목록을 소유한다. 자식 순서는 문서
//   순서이며 SQL 조각 연결 순서이므로 append 이후 재정렬/삭제하지 않는다.
// - Empty 노드는 스택 균형을 맞추기 위해서만 생성되고 부모에 붙지 않는다.
//
// [하위 소비자 계약]
// - kind() + attributes() 로 노드 종류/속성을 확인한다.
// - children() 로 순서 있는 자식 목록을 얻는다 (Data 는 항상 빈 목록).
// - Choose 의 자식 종류는 강제하지 않으므로 소비자가 직접 방어해야 한다.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "common/types.hpp"  // XmlAttribute, AttributeList

// ---------------------------------------------------------------------------
// NodeKind
//   Node::Body 의 대안 순서와 1:1 대응한다.
// ---------------------------------------------------------------------------
enum class NodeKind : std::uint8_t {
    kRoot      = 0,
    kMapper    = 1,
    kQuery     = 2,
    kIf        = 3,
    kChoose    = 4,
    kWhen      = 5,
    kOtherwise = 6,
    kEmpty     = 7,
    kData      = 8,
};

// ---------------------------------------------------------------------------
// QueryKind
//   <select|insert|update|delete> 요소 이름에서 결정되는 구문 종류.
// ---------------------------------------------------------------------------
enum class QueryKind : std::uint8_t {
    kSelect = 0,
    kInsert = 1,
    kUpdate = 2,
    kDelete = 3,
};

// ---------------------------------------------------------------------------
// PlaceholderStyle
//   kBind         : #{...}: 드라이버가 파라미터 바인딩 (이스케이프됨)
//   kSubstitution : ${...}: SQL 문자열에 그대로 치환 (인젝션 위험)
// ---------------------------------------------------------------------------
enum class PlaceholderStyle : std::uint8_t {
    kBind         = 0,
    kSubstitution = 1,
};

struct LiteralSegment {
    std::string text{};

    bool operator==(const LiteralSegment&) const = default;
};

struct PlaceholderSegment {
    std::string      expression{};  // 중괄호 안의 원문 (trim 하지 않음)
    PlaceholderStyle style{PlaceholderStyle::kBind};

    bool operator==(const PlaceholderSegment&) const = default;
};

using Segment = std::variant<LiteralSegment, PlaceholderSegment>;

class Node;
using NodePtr  = std::unique_ptr<Node>;
using NodeList = std::vector<NodePtr>;

// ---------------------------------------------------------------------------
// 노드 종류별 본문
// ---------------------------------------------------------------------------

// 파싱 결과 최상위 컨테이너. 파싱당 정확히 하나, 속성 없음.
struct RootNode {
    NodeList children{};
};

// <mapper namespace="...">
struct MapperNode {
    AttributeList attributes{};
    NodeList      children{};
};

// <select|insert|update|delete id="..." resultType="...">
struct QueryNode {
    QueryKind     kind{QueryKind::kSelect};
    AttributeList attributes{};
    NodeList      children{};
};

// <if test="...">  test 는 평가하지 않고 원문 그대로 보관한다.
struct IfNode {
    std::string   test{};
    AttributeList attributes{};
    NodeList      children{};
};

// <choose>: 자식 종류를 강제하지 않는다.
struct ChooseNode {
    AttributeList attributes{};
    NodeList      children{};
};

// <when test="...">
struct WhenNode {
    std::string   test{};
    AttributeList attributes{};
    NodeList      children{};
};

// <otherwise>
struct OtherwiseNode {
    AttributeList attributes{};
    NodeList      children{};
};

// 인식하지 못한 요소. 하위 트리와 함께 부착 시점에 버려진다.
struct EmptyNode {
    std::string element_name{};
    NodeList    children{};
};

// 공백을 제거한 문자 데이터와 그 세그먼트 목록. 리프 노드.
struct DataNode {
    std::string          text{};
    std::vector<Segment> segments{};
};

// ---------------------------------------------------------------------------
// Node
//   AST 노드 하나. 본문(variant) + 생성 시점의 라인 위치.
//
//   복사 금지 (자식 소유권은 unique_ptr), 이동 허용.
//   소멸과 이동 대입은 하위 트리를 명시적 worklist 로 해제하므로
//   중첩 깊이가 네이티브 스택을 소모하지 않는다.
// ---------------------------------------------------------------------------
class Node {
public:
    using Body = std::variant<RootNode,
                              MapperNode,
                              QueryNode,
                              IfNode,
                              ChooseNode,
                              WhenNode,
                              OtherwiseNode,
                              EmptyNode,
                              DataNode>;

    explicit Node(Body body, std::size_t line = 0);

    ~Node();

    Node(const Node&)            = delete;
    Node& operator=(const Node&) = delete;
    Node(Node&&)                 = default;
    Node& operator=(Node&&) noexcept;

    [[nodiscard]] NodeKind kind() const noexcept;

    // 노드가 생성된 라인 (1-based, 0 = 알 수 없음)
    [[nodiscard]] std::size_t line() const noexcept { return line_; }

    [[nodiscard]] const Body& body() const noexcept { return body_; }

    // Root/Empty/Data 는 빈 목록을 반환한다.
    [[nodiscard]] const AttributeList& attributes() const noexcept;

    // 이름이 일치하는 첫 번째 속성 값. 없으면 std::nullopt.
    [[nodiscard]] std::optional<std::string_view> attribute(std::string_view name) const;

    // Data 는 항상 빈 목록을 반환한다.
    [[nodiscard]] const NodeList& children() const noexcept;

    // 자식을 가질 수 있는 노드인지 (Data 만 false)
    [[nodiscard]] bool is_container() const noexcept;

    // append_child
    //   child 를 자식 목록 끝에 붙인다.
    //   Data 노드이거나 child 가 nullptr 이면 false 를 반환하고 child 는 버려진다.
    [[nodiscard]] bool append_child(NodePtr child);

    template <typename T>
    [[nodiscard]] const T* as() const noexcept {
        return std::get_if<T>(&body_);
    }

private:
    // 자식 목록을 꺼내고 이 노드의 목록은 비운다.
    NodeList take_children() noexcept;

    // 하위 트리 해제: 각 노드의 자식을 worklist 로 옮긴 뒤 해제하므로
    // 해제되는 노드는 항상 자식이 없다.
    static void release_subtree(NodeList pending) noexcept;

    Body        body_;
    std::size_t line_{0};
};

// ---------------------------------------------------------------------------
// walk
//   root 부터 전위 순회하며 visitor(node, depth) 를 호출한다. root 의 depth 는 0.
//   재귀 대신 명시적 스택을 사용하므로 중첩 깊이에 제한이 없다.
// ---------------------------------------------------------------------------
using NodeVisitor = std::function<void(const Node& node, std::size_t depth)>;

void walk(const Node& root, const NodeVisitor& visitor);

[[nodiscard]] std::string_view node_kind_name(NodeKind kind) noexcept;
[[nodiscard]] std::string_view query_kind_name(QueryKind kind) noexcept;
