// ---------------------------------------------------------------------------
// node.cpp
//
// AST 노드 접근자와 반복 순회 구현.
// ---------------------------------------------------------------------------

#include "ast/node.hpp"

#include <iterator>
#include <type_traits>
#include <utility>

namespace {

// variant 대안 순서 == NodeKind 값. kind() 가 index() 캐스팅에 의존한다.
template <typename T, std::size_t I = 0>
constexpr std::size_t variant_index() {
    if constexpr (I >= std::variant_size_v<Node::Body>) {
        return I;
    } else if constexpr (std::is_same_v<std::variant_alternative_t<I, Node::Body>, T>) {
        return I;
    } else {
        return variant_index<T, I + 1>();
    }
}

static_assert(variant_index<RootNode>()      == static_cast<std::size_t>(NodeKind::kRoot));
static_assert(variant_index<MapperNode>()    == static_cast<std::size_t>(NodeKind::kMapper));
static_assert(variant_index<QueryNode>()     == static_cast<std::size_t>(NodeKind::kQuery));
static_assert(variant_index<IfNode>()        == static_cast<std::size_t>(NodeKind::kIf));
static_assert(variant_index<ChooseNode>()    == static_cast<std::size_t>(NodeKind::kChoose));
static_assert(variant_index<WhenNode>()      == static_cast<std::size_t>(NodeKind::kWhen));
static_assert(variant_index<OtherwiseNode>() == static_cast<std::size_t>(NodeKind::kOtherwise));
static_assert(variant_index<EmptyNode>()     == static_cast<std::size_t>(NodeKind::kEmpty));
static_assert(variant_index<DataNode>()      == static_cast<std::size_t>(NodeKind::kData));
static_assert(std::variant_size_v<Node::Body> == 9, "NodeKind and Node::Body out of sync");

const AttributeList kNoAttributes{};
const NodeList      kNoChildren{};

template <typename B>
concept HasChildren = requires(B& b) { b.children; };

template <typename B>
concept HasAttributes = requires(B& b) { b.attributes; };

}  // namespace

Node::Node(Body body, std::size_t line)
    : body_(std::move(body))
    , line_(line)
{}

Node::~Node() {
    release_subtree(take_children());
}

Node& Node::operator=(Node&& other) noexcept {
    if (this != &other) {
        release_subtree(take_children());
        body_ = std::move(other.body_);
        line_ = other.line_;
    }
    return *this;
}

NodeList Node::take_children() noexcept {
    return std::visit(
        [](auto& b) -> NodeList {
            if constexpr (HasChildren<std::decay_t<decltype(b)>>) {
                return std::exchange(b.children, NodeList{});
            } else {
                return {};
            }
        },
        body_);
}

NodeKind Node::kind() const noexcept {
    return static_cast<NodeKind>(body_.index());
}

const AttributeList& Node::attributes() const noexcept {
    return std::visit(
        [](const auto& b) -> const AttributeList& {
            if constexpr (HasAttributes<std::decay_t<decltype(b)>>) {
                return b.attributes;
            } else {
                return kNoAttributes;
            }
        },
        body_);
}

std::optional<std::string_view> Node::attribute(std::string_view name) const {
    for (const auto& attr : attributes()) {
        if (attr.name == name) {
            return std::string_view{attr.value};
        }
    }
    return std::nullopt;
}

const NodeList& Node::children() const noexcept {
    return std::visit(
        [](const auto& b) -> const NodeList& {
            if constexpr (HasChildren<std::decay_t<decltype(b)>>) {
                return b.children;
            } else {
                return kNoChildren;
            }
        },
        body_);
}

bool Node::is_container() const noexcept {
    return kind() != NodeKind::kData;
}

bool Node::append_child(NodePtr child) {
    if (!child) {
        return false;
    }
    return std::visit(
        [&child](auto& b) -> bool {
            if constexpr (HasChildren<std::decay_t<decltype(b)>>) {
                b.children.push_back(std::move(child));
                return true;
            } else {
                return false;
            }
        },
        body_);
}

void Node::release_subtree(NodeList pending) noexcept {
    while (!pending.empty()) {
        NodePtr node = std::move(pending.back());
        pending.pop_back();
        if (node) {
            NodeList grandchildren = node->take_children();
            std::move(grandchildren.begin(), grandchildren.end(), std::back_inserter(pending));
        }
    }
}

// ---------------------------------------------------------------------------
// walk: 명시적 스택 기반 전위 순회
//   자식은 역순으로 push 하여 문서 순서대로 방문되도록 한다.
// ---------------------------------------------------------------------------
void walk(const Node& root, const NodeVisitor& visitor) {
    std::vector<std::pair<const Node*, std::size_t>> stack;
    stack.emplace_back(&root, 0);

    while (!stack.empty()) {
        const auto [node, depth] = stack.back();
        stack.pop_back();

        visitor(*node, depth);

        const auto& children = node->children();
        for (auto it = children.rbegin(); it != children.rend(); ++it) {
            stack.emplace_back(it->get(), depth + 1);
        }
    }
}

std::string_view node_kind_name(NodeKind kind) noexcept {
    switch (kind) {
        case NodeKind::kRoot:      return "Root";
        case NodeKind::kMapper:    return "Mapper";
        case NodeKind::kQuery:     return "Query";
        case NodeKind::kIf:        return "If";
        case NodeKind::kChoose:    return "Choose";
        case NodeKind::kWhen:      return "When";
        case NodeKind::kOtherwise: return "Otherwise";
        case NodeKind::kEmpty:     return "Empty";
        case NodeKind::kData:      return "Data";
    }
    return "Unknown";
}

std::string_view query_kind_name(QueryKind kind) noexcept {
    switch (kind) {
        case QueryKind::kSelect: return "select";
        case QueryKind::kInsert: return "insert";
        case QueryKind::kUpdate: return "update";
        case QueryKind::kDelete: return "delete";
    }
    return "unknown";
}
