// ---------------------------------------------------------------------------
// ast_builder.cpp
//
// 비재귀 AST 빌더 구현.
//
// [이벤트별 상태 전이]
//   StartElement : 노드 생성 → 두 스택에 push
//   EndElement   : 이름 검사 → 두 스택 pop → Empty 가 아니면 부모에 append
//   CharData     : 개행 카운트 → trim → Data 생성/스캔 → 스택 top 에 즉시 append
//   Comment      : 개행 카운트만
// ---------------------------------------------------------------------------

#include "parser/ast_builder.hpp"

#include <algorithm>
#include <string_view>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace {

struct CodePoint {
    char32_t    value;
    std::size_t size;
};

// pos 에서 시작하는 UTF-8 코드 포인트 하나를 디코드한다.
// 잘못된 시퀀스는 공백이 아닌 1바이트 문자로 취급한다.
CodePoint decode_utf8(std::string_view s, std::size_t pos) {
    const auto lead = static_cast<unsigned char>(s[pos]);
    if (lead < 0x80) {
        return {lead, 1};
    }
    const std::size_t len = (lead & 0xE0) == 0xC0 ? 2
                          : (lead & 0xF0) == 0xE0 ? 3
                          : (lead & 0xF8) == 0xF0 ? 4
                          : 0;
    if (len == 0 || pos + len > s.size()) {
        return {0xFFFD, 1};
    }
    char32_t value = lead & (0x7F >> len);
    for (std::size_t i = 1; i < len; ++i) {
        const auto b = static_cast<unsigned char>(s[pos + i]);
        if ((b & 0xC0) != 0x80) {
            return {0xFFFD, 1};
        }
        value = (value << 6) | (b & 0x3F);
    }
    return {value, len};
}

// 유니코드 White_Space 속성 (ASCII 제어 공백, NEL, NBSP, Zs/Zl/Zp)
bool is_space(char32_t c) {
    switch (c) {
        case U'\t': case U'\n': case U'\v': case U'\f': case U'\r': case U' ':
        case 0x0085: case 0x00A0: case 0x1680:
        case 0x2028: case 0x2029: case 0x202F: case 0x205F: case 0x3000:
            return true;
        default:
            return c >= 0x2000 && c <= 0x200A;
    }
}

// 문자 데이터 앞뒤의 유니코드 공백 제거.
std::string_view trim(std::string_view s) {
    std::size_t begin = 0;
    while (begin < s.size()) {
        const auto cp = decode_utf8(s, begin);
        if (!is_space(cp.value)) {
            break;
        }
        begin += cp.size;
    }

    std::size_t end = s.size();
    while (end > begin) {
        // 마지막 코드 포인트의 선두 바이트까지 되돌아간다.
        std::size_t start = end - 1;
        while (start > begin && end - start < 4 &&
               (static_cast<unsigned char>(s[start]) & 0xC0) == 0x80) {
            --start;
        }
        auto cp = decode_utf8(s, start);
        if (start + cp.size != end) {
            cp = {0xFFFD, 1};
        }
        if (!is_space(cp.value)) {
            break;
        }
        end = start;
    }
    return s.substr(begin, end - begin);
}

std::string take_attribute(const AttributeList& attributes, std::string_view name) {
    const auto it = std::find_if(attributes.begin(), attributes.end(),
                                 [name](const XmlAttribute& a) { return a.name == name; });
    if (it == attributes.end()) {
        return {};
    }
    return it->value;
}

}  // namespace

NodePtr make_element_node(const std::string& name, AttributeList attributes, std::size_t line) {
    if (name == "mapper") {
        return std::make_unique<Node>(MapperNode{std::move(attributes)}, line);
    }
    if (name == "select") {
        return std::make_unique<Node>(QueryNode{QueryKind::kSelect, std::move(attributes)}, line);
    }
    if (name == "insert") {
        return std::make_unique<Node>(QueryNode{QueryKind::kInsert, std::move(attributes)}, line);
    }
    if (name == "update") {
        return std::make_unique<Node>(QueryNode{QueryKind::kUpdate, std::move(attributes)}, line);
    }
    if (name == "delete") {
        return std::make_unique<Node>(QueryNode{QueryKind::kDelete, std::move(attributes)}, line);
    }
    if (name == "if") {
        auto test = take_attribute(attributes, "test");
        return std::make_unique<Node>(IfNode{std::move(test), std::move(attributes)}, line);
    }
    if (name == "choose") {
        return std::make_unique<Node>(ChooseNode{std::move(attributes)}, line);
    }
    if (name == "when") {
        auto test = take_attribute(attributes, "test");
        return std::make_unique<Node>(WhenNode{std::move(test), std::move(attributes)}, line);
    }
    if (name == "otherwise") {
        return std::make_unique<Node>(OtherwiseNode{std::move(attributes)}, line);
    }
    return std::make_unique<Node>(EmptyNode{name}, line);
}

AstBuilder::AstBuilder(ParserOptions options)
    : options_(options)
{
    node_stack_.push_back(std::make_unique<Node>(RootNode{}, current_line_));
}

std::expected<void, ParseError> AstBuilder::consume(XmlEvent event) {
    if (node_stack_.empty()) {
        return std::unexpected(ParseError{
            ParseErrorCode::kInternalError,
            "ast builder already finished",
        });
    }

    switch (event.type) {
        case XmlEventType::kStartElement:
            return on_start_element(event);

        case XmlEventType::kEndElement:
            return on_end_element(event);

        case XmlEventType::kCharData:
            return on_char_data(event);

        case XmlEventType::kComment:
            count_newlines(event.data);
            return {};

        case XmlEventType::kEndOfStream:
        default:
            return std::unexpected(ParseError{
                ParseErrorCode::kInternalError,
                "end of stream must be handled by finish()",
                {},
                current_line_,
            });
    }
}

std::expected<Node, ParseError> AstBuilder::finish() {
    if (node_stack_.empty()) {
        return std::unexpected(ParseError{
            ParseErrorCode::kInternalError,
            "ast builder already finished",
        });
    }

    if (!element_stack_.empty()) {
        const auto& innermost = element_stack_.back();
        return std::unexpected(ParseError{
            ParseErrorCode::kUnterminatedElement,
            fmt::format("expected to read the end element of <{}>, but reached end of input",
                        innermost.name),
            innermost.name,
            innermost.line,
        });
    }

    Node root = std::move(*node_stack_.front());
    node_stack_.clear();
    return root;
}

// ---------------------------------------------------------------------------
// StartElement
// ---------------------------------------------------------------------------
std::expected<void, ParseError> AstBuilder::on_start_element(XmlEvent& event) {
    if (options_.max_depth > 0 && element_stack_.size() >= options_.max_depth) {
        return std::unexpected(ParseError{
            ParseErrorCode::kDepthLimitExceeded,
            fmt::format("element <{}> exceeds the maximum nesting depth of {}",
                        event.name, options_.max_depth),
            event.name,
            current_line_,
        });
    }

    auto node = make_element_node(event.name, std::move(event.attributes), current_line_);
    element_stack_.push_back(OpenElement{std::move(event.name), current_line_});
    node_stack_.push_back(std::move(node));
    return {};
}

// ---------------------------------------------------------------------------
// EndElement
// ---------------------------------------------------------------------------
std::expected<void, ParseError> AstBuilder::on_end_element(const XmlEvent& event) {
    if (element_stack_.empty()) {
        return std::unexpected(ParseError{
            ParseErrorCode::kUnexpectedEndElement,
            fmt::format("unexpected end element </{}>", event.name),
            event.name,
            current_line_,
        });
    }

    const auto& open = element_stack_.back();
    if (open.name != event.name) {
        return std::unexpected(ParseError{
            ParseErrorCode::kTagMismatch,
            fmt::format("expected to read the end element of <{}>, but got </{}>",
                        open.name, event.name),
            event.name,
            current_line_,
        });
    }

    element_stack_.pop_back();
    NodePtr popped = std::move(node_stack_.back());
    node_stack_.pop_back();

    // Root 는 element_stack_ 에 대응 항목이 없으므로 pop 후에도 항상 남아 있다.
    if (popped->kind() == NodeKind::kEmpty) {
        const auto* empty = popped->as<EmptyNode>();
        spdlog::debug("ast_builder: pruned unknown element <{}> (line {})",
                      empty != nullptr ? empty->element_name : std::string{}, popped->line());
        return {};
    }

    if (!node_stack_.back()->append_child(std::move(popped))) {
        return std::unexpected(ParseError{
            ParseErrorCode::kInternalError,
            fmt::format("cannot append <{}> to a non-container node", event.name),
            event.name,
            current_line_,
        });
    }
    return {};
}

// ---------------------------------------------------------------------------
// CharData
//   개행 카운트는 trim 전에 수행해야 실제 문서 위치와 일치한다.
// ---------------------------------------------------------------------------
std::expected<void, ParseError> AstBuilder::on_char_data(const XmlEvent& event) {
    const std::size_t start_line = current_line_;
    count_newlines(event.data);

    const auto trimmed = trim(event.data);
    if (trimmed.empty()) {
        return {};
    }

    // 앞쪽 공백에 포함된 개행만큼 Data 노드의 시작 라인을 보정한다.
    const auto leading = std::string_view(event.data).substr(
        0, static_cast<std::size_t>(trimmed.data() - event.data.data()));
    const auto data_line =
        start_line + static_cast<std::size_t>(std::count(leading.begin(), leading.end(), '\n'));

    auto segments = scanner_.scan(trimmed);
    if (!segments) {
        const auto& inner = segments.error();
        return std::unexpected(ParseError{
            ParseErrorCode::kDataScanError,
            fmt::format("cannot parse data node: {}", inner.message),
            inner.context,
            data_line,
            inner.code,
        });
    }

    auto data_node = std::make_unique<Node>(
        DataNode{std::string(trimmed), std::move(*segments)}, data_line);

    if (!node_stack_.back()->append_child(std::move(data_node))) {
        return std::unexpected(ParseError{
            ParseErrorCode::kInternalError,
            "cannot append data node to a non-container node",
            {},
            data_line,
        });
    }
    return {};
}

void AstBuilder::count_newlines(const std::string& raw) noexcept {
    current_line_ += static_cast<std::size_t>(std::count(raw.begin(), raw.end(), '\n'));
}
