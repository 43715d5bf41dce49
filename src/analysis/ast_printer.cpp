#include "analysis/ast_printer.hpp"

#include <type_traits>

#include <fmt/format.h>

namespace {

// 한 줄 출력을 위해 따옴표/역슬래시/제어 문자를 이스케이프한다.
std::string quote(std::string_view text) {
    std::string result;
    result.reserve(text.size() + 2);
    result.push_back('"');
    for (const char ch : text) {
        switch (ch) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n";  break;
            case '\r': result += "\\r";  break;
            case '\t': result += "\\t";  break;
            default:   result.push_back(ch); break;
        }
    }
    result.push_back('"');
    return result;
}

void append_attributes(std::string& out, const AttributeList& attributes) {
    for (const auto& attr : attributes) {
        out += fmt::format(" {}={}", attr.name, quote(attr.value));
    }
}

void append_segments(std::string& out, const std::vector<Segment>& segments) {
    for (const auto& segment : segments) {
        std::visit(
            [&out](const auto& s) {
                using T = std::decay_t<decltype(s)>;
                if constexpr (std::is_same_v<T, LiteralSegment>) {
                    out += ' ';
                    out += quote(s.text);
                } else {
                    out += s.style == PlaceholderStyle::kBind ? " #{" : " ${";
                    out += s.expression;
                    out += '}';
                }
            },
            segment);
    }
}

}  // namespace

std::string describe_node(const Node& node) {
    std::string line{node_kind_name(node.kind())};

    if (const auto* query = node.as<QueryNode>()) {
        line += fmt::format("({})", query_kind_name(query->kind));
    } else if (const auto* empty = node.as<EmptyNode>()) {
        line += fmt::format(" <{}>", empty->element_name);
    } else if (const auto* data = node.as<DataNode>()) {
        append_segments(line, data->segments);
        return line;
    }

    append_attributes(line, node.attributes());
    return line;
}

std::string dump_tree(const Node& root) {
    std::string out;
    walk(root, [&out](const Node& node, std::size_t depth) {
        out.append(depth * 2, ' ');
        out += describe_node(node);
        out += '\n';
    });
    return out;
}
