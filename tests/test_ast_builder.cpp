// ---------------------------------------------------------------------------
// test_ast_builder.cpp
//
// AstBuilder / MapperParser(XmlEventSource&) 단위 테스트.
//
// [테스트 범위]
// - 스택 균형: 매 이벤트 후 node_depth == element_depth + 1
// - 요소 이름 → 노드 종류 디스패치, test 속성 추출
// - 알 수 없는 요소 가지치기 (하위 트리 포함)
// - 공백 문자 데이터 생략, trim 및 세그먼트 스캔
// - 라인 카운트: 문자 데이터/주석 개행만 반영
// - 오류: UnexpectedEndElement, TagMismatch, UnterminatedElement,
//   DataScanError(cause), DepthLimitExceeded
// - 이벤트 소스 오류 → MalformedXml
//
// 실제 XML 토크나이저 대신 미리 준비한 이벤트 목록을 재생하는
// ScriptedEventSource 를 사용하여 빌더 동작만 검증한다.
// ---------------------------------------------------------------------------

#include "parser/ast_builder.hpp"
#include "parser/mapper_parser.hpp"

#include <gtest/gtest.h>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace {

XmlEvent start(const std::string& name, AttributeList attrs = {}) {
    return XmlEvent{XmlEventType::kStartElement, name, std::move(attrs)};
}

XmlEvent end(const std::string& name) {
    return XmlEvent{XmlEventType::kEndElement, name};
}

XmlEvent text(const std::string& data) {
    return XmlEvent{XmlEventType::kCharData, {}, {}, data};
}

XmlEvent comment(const std::string& data) {
    return XmlEvent{XmlEventType::kComment, {}, {}, data};
}

// ---------------------------------------------------------------------------
// ScriptedEventSource
//   준비된 이벤트를 순서대로 돌려주고, 끝나면 kEndOfStream 을 반복한다.
//   fail_at 위치에 도달하면 XmlSourceError 를 반환한다.
// ---------------------------------------------------------------------------
class ScriptedEventSource final : public XmlEventSource {
public:
    explicit ScriptedEventSource(std::vector<XmlEvent> events,
                                 std::size_t           fail_at = static_cast<std::size_t>(-1))
        : events_(std::move(events))
        , fail_at_(fail_at) {}

    std::expected<XmlEvent, XmlSourceError> next() override {
        if (pos_ == fail_at_) {
            return std::unexpected(XmlSourceError{"scripted failure", 7, 3});
        }
        if (pos_ >= events_.size()) {
            return XmlEvent{XmlEventType::kEndOfStream};
        }
        return events_[pos_++];
    }

private:
    std::vector<XmlEvent> events_;
    std::size_t           fail_at_;
    std::size_t           pos_{0};
};

// 이벤트를 하나씩 넣으며 매 단계 스택 균형을 확인한다.
std::expected<Node, ParseError> build_checked(const std::vector<XmlEvent>& events,
                                              ParserOptions                options = {}) {
    AstBuilder builder{options};
    EXPECT_EQ(builder.node_depth(), builder.element_depth() + 1);

    for (const auto& event : events) {
        auto step = builder.consume(event);
        if (!step) {
            return std::unexpected(step.error());
        }
        EXPECT_EQ(builder.node_depth(), builder.element_depth() + 1);
    }
    return builder.finish();
}

}  // namespace

// ===========================================================================
// 정상 트리 구성
// ===========================================================================

TEST(AstBuilder, EndToEnd_SelectWithPlaceholder) {
    const std::vector<XmlEvent> events = {
        start("mapper", {{"namespace", "u"}}),
        start("select", {{"id", "q"}}),
        text("SELECT * FROM t WHERE id = #{id}"),
        end("select"),
        end("mapper"),
    };

    auto root = build_checked(events);
    ASSERT_TRUE(root.has_value()) << root.error().message;
    ASSERT_EQ(root->kind(), NodeKind::kRoot);
    ASSERT_EQ(root->children().size(), 1u);

    const Node& mapper = *root->children()[0];
    EXPECT_EQ(mapper.kind(), NodeKind::kMapper);
    EXPECT_EQ(mapper.attribute("namespace").value_or(""), "u");
    ASSERT_EQ(mapper.children().size(), 1u);

    const Node& select = *mapper.children()[0];
    ASSERT_NE(select.as<QueryNode>(), nullptr);
    EXPECT_EQ(select.as<QueryNode>()->kind, QueryKind::kSelect);
    EXPECT_EQ(select.attribute("id").value_or(""), "q");
    ASSERT_EQ(select.children().size(), 1u);

    const auto* data = select.children()[0]->as<DataNode>();
    ASSERT_NE(data, nullptr);
    EXPECT_EQ(data->text, "SELECT * FROM t WHERE id = #{id}");
    const std::vector<Segment> expected = {
        LiteralSegment{"SELECT * FROM t WHERE id = "},
        PlaceholderSegment{"id", PlaceholderStyle::kBind},
    };
    EXPECT_EQ(data->segments, expected);
}

TEST(AstBuilder, QueryKinds_Dispatched) {
    const std::vector<XmlEvent> events = {
        start("mapper"),
        start("select"), end("select"),
        start("insert"), end("insert"),
        start("update"), end("update"),
        start("delete"), end("delete"),
        end("mapper"),
    };

    auto root = build_checked(events);
    ASSERT_TRUE(root.has_value());
    const auto& queries = root->children()[0]->children();
    ASSERT_EQ(queries.size(), 4u);
    EXPECT_EQ(queries[0]->as<QueryNode>()->kind, QueryKind::kSelect);
    EXPECT_EQ(queries[1]->as<QueryNode>()->kind, QueryKind::kInsert);
    EXPECT_EQ(queries[2]->as<QueryNode>()->kind, QueryKind::kUpdate);
    EXPECT_EQ(queries[3]->as<QueryNode>()->kind, QueryKind::kDelete);
}

TEST(AstBuilder, ChooseWhenOtherwise_Structure) {
    const std::vector<XmlEvent> events = {
        start("select"),
        start("choose"),
        start("when", {{"test", "a != null"}}),
        text("A"),
        end("when"),
        start("otherwise"),
        text("B"),
        end("otherwise"),
        end("choose"),
        end("select"),
    };

    auto root = build_checked(events);
    ASSERT_TRUE(root.has_value());

    const Node& choose = *root->children()[0]->children()[0];
    ASSERT_EQ(choose.kind(), NodeKind::kChoose);
    ASSERT_EQ(choose.children().size(), 2u);

    const Node& when = *choose.children()[0];
    ASSERT_NE(when.as<WhenNode>(), nullptr);
    EXPECT_EQ(when.as<WhenNode>()->test, "a != null");
    ASSERT_EQ(when.children().size(), 1u);
    EXPECT_EQ(when.children()[0]->as<DataNode>()->text, "A");

    const Node& otherwise = *choose.children()[1];
    EXPECT_EQ(otherwise.kind(), NodeKind::kOtherwise);
    ASSERT_EQ(otherwise.children().size(), 1u);
    EXPECT_EQ(otherwise.children()[0]->as<DataNode>()->text, "B");
}

TEST(AstBuilder, IfTestAttribute_KeptRaw) {
    const std::vector<XmlEvent> events = {
        start("if", {{"test", "name != null and name != ''"}}),
        end("if"),
    };

    auto root = build_checked(events);
    ASSERT_TRUE(root.has_value());
    const auto* if_node = root->children()[0]->as<IfNode>();
    ASSERT_NE(if_node, nullptr);
    EXPECT_EQ(if_node->test, "name != null and name != ''");
    // 원본 속성 목록도 보존된다.
    EXPECT_EQ(root->children()[0]->attribute("test").value_or(""), "name != null and name != ''");
}

TEST(AstBuilder, IfWithoutTest_EmptyTest) {
    auto root = build_checked({start("if"), end("if")});
    ASSERT_TRUE(root.has_value());
    EXPECT_TRUE(root->children()[0]->as<IfNode>()->test.empty());
}

TEST(AstBuilder, ChooseChildren_NotRestricted) {
    const std::vector<XmlEvent> events = {
        start("choose"),
        text("stray"),
        start("if", {{"test", "x"}}),
        end("if"),
        end("choose"),
    };

    auto root = build_checked(events);
    ASSERT_TRUE(root.has_value());
    const Node& choose = *root->children()[0];
    ASSERT_EQ(choose.children().size(), 2u);
    EXPECT_EQ(choose.children()[0]->kind(), NodeKind::kData);
    EXPECT_EQ(choose.children()[1]->kind(), NodeKind::kIf);
}

// ===========================================================================
// 가지치기 / 공백
// ===========================================================================

TEST(AstBuilder, UnknownElement_PrunedWithSubtree) {
    const std::vector<XmlEvent> events = {
        start("select"),
        text("before"),
        start("foo"),
        start("if", {{"test", "x"}}),
        text("inside"),
        end("if"),
        end("foo"),
        text("after"),
        end("select"),
    };

    auto root = build_checked(events);
    ASSERT_TRUE(root.has_value());

    const Node& select = *root->children()[0];
    ASSERT_EQ(select.children().size(), 2u);
    EXPECT_EQ(select.children()[0]->as<DataNode>()->text, "before");
    EXPECT_EQ(select.children()[1]->as<DataNode>()->text, "after");

    walk(*root, [](const Node& node, std::size_t) {
        EXPECT_NE(node.kind(), NodeKind::kEmpty);
    });
}

TEST(AstBuilder, UnknownRootElement_EmptyRoot) {
    auto root = build_checked({start("resultMap"), text("x"), end("resultMap")});
    ASSERT_TRUE(root.has_value());
    EXPECT_TRUE(root->children().empty());
}

TEST(AstBuilder, WhitespaceOnlyText_NoNode) {
    const std::vector<XmlEvent> events = {
        start("mapper"),
        text("\n   \t\r\n  "),
        start("select"),
        text("   "),
        end("select"),
        text("\n"),
        end("mapper"),
    };

    auto root = build_checked(events);
    ASSERT_TRUE(root.has_value());
    const Node& mapper = *root->children()[0];
    ASSERT_EQ(mapper.children().size(), 1u);
    EXPECT_EQ(mapper.children()[0]->kind(), NodeKind::kQuery);
    EXPECT_TRUE(mapper.children()[0]->children().empty());
}

TEST(AstBuilder, TextTrimmed) {
    auto root = build_checked({start("select"), text("\n    SELECT 1\n  "), end("select")});
    ASSERT_TRUE(root.has_value());
    EXPECT_EQ(root->children()[0]->children()[0]->as<DataNode>()->text, "SELECT 1");
}

TEST(AstBuilder, UnicodeSpaceOnlyText_NoNode) {
    // U+00A0 (NBSP), U+0085 (NEL), U+3000 (전각 공백)
    auto root = build_checked(
        {start("select"), text("\xC2\xA0 \xC2\x85\n\xE3\x80\x80"), end("select")});
    ASSERT_TRUE(root.has_value());
    EXPECT_TRUE(root->children()[0]->children().empty());
}

TEST(AstBuilder, UnicodeSpaces_Trimmed) {
    auto root = build_checked(
        {start("select"), text("\xC2\xA0SELECT \xEA\xB0\x80\xE2\x80\x83"), end("select")});
    ASSERT_TRUE(root.has_value());
    // 한글 U+AC00 은 공백이 아니므로 유지된다.
    EXPECT_EQ(root->children()[0]->children()[0]->as<DataNode>()->text, "SELECT \xEA\xB0\x80");
}

TEST(AstBuilder, TopLevelText_AttachedToRoot) {
    auto root = build_checked({text("orphan")});
    ASSERT_TRUE(root.has_value());
    ASSERT_EQ(root->children().size(), 1u);
    EXPECT_EQ(root->children()[0]->kind(), NodeKind::kData);
}

TEST(AstBuilder, NoEvents_EmptyRoot) {
    auto root = build_checked({});
    ASSERT_TRUE(root.has_value());
    EXPECT_EQ(root->kind(), NodeKind::kRoot);
    EXPECT_TRUE(root->children().empty());
}

// ===========================================================================
// 라인 추적
// ===========================================================================

TEST(AstBuilder, LineNumbers_FromCharDataAndComments) {
    const std::vector<XmlEvent> events = {
        start("mapper"),                 // line 1
        text("\n  "),                    // → line 2
        comment(" one\n two "),          // → line 3
        text("\n  "),                    // → line 4
        start("select"),                 // line 4
        text("\n    SELECT 1\n  "),      // Data line 5, → line 6
        end("select"),
        text("\n"),
        end("mapper"),
    };

    auto root = build_checked(events);
    ASSERT_TRUE(root.has_value());

    const Node& mapper = *root->children()[0];
    EXPECT_EQ(root->line(), 1u);
    EXPECT_EQ(mapper.line(), 1u);

    const Node& select = *mapper.children()[0];
    EXPECT_EQ(select.line(), 4u);
    EXPECT_EQ(select.children()[0]->line(), 5u);
}

TEST(AstBuilder, CurrentLine_NeverDecreases) {
    AstBuilder  builder;
    std::size_t last = builder.current_line();

    for (const auto& event : {start("a"), text("x\ny"), comment("\n"), text(" "), end("a")}) {
        ASSERT_TRUE(builder.consume(event).has_value());
        EXPECT_GE(builder.current_line(), last);
        last = builder.current_line();
    }
    EXPECT_EQ(last, 3u);
}

// ===========================================================================
// 오류
// ===========================================================================

TEST(AstBuilder, EndWithoutStart_UnexpectedEndElement) {
    auto root = build_checked({end("select")});
    ASSERT_FALSE(root.has_value());
    EXPECT_EQ(root.error().code, ParseErrorCode::kUnexpectedEndElement);
    EXPECT_NE(root.error().message.find("select"), std::string::npos);
}

TEST(AstBuilder, ExtraEnd_UnexpectedEndElement) {
    auto root = build_checked({start("mapper"), end("mapper"), end("mapper")});
    ASSERT_FALSE(root.has_value());
    EXPECT_EQ(root.error().code, ParseErrorCode::kUnexpectedEndElement);
}

TEST(AstBuilder, MismatchedEnd_TagMismatchNamesBoth) {
    auto root = build_checked({start("mapper"), start("select"), text("x"), end("update")});
    ASSERT_FALSE(root.has_value());
    EXPECT_EQ(root.error().code, ParseErrorCode::kTagMismatch);
    EXPECT_NE(root.error().message.find("select"), std::string::npos);
    EXPECT_NE(root.error().message.find("update"), std::string::npos);
    EXPECT_EQ(root.error().context, "update");
}

TEST(AstBuilder, MismatchAgainstUnknownElement_StillChecked) {
    // 가지치기 대상 요소도 이름 검사를 받는다.
    auto root = build_checked({start("foo"), end("bar")});
    ASSERT_FALSE(root.has_value());
    EXPECT_EQ(root.error().code, ParseErrorCode::kTagMismatch);
}

TEST(AstBuilder, OpenAtEnd_UnterminatedNamesInnermost) {
    auto root = build_checked({start("mapper"), text("\n"), start("select")});
    ASSERT_FALSE(root.has_value());
    EXPECT_EQ(root.error().code, ParseErrorCode::kUnterminatedElement);
    EXPECT_NE(root.error().message.find("select"), std::string::npos);
    EXPECT_EQ(root.error().line, 2u);
}

TEST(AstBuilder, UnterminatedPlaceholder_WrappedAsDataScanError) {
    auto root = build_checked({start("select"), text("\n\nWHERE id = #{id"), end("select")});
    ASSERT_FALSE(root.has_value());
    EXPECT_EQ(root.error().code, ParseErrorCode::kDataScanError);
    ASSERT_TRUE(root.error().cause.has_value());
    EXPECT_EQ(*root.error().cause, ParseErrorCode::kUnterminatedPlaceholder);
    EXPECT_EQ(root.error().line, 3u);
}

TEST(AstBuilder, DepthLimit_Exceeded) {
    ParserOptions options;
    options.max_depth = 2;

    auto ok = build_checked({start("mapper"), start("select"), end("select"), end("mapper")},
                            options);
    EXPECT_TRUE(ok.has_value());

    auto too_deep = build_checked({start("mapper"), start("select"), start("if")}, options);
    ASSERT_FALSE(too_deep.has_value());
    EXPECT_EQ(too_deep.error().code, ParseErrorCode::kDepthLimitExceeded);
    EXPECT_EQ(too_deep.error().context, "if");
}

TEST(AstBuilder, DepthLimitZero_Unlimited) {
    std::vector<XmlEvent> events;
    for (int i = 0; i < 1000; ++i) {
        events.push_back(start("if"));
    }
    for (int i = 0; i < 1000; ++i) {
        events.push_back(end("if"));
    }
    auto root = build_checked(events);
    EXPECT_TRUE(root.has_value());
}

TEST(AstBuilder, ConsumeAfterFinish_InternalError) {
    AstBuilder builder;
    ASSERT_TRUE(builder.finish().has_value());

    auto step = builder.consume(text("late"));
    ASSERT_FALSE(step.has_value());
    EXPECT_EQ(step.error().code, ParseErrorCode::kInternalError);
}

// ===========================================================================
// MapperParser 구동 루프 (이벤트 소스 주입)
// ===========================================================================

TEST(MapperParserLoop, ScriptedSource_BuildsTree) {
    ScriptedEventSource source{{start("mapper"), start("delete"), text("DELETE FROM t"),
                                end("delete"), end("mapper")}};
    const MapperParser parser;

    auto root = parser.parse(source);
    ASSERT_TRUE(root.has_value());
    EXPECT_EQ(root->children()[0]->children()[0]->as<QueryNode>()->kind, QueryKind::kDelete);
}

TEST(MapperParserLoop, SourceFailure_MalformedXml) {
    ScriptedEventSource source{{start("mapper"), start("select")}, 1};
    const MapperParser parser;

    auto root = parser.parse(source);
    ASSERT_FALSE(root.has_value());
    EXPECT_EQ(root.error().code, ParseErrorCode::kMalformedXml);
    EXPECT_EQ(root.error().line, 7u);
    EXPECT_NE(root.error().message.find("scripted failure"), std::string::npos);
}

TEST(MapperParserLoop, BuilderErrorStopsLoop) {
    ScriptedEventSource source{{start("select"), end("update"), start("never")}};
    const MapperParser parser;

    auto root = parser.parse(source);
    ASSERT_FALSE(root.has_value());
    EXPECT_EQ(root.error().code, ParseErrorCode::kTagMismatch);
}
