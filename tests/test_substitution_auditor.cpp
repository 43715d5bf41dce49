// ---------------------------------------------------------------------------
// test_substitution_auditor.cpp
//
// SubstitutionAuditor 단위 테스트.
//
// [테스트 범위]
// - ${...} 탐지, #{...} 무시
// - 감싸는 mapper namespace / 구문 id 컨텍스트
// - 허용 정규식 (앞뒤 공백 무시), 잘못된 정규식 건너뛰기
// - 형제 구문 간 컨텍스트 누수 없음
//
// [오탐/미탐 트레이드오프]
// - 허용 목록은 표현식 문자열만 본다. 호출자가 실제로 값을 검증하는지는 알 수 없다.
// ---------------------------------------------------------------------------

#include "analysis/substitution_auditor.hpp"
#include "parser/mapper_parser.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace {

constexpr const char* kMapper = R"(<mapper namespace="com.example.OrderMapper">
  <select id="list">
    SELECT * FROM orders WHERE user_id = #{userId}
    ORDER BY ${orderBy}
  </select>
  <select id="byTable">
    SELECT * FROM ${ tableName }
    <if test="limit != null">LIMIT ${limit}</if>
  </select>
  <delete id="purge">DELETE FROM orders WHERE id = #{id}</delete>
</mapper>)";

Node parse_or_die(const char* xml) {
    const MapperParser parser;
    auto root = parser.parse(xml);
    EXPECT_TRUE(root.has_value());
    if (!root) {
        return Node(RootNode{});
    }
    return std::move(*root);
}

}  // namespace

TEST(SubstitutionAuditor, FlagsSubstitutionOnly) {
    const SubstitutionAuditor auditor;
    const Node root = parse_or_die(kMapper);

    const auto findings = auditor.audit(root);
    ASSERT_EQ(findings.size(), 3u);

    EXPECT_EQ(findings[0].namespace_id, "com.example.OrderMapper");
    EXPECT_EQ(findings[0].statement_id, "list");
    EXPECT_EQ(findings[0].expression, "orderBy");
    EXPECT_EQ(findings[0].line, 3u);

    EXPECT_EQ(findings[1].statement_id, "byTable");
    EXPECT_EQ(findings[1].expression, " tableName ");

    // <if> 안쪽도 감싸는 구문 id 를 유지한다.
    EXPECT_EQ(findings[2].statement_id, "byTable");
    EXPECT_EQ(findings[2].expression, "limit");
    EXPECT_EQ(findings[2].line, 8u);
}

TEST(SubstitutionAuditor, AllowedPattern_Suppresses) {
    const SubstitutionAuditor auditor{{"^orderBy$", "^tableName$"}};
    EXPECT_EQ(auditor.pattern_count(), 2u);

    const auto findings = auditor.audit(parse_or_die(kMapper));
    ASSERT_EQ(findings.size(), 1u);
    EXPECT_EQ(findings[0].expression, "limit");
}

TEST(SubstitutionAuditor, IsAllowed_TrimsExpression) {
    const SubstitutionAuditor auditor{{"^tableName$"}};
    EXPECT_TRUE(auditor.is_allowed("  tableName\t"));
    EXPECT_FALSE(auditor.is_allowed("tableName2"));
}

TEST(SubstitutionAuditor, InvalidPattern_Skipped) {
    const SubstitutionAuditor auditor{{"([unclosed", "^limit$"}};
    EXPECT_EQ(auditor.pattern_count(), 1u);
    EXPECT_TRUE(auditor.is_allowed("limit"));
}

TEST(SubstitutionAuditor, NoMapper_EmptyContext) {
    const SubstitutionAuditor auditor;
    const auto findings = auditor.audit(parse_or_die("<select>SELECT ${x}</select>"));
    ASSERT_EQ(findings.size(), 1u);
    EXPECT_TRUE(findings[0].namespace_id.empty());
    EXPECT_TRUE(findings[0].statement_id.empty());
}

TEST(SubstitutionAuditor, SiblingStatements_ContextDoesNotLeak) {
    const SubstitutionAuditor auditor;
    const auto findings = auditor.audit(parse_or_die(
        R"(<mapper namespace="n"><select id="a">A</select><update>SET ${c}</update></mapper>)"));
    ASSERT_EQ(findings.size(), 1u);
    EXPECT_EQ(findings[0].namespace_id, "n");
    EXPECT_TRUE(findings[0].statement_id.empty());
}

TEST(SubstitutionAuditor, MovedAuditor_KeepsPatterns) {
    SubstitutionAuditor original{{"^a$"}};
    const SubstitutionAuditor moved{std::move(original)};
    EXPECT_EQ(moved.pattern_count(), 1u);
    EXPECT_TRUE(moved.is_allowed("a"));
}
