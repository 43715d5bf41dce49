// ---------------------------------------------------------------------------
// substitution_auditor.cpp
//
// ${...} 치환 플레이스홀더 탐지 구현.
//
// [CompiledPattern 구현 주의사항]
// 헤더는 CompiledPattern 을 전방 선언만 하므로 vector<CompiledPattern> 의
// 소멸/이동 코드가 헤더 포함 지점에서 인스턴스화되지 않도록 특수 멤버 함수를
// 이 파일에서 정의한다.
// ---------------------------------------------------------------------------

#include "analysis/substitution_auditor.hpp"

#include <regex>
#include <utility>

#include <spdlog/spdlog.h>

struct SubstitutionAuditor::CompiledPattern {
    std::string source_pattern;  // 원본 패턴 문자열 (로그용)
    std::regex  compiled;
};

namespace {

std::string_view trim(std::string_view s) {
    constexpr std::string_view kWhitespace = " \t\r\n";
    const auto begin = s.find_first_not_of(kWhitespace);
    if (begin == std::string_view::npos) {
        return {};
    }
    const auto end = s.find_last_not_of(kWhitespace);
    return s.substr(begin, end - begin + 1);
}

// 순회 중 현재 노드를 감싸는 매퍼/구문 식별자
struct StatementContext {
    std::string namespace_id{};
    std::string statement_id{};
};

}  // namespace

SubstitutionAuditor::SubstitutionAuditor(std::vector<std::string> allowed_patterns) {
    compiled_patterns_.reserve(allowed_patterns.size());

    for (auto& pattern : allowed_patterns) {
        try {
            std::regex re(pattern, std::regex_constants::ECMAScript);
            compiled_patterns_.push_back(CompiledPattern{std::move(pattern), std::move(re)});
        } catch (const std::regex_error& e) {
            // 잘못된 허용 패턴은 무시된다. 해당 표현식은 계속 보고된다 (false positive).
            spdlog::warn("substitution_auditor: invalid allowed pattern '{}' skipped: {}",
                         pattern, e.what());
        }
    }
}

SubstitutionAuditor::~SubstitutionAuditor() = default;
SubstitutionAuditor::SubstitutionAuditor(SubstitutionAuditor&&) noexcept = default;
SubstitutionAuditor& SubstitutionAuditor::operator=(SubstitutionAuditor&&) noexcept = default;

bool SubstitutionAuditor::is_allowed(std::string_view expression) const {
    const auto trimmed = trim(expression);
    for (const auto& p : compiled_patterns_) {
        if (std::regex_search(trimmed.begin(), trimmed.end(), p.compiled)) {
            return true;
        }
    }
    return false;
}

std::size_t SubstitutionAuditor::pattern_count() const noexcept {
    return compiled_patterns_.size();
}

// ---------------------------------------------------------------------------
// audit
//   walk() 의 전위 순회 깊이를 이용해 조상 컨텍스트를 스택으로 유지한다.
//   contexts[d] 는 깊이 d 노드를 방문한 뒤의 컨텍스트.
// ---------------------------------------------------------------------------
std::vector<SubstitutionFinding> SubstitutionAuditor::audit(const Node& root) const {
    std::vector<SubstitutionFinding> findings;
    std::vector<StatementContext>    contexts;

    walk(root, [&](const Node& node, std::size_t depth) {
        contexts.resize(depth);
        StatementContext ctx = depth > 0 ? contexts[depth - 1] : StatementContext{};

        switch (node.kind()) {
            case NodeKind::kMapper:
                ctx.namespace_id = std::string(node.attribute("namespace").value_or(""));
                break;
            case NodeKind::kQuery:
                ctx.statement_id = std::string(node.attribute("id").value_or(""));
                break;
            case NodeKind::kData:
                for (const auto& segment : node.as<DataNode>()->segments) {
                    const auto* placeholder = std::get_if<PlaceholderSegment>(&segment);
                    if (placeholder == nullptr ||
                        placeholder->style != PlaceholderStyle::kSubstitution ||
                        is_allowed(placeholder->expression)) {
                        continue;
                    }
                    findings.push_back(SubstitutionFinding{
                        ctx.namespace_id, ctx.statement_id, placeholder->expression, node.line()});
                }
                break;
            default:
                break;
        }

        contexts.push_back(std::move(ctx));
    });

    return findings;
}
