// ---------------------------------------------------------------------------
// mapper_parser.cpp
//
// 이벤트 소스 → AstBuilder 구동 루프.
// ---------------------------------------------------------------------------

#include "parser/mapper_parser.hpp"

#include <string>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "parser/expat_event_source.hpp"

namespace {

void log_failure(const ParseError& error) {
    spdlog::warn("mapper_parser: parse failed with {} at line {}: {}",
                 parse_error_code_name(error.code), error.line, error.message);
}

}  // namespace

MapperParser::MapperParser(ParserOptions options)
    : options_(options)
{}

std::expected<Node, ParseError> MapperParser::parse(std::string_view xml) const {
    ExpatEventSource source{xml};
    return parse(source);
}

std::expected<Node, ParseError> MapperParser::parse(XmlEventSource& source) const {
    AstBuilder builder{options_};

    // 이벤트 하나당 상태 전이 한 번. 소스가 문서 길이에 비례해 유한하므로 종료한다.
    while (true) {
        auto event = source.next();
        if (!event) {
            const auto& cause = event.error();
            ParseError error{
                ParseErrorCode::kMalformedXml,
                fmt::format("failed to get token from xml decoder: {} (line {}, column {})",
                            cause.message, cause.line, cause.column),
                cause.message,
                cause.line,
            };
            log_failure(error);
            return std::unexpected(std::move(error));
        }

        if (event->type == XmlEventType::kEndOfStream) {
            break;
        }

        if (auto step = builder.consume(std::move(*event)); !step) {
            log_failure(step.error());
            return std::unexpected(std::move(step.error()));
        }
    }

    auto root = builder.finish();
    if (!root) {
        log_failure(root.error());
    }
    return root;
}
