// ---------------------------------------------------------------------------
// data_scanner.cpp
//
// 문자 데이터 세그먼트 스캐너 구현.
// ---------------------------------------------------------------------------

#include "parser/data_scanner.hpp"

#include <string>

#include <fmt/format.h>

namespace {

// 오류 context 에 남길 입력 단편 최대 길이
constexpr std::size_t kContextLength = 32;

// data[pos] 에서 플레이스홀더가 열리면 스타일을 반환한다.
std::optional<PlaceholderStyle> opener_at(std::string_view data, std::size_t pos) {
    if (pos + 1 >= data.size() || data[pos + 1] != '{') {
        return std::nullopt;
    }
    if (data[pos] == '#') {
        return PlaceholderStyle::kBind;
    }
    if (data[pos] == '$') {
        return PlaceholderStyle::kSubstitution;
    }
    return std::nullopt;
}

}  // namespace

std::expected<std::vector<Segment>, ParseError>
DataScanner::scan(std::string_view data) const {
    std::vector<Segment> segments;

    // 아직 내보내지 않은 리터럴 구간의 시작 위치
    std::size_t literal_begin = 0;
    std::size_t pos           = 0;

    while (pos < data.size()) {
        const auto style = opener_at(data, pos);
        if (!style) {
            ++pos;
            continue;
        }

        const auto close = data.find('}', pos + 2);
        if (close == std::string_view::npos) {
            return std::unexpected(ParseError{
                ParseErrorCode::kUnterminatedPlaceholder,
                fmt::format("placeholder opened with '{}{{' at offset {} is never closed",
                            data[pos], pos),
                std::string(data.substr(pos, kContextLength)),
            });
        }

        if (pos > literal_begin) {
            segments.emplace_back(LiteralSegment{
                std::string(data.substr(literal_begin, pos - literal_begin))});
        }
        segments.emplace_back(PlaceholderSegment{
            std::string(data.substr(pos + 2, close - pos - 2)), *style});

        pos           = close + 1;
        literal_begin = pos;
    }

    if (literal_begin < data.size()) {
        segments.emplace_back(LiteralSegment{std::string(data.substr(literal_begin))});
    }

    return segments;
}
