// ---------------------------------------------------------------------------
// expat_event_source.cpp
//
// expat 콜백을 풀 방식 이벤트 스트림으로 바꾸는 어댑터 구현.
// ---------------------------------------------------------------------------

#include "parser/expat_event_source.hpp"

#include <climits>
#include <new>
#include <utility>

#include <spdlog/spdlog.h>

namespace {

// "prefix:local" → "local"
std::string local_name(std::string_view qualified) {
    const auto colon = qualified.rfind(':');
    if (colon == std::string_view::npos) {
        return std::string(qualified);
    }
    return std::string(qualified.substr(colon + 1));
}

// ---------------------------------------------------------------------------
// expat 오류 위치에 종료 태그가 있으면 그 로컬 이름을 반환한다.
//
// expat 은 오류 종류에 따라 eventPtr 를 '<', '/', 또는 태그 이름 시작에
// 둔다 (XML_ERROR_TAG_MISMATCH 는 이름 시작). 세 경우를 모두 허용한다.
// ---------------------------------------------------------------------------
std::optional<std::string> end_tag_name_at(std::string_view doc, XML_Index index) {
    if (index < 0 || static_cast<std::size_t>(index) >= doc.size()) {
        return std::nullopt;
    }
    auto pos = static_cast<std::size_t>(index);

    if (doc.compare(pos, 2, "</") == 0) {
        pos += 2;
    } else if (doc[pos] == '/' && pos >= 1 && doc[pos - 1] == '<') {
        pos += 1;
    } else if (pos < 2 || doc.compare(pos - 2, 2, "</") != 0) {
        return std::nullopt;
    }

    const auto end = doc.find_first_of(" \t\r\n/>", pos);
    if (end == std::string_view::npos || end == pos) {
        return std::nullopt;
    }
    return local_name(doc.substr(pos, end - pos));
}

// 종료 태그 위치 오류로 해석할 수 있는 expat 오류 코드
bool is_end_tag_error(XML_Error code) {
    switch (code) {
        case XML_ERROR_TAG_MISMATCH:
        case XML_ERROR_JUNK_AFTER_DOC_ELEMENT:
        case XML_ERROR_SYNTAX:
        case XML_ERROR_INVALID_TOKEN:
            return true;
        default:
            return false;
    }
}

}  // namespace

ExpatEventSource::ExpatEventSource(std::string_view document)
    : parser_(XML_ParserCreate(nullptr))
    , document_(document)
{
    if (parser_ == nullptr) {
        spdlog::error("expat_event_source: XML_ParserCreate failed");
        throw std::bad_alloc();
    }

    XML_SetUserData(parser_, this);
    XML_SetElementHandler(parser_, on_start_element, on_end_element);
    XML_SetCharacterDataHandler(parser_, on_character_data);
    XML_SetCommentHandler(parser_, on_comment);
    XML_SetCdataSectionHandler(parser_, on_cdata_boundary, on_cdata_boundary);
    // Expand 변형은 내부 엔티티 확장을 유지한다.
    XML_SetDefaultHandlerExpand(parser_, on_default);
}

ExpatEventSource::~ExpatEventSource() {
    if (parser_ != nullptr) {
        XML_ParserFree(parser_);
    }
}

std::expected<XmlEvent, XmlSourceError> ExpatEventSource::next() {
    while (pending_.empty()) {
        if (deferred_error_) {
            return std::unexpected(*deferred_error_);
        }
        if (finished_) {
            return XmlEvent{XmlEventType::kEndOfStream};
        }
        if (auto pumped = pump(); !pumped) {
            return std::unexpected(std::move(pumped.error()));
        }
    }

    XmlEvent event = std::move(pending_.front());
    pending_.pop_front();
    return event;
}

std::expected<void, XmlSourceError> ExpatEventSource::pump() {
    XML_Status status = XML_STATUS_ERROR;

    if (!started_) {
        started_ = true;
        if (document_.size() > static_cast<std::size_t>(INT_MAX)) {
            finished_       = true;
            deferred_error_ = XmlSourceError{"document is too large for a single expat buffer"};
            return std::unexpected(*deferred_error_);
        }
        // 입력 전체가 메모리에 있으므로 한 번에 넘기고 isFinal 로 표시한다.
        status = XML_Parse(parser_, document_.data(), static_cast<int>(document_.size()), XML_TRUE);
    } else {
        status = XML_ResumeParser(parser_);
    }

    switch (status) {
        case XML_STATUS_SUSPENDED:
            return {};
        case XML_STATUS_OK:
            flush_text();
            finished_ = true;
            return {};
        case XML_STATUS_ERROR:
        default:
            return handle_error();
    }
}

std::expected<void, XmlSourceError> ExpatEventSource::handle_error() {
    const XML_Error code = XML_GetErrorCode(parser_);
    flush_text();
    finished_ = true;

    // 입력 종료 시 열린 요소 판정은 빌더에 맡긴다.
    if (code == XML_ERROR_NO_ELEMENTS) {
        return {};
    }

    if (is_end_tag_error(code)) {
        if (auto name = end_tag_name_at(document_, XML_GetCurrentByteIndex(parser_))) {
            spdlog::debug("expat_event_source: surfacing rejected end tag </{}> ({}) as end element",
                          *name, XML_ErrorString(code));
            pending_.push_back(XmlEvent{XmlEventType::kEndElement, std::move(*name)});
            deferred_error_ = current_error();
            return {};
        }
    }

    // 이후 next() 호출도 같은 오류를 반환한다.
    deferred_error_ = current_error();
    return std::unexpected(*deferred_error_);
}

XmlSourceError ExpatEventSource::current_error() const {
    return XmlSourceError{
        XML_ErrorString(XML_GetErrorCode(parser_)),
        static_cast<std::size_t>(XML_GetCurrentLineNumber(parser_)),
        // expat 열 번호는 0-based
        static_cast<std::size_t>(XML_GetCurrentColumnNumber(parser_)) + 1,
    };
}

void ExpatEventSource::flush_text() {
    if (text_.empty()) {
        return;
    }
    pending_.push_back(XmlEvent{XmlEventType::kCharData, {}, {}, std::move(text_)});
    text_.clear();
}

void ExpatEventSource::emit(XmlEvent event) {
    flush_text();
    pending_.push_back(std::move(event));
    suspend();
}

void ExpatEventSource::suspend() {
    // 빈 요소(<a/>)처럼 정지 요청 뒤에도 콜백이 이어질 수 있다.
    // 이미 정지된 상태에서 다시 요청하면 expat 이 오류를 기록하므로 건너뛴다.
    XML_ParsingStatus status{};
    XML_GetParsingStatus(parser_, &status);
    if (status.parsing != XML_PARSING) {
        return;
    }
    if (XML_StopParser(parser_, XML_TRUE) != XML_STATUS_OK) {
        spdlog::debug("expat_event_source: XML_StopParser refused: {}",
                      XML_ErrorString(XML_GetErrorCode(parser_)));
    }
}

// ---------------------------------------------------------------------------
// expat 콜백
// ---------------------------------------------------------------------------
void XMLCALL ExpatEventSource::on_start_element(void* user_data, const XML_Char* name,
                                                const XML_Char** attrs) {
    auto* self = static_cast<ExpatEventSource*>(user_data);

    XmlEvent event{XmlEventType::kStartElement, local_name(name)};
    for (int i = 0; attrs[i] != nullptr; i += 2) {
        event.attributes.push_back(XmlAttribute{attrs[i], attrs[i + 1]});
    }

    self->emit(std::move(event));
}

void XMLCALL ExpatEventSource::on_end_element(void* user_data, const XML_Char* name) {
    auto* self = static_cast<ExpatEventSource*>(user_data);

    self->emit(XmlEvent{XmlEventType::kEndElement, local_name(name)});
}

void XMLCALL ExpatEventSource::on_character_data(void* user_data, const XML_Char* data,
                                                 int length) {
    // expat 은 줄 단위/엔티티 단위로 나눠 호출하므로 다음 구조 이벤트까지 합친다.
    auto* self = static_cast<ExpatEventSource*>(user_data);
    self->text_.append(data, static_cast<std::size_t>(length));
}

void XMLCALL ExpatEventSource::on_comment(void* user_data, const XML_Char* data) {
    auto* self = static_cast<ExpatEventSource*>(user_data);
    self->emit(XmlEvent{XmlEventType::kComment, {}, {}, data});
}

void XMLCALL ExpatEventSource::on_default(void* user_data, const XML_Char* data, int length) {
    // 문서 요소 밖(프롤로그/에필로그)의 공백은 문자 데이터 핸들러로 오지 않는다.
    // 라인 카운트가 어긋나지 않도록 공백만 문자 데이터로 합친다.
    // XML 선언, DOCTYPE 등 나머지 마크업은 버린다.
    const std::string_view chunk(data, static_cast<std::size_t>(length));
    if (chunk.find_first_not_of(" \t\r\n") != std::string_view::npos) {
        return;
    }
    auto* self = static_cast<ExpatEventSource*>(user_data);
    self->text_.append(chunk);
}

void XMLCALL ExpatEventSource::on_cdata_boundary(void* user_data) {
    // CDATA 경계에서 문자 데이터 청크를 끊는다.
    auto* self = static_cast<ExpatEventSource*>(user_data);
    self->flush_text();
}
