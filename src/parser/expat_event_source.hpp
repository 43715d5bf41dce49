#pragma once

// ---------------------------------------------------------------------------
// expat_event_source.hpp
//
// expat 기반 풀(pull) 방식 XmlEventSource.
//
// expat 은 콜백(push) 방식이므로, 구조 이벤트(시작/종료 태그, 주석)를 받을
// 때마다 XML_StopParser(resumable) 로 파서를 일시 정지하고, next() 에서
// 대기 이벤트가 비면 XML_ResumeParser 로 재개한다. 버퍼에 쌓이는 이벤트는
// 최대 두 개(합쳐진 문자 데이터 + 구조 이벤트)이다.
//
// [expat 오류 변환 규칙]
// - 열린 요소가 남은 채 문서가 끝나거나 문서가 비어 있으면 (XML_ERROR_NO_ELEMENTS)
//   kEndOfStream 으로 전달한다. 미종료 판정은 빌더 몫이다.
// - expat 이 거부한 종료 태그(이름 불일치, 열린 요소 없음, 문서 요소 뒤)는
//   해당 이름의 kEndElement 로 먼저 전달하고, 그 다음 호출에서 원래 expat
//   오류를 반환한다. 빌더가 TagMismatch / UnexpectedEndElement 를 보고하게 된다.
// - 그 밖의 모든 expat 오류는 XmlSourceError 로 반환하며, 이후 호출도 같은 오류를 반환한다.
// ---------------------------------------------------------------------------

#include <deque>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

#include <expat.h>

#include "parser/xml_event.hpp"

// ---------------------------------------------------------------------------
// ExpatEventSource
//   document 는 파싱이 끝날 때까지 유효해야 한다 (복사하지 않음).
//   XML_ParserCreate 실패 시 생성자가 std::bad_alloc 을 던진다.
// ---------------------------------------------------------------------------
class ExpatEventSource final : public XmlEventSource {
public:
    explicit ExpatEventSource(std::string_view document);
    ~ExpatEventSource() override;

    // XML_Parser 핸들 소유권이 유일하므로 복사/이동 금지
    ExpatEventSource(const ExpatEventSource&)            = delete;
    ExpatEventSource& operator=(const ExpatEventSource&) = delete;
    ExpatEventSource(ExpatEventSource&&)                 = delete;
    ExpatEventSource& operator=(ExpatEventSource&&)      = delete;

    [[nodiscard]] std::expected<XmlEvent, XmlSourceError> next() override;

private:
    static void XMLCALL on_start_element(void* user_data, const XML_Char* name,
                                         const XML_Char** attrs);
    static void XMLCALL on_end_element(void* user_data, const XML_Char* name);
    static void XMLCALL on_character_data(void* user_data, const XML_Char* data, int length);
    static void XMLCALL on_comment(void* user_data, const XML_Char* data);
    static void XMLCALL on_cdata_boundary(void* user_data);
    static void XMLCALL on_default(void* user_data, const XML_Char* data, int length);

    // expat 을 다음 일시 정지 지점(또는 문서 끝)까지 진행시킨다.
    [[nodiscard]] std::expected<void, XmlSourceError> pump();
    [[nodiscard]] std::expected<void, XmlSourceError> handle_error();
    [[nodiscard]] XmlSourceError current_error() const;

    // 쌓인 문자 데이터를 kCharData 이벤트 하나로 내보낸다.
    void flush_text();
    // 문자 데이터를 먼저 내보낸 뒤 event 를 큐에 넣고 파서를 일시 정지한다.
    void emit(XmlEvent event);
    void suspend();

    XML_Parser                    parser_{nullptr};
    std::string_view              document_;
    std::deque<XmlEvent>          pending_{};
    std::string                   text_{};
    std::optional<XmlSourceError> deferred_error_{};
    bool                          started_{false};
    bool                          finished_{false};
};
