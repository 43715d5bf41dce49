#pragma once

// ---------------------------------------------------------------------------
// xml_event.hpp
//
// AST 빌더와 하위 XML 토크나이저 사이의 경계.
// 빌더는 이 인터페이스만 알고, 실제 토크나이저(expat)는 모른다.
//
// [이벤트 순서 계약]
// - next() 는 문서 앞에서 뒤로 한 번만 읽는다 (되감기 없음).
// - 문서 끝에서 kEndOfStream 을 한 번 반환한다. 이후 호출 결과는 정의하지 않는다.
// - 인접한 문자 데이터는 하나의 kCharData 로 합쳐서 전달해야 한다.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>

#include "common/types.hpp"  // AttributeList

enum class XmlEventType : std::uint8_t {
    kStartElement = 0,  // name + attributes
    kEndElement   = 1,  // name
    kCharData     = 2,  // data (엔티티 디코딩 완료, trim 전 원문)
    kComment      = 3,  // data
    kEndOfStream  = 4,
};

struct XmlEvent {
    XmlEventType  type{XmlEventType::kEndOfStream};
    std::string   name{};        // 요소 로컬 이름 (접두사 제외)
    AttributeList attributes{};  // kStartElement 전용, 문서 순서
    std::string   data{};        // kCharData / kComment 전용
};

// ---------------------------------------------------------------------------
// XmlSourceError
//   하위 토크나이저가 올바른 이벤트 스트림을 만들지 못했을 때의 원인.
//   빌더는 이를 ParseErrorCode::kMalformedXml 로 감싼다.
// ---------------------------------------------------------------------------
struct XmlSourceError {
    std::string message{};
    std::size_t line{0};    // 1-based, 0 = 알 수 없음
    std::size_t column{0};  // 1-based, 0 = 알 수 없음
};

// ---------------------------------------------------------------------------
// XmlEventSource
//   스트리밍 XML 이벤트 공급자 추상 인터페이스.
// ---------------------------------------------------------------------------
class XmlEventSource {
public:
    virtual ~XmlEventSource() = default;

    [[nodiscard]] virtual std::expected<XmlEvent, XmlSourceError> next() = 0;
};
