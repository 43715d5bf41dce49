#pragma once

// ---------------------------------------------------------------------------
// config_loader.hpp
//
// YAML 설정 파일을 로드하여 ScanConfig 로 변환하는 로더.
//
// [설계 원칙]
// - load() 실패 시 std::unexpected(error_message) 반환.
// - 부분적으로 파싱된 설정을 반환하지 않는다 (all-or-nothing).
// - 누락된 키는 구조체 기본값을 적용한다.
// ---------------------------------------------------------------------------

#include <expected>
#include <filesystem>
#include <string>

#include "config/scan_config.hpp"

class ConfigLoader {
public:
    ConfigLoader()  = default;
    ~ConfigLoader() = default;

    ConfigLoader(const ConfigLoader&)            = default;
    ConfigLoader& operator=(const ConfigLoader&) = default;
    ConfigLoader(ConfigLoader&&)                 = default;
    ConfigLoader& operator=(ConfigLoader&&)      = default;

    // load
    //   지정된 경로의 YAML 파일을 읽어 ScanConfig 로 파싱한다.
    //
    //   실패: 파일 없음, YAML 문법 오류(라인/열 포함), 최상위가 map 이 아님,
    //         섹션 타입 변환 오류.
    //   경고만: 알 수 없는 log_level (info 로 대체), 잘못된 허용 정규식.
    [[nodiscard]] static std::expected<ScanConfig, std::string>
    load(const std::filesystem::path& config_path);
};
