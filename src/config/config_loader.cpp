// ---------------------------------------------------------------------------
// config_loader.cpp
//
// YAML 설정 파일을 로드하여 ScanConfig 구조체로 파싱한다.
//
// [설계 원칙]
// - All-or-nothing: 파싱 실패 시 부분 설정을 반환하지 않는다.
// - 필드 누락 시 기본값(구조체 기본값)을 적용한다.
// - YAML 파일 전체를 로그에 출력하지 않는다.
//
// [알려진 한계]
// - allowed_expressions 의 잘못된 정규식은 로드 실패로 처리하지 않는다.
//   SubstitutionAuditor 가 건너뛰므로 해당 표현식은 계속 보고된다.
// ---------------------------------------------------------------------------

#include "config/config_loader.hpp"

#include <array>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

namespace {

constexpr std::array<std::string_view, 4> kLogLevels = {"debug", "info", "warn", "error"};

// ---------------------------------------------------------------------------
// 내부 헬퍼: YAML 노드에서 string 벡터를 읽는다.
// 노드가 없거나 sequence 가 아니면 빈 벡터를 반환한다.
// ---------------------------------------------------------------------------
[[nodiscard]] std::vector<std::string> read_string_sequence(const YAML::Node& node) {
    std::vector<std::string> result;
    if (!node || !node.IsSequence()) {
        return result;
    }
    result.reserve(node.size());
    for (const auto& item : node) {
        if (item.IsScalar()) {
            result.push_back(item.as<std::string>());
        }
    }
    return result;
}

[[nodiscard]] bool read_bool(const YAML::Node& node, bool fallback) {
    if (!node || !node.IsScalar()) {
        return fallback;
    }
    try {
        return node.as<bool>();
    } catch (const YAML::Exception&) {
        return fallback;
    }
}

[[nodiscard]] std::uint32_t read_uint32(const YAML::Node& node, std::uint32_t fallback) {
    if (!node || !node.IsScalar()) {
        return fallback;
    }
    try {
        return node.as<std::uint32_t>();
    } catch (const YAML::Exception&) {
        spdlog::warn("config_loader: '{}' is not an unsigned integer, using default {}",
                     node.Scalar(), fallback);
        return fallback;
    }
}

[[nodiscard]] std::string read_string(const YAML::Node& node, const std::string& fallback) {
    if (!node || !node.IsScalar()) {
        return fallback;
    }
    try {
        return node.as<std::string>();
    } catch (const YAML::Exception&) {
        return fallback;
    }
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: 허용 정규식 사전 검증. 로드 시점에 운영자에게 알린다.
// ---------------------------------------------------------------------------
void validate_allowed_expressions(const std::vector<std::string>& patterns) {
    for (const auto& p : patterns) {
        try {
            std::regex{p, std::regex_constants::ECMAScript};
        } catch (const std::regex_error& e) {
            spdlog::warn(
                "config_loader: audit.allowed_expressions '{}' is invalid regex and will be "
                "skipped by SubstitutionAuditor: {}",
                p, e.what());
        }
    }
}

[[nodiscard]] GlobalConfig parse_global(const YAML::Node& global_node) {
    GlobalConfig cfg{};
    if (!global_node || !global_node.IsMap()) {
        return cfg;
    }

    cfg.log_level = read_string(global_node["log_level"], cfg.log_level);
    cfg.log_path  = read_string(global_node["log_path"],  cfg.log_path);

    bool known = false;
    for (const auto level : kLogLevels) {
        if (cfg.log_level == level) {
            known = true;
            break;
        }
    }
    if (!known) {
        spdlog::warn("config_loader: global.log_level '{}' is not one of debug|info|warn|error, "
                     "defaulting to 'info'",
                     cfg.log_level);
        cfg.log_level = "info";
    }

    return cfg;
}

[[nodiscard]] ParserConfig parse_parser(const YAML::Node& parser_node) {
    ParserConfig cfg{};
    if (!parser_node || !parser_node.IsMap()) {
        return cfg;
    }

    cfg.max_depth = read_uint32(parser_node["max_depth"], cfg.max_depth);
    return cfg;
}

[[nodiscard]] AuditConfig parse_audit(const YAML::Node& audit_node) {
    AuditConfig cfg{};
    if (!audit_node || !audit_node.IsMap()) {
        return cfg;
    }

    cfg.flag_substitution   = read_bool(audit_node["flag_substitution"], cfg.flag_substitution);
    cfg.allowed_expressions = read_string_sequence(audit_node["allowed_expressions"]);
    return cfg;
}

}  // namespace

// ---------------------------------------------------------------------------
// ConfigLoader::load 구현
// ---------------------------------------------------------------------------
std::expected<ScanConfig, std::string>
ConfigLoader::load(const std::filesystem::path& config_path) {
    // 1. 경로 정규화
    std::error_code ec;
    const auto canonical_path = std::filesystem::canonical(config_path, ec);
    if (ec) {
        const std::string err = fmt::format(
            "config_loader: cannot resolve config path '{}': {}",
            config_path.string(), ec.message()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    spdlog::info("config_loader: loading config from '{}'", canonical_path.string());

    // 2. YAML 파일 로드 (yaml-cpp 예외 처리)
    YAML::Node root;
    try {
        root = YAML::LoadFile(canonical_path.string());
    } catch (const YAML::BadFile& e) {
        const std::string err = fmt::format(
            "config_loader: cannot open file '{}': {}",
            canonical_path.string(), e.what()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    } catch (const YAML::ParserException& e) {
        const std::string err = fmt::format(
            "config_loader: YAML parse error in '{}' at line {}, col {}: {}",
            canonical_path.string(),
            e.mark.line + 1,   // yaml-cpp는 0-based
            e.mark.column + 1,
            e.what()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    } catch (const YAML::Exception& e) {
        const std::string err = fmt::format(
            "config_loader: YAML error in '{}': {}",
            canonical_path.string(), e.what()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    if (!root || !root.IsMap()) {
        const std::string err = fmt::format(
            "config_loader: '{}' is not a valid YAML map (top-level)",
            canonical_path.string()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    // 3. 각 섹션 파싱
    ScanConfig cfg{};

    try {
        cfg.global = parse_global(root["global"]);
        cfg.parser = parse_parser(root["parser"]);
        cfg.audit  = parse_audit(root["audit"]);
    } catch (const YAML::Exception& e) {
        const std::string err = fmt::format(
            "config_loader: error parsing '{}': {}", canonical_path.string(), e.what()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    // 4. 허용 정규식 사전 검증 (경고만, 로드 실패 아님)
    validate_allowed_expressions(cfg.audit.allowed_expressions);

    spdlog::info(
        "config_loader: config loaded: log_level={}, max_depth={}, flag_substitution={}, "
        "allowed_expressions={}",
        cfg.global.log_level,
        cfg.parser.max_depth,
        cfg.audit.flag_substitution,
        cfg.audit.allowed_expressions.size()
    );

    return cfg;
}
