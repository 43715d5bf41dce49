#include "analysis/ast_printer.hpp"
#include "analysis/substitution_auditor.hpp"
#include "config/config_loader.hpp"
#include "logger/structured_logger.hpp"
#include "parser/mapper_parser.hpp"

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// Helper: 환경변수 읽기 (없으면 기본값 반환)
// ---------------------------------------------------------------------------
namespace {

constexpr const char* kDefaultConfigPath = "config/mapperscan.yaml";

constexpr int kExitOk          = 0;
constexpr int kExitParseFailed = 1;
constexpr int kExitUsage       = 2;

std::string env_str(const char* name, std::string default_val) {
    const char* val = std::getenv(name);  // NOLINT(concurrency-mt-unsafe)
    if (val != nullptr && val[0] != '\0') {
        return val;
    }
    return default_val;
}

void print_usage(const char* argv0) {
    std::fprintf(stderr, "usage: %s [--dump] <mapper.xml>...\n", argv0);
}

// ---------------------------------------------------------------------------
// 설정 로드
//   MAPPERSCAN_CONFIG 가 지정되면 반드시 로드되어야 한다.
//   기본 경로 파일이 없으면 내장 기본값을 사용한다.
// ---------------------------------------------------------------------------
std::optional<ScanConfig> load_config() {
    const char* explicit_path = std::getenv("MAPPERSCAN_CONFIG");  // NOLINT(concurrency-mt-unsafe)
    const std::string path    = env_str("MAPPERSCAN_CONFIG", kDefaultConfigPath);

    const bool is_default = explicit_path == nullptr || explicit_path[0] == '\0';
    std::error_code ec;
    if (is_default && !std::filesystem::exists(path, ec)) {
        spdlog::info("mapperscan: no config at '{}', using built-in defaults", path);
        return ScanConfig{};
    }

    auto loaded = ConfigLoader::load(path);
    if (!loaded) {
        return std::nullopt;
    }
    return std::move(*loaded);
}

std::optional<std::string> read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        return std::nullopt;
    }
    return buffer.str();
}

struct TreeStats {
    std::size_t statements{0};
    std::size_t placeholders{0};
};

TreeStats collect_stats(const Node& root) {
    TreeStats stats;
    walk(root, [&stats](const Node& node, std::size_t /*depth*/) {
        if (node.kind() == NodeKind::kQuery) {
            ++stats.statements;
        } else if (const auto* data = node.as<DataNode>()) {
            for (const auto& segment : data->segments) {
                if (std::holds_alternative<PlaceholderSegment>(segment)) {
                    ++stats.placeholders;
                }
            }
        }
    });
    return stats;
}

// ---------------------------------------------------------------------------
// 파일 하나 처리. 읽기/파싱 성공 시 true.
// ---------------------------------------------------------------------------
bool scan_file(const std::string&         path,
               const ScanConfig&          config,
               const MapperParser&        parser,
               const SubstitutionAuditor& auditor,
               StructuredLogger&          logger,
               bool                       dump) {
    ParseLog entry{};
    entry.file      = path;
    entry.timestamp = std::chrono::system_clock::now();

    const auto content = read_file(path);
    if (!content) {
        entry.ok             = false;
        entry.error_code_raw = static_cast<std::uint8_t>(ParseErrorCode::kMalformedXml);
        entry.error_message  = "cannot read file";
        logger.log_parse(entry);
        return false;
    }

    const auto started = std::chrono::steady_clock::now();
    auto root          = parser.parse(*content);
    entry.duration     = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - started);

    if (!root) {
        const auto& err      = root.error();
        entry.ok             = false;
        entry.error_code_raw = static_cast<std::uint8_t>(err.code);
        entry.error_message  = err.message;
        entry.line           = err.line;
        logger.log_parse(entry);
        return false;
    }

    const auto stats   = collect_stats(*root);
    entry.ok           = true;
    entry.statements   = stats.statements;
    entry.placeholders = stats.placeholders;
    logger.log_parse(entry);

    if (dump) {
        std::fputs(dump_tree(*root).c_str(), stdout);
    }

    if (config.audit.flag_substitution) {
        for (const auto& finding : auditor.audit(*root)) {
            logger.log_finding(FindingLog{
                path,
                finding.namespace_id,
                finding.statement_id,
                finding.expression,
                finding.line,
                std::chrono::system_clock::now(),
            });
        }
    }

    return true;
}

} // namespace

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------
int main(int argc, char* argv[]) {

    // ── 인자 파싱 ───────────────────────────────────────────────────────
    bool                     dump = false;
    std::vector<std::string> files;
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg{argv[i]};
        if (arg == "--dump") {
            dump = true;
        } else if (arg.starts_with("--")) {
            spdlog::error("mapperscan: unknown option '{}'", arg);
            print_usage(argv[0]);
            return kExitUsage;
        } else {
            files.emplace_back(arg);
        }
    }
    if (files.empty()) {
        print_usage(argv[0]);
        return kExitUsage;
    }

    // ── 설정 로드 ───────────────────────────────────────────────────────
    const auto config = load_config();
    if (!config) {
        spdlog::critical("mapperscan: failed to load config, aborting");
        return kExitParseFailed;
    }

    // ── 로깅 초기화 ─────────────────────────────────────────────────────
    const LogLevel level = parse_log_level(config->global.log_level).value_or(LogLevel::kInfo);
    spdlog::set_level(level == LogLevel::kDebug  ? spdlog::level::debug
                      : level == LogLevel::kWarn  ? spdlog::level::warn
                      : level == LogLevel::kError ? spdlog::level::err
                                                  : spdlog::level::info);

    try {
        StructuredLogger logger{level, config->global.log_path};

        spdlog::info("mapperscan: scanning {} file(s), max_depth={}", files.size(),
                     config->parser.max_depth);

        // ── 파일별 파싱 ─────────────────────────────────────────────────
        const MapperParser        parser{ParserOptions{config->parser.max_depth}};
        const SubstitutionAuditor auditor{config->audit.allowed_expressions};

        bool all_ok = true;
        for (const auto& file : files) {
            if (!scan_file(file, *config, parser, auditor, logger, dump)) {
                all_ok = false;
            }
        }

        return all_ok ? kExitOk : kExitParseFailed;

    } catch (const std::runtime_error& e) {
        spdlog::critical("mapperscan: {}", e.what());
        return kExitParseFailed;
    }
}
