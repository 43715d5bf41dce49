#pragma once

// ---------------------------------------------------------------------------
// ast_printer.hpp
//
// AST 를 사람이 읽을 수 있는 들여쓰기 텍스트로 렌더링한다 (진단/CLI --dump 용).
//
// 출력 예:
//   Root
//     Mapper namespace="m"
//       Query(select) id="s"
//         Data "SELECT * FROM t WHERE id = " #{id}
// ---------------------------------------------------------------------------

#include <string>

#include "ast/node.hpp"

// 노드 하나의 한 줄 표현 (들여쓰기, 개행 제외)
[[nodiscard]] std::string describe_node(const Node& node);

// root 이하 전체 트리. 노드당 한 줄, 깊이당 공백 두 칸.
[[nodiscard]] std::string dump_tree(const Node& root);
