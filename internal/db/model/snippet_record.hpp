#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace storygraph::db::model {

/*
  Persistent snippet row.

  IMPORTANT:
  - id, story and created_at_ms never change after insert.
  - parent_id is the backward edge; child_id marks the one active
    forward edge. Other children of the same parent are alternates.
  - Only content, kind, parent_id and child_id are ever rewritten.
*/

struct SnippetRecord {
  std::string id;
  std::string story;

  std::optional<std::string> parent_id; // absent only for a root
  std::optional<std::string> child_id;  // active continuation

  std::string kind = "ai"; // "user", "ai", ...
  std::string content;

  // epoch ms
  uint64_t created_at_ms = 0;
};

inline constexpr const char* kKindUser = "user";

} // namespace storygraph::db::model
