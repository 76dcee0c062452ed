#pragma once

#include <cstdint>
#include <string>

namespace storygraph::db::model {

/*
  Named, movable pointer into a story graph.

  (story, name) is the identity. created_at_ms is set on first insert
  and kept by later upserts.
*/

struct BranchRecord {
  std::string story;
  std::string name;
  std::string head_id;

  // epoch ms
  uint64_t created_at_ms = 0;
};

} // namespace storygraph::db::model
