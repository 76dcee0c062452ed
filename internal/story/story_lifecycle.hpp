#pragma once

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/graph/traversal.hpp"

namespace storygraph::story {

// source snippet id -> copied snippet id
using IdMap = std::unordered_map<std::string, std::string>;

enum class DuplicateMode { kAll, kMain };

// "all" or "main"; anything else is util::InvalidArgument.
DuplicateMode ParseDuplicateMode(const std::string& mode);

/*
  Whole-story operations. Each runs as a single transaction.
*/
class StoryLifecycle {
 public:
  explicit StoryLifecycle(std::shared_ptr<db::Repository> repository);

  void DeleteStory(const std::string& story);

  // Deletes the story and leaves a fresh empty "user" root.
  graph::Snippet TruncateStory(const std::string& story);

  IdMap DuplicateStoryAll(const std::string& source, const std::string& target);
  IdMap DuplicateStoryMain(const std::string& source, const std::string& target);
  IdMap DuplicateStory(const std::string& source, const std::string& target, DuplicateMode mode);

  std::vector<std::string> ListStories();
  void                     PurgeAll();

 private:
  void CheckDuplicateTargets(db::Transaction& tx, const std::string& source, const std::string& target);

  std::shared_ptr<db::Repository> repository_;
};

} // namespace storygraph::story
