#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/branch/branch_index.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/graph/graph_store.hpp"
#include "internal/service/story_service.hpp"
#include "internal/story/story_lifecycle.hpp"

namespace storygraph::factory {

/*
  Runtime

  Owns all long-lived components used by a process.
  Everything here lives for the lifetime of the process.
*/
struct Runtime {
  std::shared_ptr<db::Repository> repository;

  std::shared_ptr<graph::GraphStore>       graph;
  std::shared_ptr<branch::BranchIndex>     branches;
  std::shared_ptr<story::StoryLifecycle>   lifecycle;
  std::shared_ptr<service::StoryService>   story_service;
};

/*
  BuildRuntime

  Constructs the entire backend based on runtime config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
*/
Runtime BuildRuntime(const storygraph::runtime::config::RuntimeConfig& config);

// Runtime over an explicit repository; used by tests.
Runtime BuildRuntime(std::shared_ptr<db::Repository> repository, const std::string& default_branch = "main");

} // namespace storygraph::factory
