#pragma once

#include <memory>
#include <string>

namespace storygraph::graph { class GraphStore; }
namespace storygraph::branch { class BranchIndex; }
namespace storygraph::story { class StoryLifecycle; }

namespace storygraph::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<storygraph::graph::GraphStore> graph;
  std::shared_ptr<storygraph::branch::BranchIndex> branches;
  std::shared_ptr<storygraph::story::StoryLifecycle> lifecycle;

  // Branch used when a request names none.
  std::string default_branch = "main";
};

}
