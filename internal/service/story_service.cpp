#include "story_service.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace storygraph::service {

using storygraph::observability::StringField;

namespace {

std::string Trim(const std::string& value) {
  const auto first = value.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return {};
  }
  const auto last = value.find_last_not_of(" \t\r\n");
  return value.substr(first, last - first + 1);
}

std::string Lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

} // namespace

StoryService::StoryService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.graph || !ctx_.branches) {
    throw std::invalid_argument("StoryService: graph and branch index are required");
  }
  if (ctx_.default_branch.empty()) {
    ctx_.default_branch = "main";
  }
}

std::string StoryService::BranchName(const std::string& requested) const {
  auto name = Trim(requested);
  return name.empty() ? ctx_.default_branch : name;
}

void StoryService::MoveBranch(const std::string& story, const std::string& name, const std::string& head_id) {
  try {
    ctx_.branches->UpsertBranch(story, name, head_id);
  } catch (const std::exception& ex) {
    STORYGRAPH_LOG_ERROR("snippet written but branch head not updated",
                         {StringField("story", story), StringField("branch", name), StringField("head_id", head_id), StringField("error", ex.what())});
    throw;
  }
}

graph::Snippet StoryService::Append(const AppendRequest& req) {
  auto row = ctx_.graph->CreateSnippet(req.story, req.content, req.kind, req.parent_id, req.set_active);
  if (req.set_active != false) {
    MoveBranch(req.story, BranchName(req.branch), row.id);
  }
  return row;
}

graph::Snippet StoryService::Regenerate(const RegenerateRequest& req) {
  auto row = ctx_.graph->RegenerateSnippet(req.story, req.target_id, req.content, req.kind, req.set_active);
  if (req.set_active) {
    MoveBranch(req.story, BranchName(req.branch), row.id);
  }
  return row;
}

void StoryService::ChooseActive(const ChooseActiveRequest& req) {
  ctx_.graph->ChooseActiveChild(req.story, req.parent_id, req.child_id);
  MoveBranch(req.story, BranchName(req.branch), req.child_id);
}

graph::Snippet StoryService::InsertAbove(const InsertAboveRequest& req) {
  return ctx_.graph->InsertAbove(req.story, req.target_id, req.content, req.kind, req.set_active);
}

graph::Snippet StoryService::InsertBelow(const InsertBelowRequest& req) {
  const auto name   = BranchName(req.branch);
  const auto before = ctx_.branches->GetBranch(req.story, name);

  auto row = ctx_.graph->InsertBelow(req.story, req.parent_id, req.content, req.kind, true);
  if (before && before->head_id == req.parent_id) {
    MoveBranch(req.story, name, row.id);
  }
  return row;
}

graph::Snippet StoryService::Update(const UpdateRequest& req) {
  return ctx_.graph->UpdateSnippet(req.id, req.content, req.kind);
}

void StoryService::Delete(const std::string& id, const std::string& story_hint) {
  auto row = ctx_.graph->Get(id);
  if (!row) {
    throw util::NotFound("snippet not found: " + id);
  }

  const auto hint = Trim(story_hint);
  if (!hint.empty() && hint != row->story) {
    throw util::StructuralViolation("snippet " + id + " belongs to a different story");
  }
  if (!ctx_.graph->DeleteSnippet(row->story, id)) {
    throw util::NotFound("snippet not found: " + id);
  }
}

BranchPath StoryService::ResolvePath(const std::string& story, const std::string& branch, const std::optional<std::string>& head_id) {
  graph::SnippetPath path;
  const auto         name = Trim(branch);

  if (head_id && !head_id->empty()) {
    path = ctx_.graph->PathFromHead(story, *head_id);
  } else if (!name.empty() && Lower(name) != Lower(ctx_.default_branch)) {
    auto found = ctx_.branches->GetBranch(story, name);
    if (!found) {
      throw util::NotFound("branch not found: " + name);
    }
    path = ctx_.graph->PathFromHead(story, found->head_id);
  } else if (auto main = ctx_.branches->GetBranch(story, ctx_.default_branch)) {
    auto validation = ctx_.branches->ValidateBranchHead(story, main->head_id);
    if (validation.valid) {
      path = ctx_.graph->PathFromHead(story, main->head_id);
    } else {
      STORYGRAPH_LOG_WARN("corrupted branch detected; attempting repair",
                          {StringField("story", story), StringField("branch", main->name), StringField("reason", validation.reason.value_or(""))});
      if (auto repaired = ctx_.branches->RepairBranchHead(story, main->name)) {
        path = ctx_.graph->PathFromHead(story, *repaired);
      } else {
        STORYGRAPH_LOG_WARN("repair failed; using main path", {StringField("story", story), StringField("branch", main->name)});
        path = ctx_.graph->MainPath(story);
      }
    }
  } else {
    path = ctx_.graph->MainPath(story);
  }

  BranchPath out;
  out.story = story;
  out.text  = graph::GraphStore::BuildText(path);
  if (!path.empty()) {
    out.head_id = path.back().id;
  }
  out.path = std::move(path);
  return out;
}

StoryTree StoryService::TreeForMainPath(const std::string& story) {
  StoryTree tree;
  tree.story = story;
  for (auto& parent : ctx_.graph->MainPath(story)) {
    TreeRow row;
    row.children = ctx_.graph->ListChildren(story, parent.id);
    row.parent   = std::move(parent);
    tree.rows.push_back(std::move(row));
  }
  return tree;
}

BranchHealthReport StoryService::BranchHealth(const std::string& story) {
  BranchHealthReport report;
  report.story = story;
  for (const auto& branch : ctx_.branches->ListBranches(story)) {
    auto validation = ctx_.branches->ValidateBranchHead(story, branch.head_id);
    report.healthy  = report.healthy && validation.valid;
    report.branches.emplace(branch.name, std::move(validation));
  }
  return report;
}

} // namespace storygraph::service
