#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

using storygraph::graph::Snippet;
using storygraph::graph::SnippetPath;

static void Usage() {
  std::cout << "Usage: storygraphctl [--config <config.yaml>] <command> [args]\n"
            << "  stories\n"
            << "  append <story> <kind> <content> [--parent <id>] [--inactive] [--branch <name>]\n"
            << "  regenerate <story> <target_id> <kind> <content> [--inactive] [--branch <name>]\n"
            << "  choose <story> <parent_id> <child_id> [--branch <name>]\n"
            << "  insert-above <story> <target_id> <kind> <content> [--inactive]\n"
            << "  insert-below <story> <parent_id> <kind> <content> [--branch <name>]\n"
            << "  update <id> [--content <text>] [--kind <kind>]\n"
            << "  delete <id> [--story <story>]\n"
            << "  get <id>\n"
            << "  path <story> [--branch <name>] [--head <id>]\n"
            << "  text <story> [--branch <name>] [--head <id>]\n"
            << "  tree <story>\n"
            << "  children <story> <parent_id>\n"
            << "  branches <story>\n"
            << "  branch-set <story> <name> <head_id>\n"
            << "  branch-delete <story> <name>\n"
            << "  health <story>\n"
            << "  repair <story> <name>\n"
            << "  truncate <story>\n"
            << "  delete-story <story>\n"
            << "  duplicate <source> <target> [all|main]\n"
            << "  reset\n";
}

namespace {

// Positional arguments plus --flag [value] options.
struct Args {
  std::vector<std::string> positional;
  std::vector<std::pair<std::string, std::optional<std::string>>> options;

  std::optional<std::string> Option(const std::string& name) const {
    for (const auto& [key, value] : options) {
      if (key == name) {
        return value.value_or("");
      }
    }
    return std::nullopt;
  }

  bool Flag(const std::string& name) const {
    return Option(name).has_value();
  }
};

bool TakesValue(const std::string& flag) {
  return flag == "--parent" || flag == "--branch" || flag == "--head" || flag == "--story" || flag == "--content" || flag == "--kind" ||
         flag == "--config";
}

Args Parse(int argc, char** argv) {
  Args args;
  for (int i = 1; i < argc; ++i) {
    std::string token = argv[i];
    if (token.rfind("--", 0) == 0) {
      if (TakesValue(token)) {
        if (i + 1 >= argc) {
          throw storygraph::util::InvalidArgument("missing value for " + token);
        }
        args.options.emplace_back(token, std::string(argv[++i]));
      } else {
        args.options.emplace_back(token, std::nullopt);
      }
      continue;
    }
    args.positional.push_back(std::move(token));
  }
  return args;
}

std::string Opt(const std::optional<std::string>& value) {
  return value ? *value : "-";
}

void PrintSnippet(const Snippet& s) {
  std::cout << s.id << "\t" << s.kind << "\tparent=" << Opt(s.parent_id) << "\tchild=" << Opt(s.child_id) << "\t" << s.content << "\n";
}

void PrintPath(const SnippetPath& path) {
  for (const auto& s : path) {
    PrintSnippet(s);
  }
}

} // namespace

int main(int argc, char** argv) {
  Args args;
  try {
    args = Parse(argc, argv);
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    Usage();
    return 1;
  }

  if (args.positional.empty()) {
    Usage();
    return 1;
  }

  const auto&              cmd = args.positional[0];
  const auto               n   = args.positional.size();
  const auto&              p   = args.positional;
  storygraph::runtime::config::RuntimeConfig config;

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    if (auto path = args.Option("--config")) {
      config = storygraph::config::ConfigLoader::LoadFromYaml(*path);
    }
    storygraph::observability::InitializeLogging(config);

    auto  runtime = storygraph::factory::BuildRuntime(config);
    auto& service = *runtime.story_service;

    // ------------------------------------------------------------

    if (cmd == "stories") {
      for (const auto& story : runtime.lifecycle->ListStories()) {
        std::cout << story << "\n";
      }
    } else if (cmd == "append" && n >= 4) {
      storygraph::service::AppendRequest req;
      req.story     = p[1];
      req.kind      = p[2];
      req.content   = p[3];
      req.parent_id = args.Option("--parent");
      if (args.Flag("--inactive")) {
        req.set_active = false;
      }
      req.branch = args.Option("--branch").value_or("");
      PrintSnippet(service.Append(req));
    } else if (cmd == "regenerate" && n >= 5) {
      storygraph::service::RegenerateRequest req;
      req.story      = p[1];
      req.target_id  = p[2];
      req.kind       = p[3];
      req.content    = p[4];
      req.set_active = !args.Flag("--inactive");
      req.branch     = args.Option("--branch").value_or("");
      PrintSnippet(service.Regenerate(req));
    } else if (cmd == "choose" && n >= 4) {
      service.ChooseActive({p[1], p[2], p[3], args.Option("--branch").value_or("")});
      std::cout << "ok\n";
    } else if (cmd == "insert-above" && n >= 5) {
      PrintSnippet(service.InsertAbove({p[1], p[2], p[4], p[3], !args.Flag("--inactive")}));
    } else if (cmd == "insert-below" && n >= 5) {
      PrintSnippet(service.InsertBelow({p[1], p[2], p[4], p[3], args.Option("--branch").value_or("")}));
    } else if (cmd == "update" && n >= 2) {
      PrintSnippet(service.Update({p[1], args.Option("--content"), args.Option("--kind")}));
    } else if (cmd == "delete" && n >= 2) {
      service.Delete(p[1], args.Option("--story").value_or(""));
      std::cout << "ok\n";
    } else if (cmd == "get" && n >= 2) {
      auto row = runtime.graph->Get(p[1]);
      if (!row) {
        throw storygraph::util::NotFound("snippet not found: " + p[1]);
      }
      PrintSnippet(*row);
    } else if ((cmd == "path" || cmd == "text") && n >= 2) {
      auto resolved = service.ResolvePath(p[1], args.Option("--branch").value_or(""), args.Option("--head"));
      if (cmd == "path") {
        std::cout << "head=" << Opt(resolved.head_id) << "\n";
        PrintPath(resolved.path);
      } else {
        std::cout << resolved.text << "\n";
      }
    } else if (cmd == "tree" && n >= 2) {
      for (const auto& row : service.TreeForMainPath(p[1]).rows) {
        PrintSnippet(row.parent);
        for (const auto& child : row.children) {
          std::cout << "  " << (row.parent.child_id == child.id ? "* " : "  ");
          PrintSnippet(child);
        }
      }
    } else if (cmd == "children" && n >= 3) {
      PrintPath(runtime.graph->ListChildren(p[1], p[2]));
    } else if (cmd == "branches" && n >= 2) {
      for (const auto& branch : runtime.branches->ListBranches(p[1])) {
        std::cout << branch.name << "\t" << branch.head_id << "\t" << branch.created_at_ms << "\n";
      }
    } else if (cmd == "branch-set" && n >= 4) {
      auto branch = runtime.branches->UpsertBranch(p[1], p[2], p[3]);
      std::cout << branch.name << "\t" << branch.head_id << "\n";
    } else if (cmd == "branch-delete" && n >= 3) {
      runtime.branches->DeleteBranch(p[1], p[2]);
      std::cout << "ok\n";
    } else if (cmd == "health" && n >= 2) {
      auto report = service.BranchHealth(p[1]);
      std::cout << "healthy=" << (report.healthy ? "true" : "false") << "\n";
      for (const auto& [name, validation] : report.branches) {
        std::cout << name << "\t" << (validation.valid ? "ok" : validation.reason.value_or("invalid")) << "\n";
      }
    } else if (cmd == "repair" && n >= 3) {
      auto head = runtime.branches->RepairBranchHead(p[1], p[2]);
      std::cout << (head ? *head : "unrepairable") << "\n";
    } else if (cmd == "truncate" && n >= 2) {
      PrintSnippet(runtime.lifecycle->TruncateStory(p[1]));
    } else if (cmd == "delete-story" && n >= 2) {
      runtime.lifecycle->DeleteStory(p[1]);
      std::cout << "ok\n";
    } else if (cmd == "duplicate" && n >= 3) {
      auto mode = storygraph::story::DuplicateMode::kAll;
      try {
        mode = storygraph::story::ParseDuplicateMode(n >= 4 ? p[3] : "all");
      } catch (const storygraph::util::InvalidArgument& e) {
        std::cerr << e.what() << "\n";
        Usage();
        storygraph::observability::ShutdownLogging();
        return 1;
      }
      auto ids = runtime.lifecycle->DuplicateStory(p[1], p[2], mode);
      for (const auto& [from, to] : ids) {
        std::cout << from << "\t" << to << "\n";
      }
    } else if (cmd == "reset") {
      runtime.lifecycle->PurgeAll();
      std::cout << "ok\n";
    } else {
      Usage();
      storygraph::observability::ShutdownLogging();
      return 1;
    }

    storygraph::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    STORYGRAPH_LOG_ERROR("Fatal error", {storygraph::observability::StringField("command", cmd), storygraph::observability::StringField("error", e.what())});
    storygraph::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
