#include "image/build_plan.hpp"

#include "image/image_reference.hpp"

#include <set>
#include <utility>

namespace relpack::image {

namespace {

bool IsStageName(std::string_view name) {
  if (name.empty()) {
    return false;
  }
  for (const char c : name) {
    if (!((c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_' || c == '-')) {
      return false;
    }
  }
  return true;
}

bool ValidateOp(const BuildPlan& plan, std::size_t stage_index, std::size_t op_index,
                std::string& error) {
  const StageDescriptor& stage = plan.stages[stage_index];
  const LayerOp& op = stage.ops[op_index];
  const std::string where =
      "stage '" + stage.name + "' op " + std::to_string(op_index) + " (" + ToString(op.kind) + ")";

  switch (op.kind) {
  case LayerOpKind::kWorkdir:
    if (op.path.empty() || op.path.front() != '/') {
      error = where + ": workdir must be an absolute path";
      return false;
    }
    return true;
  case LayerOpKind::kCopy:
    if (op.sources.empty() || op.path.empty()) {
      error = where + ": copy needs at least one source and a destination";
      return false;
    }
    return true;
  case LayerOpKind::kCopyFromStage:
    if (!op.from_stage.has_value() || *op.from_stage >= stage_index) {
      error = where + ": can only copy from an earlier stage";
      return false;
    }
    if (op.sources.empty() || op.path.empty()) {
      error = where + ": copy needs at least one source and a destination";
      return false;
    }
    return true;
  case LayerOpKind::kRun:
    if (op.command.empty()) {
      error = where + ": command cannot be empty";
      return false;
    }
    return true;
  case LayerOpKind::kInstallPackages:
    if (op.packages.empty()) {
      error = where + ": package list cannot be empty";
      return false;
    }
    return true;
  case LayerOpKind::kCreateUser:
    if (op.user.empty() || IsRootUser(op.user) || op.uid == 0U) {
      error = where + ": created user must be non-root with a non-zero id";
      return false;
    }
    return true;
  case LayerOpKind::kSetUser:
    if (op.user.empty()) {
      error = where + ": user cannot be empty";
      return false;
    }
    return true;
  case LayerOpKind::kEntrypoint:
    if (op.argv.empty() || op.argv.front().empty()) {
      error = where + ": entrypoint cannot be empty";
      return false;
    }
    return true;
  }

  error = where + ": unknown layer operation";
  return false;
}

bool DependsOn(const StageDescriptor& stage, std::size_t dependency) {
  if (stage.parent.has_value() && *stage.parent == dependency) {
    return true;
  }
  for (const auto& op : stage.ops) {
    if (op.kind == LayerOpKind::kCopyFromStage && op.from_stage == dependency) {
      return true;
    }
  }
  return false;
}

} // namespace

const char* ToString(LayerOpKind kind) {
  switch (kind) {
  case LayerOpKind::kWorkdir:
    return "workdir";
  case LayerOpKind::kCopy:
    return "copy";
  case LayerOpKind::kCopyFromStage:
    return "copy_from_stage";
  case LayerOpKind::kRun:
    return "run";
  case LayerOpKind::kInstallPackages:
    return "install_packages";
  case LayerOpKind::kCreateUser:
    return "create_user";
  case LayerOpKind::kSetUser:
    return "set_user";
  case LayerOpKind::kEntrypoint:
    return "entrypoint";
  }
  return "unknown";
}

LayerOp Workdir(std::string path) {
  LayerOp op;
  op.kind = LayerOpKind::kWorkdir;
  op.path = std::move(path);
  return op;
}

LayerOp CopyFromContext(std::vector<std::string> sources, std::string destination) {
  LayerOp op;
  op.kind = LayerOpKind::kCopy;
  op.sources = std::move(sources);
  op.path = std::move(destination);
  return op;
}

LayerOp CopyFromStage(std::size_t stage_index, std::string source, std::string destination) {
  LayerOp op;
  op.kind = LayerOpKind::kCopyFromStage;
  op.from_stage = stage_index;
  op.sources = {std::move(source)};
  op.path = std::move(destination);
  return op;
}

LayerOp Run(std::string command) {
  LayerOp op;
  op.kind = LayerOpKind::kRun;
  op.command = std::move(command);
  return op;
}

LayerOp InstallPackages(std::vector<std::string> packages) {
  LayerOp op;
  op.kind = LayerOpKind::kInstallPackages;
  op.packages = std::move(packages);
  return op;
}

LayerOp CreateUser(std::string user, std::uint32_t uid) {
  LayerOp op;
  op.kind = LayerOpKind::kCreateUser;
  op.user = std::move(user);
  op.uid = uid;
  return op;
}

LayerOp SetUser(std::string user) {
  LayerOp op;
  op.kind = LayerOpKind::kSetUser;
  op.user = std::move(user);
  return op;
}

LayerOp Entrypoint(std::vector<std::string> argv) {
  LayerOp op;
  op.kind = LayerOpKind::kEntrypoint;
  op.argv = std::move(argv);
  return op;
}

std::size_t AddStage(BuildPlan& plan, StageDescriptor stage) {
  plan.stages.push_back(std::move(stage));
  return plan.stages.size() - 1U;
}

std::optional<std::size_t> FindStage(const BuildPlan& plan, std::string_view name) {
  for (std::size_t i = 0; i < plan.stages.size(); ++i) {
    if (plan.stages[i].name == name) {
      return i;
    }
  }
  return std::nullopt;
}

bool ValidateBuildPlan(const BuildPlan& plan, std::string& error) {
  if (plan.stages.empty()) {
    error = "build plan has no stages";
    return false;
  }

  std::set<std::string> names;
  for (std::size_t i = 0; i < plan.stages.size(); ++i) {
    const StageDescriptor& stage = plan.stages[i];
    if (!IsStageName(stage.name)) {
      error = "stage " + std::to_string(i) + " has an invalid name '" + stage.name + "'";
      return false;
    }
    if (!names.insert(stage.name).second) {
      error = "duplicate stage name '" + stage.name + "'";
      return false;
    }

    if (stage.parent.has_value()) {
      if (*stage.parent >= i) {
        error = "stage '" + stage.name + "' can only inherit from an earlier stage";
        return false;
      }
      if (!stage.base_image.empty()) {
        error = "stage '" + stage.name + "' has both a parent stage and a base image";
        return false;
      }
    } else if (!IsPinnedImageReference(stage.base_image)) {
      error = "stage '" + stage.name + "' base image '" + stage.base_image +
              "' is not pinned to a version tag or digest";
      return false;
    }

    for (std::size_t op_index = 0; op_index < stage.ops.size(); ++op_index) {
      if (!ValidateOp(plan, i, op_index, error)) {
        return false;
      }
    }

    if (i > 0U && !DependsOn(stage, i - 1U)) {
      error = "stage '" + stage.name + "' must build on the preceding stage '" +
              plan.stages[i - 1U].name + "'";
      return false;
    }
  }

  if (!FindStage(plan, plan.publish_target).has_value()) {
    error = "publish target '" + plan.publish_target + "' is not a stage of the plan";
    return false;
  }
  return true;
}

bool ResolveStageChain(const BuildPlan& plan, std::string_view target,
                       std::vector<std::size_t>& chain, std::string& error) {
  chain.clear();
  const std::optional<std::size_t> target_index = FindStage(plan, target);
  if (!target_index.has_value()) {
    error = "unknown stage '" + std::string(target) + "'";
    return false;
  }

  // Dependencies always point backwards, so one reverse sweep marks the full
  // closure.
  std::vector<bool> needed(plan.stages.size(), false);
  needed[*target_index] = true;
  for (std::size_t i = *target_index + 1U; i-- > 0U;) {
    if (!needed[i]) {
      continue;
    }
    const StageDescriptor& stage = plan.stages[i];
    if (stage.parent.has_value()) {
      needed[*stage.parent] = true;
    }
    for (const auto& op : stage.ops) {
      if (op.kind == LayerOpKind::kCopyFromStage && op.from_stage.has_value()) {
        needed[*op.from_stage] = true;
      }
    }
  }

  for (std::size_t i = 0; i <= *target_index; ++i) {
    if (needed[i]) {
      chain.push_back(i);
    }
  }
  return true;
}

StageIdentity EffectiveIdentity(const BuildPlan& plan, std::size_t stage_index) {
  std::vector<std::size_t> lineage;
  std::optional<std::size_t> cursor = stage_index;
  while (cursor.has_value() && *cursor < plan.stages.size()) {
    lineage.push_back(*cursor);
    cursor = plan.stages[*cursor].parent;
  }

  StageIdentity identity;
  for (auto it = lineage.rbegin(); it != lineage.rend(); ++it) {
    for (const auto& op : plan.stages[*it].ops) {
      if (op.kind == LayerOpKind::kWorkdir) {
        identity.workdir = op.path;
      } else if (op.kind == LayerOpKind::kSetUser) {
        identity.user = op.user;
      } else if (op.kind == LayerOpKind::kEntrypoint) {
        identity.entrypoint = op.argv;
      }
    }
  }
  return identity;
}

bool IsRootUser(std::string_view user) {
  const std::string_view name = user.substr(0, user.find(':'));
  return name.empty() || name == "root" || name == "0";
}

BuildPlan MakeReleasePlan(const config::ReleaseConfig& config) {
  BuildPlan plan;
  plan.publish_target = config.publish_target;

  StageDescriptor builder;
  builder.name = std::string(kBuilderStage);
  builder.base_image = config.builder.image;
  builder.ops.push_back(Workdir(config.builder.workdir));
  if (!config.builder.lock_files.empty()) {
    builder.ops.push_back(CopyFromContext(config.builder.lock_files, "./"));
  }
  for (const auto& dir : config.builder.source_dirs) {
    builder.ops.push_back(CopyFromContext({dir}, "./" + dir));
  }
  for (const auto& dir : config.builder.asset_dirs) {
    builder.ops.push_back(CopyFromContext({dir}, "./" + dir));
  }
  builder.ops.push_back(Run(config.builder.build_command));
  const std::size_t builder_index = AddStage(plan, std::move(builder));

  std::string install_dir = config.base.install_dir;
  if (install_dir.empty() || install_dir.back() != '/') {
    install_dir.push_back('/');
  }

  StageDescriptor base;
  base.name = std::string(kBaseStage);
  base.base_image = config.base.image;
  base.ops.push_back(CopyFromStage(builder_index, config.builder.artifact_path, install_dir));
  if (!config.base.runtime_packages.empty()) {
    base.ops.push_back(InstallPackages(config.base.runtime_packages));
  }
  base.ops.push_back(Entrypoint({install_dir + config.binary}));
  const std::size_t base_index = AddStage(plan, std::move(base));

  const std::string uid = std::to_string(config.rootless.uid);
  StageDescriptor rootless;
  rootless.name = std::string(kRootlessStage);
  rootless.parent = base_index;
  rootless.ops.push_back(CreateUser(config.rootless.user, config.rootless.uid));
  rootless.ops.push_back(Workdir("/home/" + config.rootless.user));
  rootless.ops.push_back(SetUser(uid + ":" + uid));
  AddStage(plan, std::move(rootless));

  return plan;
}

} // namespace relpack::image
