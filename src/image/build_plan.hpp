#pragma once

#include "config/release_config.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace relpack::image {

enum class LayerOpKind {
  kWorkdir,
  kCopy,
  kCopyFromStage,
  kRun,
  kInstallPackages,
  kCreateUser,
  kSetUser,
  kEntrypoint,
};

const char* ToString(LayerOpKind kind);

// One instruction of a stage. Only the fields relevant to `kind` are set:
// - kWorkdir: `path`
// - kCopy: `sources` (build-context relative), `path` (destination)
// - kCopyFromStage: `from_stage`, `sources` (paths inside that stage), `path`
// - kRun: `command`
// - kInstallPackages: `packages`
// - kCreateUser: `user`, `uid` (group gets the same id)
// - kSetUser: `user` (name or `uid:gid`)
// - kEntrypoint: `argv`
struct LayerOp {
  LayerOpKind kind = LayerOpKind::kRun;
  std::string path;
  std::vector<std::string> sources;
  std::optional<std::size_t> from_stage;
  std::string command;
  std::vector<std::string> packages;
  std::string user;
  std::uint32_t uid = 0;
  std::vector<std::string> argv;
};

LayerOp Workdir(std::string path);
LayerOp CopyFromContext(std::vector<std::string> sources, std::string destination);
LayerOp CopyFromStage(std::size_t stage_index, std::string source, std::string destination);
LayerOp Run(std::string command);
LayerOp InstallPackages(std::vector<std::string> packages);
LayerOp CreateUser(std::string user, std::uint32_t uid);
LayerOp SetUser(std::string user);
LayerOp Entrypoint(std::vector<std::string> argv);

// Stages start either from an external image (`base_image`) or from an
// earlier stage of the same plan (`parent`), never both.
struct StageDescriptor {
  std::string name;
  std::string base_image;
  std::optional<std::size_t> parent;
  std::vector<LayerOp> ops;
};

// Arena of stages referenced by index. Stage order is build order.
struct BuildPlan {
  std::vector<StageDescriptor> stages;
  std::string publish_target;
};

// Runtime identity an image reports when inspected.
struct StageIdentity {
  std::string user = "root";
  std::string workdir = "/";
  std::vector<std::string> entrypoint;
};

inline constexpr std::string_view kBuilderStage = "builder";
inline constexpr std::string_view kBaseStage = "base";
inline constexpr std::string_view kRootlessStage = "rootless";

std::size_t AddStage(BuildPlan& plan, StageDescriptor stage);

std::optional<std::size_t> FindStage(const BuildPlan& plan, std::string_view name);

// Structural checks:
// - at least one stage, unique lowercase names
// - root stages use a pinned base image; derived stages have none
// - `parent` and `from_stage` reference earlier stages only
// - every stage after the first builds on the one right before it
//   (by inheritance or by copying from it), so the plan is one linear chain
// - per-op required fields are present, created users are non-root
// - `publish_target` names a stage
bool ValidateBuildPlan(const BuildPlan& plan, std::string& error);

// Indices of every stage `target` depends on, plus `target` itself, in build
// order.
bool ResolveStageChain(const BuildPlan& plan, std::string_view target,
                       std::vector<std::size_t>& chain, std::string& error);

// Folds WORKDIR/USER/ENTRYPOINT along the inheritance chain of `stage_index`.
StageIdentity EffectiveIdentity(const BuildPlan& plan, std::size_t stage_index);

bool IsRootUser(std::string_view user);

// builder -> base -> rootless, parameterized by `config`. `config` must have
// passed validation and had derived defaults applied.
BuildPlan MakeReleasePlan(const config::ReleaseConfig& config);

} // namespace relpack::image
