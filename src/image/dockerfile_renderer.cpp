#include "image/dockerfile_renderer.hpp"

#include "core/json_utils.hpp"

#include <sstream>
#include <string_view>

namespace relpack::image {

namespace {

bool NeedsJsonForm(const std::vector<std::string>& args) {
  for (const auto& arg : args) {
    if (arg.find_first_of(" \t\"") != std::string::npos) {
      return true;
    }
  }
  return false;
}

void RenderCopy(std::ostringstream& out, std::string_view flags,
                const std::vector<std::string>& sources, const std::string& destination) {
  std::vector<std::string> args = sources;
  args.push_back(destination);

  out << "COPY ";
  if (!flags.empty()) {
    out << flags << ' ';
  }
  if (NeedsJsonForm(args)) {
    out << core::ToJsonStringArray(args) << '\n';
    return;
  }
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (i != 0U) {
      out << ' ';
    }
    out << args[i];
  }
  out << '\n';
}

void RenderOp(std::ostringstream& out, const BuildPlan& plan, const LayerOp& op) {
  switch (op.kind) {
  case LayerOpKind::kWorkdir:
    out << "WORKDIR " << op.path << '\n';
    return;
  case LayerOpKind::kCopy:
    RenderCopy(out, "", op.sources, op.path);
    return;
  case LayerOpKind::kCopyFromStage:
    RenderCopy(out, "--from=" + plan.stages[*op.from_stage].name, op.sources, op.path);
    return;
  case LayerOpKind::kRun:
    out << "RUN " << op.command << '\n';
    return;
  case LayerOpKind::kInstallPackages: {
    out << "RUN apt-get update \\\n"
        << "    && apt-get install -y --no-install-recommends";
    for (const auto& package : op.packages) {
      out << ' ' << package;
    }
    out << " \\\n"
        << "    && rm -rf /var/lib/apt/lists/*\n";
    return;
  }
  case LayerOpKind::kCreateUser: {
    const std::string id = std::to_string(op.uid);
    out << "RUN groupadd --gid " << id << ' ' << op.user << " \\\n"
        << "    && useradd --create-home --uid " << id << " --gid " << id << ' ' << op.user
        << '\n';
    return;
  }
  case LayerOpKind::kSetUser:
    out << "USER " << op.user << '\n';
    return;
  case LayerOpKind::kEntrypoint:
    out << "ENTRYPOINT " << core::ToJsonStringArray(op.argv) << '\n';
    return;
  }
}

} // namespace

std::string RenderDockerfile(const BuildPlan& plan) {
  std::ostringstream out;
  out << "# syntax=docker/dockerfile:1\n"
      << "# Generated by relpack from the release config; do not edit by hand.\n";

  for (const auto& stage : plan.stages) {
    out << '\n';
    const std::string& from =
        stage.parent.has_value() ? plan.stages[*stage.parent].name : stage.base_image;
    out << "FROM " << from << " AS " << stage.name << '\n';

    for (const auto& op : stage.ops) {
      RenderOp(out, plan, op);
    }
  }
  return out.str();
}

} // namespace relpack::image
