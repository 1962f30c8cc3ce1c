#pragma once

#include "image/build_plan.hpp"

#include <string>

namespace relpack::image {

// Renders a validated plan as Dockerfile text.
//
// Output is a pure function of the plan: identical plans render
// byte-identical text, which keeps the build fingerprint stable across
// reruns. Package installs and user creation render as single RUN layers so
// apt index cleanup lands in the same layer as the install.
std::string RenderDockerfile(const BuildPlan& plan);

} // namespace relpack::image
