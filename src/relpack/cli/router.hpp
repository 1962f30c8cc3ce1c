#pragma once

namespace relpack::cli {

// Routes `relpack` subcommands and returns process exit codes with a stable
// contract for CI jobs:
//   0  => success
//   1  => command failed after valid invocation
//   2  => usage error (unknown command / invalid args)
//   10 => invalid release config
//   20 => version could not be resolved from the manifest
//   30 => build plan or image build failed
//   40 => publish failed (credentials, auth, registry)
int Dispatch(int argc, char** argv);

} // namespace relpack::cli
