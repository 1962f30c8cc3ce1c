#include "config/release_config.hpp"
#include "image/build_plan.hpp"
#include "image/dockerfile_renderer.hpp"

#include <catch2/catch.hpp>

#include <string>

namespace {

relpack::config::ReleaseConfig DemoConfig() {
  relpack::config::ReleaseConfig config;
  config.image_name = "example/demo-bot";
  config.binary = "demo-bot";
  relpack::config::ApplyDerivedDefaults(config);
  return config;
}

} // namespace

TEST_CASE("Default release plan renders the three-stage Dockerfile", "[image][dockerfile]") {
  const std::string dockerfile =
      relpack::image::RenderDockerfile(relpack::image::MakeReleasePlan(DemoConfig()));

  const std::string expected =
      "# syntax=docker/dockerfile:1\n"
      "# Generated by relpack from the release config; do not edit by hand.\n"
      "\n"
      "FROM rust:1.66.0-bullseye AS builder\n"
      "WORKDIR /app\n"
      "COPY Cargo.toml Cargo.lock ./\n"
      "COPY src ./src\n"
      "COPY imgs ./imgs\n"
      "RUN cargo build --release --bin demo-bot --features=all\n"
      "\n"
      "FROM debian:bullseye-20211201-slim AS base\n"
      "COPY --from=builder /app/target/release/demo-bot /usr/local/bin/\n"
      "RUN apt-get update \\\n"
      "    && apt-get install -y --no-install-recommends openssl ca-certificates tzdata \\\n"
      "    && rm -rf /var/lib/apt/lists/*\n"
      "ENTRYPOINT [\"/usr/local/bin/demo-bot\"]\n"
      "\n"
      "FROM base AS rootless\n"
      "RUN groupadd --gid 1000 demo-bot \\\n"
      "    && useradd --create-home --uid 1000 --gid 1000 demo-bot\n"
      "WORKDIR /home/demo-bot\n"
      "USER 1000:1000\n";
  REQUIRE(dockerfile == expected);
}

TEST_CASE("Copy sources with spaces switch to the JSON form", "[image][dockerfile]") {
  relpack::config::ReleaseConfig config = DemoConfig();
  config.builder.asset_dirs = {"static files"};

  const std::string dockerfile =
      relpack::image::RenderDockerfile(relpack::image::MakeReleasePlan(config));
  REQUIRE(dockerfile.find("COPY [\"static files\",\"./static files\"]\n") != std::string::npos);
}

TEST_CASE("Empty runtime package list emits no install layer", "[image][dockerfile]") {
  relpack::config::ReleaseConfig config = DemoConfig();
  config.base.runtime_packages.clear();

  const std::string dockerfile =
      relpack::image::RenderDockerfile(relpack::image::MakeReleasePlan(config));
  REQUIRE(dockerfile.find("apt-get") == std::string::npos);
  REQUIRE(dockerfile.find("ENTRYPOINT [\"/usr/local/bin/demo-bot\"]") != std::string::npos);
}
