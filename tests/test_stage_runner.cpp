#include "recon_splat/config/configuration.hpp"
#include "recon_splat/core/errors.hpp"
#include "recon_splat/pipeline/stage_runner.hpp"
#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

#include <sstream>

namespace fs = std::filesystem;

using recon_splat::FailureKind;
using recon_splat::Stage;
using recon_splat::config::Config;
using namespace recon_splat::pipeline;
using recon_splat::testing::FakeLauncher;
using recon_splat::testing::TempDir;
using recon_splat::testing::touch;

namespace {

StageSpec probe_spec(bool accepts_mask) {
    StageSpec s;
    s.stage = Stage::MATCHING;
    s.step_label = "2/5";
    s.label = "probe";
    s.binary = "probe_tool";
    s.accepts_mask = accepts_mask;
    s.args_builder = [](const ProjectLayout&, const Config&, const MaskDecision& m) {
        std::vector<std::string> args = {"run"};
        if (m.active) args.push_back("--mask=" + m.source_dir.string());
        return args;
    };
    s.precondition = [](const ProjectLayout& l) { return fs::exists(l.images_dir); };
    s.precondition_message = "no images";
    s.postcondition = [](const ProjectLayout& l) { return fs::exists(l.database_path); };
    s.postcondition_message = "no database";
    return s;
}

MaskDecision active_mask() {
    MaskDecision m;
    m.active = true;
    m.mask_count = 1;
    m.source_dir = "/masks";
    return m;
}

struct Fixture {
    TempDir tmp;
    ProjectLayout layout = derive_layout(tmp / "proj", tmp / "images");
    Config cfg;
    FakeLauncher launcher;

    Fixture() { fs::create_directories(layout.images_dir); }
};

} // namespace

TEST_CASE("stage_runner_precondition_unmet_launches_nothing") {
    Fixture f;
    fs::remove_all(f.layout.images_dir);
    StageRunner runner(f.launcher);

    StageResult r = runner.run(probe_spec(false), f.layout, f.cfg, {});
    REQUIRE_FALSE(r.success);
    REQUIRE(r.kind == FailureKind::PRECONDITION_UNMET);
    REQUIRE(r.reason == "no images");
    REQUIRE(f.launcher.calls.empty());
}

TEST_CASE("stage_runner_non_zero_exit") {
    Fixture f;
    f.launcher.on_launch = [](const Command&) { return 3; };
    StageRunner runner(f.launcher);

    StageResult r = runner.run(probe_spec(false), f.layout, f.cfg, {});
    REQUIRE_FALSE(r.success);
    REQUIRE(r.kind == FailureKind::PROCESS_EXIT_NON_ZERO);
    REQUIRE(r.exit_code == 3);
    REQUIRE(f.launcher.calls.size() == 1);
}

TEST_CASE("stage_runner_missing_executable_reports_exit_127") {
    Fixture f;
    f.launcher.on_launch = [](const Command&) { return 127; };
    StageRunner runner(f.launcher);

    StageResult r = runner.run(probe_spec(false), f.layout, f.cfg, {});
    REQUIRE(r.kind == FailureKind::PROCESS_EXIT_NON_ZERO);
    REQUIRE(r.reason.find("probe_tool") != std::string::npos);
}

TEST_CASE("stage_runner_launch_failure") {
    Fixture f;
    f.launcher.on_launch = [](const Command&) -> int {
        throw recon_splat::PipelineError("fork failed");
    };
    StageRunner runner(f.launcher);

    StageResult r = runner.run(probe_spec(false), f.layout, f.cfg, {});
    REQUIRE_FALSE(r.success);
    REQUIRE(r.kind == FailureKind::LAUNCH_FAILED);
}

TEST_CASE("stage_runner_postcondition_unmet_after_clean_exit") {
    Fixture f;
    StageRunner runner(f.launcher);

    StageResult r = runner.run(probe_spec(false), f.layout, f.cfg, {});
    REQUIRE_FALSE(r.success);
    REQUIRE(r.kind == FailureKind::POSTCONDITION_UNMET);
    REQUIRE(r.exit_code == 0);
    REQUIRE(r.reason == "no database");
}

TEST_CASE("stage_runner_success") {
    Fixture f;
    f.launcher.on_launch = [&f](const Command&) {
        touch(f.layout.database_path);
        return 0;
    };
    std::ostringstream out, err;
    PipelineLog log(out, err);
    StageRunner runner(f.launcher, &log);

    StageResult r = runner.run(probe_spec(false), f.layout, f.cfg, {});
    REQUIRE(r.success);
    REQUIRE(r.kind == FailureKind::NONE);
    REQUIRE(r.command == "probe_tool run");
    REQUIRE(out.str().find("Running: probe_tool run") != std::string::npos);
}

TEST_CASE("stage_runner_forwards_mask_only_to_accepting_stages") {
    Fixture f;
    StageRunner runner(f.launcher);

    runner.run(probe_spec(false), f.layout, f.cfg, active_mask());
    runner.run(probe_spec(true), f.layout, f.cfg, active_mask());
    REQUIRE(f.launcher.calls.size() == 2);
    REQUIRE(f.launcher.calls[0].args == std::vector<std::string>{"run"});
    REQUIRE(f.launcher.calls[1].args == std::vector<std::string>{"run", "--mask=/masks"});
}
