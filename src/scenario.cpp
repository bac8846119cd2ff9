#include "switchover/scenario.hpp"

#include <iostream>
#include <sstream>
#include <thread>

#include "switchover/hash.hpp"
#include "switchover/jsonlite.hpp"
#include "switchover/observability.hpp"
#include "switchover/version.hpp"

namespace switchover {

namespace {

ConvergenceVerifier::SleepFn sleep_or_real(const ConvergenceVerifier::SleepFn& sleep) {
  if (sleep) return sleep;
  return [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
}

ConvergenceVerifier::ClockFn clock_or_real(const ConvergenceVerifier::ClockFn& clock) {
  if (clock) return clock;
  return [] {
    return static_cast<std::uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                          std::chrono::steady_clock::now().time_since_epoch())
                                          .count());
  };
}

std::string quoted(const std::string& s) { return "\"" + jsonlite::escape(s) + "\""; }

std::string string_array(const std::vector<std::string>& items) {
  std::string out = "[";
  for (std::size_t i = 0; i < items.size(); ++i) {
    if (i) out += ",";
    out += quoted(items[i]);
  }
  return out + "]";
}

}  // namespace

std::string to_string(StepKind kind) {
  switch (kind) {
    case StepKind::given:
      return "Given";
    case StepKind::when:
      return "When";
    case StepKind::then:
      return "Then";
  }
  return "Step";
}

std::string to_string(VolumeOutcome outcome) {
  switch (outcome) {
    case VolumeOutcome::none:
      return "none";
    case VolumeOutcome::published:
      return "published";
    case VolumeOutcome::degraded:
      return "degraded";
    case VolumeOutcome::republished:
      return "republished";
    case VolumeOutcome::self_healed:
      return "self_healed";
    case VolumeOutcome::stuck_degraded:
      return "stuck_degraded";
  }
  return "none";
}

std::string to_string(StepStatus status) {
  switch (status) {
    case StepStatus::passed:
      return "passed";
    case StepStatus::failed:
      return "failed";
    case StepStatus::skipped:
      return "skipped";
  }
  return "skipped";
}

// ---------------------------------------------------------------------------
// ScenarioContext
// ---------------------------------------------------------------------------

ScenarioContext::ScenarioContext(const std::string& scenario_name,
                                 const Collaborators& collaborators,
                                 const HarnessConfig& harness_config)
    : scenario(scenario_name),
      config(harness_config),
      control_plane(collaborators.control_plane),
      runtime(collaborators.runtime),
      initiator(collaborators.initiator),
      deployer(collaborators.deployer),
      injector(collaborators.control_plane, collaborators.runtime, collaborators.initiator),
      verifier(sleep_or_real(collaborators.sleep), clock_or_real(collaborators.clock)),
      path_budget{harness_config.path_interval_ms, harness_config.path_attempts},
      cordon_budget{harness_config.cordon_interval_ms, harness_config.cordon_attempts},
      startup_budget{harness_config.startup_interval_ms, harness_config.startup_attempts},
      ha_fail_window{1000, harness_config.ha_fail_window_s},
      clock_(clock_or_real(collaborators.clock)) {
  injector.set_scenario(scenario);
  verifier.set_scenario(scenario);
}

const VolumeRecord& ScenarioContext::published_volume() const {
  if (!volume) throw HarnessError(ErrorCode::not_found, "no volume has been published");
  return *volume;
}

std::string ScenarioContext::device_uri() const {
  const auto& vol = published_volume();
  if (!vol.target || vol.target->device_uri.empty()) {
    throw HarnessError(ErrorCode::not_found, "volume " + vol.uuid + " has no target deviceUri");
  }
  return vol.target->device_uri;
}

const std::string& ScenarioContext::device() const {
  if (!connection) throw HarnessError(ErrorCode::not_found, "no initiator is connected");
  return connection->device();
}

std::vector<std::string> ScenarioContext::teardown() {
  std::vector<std::string> errors;
  auto record = [&](const std::string& action, const std::string& error) {
    HarnessEvent ev;
    ev.kind = EventKind::teardown;
    ev.scenario = scenario;
    ev.step = action;
    ev.ok = error.empty();
    ev.error_code = error.empty() ? ErrorCode::none : ErrorCode::teardown_failed;
    ev.detail = error;
    emit_harness_event(ev);
    if (!error.empty()) {
      std::cerr << "[teardown] WARN: " << action << " failed: " << error << "\n";
      errors.push_back(action + ": " + error);
    }
  };

  if (connection) {
    const std::string action = "disconnect " + connection->device_uri();
    try {
      connection->close();
      record(action, "");
    } catch (const std::exception& e) {
      record(action, e.what());
    }
    connection.reset();
  }

  for (auto& e : injector.revert_all()) errors.push_back(std::move(e));

  if (cluster) {
    try {
      cluster->close();
      record("stop cluster", "");
    } catch (const std::exception& e) {
      record("stop cluster", e.what());
    }
    cluster.reset();
  }

  if (disks) {
    try {
      disks->close();
      record("remove backing disks", "");
    } catch (const std::exception& e) {
      record("remove backing disks", e.what());
    }
    disks.reset();
  }
  return errors;
}

// ---------------------------------------------------------------------------
// Reports
// ---------------------------------------------------------------------------

const StepReport* ScenarioReport::first_failure() const {
  for (const auto& s : steps) {
    if (s.status == StepStatus::failed) return &s;
  }
  return nullptr;
}

std::string ScenarioReport::to_json() const {
  std::ostringstream o;
  o << "{\"schema\":\"switchover_report_v" << version::REPORT_SCHEMA_VERSION << "\""
    << ",\"feature\":" << quoted(feature)
    << ",\"scenario\":" << quoted(scenario)
    << ",\"control_plane\":" << quoted(control_plane)
    << ",\"passed\":" << (passed ? "true" : "false")
    << ",\"outcome\":" << quoted(switchover::to_string(outcome))
    << ",\"published_node\":" << quoted(published_node)
    << ",\"final_target_node\":" << quoted(final_target_node)
    << ",\"elapsed_ms\":" << elapsed_ms
    << ",\"steps\":[";
  for (std::size_t i = 0; i < steps.size(); ++i) {
    const auto& s = steps[i];
    if (i) o << ",";
    o << "{\"kind\":" << quoted(switchover::to_string(s.kind))
      << ",\"text\":" << quoted(s.text)
      << ",\"status\":" << quoted(switchover::to_string(s.status))
      << ",\"duration_ms\":" << s.duration_ms;
    if (s.status == StepStatus::failed) {
      o << ",\"error_code\":" << quoted(switchover::to_string(s.error_code))
        << ",\"error\":" << quoted(s.error);
    }
    o << "}";
  }
  o << "],\"notes\":" << string_array(notes)
    << ",\"teardown_errors\":" << string_array(teardown_errors)
    << ",\"hash_primitive\":\"blake3\"";
  const std::string body = o.str();
  return body + ",\"digest\":\"" + report_digest(body + "}") + "\"}";
}

std::string suite_to_json(const std::vector<ScenarioReport>& reports) {
  std::size_t passed = 0;
  for (const auto& r : reports) {
    if (r.passed) ++passed;
  }
  std::string out = "{\"schema\":\"switchover_suite_v" +
                    std::to_string(version::SUITE_SCHEMA_VERSION) +
                    "\",\"passed\":" + std::to_string(passed) +
                    ",\"failed\":" + std::to_string(reports.size() - passed) +
                    ",\"stats\":" + global_harness_stats().to_json() + ",\"scenarios\":[";
  for (std::size_t i = 0; i < reports.size(); ++i) {
    if (i) out += ",";
    out += reports[i].to_json();
  }
  return out + "]}";
}

// ---------------------------------------------------------------------------
// ScenarioRunner
// ---------------------------------------------------------------------------

ScenarioRunner::ScenarioRunner(Collaborators collaborators, HarnessConfig config)
    : collaborators_(std::move(collaborators)), config_(std::move(config)) {}

ScenarioReport ScenarioRunner::run(const Scenario& scenario) {
  ScenarioReport report;
  report.feature = scenario.feature;
  report.scenario = scenario.name;
  report.control_plane = collaborators_.control_plane.endpoint();

  ScenarioContext ctx(scenario.name, collaborators_, config_);
  const std::uint64_t started = ctx.now_ms();
  std::cerr << "[scenario] " << scenario.feature << ": " << scenario.name << " against "
            << report.control_plane << "\n";

  bool failed = false;
  for (const auto& step : scenario.steps) {
    StepReport sr;
    sr.kind = step.kind;
    sr.text = step.text;
    if (failed) {
      sr.status = StepStatus::skipped;
      report.steps.push_back(sr);
      continue;
    }

    const std::uint64_t step_start = ctx.now_ms();
    try {
      step.action(ctx);
      sr.status = StepStatus::passed;
    } catch (const HarnessError& e) {
      sr.status = StepStatus::failed;
      sr.error_code = e.code();
      sr.error = e.what();
    } catch (const std::exception& e) {
      sr.status = StepStatus::failed;
      sr.error = e.what();
    }
    sr.duration_ms = ctx.now_ms() - step_start;
    failed = sr.status == StepStatus::failed;

    HarnessEvent ev;
    ev.kind = EventKind::step;
    ev.scenario = scenario.name;
    ev.step = to_string(step.kind) + " " + step.text;
    ev.ok = !failed;
    ev.duration_ns = sr.duration_ms * 1000000ULL;
    ev.error_code = sr.error_code;
    ev.detail = sr.error;
    emit_harness_event(ev);

    std::cerr << "[scenario]   " << ev.step << (failed ? " FAILED: " + sr.error : " ok") << "\n";
    report.steps.push_back(sr);
  }

  report.outcome = ctx.outcome;
  report.published_node = ctx.published_node;
  report.final_target_node = ctx.final_target_node;
  report.notes = ctx.notes;
  report.teardown_errors = ctx.teardown();
  report.elapsed_ms = ctx.now_ms() - started;
  report.passed = !failed && report.teardown_errors.empty();

  HarnessEvent ev;
  ev.kind = EventKind::scenario;
  ev.scenario = scenario.name;
  ev.step = scenario.feature;
  ev.ok = report.passed;
  ev.duration_ns = report.elapsed_ms * 1000000ULL;
  if (const auto* f = report.first_failure()) {
    ev.error_code = f->error_code;
    ev.detail = f->error;
  } else if (!report.teardown_errors.empty()) {
    ev.error_code = ErrorCode::teardown_failed;
    ev.detail = report.teardown_errors.front();
  }
  emit_harness_event(ev);
  std::cerr << "[scenario] " << scenario.name << ": " << (report.passed ? "PASSED" : "FAILED")
            << " (" << report.elapsed_ms << "ms, outcome " << to_string(report.outcome) << ")\n";
  return report;
}

std::vector<ScenarioReport> ScenarioRunner::run_all(const std::vector<Scenario>& scenarios) {
  std::vector<ScenarioReport> out;
  out.reserve(scenarios.size());
  for (const auto& s : scenarios) out.push_back(run(s));
  return out;
}

}  // namespace switchover
