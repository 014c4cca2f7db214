/**
 * @file main.cpp
 * @brief sideload CLI: discover devices, manage projects, build/deploy/sign.
 *
 * Commands:
 *   discover  [--configure] [--first-device | --select N] [--password P]
 *   device    --ip IP --password P [--no-check]
 *   add       --name N --root DIR --sign-key K --sign-package PKG --output OUT [--files G...]
 *   edit      NAME [--root ...] [--sign-key ...] [--sign-package ...] [--output ...] [--files ...]
 *   remove    NAME
 *   list
 *   generate  [NAME] [--skip-build] [--use-existing-build] [--build-task L]
 *             [--build-answer skip|existing|first] [--skip-rekey] [--package-only]
 *             [--fallback-package] [--discover [--first-device | --select N]
 *             [--password P] [--remember]]
 *
 * Output:
 *   status=ok ... on stdout, status=error reason=... on stderr, logs on stderr.
 *   Exit 0 ok, 1 generic, 2 usage, 3..10 per failure kind (see stage_result.hpp).
 *
 * State:
 *   $XDG_CONFIG_HOME/sideload/config.json, or --config-dir DIR.
 */

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include "sideload/authenticator.hpp"
#include "sideload/discovery.hpp"
#include "sideload/orchestrator.hpp"
#include "build_config.hpp"
#include "http_auth.hpp"
#include "http_backend.hpp"
#include "http_io.hpp"
#include "project_store.hpp"
#include "task_catalog.hpp"

namespace fs = std::filesystem;
using namespace sideload;

static constexpr int EXIT_GENERIC = 1;
static constexpr int EXIT_USAGE   = 2;

static int fail(const std::string& reason, int code) {
  std::cerr << "status=error reason=" << reason << "\n";
  return code;
}

static void print_device(size_t index, const Device& d) {
  std::cout << "index=" << index
            << " ip=" << d.address
            << " name=\"" << d.name << "\""
            << " model=\"" << d.model << "\""
            << " serial=" << d.serial;
  if (d.software_version) std::cout << " version=" << *d.software_version;
  std::cout << "\n";
}

static void print_project(const Project& p) {
  std::cout << "project=" << p.name
            << " root=" << p.root_dir
            << " sign_package=" << p.sign_package
            << " output=" << p.output << "\n";
}

// Pick one device out of a discovery result.
//   - --select N wins, then --first-device, then "exactly one found".
static bool pick_device(const std::vector<Device>& devices, bool first, int select,
                        Device& out, std::string& err) {
  if (devices.empty()) { err = "no_devices_found"; return false; }
  if (select >= 0) {
    if (static_cast<size_t>(select) >= devices.size()) { err = "bad_select:" + std::to_string(select); return false; }
    out = devices[select];
    return true;
  }
  if (first || devices.size() == 1) { out = devices.front(); return true; }
  err = "multiple_devices_found need_select";
  return false;
}

static DiscoveryResult run_discovery(HttpTransport& http) {
  NetworkDiscovery disco(http);
  auto r = disco.discover();
  if (!r.ok) spdlog::warn("{}", r.error);
  for (size_t i = 0; i < r.devices.size(); ++i) print_device(i, r.devices[i]);
  return r;
}

// Reachability then credential; both gate anything that talks to the developer server.
static int check_device(HttpTransport& http, const Device& d, const std::string& password) {
  DeviceAuthenticator auth(http);
  if (!auth.test_reachable(d)) {
    std::cerr << "status=error kind=" << to_string(ErrorKind::NetworkUnreachable)
              << " reason=device_unreachable ip=" << d.address << "\n";
    for (const auto& h : remediation_for(ErrorKind::NetworkUnreachable)) std::cerr << "hint=" << h << "\n";
    return exit_code_for(ErrorKind::NetworkUnreachable);
  }
  if (!auth.test_credential(d.address, password)) {
    std::cerr << "status=error kind=" << to_string(ErrorKind::AuthenticationFailed)
              << " reason=credential_rejected ip=" << d.address << "\n";
    for (const auto& h : remediation_for(ErrorKind::AuthenticationFailed)) std::cerr << "hint=" << h << "\n";
    return exit_code_for(ErrorKind::AuthenticationFailed);
  }
  return 0;
}

static BuildChoice parse_build_answer(const std::string& s) {
  if (s == "existing") return {BuildChoiceKind::UseExisting, {}};
  if (s == "first")    return {BuildChoiceKind::RunTask, {}};
  return {BuildChoiceKind::Skip, {}};
}

int main(int argc, char** argv) {
  CLI::App app{"sideload: build, deploy and sign channels on a developer-mode device"};
  app.require_subcommand(1);

  // ---- global ----
  std::string config_dir;
  bool verbose = false, quiet = false;
  app.add_option("--config-dir", config_dir, "Directory holding config.json (default: XDG config)");
  app.add_flag("-v,--verbose", verbose, "Debug logging");
  app.add_flag("-q,--quiet", quiet, "Warnings and errors only");

  // ---- discover ----
  auto* cmd_discover = app.add_subcommand("discover", "Find devices on the local network");
  bool d_configure = false, d_first = false;
  int d_select = -1;
  std::string d_password;
  auto* d_opt_configure = cmd_discover->add_flag("--configure", d_configure, "Save the chosen device as the default");
  auto* d_opt_first = cmd_discover->add_flag("--first-device", d_first, "Choose the first device found")
                          ->needs(d_opt_configure);
  cmd_discover->add_option("--select", d_select, "Choose device by index")
      ->excludes(d_opt_first)->needs(d_opt_configure);
  cmd_discover->add_option("--password", d_password, "Developer password of the chosen device")
      ->needs(d_opt_configure);

  // ---- device ----
  auto* cmd_device = app.add_subcommand("device", "Set the default device");
  std::string dv_ip, dv_password;
  bool dv_no_check = false;
  cmd_device->add_option("--ip", dv_ip, "Device IPv4 address")->required();
  cmd_device->add_option("--password", dv_password, "Developer password")->required();
  cmd_device->add_flag("--no-check", dv_no_check, "Save without contacting the device");

  // ---- add ----
  auto* cmd_add = app.add_subcommand("add", "Register a project");
  Project a_proj;
  cmd_add->add_option("--name", a_proj.name, "Unique project name")->required();
  cmd_add->add_option("--root", a_proj.root_dir, "Project root directory")->required();
  cmd_add->add_option("--sign-key", a_proj.sign_key, "Signing password of the reference package")->required();
  cmd_add->add_option("--sign-package", a_proj.sign_package, "Previously signed .pkg")->required();
  cmd_add->add_option("--output", a_proj.output, "Where to write the signed package")->required();
  cmd_add->add_option("--files", a_proj.files, "Include globs");

  // ---- edit ----
  auto* cmd_edit = app.add_subcommand("edit", "Change a project");
  std::string e_name, e_root, e_key, e_pkg, e_out;
  std::vector<std::string> e_files;
  cmd_edit->add_option("name", e_name, "Project name")->required();
  auto* e_opt_root  = cmd_edit->add_option("--root", e_root, "Project root directory");
  auto* e_opt_key   = cmd_edit->add_option("--sign-key", e_key, "Signing password");
  auto* e_opt_pkg   = cmd_edit->add_option("--sign-package", e_pkg, "Reference package");
  auto* e_opt_out   = cmd_edit->add_option("--output", e_out, "Output package path");
  auto* e_opt_files = cmd_edit->add_option("--files", e_files, "Include globs");

  // ---- remove ----
  auto* cmd_remove = app.add_subcommand("remove", "Forget a project");
  std::string r_name;
  cmd_remove->add_option("name", r_name, "Project name")->required();

  // ---- list ----
  auto* cmd_list = app.add_subcommand("list", "Show the default device and all projects");

  // ---- generate ----
  auto* cmd_gen = app.add_subcommand("generate", "Build, deploy and sign a project");
  std::string g_name, g_password, g_build_answer = "skip";
  RunOptions g_opts;
  bool g_fallback = false, g_discover = false, g_first = false, g_remember = false;
  int g_select = -1;
  cmd_gen->add_option("name", g_name, "Project name (optional when only one exists)");
  cmd_gen->add_flag("--skip-build", g_opts.skip_build, "Do not run any build task");
  cmd_gen->add_flag("--use-existing-build", g_opts.use_existing_build, "Use the build already on disk");
  cmd_gen->add_option("--build-task", g_opts.build_task, "Run this task label");
  cmd_gen->add_option("--build-answer", g_build_answer, "Build choice when no task is given")
      ->check(CLI::IsMember({"skip", "existing", "first"}));
  cmd_gen->add_flag("--skip-rekey", g_opts.skip_rekey, "Do not rekey the device");
  cmd_gen->add_flag("--package-only", g_opts.package_only, "Package the installed channel only");
  cmd_gen->add_flag("--fallback-package", g_fallback, "Accept package-only if the deploy times out");
  auto* g_opt_discover = cmd_gen->add_flag("--discover", g_discover, "Discover the device instead of using the default");
  auto* g_opt_first = cmd_gen->add_flag("--first-device", g_first, "With --discover: first device found");
  cmd_gen->add_option("--select", g_select, "With --discover: device index")->excludes(g_opt_first)->needs(g_opt_discover);
  cmd_gen->add_option("--password", g_password, "Developer password (default: stored)");
  cmd_gen->add_flag("--remember", g_remember, "With --discover: save the device as default")->needs(g_opt_discover);
  g_opt_first->needs(g_opt_discover);

  CLI11_PARSE(app, argc, argv);

  // -------- logging --------
  spdlog::set_default_logger(spdlog::stderr_color_mt("sideload"));
  spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
  spdlog::set_level(spdlog::level::info);
  spdlog::cfg::load_env_levels();
  if (verbose) spdlog::set_level(spdlog::level::debug);
  if (quiet)   spdlog::set_level(spdlog::level::warn);

  // -------- state --------
  ProjectStore store(config_dir.empty() ? ProjectStore::default_path()
                                        : fs::path(config_dir) / "config.json");
  std::string err;
  if (!store.load(err)) return fail(err, EXIT_GENERIC);

  BeastTransport wire;
  AuthenticatingTransport http(wire);

  // -------- discover --------
  if (*cmd_discover) {
    auto r = run_discovery(http);
    if (!d_configure) {
      std::cout << "status=ok devices=" << r.devices.size() << "\n";
      return 0;
    }
    Device chosen;
    if (!pick_device(r.devices, d_first, d_select, chosen, err)) return fail(err, EXIT_USAGE);
    if (d_password.empty()) return fail("password_required", EXIT_USAGE);
    if (int rc = check_device(http, chosen, d_password); rc != 0) return rc;

    store.set_device(to_device_config(chosen, d_password));
    if (!store.save(err)) return fail(err, EXIT_GENERIC);
    std::cout << "status=ok device=" << chosen.address << " name=\"" << chosen.name << "\"\n";
    return 0;
  }

  // -------- device --------
  if (*cmd_device) {
    NetworkDiscovery disco(http);
    Device d;
    if (auto info = disco.query_device(dv_ip, std::chrono::milliseconds(3000), false)) {
      d = *info;
    } else {
      spdlog::warn("no device-info from {}", dv_ip);
      d = to_authorized(DeviceConfig{dv_ip, dv_password, "", "", "", ""}).device;
    }
    if (!dv_no_check) {
      if (int rc = check_device(http, d, dv_password); rc != 0) return rc;
    }
    store.set_device(to_device_config(d, dv_password));
    if (!store.save(err)) return fail(err, EXIT_GENERIC);
    std::cout << "status=ok device=" << d.address << " name=\"" << d.name << "\"\n";
    return 0;
  }

  // -------- add --------
  if (*cmd_add) {
    std::error_code ec;
    if (!fs::is_directory(a_proj.root_dir, ec)) return fail("root_not_found:" + a_proj.root_dir, EXIT_USAGE);
    if (!validate_package_file(a_proj.sign_package, err)) return fail(err, EXIT_USAGE);
    if (!store.add(a_proj, err)) return fail(err, EXIT_USAGE);
    if (!store.save(err)) return fail(err, EXIT_GENERIC);
    std::cout << "status=ok added=" << a_proj.name << "\n";
    return 0;
  }

  // -------- edit --------
  if (*cmd_edit) {
    ProjectPatch patch;
    if (e_opt_root->count())  patch.root_dir = e_root;
    if (e_opt_key->count())   patch.sign_key = e_key;
    if (e_opt_out->count())   patch.output = e_out;
    if (e_opt_files->count()) patch.files = e_files;
    if (e_opt_pkg->count()) {
      if (!validate_package_file(e_pkg, err)) return fail(err, EXIT_USAGE);
      patch.sign_package = e_pkg;
    }
    if (!store.update(e_name, patch, err)) return fail(err, EXIT_USAGE);
    if (!store.save(err)) return fail(err, EXIT_GENERIC);
    std::cout << "status=ok updated=" << e_name << "\n";
    return 0;
  }

  // -------- remove --------
  if (*cmd_remove) {
    if (!store.remove(r_name, err)) return fail(err, EXIT_USAGE);
    if (!store.save(err)) return fail(err, EXIT_GENERIC);
    std::cout << "status=ok removed=" << r_name << "\n";
    return 0;
  }

  // -------- list --------
  if (*cmd_list) {
    if (const auto& d = store.device()) {
      std::cout << "device=" << d->ip << " name=\"" << d->name << "\" model=\"" << d->model << "\"\n";
    } else {
      std::cout << "device=none\n";
    }
    for (const auto& p : store.list()) print_project(p);
    std::cout << "status=ok projects=" << store.list().size() << "\n";
    return 0;
  }

  // -------- generate --------
  if (!*cmd_gen) return fail("no_command", EXIT_USAGE);

  // ===== project =====
  Project project;
  if (!g_name.empty()) {
    auto p = store.get(g_name);
    if (!p) return fail("not_found:" + g_name, EXIT_USAGE);
    project = *p;
  } else if (store.list().size() == 1) {
    project = store.list().front();
  } else {
    std::cerr << "status=error reason=" << (store.list().empty() ? "no_projects" : "need_project_name") << "\n";
    for (const auto& p : store.list()) std::cerr << "candidate project=" << p.name << "\n";
    return EXIT_USAGE;
  }

  // ===== device =====
  AuthorizedDevice device;
  if (g_discover) {
    auto r = run_discovery(http);
    Device chosen;
    if (!pick_device(r.devices, g_first, g_select, chosen, err)) return fail(err, EXIT_USAGE);
    std::string password = g_password;
    if (password.empty() && store.device()) password = store.device()->password;
    if (password.empty()) return fail("password_required", EXIT_USAGE);
    device.device = chosen;
    device.password = password;
    if (g_remember) {
      store.set_device(to_device_config(chosen, password));
      if (!store.save(err)) return fail(err, EXIT_GENERIC);
    }
  } else if (store.device()) {
    device = to_authorized(*store.device());
    if (!g_password.empty()) device.password = g_password;
  } else {
    return fail("no_device_configured (use `sideload device` or --discover)", EXIT_USAGE);
  }

  if (int rc = check_device(http, device.device, device.password); rc != 0) return rc;

  // ===== run =====
  HttpDeployBackend backend(http);
  JsonTaskCatalog catalog;
  JsonBuildConfig config;
  BuildTaskRunner runner;
  ScriptedDecisions decisions(parse_build_answer(g_build_answer), g_fallback);
  Orchestrator orch(http, backend, catalog, config, runner, decisions);

  auto report = orch.run(project, device, g_opts);
  for (const auto& w : report.warnings) std::cerr << "warning=" << w << "\n";

  if (!report.ok) {
    std::cerr << "status=error stage=" << to_string(report.failed_stage)
              << " kind=" << to_string(report.failure.kind)
              << " reason=" << report.failure.message << "\n";
    for (const auto& h : report.failure.hints) std::cerr << "hint=" << h << "\n";
    for (const auto& h : remediation_for(report.failure.kind)) std::cerr << "hint=" << h << "\n";
    return report.exit_code();
  }

  std::cout << "status=ok artifact=" << report.artifact
            << " size_kb=" << report.artifact_size / 1024
            << (report.fallback_used ? " fallback=package_only" : "") << "\n";
  return 0;
}
