// ============================================================================
// http_backend.cpp — implementation for http_backend.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

/**
 * @file http_backend.cpp
 */

#include "http_backend.hpp"
#include "sideload/task_runner.hpp"   // run_process() for the zip step

#include <spdlog/spdlog.h>

#include <fstream>
#include <regex>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;
namespace sideload {

static constexpr std::chrono::milliseconds ZIP_KILL_GRACE{2000};


// -------- helpers --------

static bool read_file(const fs::path& p, std::string& out) {
    std::ifstream in(p, std::ios::binary);
    if (!in) return false;
    std::ostringstream ss;
    ss << in.rdbuf();
    out = ss.str();
    return true;
}

static bool write_file(const fs::path& p, const std::string& data) {
    std::ofstream out(p, std::ios::binary | std::ios::trunc);
    if (!out) return false;
    out.write(data.data(), static_cast<std::streamsize>(data.size()));
    return static_cast<bool>(out);
}

static BackendResult failure(ErrorKind k, std::string msg) {
    BackendResult r;
    r.ok = false;
    r.kind = k;
    r.message = std::move(msg);
    return r;
}

/*
 * check_reply()
 * -------------
 * Shared status mapping for every developer-server call. Returns true when
 * the reply is a 200; otherwise fills `out` with the mapped failure.
 */
static bool check_reply(const HttpResponse& res, const char* what, BackendResult& out) {
    if (!res.ok) {
        const bool cancelled = res.error == "cancelled";
        out = failure(cancelled ? ErrorKind::TransferTimedOut : ErrorKind::NetworkUnreachable,
                      std::string(what) + ": " + res.error);
        return false;
    }
    if (res.status == 401 || res.status == 403) {
        out = failure(ErrorKind::AuthenticationFailed,
                      std::string(what) + ": authentication failed (HTTP " + std::to_string(res.status) + ")");
        return false;
    }
    if (res.status != 200) {
        out = failure(ErrorKind::DeployFailed,
                      std::string(what) + ": HTTP " + std::to_string(res.status));
        return false;
    }
    return true;
}

static bool looks_like_html(const HttpResponse& res) {
    if (res.content_type.find("text/html") != std::string::npos) return true;
    auto b = res.body.find_first_not_of(" \t\r\n");
    return b != std::string::npos && res.body[b] == '<';
}


// -------- public API --------

std::string find_package_link(const std::string& page) {
    static const std::regex link(R"(pkgs/+([A-Za-z0-9_.\-]+\.pkg))");
    std::smatch m;
    if (!std::regex_search(page, m, link)) return {};
    return "/pkgs/" + m[1].str();
}

HttpDeployBackend::HttpDeployBackend(HttpTransport& http, fs::path staging_dir,
                                     std::chrono::milliseconds rekey_timeout)
    : http_(http), staging_(std::move(staging_dir)), rekey_timeout_(rekey_timeout) {}

fs::path HttpDeployBackend::default_staging_dir() {
    std::error_code ec;
    auto tmp = fs::temp_directory_path(ec);
    if (ec) tmp = "/tmp";
    return tmp / "sideload-staging";
}

HttpResponse HttpDeployBackend::post_form(const AuthorizedDevice& device, const std::string& target,
                                          const MultipartForm& form, std::chrono::milliseconds timeout) {
    HttpRequest req;
    req.method = "POST";
    req.host = device.device.address;
    req.port = DEVELOPER_PORT;
    req.target = target;
    req.user = DEVELOPER_USER;
    req.password = device.password;
    req.content_type = form.content_type();
    req.body = form.body();
    req.timeout = timeout;
    req.cancel = &cancel_;
    return http_.send(req);
}

bool HttpDeployBackend::zip_directory(const fs::path& dir, const fs::path& zip,
                                      std::chrono::milliseconds timeout, std::string& err) {
    std::error_code ec;
    fs::remove(zip, ec);  // zip(1) would otherwise update an old archive

    ProcessSpec spec;
    spec.argv = {"zip", "-q", "-r", "-X", zip.string(), "."};
    spec.cwd = dir;
    auto outcome = run_process(spec, timeout, ZIP_KILL_GRACE);
    if (!outcome.ok()) {
        err = "zip " + std::string(to_string(outcome.kind)) +
              (outcome.message.empty() ? "" : ": " + outcome.message);
        return false;
    }
    return true;
}

// ---- rekey() — push the reference package so the device adopts its signing key
// POLICY: the server answers 200 even on rejection; failure markers in the page decide.
BackendResult HttpDeployBackend::rekey(const AuthorizedDevice& device,
                                       const std::string& sign_key,
                                       const std::string& package_path) {
    cancel_.store(false);

    std::string pkg;
    if (!read_file(package_path, pkg))
        return failure(ErrorKind::IoFailed, "cannot read " + package_path);

    MultipartForm form;
    form.add_field("mysubmit", "Rekey");
    form.add_field("passwd", sign_key);
    form.add_file("archive", fs::path(package_path).filename().string(), pkg);

    auto res = post_form(device, "/plugin_install", form, rekey_timeout_);
    BackendResult out;
    if (!check_reply(res, "rekey", out)) return out;
    if (res.body.find("Failed") != std::string::npos || res.body.find("Error") != std::string::npos)
        return failure(ErrorKind::DeployFailed, "rekey rejected by the device");

    out.ok = true;
    return out;
}

/*
 * deploy_and_sign()
 * -----------------
 * Phases:
 *   1) zip the build directory into the staging directory,
 *   2) upload it as a Replace install,
 *   3) package the freshly installed channel.
 * The cancel flag is checked between phases as well as inside each HTTP call.
 */
BackendResult HttpDeployBackend::deploy_and_sign(const AuthorizedDevice& device, const DeployRequest& req) {
    cancel_.store(false);

    std::error_code ec;
    fs::create_directories(staging_, ec);
    if (ec) return failure(ErrorKind::IoFailed, "cannot create " + staging_.string() + ": " + ec.message());

    // Step 1
    const fs::path zip = staging_ / (req.out_name + ".zip");
    std::string err;
    if (!zip_directory(req.build_dir, zip, req.timeout, err)) return failure(ErrorKind::IoFailed, err);
    if (cancel_.load()) return failure(ErrorKind::TransferTimedOut, "cancelled");

    std::string archive;
    if (!read_file(zip, archive)) return failure(ErrorKind::IoFailed, "cannot read " + zip.string());

    // Step 2
    MultipartForm form;
    form.add_field("mysubmit", "Replace");
    form.add_file("archive", zip.filename().string(), archive, "application/zip");

    spdlog::info("uploading {} ({} KB)", zip.filename().string(), archive.size() / 1024);
    auto res = post_form(device, "/plugin_install", form, req.timeout);
    fs::remove(zip, ec);

    BackendResult out;
    if (!check_reply(res, "install", out)) return out;
    if (res.body.find("Install Failure") != std::string::npos)
        return failure(ErrorKind::DeployFailed, "install rejected by the device");
    if (cancel_.load()) return failure(ErrorKind::TransferTimedOut, "cancelled");

    // Step 3
    return package_installed(device, req);
}

BackendResult HttpDeployBackend::create_package(const AuthorizedDevice& device, const DeployRequest& req) {
    cancel_.store(false);
    return package_installed(device, req);
}

BackendResult HttpDeployBackend::package_installed(const AuthorizedDevice& device, const DeployRequest& req) {
    std::error_code ec;
    fs::create_directories(staging_, ec);
    if (ec) return failure(ErrorKind::IoFailed, "cannot create " + staging_.string() + ": " + ec.message());

    const auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                            std::chrono::system_clock::now().time_since_epoch()).count();

    MultipartForm form;
    form.add_field("mysubmit", "Package");
    form.add_field("app_name", req.out_name);
    form.add_field("passwd", req.sign_key);
    form.add_field("pkg_time", std::to_string(now_ms));

    auto res = post_form(device, "/plugin_package", form, req.timeout);
    BackendResult out;
    if (!check_reply(res, "package", out)) return out;

    const bool html = looks_like_html(res);
    std::string artifact = std::move(res.body);
    if (html) {
        const auto link = find_package_link(artifact);
        if (link.empty())
            return failure(ErrorKind::DeployFailed, "package request returned no package link");

        HttpRequest get;
        get.host = device.device.address;
        get.port = DEVELOPER_PORT;
        get.target = link;
        get.user = DEVELOPER_USER;
        get.password = device.password;
        get.timeout = req.timeout;
        get.cancel = &cancel_;
        auto dl = http_.send(get);
        if (!check_reply(dl, "package download", out)) return out;
        artifact = std::move(dl.body);
    }
    if (artifact.empty()) return failure(ErrorKind::ArtifactMissing, "device returned an empty package");

    const fs::path dest = staging_ / (req.out_name + ".pkg");
    if (!write_file(dest, artifact)) return failure(ErrorKind::IoFailed, "cannot write " + dest.string());

    spdlog::info("package written to {} ({} KB)", dest.string(), artifact.size() / 1024);
    out.ok = true;
    out.artifact = dest.string();
    return out;
}

} // namespace sideload
