#pragma once
/**
 * @page sl-http-backend Sideload HTTP Deploy Backend
 * @file http_backend.hpp
 * @brief DeployBackend over the device's developer web server.
 *
 * @details
 * WHAT THIS DOES
 * --------------
 * - rekey():           POST /plugin_install, `mysubmit=Rekey`, `passwd`, file `archive`
 *                      (the reference package). A reply carrying a failure
 *                      marker counts as a rejected key.
 * - deploy_and_sign(): zip the build directory with the system `zip` tool,
 *                      POST /plugin_install with `mysubmit=Replace`, then
 *                      create_package().
 * - create_package():  POST /plugin_package with `mysubmit=Package`,
 *                      `app_name`, `passwd`, `pkg_time`. The reply is either
 *                      the package itself or a page linking `pkgs/<file>.pkg`,
 *                      which is then downloaded.
 * - cancel():          flips a flag every in-flight HTTP call polls.
 *
 * Artifacts and the upload zip are written under the staging directory
 * (default: `<tmp>/sideload-staging`).
 *
 * STATUS MAPPING
 * --------------
 *   transport error        → NetworkUnreachable ("cancelled" → TransferTimedOut)
 *   401 / 403              → AuthenticationFailed
 *   other non-200, marker  → DeployFailed
 *   empty package          → ArtifactMissing
 *   local file errors      → IoFailed
 */

#include "sideload/deploy_backend.hpp"
#include "http_io.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <string>

namespace sideload {

/// Link to a generated package inside a plugin_package reply page; empty if none.
std::string find_package_link(const std::string& page);

class HttpDeployBackend : public DeployBackend {
public:
    explicit HttpDeployBackend(HttpTransport& http,
                               std::filesystem::path staging_dir = default_staging_dir(),
                               std::chrono::milliseconds rekey_timeout = std::chrono::milliseconds(60000));

    static std::filesystem::path default_staging_dir();

    BackendResult rekey(const AuthorizedDevice& device,
                        const std::string& sign_key,
                        const std::string& package_path) override;

    BackendResult deploy_and_sign(const AuthorizedDevice& device, const DeployRequest& req) override;

    BackendResult create_package(const AuthorizedDevice& device, const DeployRequest& req) override;

    void cancel() override { cancel_.store(true); }

private:
    /// Package whatever is installed; leaves the cancel flag as it is.
    BackendResult package_installed(const AuthorizedDevice& device, const DeployRequest& req);
    HttpResponse post_form(const AuthorizedDevice& device, const std::string& target,
                           const MultipartForm& form, std::chrono::milliseconds timeout);
    bool zip_directory(const std::filesystem::path& dir, const std::filesystem::path& zip,
                       std::chrono::milliseconds timeout, std::string& err);

    HttpTransport& http_;
    std::filesystem::path staging_;
    std::chrono::milliseconds rekey_timeout_;
    std::atomic<bool> cancel_{false};
};

} // namespace sideload
