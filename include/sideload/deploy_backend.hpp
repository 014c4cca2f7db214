#pragma once
/**
 * @file deploy_backend.hpp
 * @brief Contract of the device-side install / rekey / package service.
 *
 * @details
 * The orchestrator decides *when* to rekey, deploy or package; a
 * DeployBackend decides *how*. Every call is blocking and reports through
 * BackendResult, never by throwing.
 *
 * Threading:
 * - deploy_and_sign() may run on a worker thread while the orchestrator
 *   waits on a timer. cancel() is then called from the orchestrator thread
 *   and must make the in-flight call return promptly. After the worker is
 *   joined the backend must accept new calls again (reset on entry).
 */

#include "sideload/device.hpp"
#include "sideload/stage_result.hpp"

#include <chrono>
#include <string>

namespace sideload {

struct DeployRequest {
    std::string build_dir;     /**< Validated staging directory. */
    std::string out_name;      /**< Artifact base name, no extension. */
    std::string sign_key;
    std::chrono::milliseconds timeout{300000};
};

struct BackendResult {
    bool ok = false;
    ErrorKind kind = ErrorKind::None;
    std::string message;
    std::string artifact;      /**< Path of the produced package on success. */
};

class DeployBackend {
public:
    virtual ~DeployBackend() = default;

    virtual BackendResult rekey(const AuthorizedDevice& device,
                                const std::string& sign_key,
                                const std::string& package_path) = 0;

    virtual BackendResult deploy_and_sign(const AuthorizedDevice& device,
                                          const DeployRequest& req) = 0;

    virtual BackendResult create_package(const AuthorizedDevice& device,
                                         const DeployRequest& req) = 0;

    virtual void cancel() = 0;
};

} // namespace sideload
