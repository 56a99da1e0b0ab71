#pragma once

#include "http_client.hpp"
#include "options.hpp"

namespace cli {

/**
 * @brief Configure console, file and syslog sinks from @a opts.
 */
void setup_logging(const Options& opts);

/**
 * @brief Run one synchronization pass over the superproject at `opts.root`.
 *
 * Reads the manifest, reconciles every submodule and publishes the pointer
 * updates. All hosting and forum requests go through @a http.
 *
 * @return `0` on success, including when there is nothing to do, and `1`
 *         when any fatal step fails.
 */
int run_sync(const Options& opts, HttpClient& http);

/**
 * @brief run_sync() with a curl transport honoring `--http-timeout`.
 */
int handle_sync_run(const Options& opts);

} // namespace cli
