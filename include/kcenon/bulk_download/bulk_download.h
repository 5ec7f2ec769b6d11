/**
 * @file bulk_download.h
 * @brief Main header for the bulk_download library
 * @version 0.1.0
 *
 * Include this header to access the download engine, the checkpoint store
 * and the integrity verifier.
 *
 * @code
 * #include <kcenon/bulk_download/bulk_download.h>
 *
 * using namespace kcenon::bulk_download;
 *
 * auto store = checkpoint_store::open("/data/courses");
 * auto tasks = parse_task_list(scraper_output);
 *
 * auto dispatcher = work_dispatcher::builder(store.value())
 *     .with_concurrency(4)
 *     .build();
 * auto report = dispatcher.value().run(tasks.value());
 *
 * integrity_verifier verifier(store.value());
 * auto summary = verifier.verify_all();
 * @endcode
 */

#ifndef KCENON_BULK_DOWNLOAD_BULK_DOWNLOAD_H
#define KCENON_BULK_DOWNLOAD_BULK_DOWNLOAD_H

#include <cstdint>
#include <string>

// Core types
#include "kcenon/bulk_download/core/types.h"
#include "kcenon/bulk_download/core/error_codes.h"
#include "kcenon/bulk_download/core/download_task.h"
#include "kcenon/bulk_download/core/cancellation.h"

// Store
#include "kcenon/bulk_download/store/checkpoint_record.h"
#include "kcenon/bulk_download/store/checkpoint_store.h"

// Transport
#include "kcenon/bulk_download/transport/http_transport.h"
#include "kcenon/bulk_download/transport/curl_transport.h"

// Adapters
#include "kcenon/bulk_download/adapters/thread_pool_adapter.h"

// Transfer
#include "kcenon/bulk_download/transfer/transfer_config.h"
#include "kcenon/bulk_download/transfer/transfer_worker.h"
#include "kcenon/bulk_download/transfer/work_dispatcher.h"

// Verification
#include "kcenon/bulk_download/verify/integrity_verifier.h"

namespace kcenon::bulk_download {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace kcenon::bulk_download

#endif  // KCENON_BULK_DOWNLOAD_BULK_DOWNLOAD_H
