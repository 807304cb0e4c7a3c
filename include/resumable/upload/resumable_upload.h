/**
 * @file resumable_upload.h
 * @brief Main header for the resumable_upload library
 * @version 0.1.0
 *
 * Include this header to access the whole upload engine.
 *
 * @code
 * #include <resumable/upload/resumable_upload.h>
 *
 * using namespace resumable::upload;
 *
 * auto coordinator = upload_coordinator::builder()
 *     .with_metadata_directory("/var/lib/uploader/resume")
 *     .with_remote_access(std::make_shared<local_remote_access>("/mnt/share"))
 *     .build();
 * @endcode
 */

#ifndef RESUMABLE_UPLOAD_RESUMABLE_UPLOAD_H
#define RESUMABLE_UPLOAD_RESUMABLE_UPLOAD_H

#include <cstdint>
#include <string>

// Core types
#include "resumable/upload/core/types.h"
#include "resumable/upload/core/error_codes.h"
#include "resumable/upload/core/upload_types.h"
#include "resumable/upload/core/fingerprint.h"
#include "resumable/upload/core/resume_store.h"

// Remote capability
#include "resumable/upload/remote/remote_access.h"
#include "resumable/upload/remote/serialized_remote_access.h"
#include "resumable/upload/remote/local_remote_access.h"

// Events
#include "resumable/upload/events/progress_event_bus.h"
#include "resumable/upload/events/observers.h"

// Engine
#include "resumable/upload/engine/retry_policy.h"
#include "resumable/upload/engine/upload_control.h"
#include "resumable/upload/engine/chunk_transfer_engine.h"

// Coordinator
#include "resumable/upload/uploader/uploader_config.h"
#include "resumable/upload/uploader/uploader_types.h"
#include "resumable/upload/uploader/upload_coordinator.h"

namespace resumable::upload {

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

}  // namespace resumable::upload

#endif  // RESUMABLE_UPLOAD_RESUMABLE_UPLOAD_H
