/**
 * @file upload_types.cpp
 * @brief Implementation of upload type helpers
 */

#include <resumable/upload/core/upload_types.h>

#include <array>

namespace resumable::upload {

auto upload_status_from_string(const std::string& text)
    -> std::optional<upload_status> {
    static constexpr std::array all_statuses = {
        upload_status::pending,
        upload_status::in_progress,
        upload_status::paused,
        upload_status::completed,
        upload_status::failed,
        upload_status::cancelled,
    };

    for (auto status : all_statuses) {
        if (text == to_string(status)) {
            return status;
        }
    }
    return std::nullopt;
}

}  // namespace resumable::upload
