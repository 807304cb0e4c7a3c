/**
 * @file remote_access.cpp
 * @brief Remote path helpers
 */

#include <resumable/upload/remote/remote_access.h>

namespace resumable::upload {

auto remote_parent_path(const std::string& path) -> std::string {
    auto end = path.find_last_not_of('/');
    if (end == std::string::npos) {
        return path.empty() ? std::string{} : std::string{"/"};
    }
    auto slash = path.find_last_of('/', end);
    if (slash == std::string::npos) {
        return {};
    }
    auto parent_end = path.find_last_not_of('/', slash);
    if (parent_end == std::string::npos) {
        return "/";
    }
    return path.substr(0, parent_end + 1);
}

}  // namespace resumable::upload
