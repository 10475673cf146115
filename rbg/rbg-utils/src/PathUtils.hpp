#ifndef RBG_UTILS_PATH_UTILS_HPP
#define RBG_UTILS_PATH_UTILS_HPP

#include <filesystem>
#include <string>

namespace rbg_utils
{

/**
 * Convert a string path to an absolute filesystem path relative to the
 * directory containing the current executable.
 *
 * @param relativePath The path string relative to the executable directory
 * @return An absolute filesystem path
 *
 * Example:
 *   If executable is at: /home/user/app/bin/rbg-exe
 *   And relativePath is: "../assets/levels/demo.gltf"
 *   Returns: /home/user/app/assets/levels/demo.gltf
 */
std::filesystem::path absolutePath(const std::string& relativePath);

/**
 * Resolve a game resource path.
 *
 * Absolute paths are returned unchanged. A relative path that exists from the
 * current working directory is made absolute against it; otherwise it is
 * resolved next to the executable with absolutePath().
 *
 * @param path Path as written in the configuration
 * @return An absolute, lexically normal path (which may not exist)
 */
std::filesystem::path resolveResourcePath(const std::filesystem::path& path);

}  // namespace rbg_utils

#endif  // RBG_UTILS_PATH_UTILS_HPP
