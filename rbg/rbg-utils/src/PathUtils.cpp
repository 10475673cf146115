#include "rbg-utils/src/PathUtils.hpp"
#include <cstdint>
#include <filesystem>
#include <string>
#include <system_error>

#ifdef _WIN32
#include <windows.h>
#elif defined(__APPLE__)
#include <mach-o/dyld.h>
#include <climits>
#include <cstdlib>
#elif defined(__linux__)
#include <limits.h>
#include <unistd.h>
#endif

#include <stdexcept>

namespace rbg_utils
{

namespace
{

std::filesystem::path executableDirectory()
{
  std::filesystem::path executablePath;

#ifdef _WIN32
  char buffer[MAX_PATH];
  DWORD length = GetModuleFileNameA(nullptr, buffer, MAX_PATH);
  if (length == 0 || length == MAX_PATH)
  {
    throw std::runtime_error("Failed to get executable path on Windows");
  }
  executablePath = std::filesystem::path(buffer);

#elif defined(__APPLE__)
  char buffer[PATH_MAX];
  uint32_t size = sizeof(buffer);
  if (_NSGetExecutablePath(buffer, &size) != 0)
  {
    throw std::runtime_error("Failed to get executable path on macOS");
  }
  char realBuffer[PATH_MAX];
  if (realpath(buffer, realBuffer) == nullptr)
  {
    throw std::runtime_error("Failed to resolve executable path on macOS");
  }
  executablePath = std::filesystem::path(realBuffer);

#elif defined(__linux__)
  char buffer[PATH_MAX];
  ssize_t length = readlink("/proc/self/exe", buffer, sizeof(buffer) - 1);
  if (length == -1)
  {
    throw std::runtime_error("Failed to get executable path on Linux");
  }
  buffer[length] = '\0';
  executablePath = std::filesystem::path(buffer);

#else
#error "Unsupported platform for absolutePath"
#endif

  return executablePath.parent_path();
}

}  // namespace

std::filesystem::path absolutePath(const std::string& relativePath)
{
  std::filesystem::path const fullPath = executableDirectory() / relativePath;

  // absolute() rather than canonical(): the path does not have to exist
  return std::filesystem::absolute(fullPath).lexically_normal();
}

std::filesystem::path resolveResourcePath(const std::filesystem::path& path)
{
  if (path.is_absolute())
  {
    return path.lexically_normal();
  }

  std::error_code ec;
  if (std::filesystem::exists(path, ec))
  {
    return std::filesystem::absolute(path).lexically_normal();
  }

  return absolutePath(path.string());
}

}  // namespace rbg_utils
