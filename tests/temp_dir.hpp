#pragma once
#include <chrono>
#include <filesystem>
#include <string>
#include <system_error>
#include <unistd.h>

namespace canopy::testing
{

  inline std::string uniqueTempPath(const std::string &stem, const std::string &ext = "")
  {
    auto base = std::filesystem::temp_directory_path() / (stem + std::to_string(::getpid()) + "-" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
    auto s = base.string() + ext;
    return s;
  }

  // directory removed on destruction
  struct TempDir
  {
    std::filesystem::path path;

    explicit TempDir(const std::string &stem) : path(uniqueTempPath(stem))
    {
      std::filesystem::create_directories(path);
    }
    ~TempDir()
    {
      std::error_code ec;
      std::filesystem::remove_all(path, ec);
    }
    TempDir(const TempDir &) = delete;
    TempDir &operator=(const TempDir &) = delete;
  };

} // namespace canopy::testing
