#pragma once

#include <filesystem>
#include <string>

namespace toolmedia::util
{

/// Creates a unique directory under the system temp directory and removes it
/// (recursively) when destroyed. Removal errors are ignored.
class ScopedTempDir
{
  public:
    explicit ScopedTempDir(const std::string& prefix = "toolmedia-img-");
    ~ScopedTempDir();

    ScopedTempDir(const ScopedTempDir&) = delete;
    ScopedTempDir& operator=(const ScopedTempDir&) = delete;
    ScopedTempDir(ScopedTempDir&& other) noexcept;
    ScopedTempDir& operator=(ScopedTempDir&& other) noexcept;

    const std::filesystem::path& path() const
    {
        return path_;
    }

    /// Removes the directory now; safe to call more than once
    void remove() noexcept;

  private:
    std::filesystem::path path_;
};

} // namespace toolmedia::util
