#include "toolmedia/util/temp_dir.hpp"

#include "toolmedia/exceptions.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <system_error>
#include <vector>

namespace toolmedia::util
{

namespace fs = std::filesystem;

ScopedTempDir::ScopedTempDir(const std::string& prefix)
{
    std::error_code ec;
    fs::path base = fs::temp_directory_path(ec);
    if (ec)
        base = "/tmp";

    std::string templ = (base / (prefix + "XXXXXX")).string();
    std::vector<char> buf(templ.begin(), templ.end());
    buf.push_back('\0');
    if (::mkdtemp(buf.data()) == nullptr)
        throw Error("failed to create temp directory under " + base.string() + ": " +
                    std::strerror(errno));
    path_ = fs::path(buf.data());
}

ScopedTempDir::~ScopedTempDir()
{
    remove();
}

ScopedTempDir::ScopedTempDir(ScopedTempDir&& other) noexcept : path_(std::move(other.path_))
{
    other.path_.clear();
}

ScopedTempDir& ScopedTempDir::operator=(ScopedTempDir&& other) noexcept
{
    if (this != &other)
    {
        remove();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

void ScopedTempDir::remove() noexcept
{
    if (path_.empty())
        return;
    std::error_code ec;
    fs::remove_all(path_, ec);
    path_.clear();
}

} // namespace toolmedia::util
