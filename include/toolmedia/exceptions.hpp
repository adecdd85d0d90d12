#pragma once
#include <stdexcept>
#include <string>

namespace toolmedia
{

struct Error : public std::runtime_error
{
    using std::runtime_error::runtime_error;
};

struct NotFoundError : public Error
{
    using Error::Error;
};

struct ValidationError : public Error
{
    using Error::Error;
};

/// Bytes could not be decoded (corrupt, truncated or unsupported format)
struct ImageDecodeError : public Error
{
    using Error::Error;
};

/// An image backend could not complete an operation
struct BackendError : public Error
{
    using Error::Error;
};

/// Raised by the read tool normalizer; never converted into a placeholder
struct ReadImageError : public Error
{
    using Error::Error;
};

} // namespace toolmedia
