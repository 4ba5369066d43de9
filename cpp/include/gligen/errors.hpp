// errors.hpp
// Author: Jason Hughes
// Date:   2026
//
// Exception types raised by the GLIGEN pipeline.

#pragma once

#include <stdexcept>
#include <string>

namespace Gligen
{

/// Malformed call arguments. Raised before any computation starts.
class ValidationError : public std::invalid_argument
{
public:
    explicit ValidationError(const std::string& what) : std::invalid_argument(what) {}
};

/// A model file, collaborator or configuration file is unavailable.
class ResourceError : public std::runtime_error
{
public:
    explicit ResourceError(const std::string& what) : std::runtime_error(what) {}
};

/// The image-embedding projection weight could not be fetched.
class WeightFetchError : public ResourceError
{
public:
    explicit WeightFetchError(const std::string& what) : ResourceError(what) {}
};

}  // namespace Gligen
