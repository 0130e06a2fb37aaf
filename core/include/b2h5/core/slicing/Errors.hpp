#pragma once

#include <stdexcept>
#include <string>

namespace b2h5
{

/**
 * @brief A chunk payload does not match the dataset it belongs to.
 *
 * Raised when a payload's element type, rank or shape contradicts the
 * dataset metadata. Indicates corrupted or incompatible storage.
 */
class DataIntegrityError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/** @brief An opaque payload's byte count is not a whole number of elements */
class SizeMismatchError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/** @brief Failure reported by HDF5 or the Blosc2 library */
class StorageError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/** @brief A read was cancelled before completion; no result exists */
class ReadCancelled : public std::runtime_error
{
public:
    ReadCancelled() : std::runtime_error("slice read cancelled") {}
};

}  // namespace b2h5
