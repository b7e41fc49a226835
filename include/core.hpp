#pragma once

#include <exception>
#include <stdexcept>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

using filesize_t = uint64_t;
using blob_t = std::vector<uint8_t>;
using span_t = std::span<uint8_t>;
using const_span_t = std::span<const uint8_t>;

const filesize_t digest_size = 4;
const filesize_t default_checksum_interval = 65532; // block + digest is 64KB

class checksummed_io_exception : public std::runtime_error
{
public:
    checksummed_io_exception(const std::string& message) : std::runtime_error(message)
    {
    }
};

// thrown by every operation on a closed or broken stream
class closed_exception : public checksummed_io_exception
{
public:
    closed_exception(const std::string& message = "closed") : checksummed_io_exception(message)
    {
    }
};

class invalid_argument_exception : public checksummed_io_exception
{
public:
    invalid_argument_exception(const std::string& message) : checksummed_io_exception(message)
    {
    }
};

class partial_write_exception : public checksummed_io_exception
{
    filesize_t bytes_written_;
public:
    partial_write_exception(const std::string& message, filesize_t bytes_written)
        : checksummed_io_exception(message), bytes_written_(bytes_written)
    {
    }

    // content bytes the sink accepted before the failure
    filesize_t get_bytes_written() const { return bytes_written_; }
};
