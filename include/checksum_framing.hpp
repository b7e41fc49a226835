#pragma once

#include <array>
#include <utility>
#include "../include/core.hpp"
#include "../include/hash32.hpp"

using digest_t = std::array<uint8_t, digest_size>;

// Layout of a checksummed stream: every run of up to `interval` content bytes
// is followed by the 4 byte big endian digest of that run.
class checksum_framing
{
    filesize_t interval_;
public:
    explicit checksum_framing(filesize_t interval);

    filesize_t get_interval() const { return interval_; }

    // content bytes plus the digest that follows them
    filesize_t get_block_size() const { return interval_ + digest_size; }

    filesize_t logical_to_physical(filesize_t logical) const;

    // physical must not point into a digest
    filesize_t physical_to_logical(filesize_t physical) const;

    // content bytes already passed in the block containing physical
    filesize_t block_offset(filesize_t physical) const;

    // size of a finished stream holding content_length bytes
    filesize_t physical_length(filesize_t content_length) const;

    // content held by a finished stream of physical_length bytes
    filesize_t content_length(filesize_t physical_length) const;

    static digest_t encode_digest(uint32_t value);
    static digest_t compute_digest(const hash32& hash);
};

class checksummed_stream_parameters
{
public:
    filesize_t interval = default_checksum_interval;
    hash32_factory new_hash = make_crc32_hash;

    checksummed_stream_parameters() = default;
    checksummed_stream_parameters(filesize_t interval, hash32_factory new_hash = make_crc32_hash)
        : interval(interval), new_hash(std::move(new_hash))
    {
    }
};
