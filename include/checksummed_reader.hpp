#pragma once

#include "../include/byte_stream.hpp"
#include "../include/checksum_framing.hpp"

// Reads content written by checksummed_writer. Digests are skipped on read
// and only checked when verify() is called.
//
// After any exception from read(), seek() or verify() the position is
// unspecified and the caller should seek before reading again.
class checksummed_reader : public byte_source
{
    enum class read_state
    {
        consuming_content,
        at_block_boundary
    };

    byte_source& source_;
    checksum_framing framing_;
    hash32_factory new_hash_;
    filesize_t block_offset_ = 0;
    read_state state_ = read_state::consuming_content;
    bool closed_ = false;

    void check_open() const;
    filesize_t finish_content_read(filesize_t content_read);

public:
    checksummed_reader(byte_source& source, const checksummed_stream_parameters& parameters);

    checksummed_reader(const checksummed_reader&) = delete;
    checksummed_reader& operator=(const checksummed_reader&) = delete;

    // Never crosses a block boundary in one call. Returns 0 at end of stream.
    filesize_t read(const span_t& data) override;

    // Offsets and the result are logical.
    filesize_t seek(int64_t offset, seek_origin origin) override;

    // Checks the digest of the block under the cursor without moving it.
    // An exception means the result is unknown, not that the block is bad.
    bool verify();

    void close() override;

    bool is_closed() const { return closed_; }
    const checksum_framing& get_framing() const { return framing_; }
};
