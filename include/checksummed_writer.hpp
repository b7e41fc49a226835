#pragma once

#include <memory>
#include "../include/byte_stream.hpp"
#include "../include/checksum_framing.hpp"

// Writes content to a sink with a digest embedded after every interval bytes.
//
// Only brand new sinks starting at offset 0 produce streams a
// checksummed_reader can read back without extra bookkeeping.
// close() must be called to emit the digest of a final partial block; the
// destructor does not do it.
class checksummed_writer : public byte_sink
{
    byte_sink& sink_;
    checksum_framing framing_;
    hash32_factory new_hash_;
    std::unique_ptr<hash32> hash_;
    filesize_t block_offset_ = 0;
    filesize_t content_length_ = 0;
    bool closed_ = false;

    void check_open() const;
    std::unique_ptr<hash32> create_hash() const;

    filesize_t write_to_sink(const const_span_t& data, filesize_t confirmed);
    void emit_digest(filesize_t confirmed);

public:
    checksummed_writer(byte_sink& sink, const checksummed_stream_parameters& parameters);

    checksummed_writer(const checksummed_writer&) = delete;
    checksummed_writer& operator=(const checksummed_writer&) = delete;

    // Returns data.size(). A sink failure poisons the writer and throws
    // partial_write_exception with the sink's exception nested.
    filesize_t write(const const_span_t& data) override;

    void close() override;

    bool is_closed() const { return closed_; }
    filesize_t get_content_length() const { return content_length_; }
    const checksum_framing& get_framing() const { return framing_; }
};
