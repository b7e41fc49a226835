#include "../include/checksummed_writer.hpp"

#include <algorithm>
#include <exception>

checksummed_writer::checksummed_writer(byte_sink& sink, const checksummed_stream_parameters& parameters)
    : sink_(sink), framing_(parameters.interval), new_hash_(parameters.new_hash)
{
    if (!new_hash_)
    {
        throw invalid_argument_exception("checksummed_writer: no hash factory");
    }
    hash_ = create_hash();
}

void checksummed_writer::check_open() const
{
    if (closed_)
    {
        throw closed_exception();
    }
}

std::unique_ptr<hash32> checksummed_writer::create_hash() const
{
    auto hash = new_hash_();
    if (!hash)
    {
        throw invalid_argument_exception("checksummed_writer: hash factory returned null");
    }
    return hash;
}

filesize_t checksummed_writer::write_to_sink(const const_span_t& data, filesize_t confirmed)
{
    filesize_t n = 0;
    try
    {
        n = sink_.write(data);
    }
    catch (const std::exception&)
    {
        closed_ = true;
        std::throw_with_nested(partial_write_exception("checksummed_writer: sink write failed", confirmed));
    }

    if (n != data.size())
    {
        closed_ = true;
        throw partial_write_exception("checksummed_writer: short write", confirmed + std::min<filesize_t>(n, data.size()));
    }
    return n;
}

void checksummed_writer::emit_digest(filesize_t confirmed)
{
    auto digest = checksum_framing::compute_digest(*hash_);
    filesize_t n = 0;
    try
    {
        n = sink_.write(digest);
    }
    catch (const std::exception&)
    {
        closed_ = true;
        std::throw_with_nested(partial_write_exception("checksummed_writer: digest write failed", confirmed));
    }

    if (n != digest.size())
    {
        closed_ = true;
        throw partial_write_exception("checksummed_writer: short digest write", confirmed);
    }
}

filesize_t checksummed_writer::write(const const_span_t& data)
{
    check_open();

    auto interval = framing_.get_interval();
    auto remaining = data;
    filesize_t written = 0;

    while (block_offset_ + remaining.size() >= interval)
    {
        auto piece = remaining.first(interval - block_offset_);
        written += write_to_sink(piece, written);
        content_length_ += piece.size();
        hash_->update(piece);
        remaining = remaining.subspan(piece.size());

        emit_digest(written);
        hash_ = create_hash();
        block_offset_ = 0;
    }

    if (!remaining.empty())
    {
        written += write_to_sink(remaining, written);
        content_length_ += remaining.size();
        hash_->update(remaining);
        block_offset_ += remaining.size();
    }

    return written;
}

void checksummed_writer::close()
{
    check_open();

    if (block_offset_ > 0)
    {
        emit_digest(0);
        block_offset_ = 0;
    }

    closed_ = true;
    sink_.close();
}
