#include "../include/checksummed_reader.hpp"

#include <algorithm>
#include <string>

checksummed_reader::checksummed_reader(byte_source& source, const checksummed_stream_parameters& parameters)
    : source_(source), framing_(parameters.interval), new_hash_(parameters.new_hash)
{
    if (!new_hash_)
    {
        throw invalid_argument_exception("checksummed_reader: no hash factory");
    }
}

void checksummed_reader::check_open() const
{
    if (closed_)
    {
        throw closed_exception();
    }
}

filesize_t checksummed_reader::read(const span_t& data)
{
    check_open();

    auto interval = framing_.get_interval();
    if (data.empty())
    {
        return 0;
    }
    if (state_ == read_state::at_block_boundary || block_offset_ >= interval)
    {
        // the source ended inside the digest that follows the cursor
        return 0;
    }

    auto wanted = std::min<filesize_t>(data.size(), interval - block_offset_);
    auto n = source_.read(data.first(wanted));
    if (n == 0)
    {
        return 0;
    }

    block_offset_ += n;
    if (block_offset_ == interval)
    {
        state_ = read_state::at_block_boundary;
    }
    return finish_content_read(n);
}

// Mid block, peeks at the next digest_size bytes and steps back over them.
// At a block boundary, consumes the digest. Either way a source that ends
// early means the tail of what was just read was digest, not content: the
// source is stepped back to the end of the content and parked there.
filesize_t checksummed_reader::finish_content_read(filesize_t content_read)
{
    digest_t digest{};
    auto got = read_full(source_, digest);
    if (got < digest_size)
    {
        auto overlap = std::min<filesize_t>(content_read, digest_size - got);
        source_.seek(-static_cast<int64_t>(got + overlap), seek_origin::current);
        block_offset_ -= overlap;
        state_ = read_state::at_block_boundary;
        return content_read - overlap;
    }

    if (state_ == read_state::at_block_boundary)
    {
        block_offset_ = 0;
        state_ = read_state::consuming_content;
    }
    else
    {
        source_.seek(-static_cast<int64_t>(digest_size), seek_origin::current);
    }
    return content_read;
}

filesize_t checksummed_reader::seek(int64_t offset, seek_origin origin)
{
    check_open();

    int64_t target = 0;
    switch (origin)
    {
    case seek_origin::begin:
        target = offset;
        break;
    case seek_origin::current:
    {
        auto physical = source_.seek(0, seek_origin::current);
        target = static_cast<int64_t>(framing_.physical_to_logical(physical)) + offset;
        break;
    }
    case seek_origin::end:
    {
        auto original = source_.seek(0, seek_origin::current);
        auto physical = source_.seek(0, seek_origin::end);
        target = static_cast<int64_t>(framing_.content_length(physical)) + offset;
        if (target < 0)
        {
            source_.seek(static_cast<int64_t>(original), seek_origin::begin);
        }
        break;
    }
    default:
        throw invalid_argument_exception("checksummed_reader: invalid seek origin " + to_string(origin));
    }

    if (target < 0)
    {
        throw invalid_argument_exception("checksummed_reader: seek to negative position " + std::to_string(target));
    }

    auto physical = source_.seek(static_cast<int64_t>(framing_.logical_to_physical(target)), seek_origin::begin);
    block_offset_ = framing_.block_offset(physical);
    state_ = read_state::consuming_content;
    return framing_.physical_to_logical(physical);
}

bool checksummed_reader::verify()
{
    check_open();

    auto hash = new_hash_();
    if (!hash)
    {
        throw invalid_argument_exception("checksummed_reader: hash factory returned null");
    }

    auto original = source_.seek(0, seek_origin::current);
    if (block_offset_ > 0)
    {
        source_.seek(-static_cast<int64_t>(block_offset_), seek_origin::current);
    }

    blob_t block(framing_.get_block_size());
    auto got = read_full(source_, block);
    if (got == 0)
    {
        source_.seek(static_cast<int64_t>(original), seek_origin::begin);
        throw checksummed_io_exception("checksummed_reader: no block to verify at " + std::to_string(original));
    }

    bool verified = false;
    if (got >= digest_size)
    {
        // a short final block still ends with its own digest
        const_span_t content = const_span_t(block).first(got - digest_size);
        const_span_t stored = const_span_t(block).subspan(got - digest_size, digest_size);
        hash->update(content);
        verified = std::ranges::equal(checksum_framing::compute_digest(*hash), stored);
    }

    source_.seek(static_cast<int64_t>(original), seek_origin::begin);
    return verified;
}

void checksummed_reader::close()
{
    check_open();

    closed_ = true;
    source_.close();
}
