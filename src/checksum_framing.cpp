#include "../include/checksum_framing.hpp"

checksum_framing::checksum_framing(filesize_t interval) : interval_(interval)
{
    if (interval_ == 0)
    {
        throw invalid_argument_exception("checksum interval must be at least 1");
    }
}

filesize_t checksum_framing::logical_to_physical(filesize_t logical) const
{
    return logical + (logical / interval_) * digest_size;
}

filesize_t checksum_framing::physical_to_logical(filesize_t physical) const
{
    return physical - (physical / get_block_size()) * digest_size;
}

filesize_t checksum_framing::block_offset(filesize_t physical) const
{
    return physical % get_block_size();
}

filesize_t checksum_framing::physical_length(filesize_t content_length) const
{
    auto blocks = (content_length + interval_ - 1) / interval_;
    return content_length + blocks * digest_size;
}

filesize_t checksum_framing::content_length(filesize_t physical_length) const
{
    auto full_blocks = physical_length / get_block_size();
    auto tail = physical_length % get_block_size();

    // the final partial block carries its own digest
    auto tail_content = tail > digest_size ? tail - digest_size : 0;
    return full_blocks * interval_ + tail_content;
}

digest_t checksum_framing::encode_digest(uint32_t value)
{
    // most significant byte first
    digest_t result{};
    for (auto it = result.rbegin(); it != result.rend(); ++it)
    {
        *it = static_cast<uint8_t>(value & 0xFF);
        value >>= 8;
    }
    return result;
}

digest_t checksum_framing::compute_digest(const hash32& hash)
{
    return encode_digest(hash.digest());
}
