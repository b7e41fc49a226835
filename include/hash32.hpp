#pragma once

#include <functional>
#include <memory>
#include "../include/core.hpp"

// A streaming 32-bit hash. One instance covers exactly one block.
class hash32
{
public:
    virtual ~hash32() = default;
    virtual void update(const const_span_t& data) = 0;
    virtual uint32_t digest() const = 0;
};

// Must return an independent instance on every call.
using hash32_factory = std::function<std::unique_ptr<hash32>()>;

class crc32_hash : public hash32
{
    unsigned long state_;
public:
    crc32_hash();
    void update(const const_span_t& data) override;
    uint32_t digest() const override;
};

class adler32_hash : public hash32
{
    unsigned long state_;
public:
    adler32_hash();
    void update(const const_span_t& data) override;
    uint32_t digest() const override;
};

std::unique_ptr<hash32> make_crc32_hash();
std::unique_ptr<hash32> make_adler32_hash();
