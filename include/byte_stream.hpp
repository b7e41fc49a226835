#pragma once

#include <span>
#include "../include/core.hpp"

enum class seek_origin : int
{
    begin = 0,
    current = 1,
    end = 2
};

// todo: consider converting to concept
class byte_source
{
public:
    virtual ~byte_source() {}

    // Reads up to data.size() bytes. Returns 0 only at end of stream; failures throw.
    virtual filesize_t read(const span_t& data) = 0;

    // Returns the new absolute position.
    virtual filesize_t seek(int64_t offset, seek_origin origin) = 0;

    virtual void close() {}
};

class byte_sink
{
public:
    virtual ~byte_sink() {}

    // Appends data, returning how many bytes were accepted.
    virtual filesize_t write(const const_span_t& data) = 0;

    virtual void close() {}
};

// Reads until data is full or the source is exhausted.
filesize_t read_full(byte_source& source, const span_t& data);

std::string to_string(seek_origin origin);
