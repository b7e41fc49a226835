#pragma once

#include "../include/byte_stream.hpp"

#include <vector>
#include <algorithm>
#include <cstring>

class memory_byte_stream : public byte_source, public byte_sink {
    filesize_t position_ = 0;
    int close_count_ = 0;

public:
    std::vector<uint8_t> buffer;

    filesize_t get_file_size() const {
        return buffer.size();
    }

    filesize_t get_position() const {
        return position_;
    }

    int get_close_count() const {
        return close_count_;
    }

    filesize_t read(const span_t& data) override {
        if (position_ >= buffer.size())
            return 0;

        auto n = std::min<filesize_t>(data.size(), buffer.size() - position_);
        std::memcpy(data.data(), buffer.data() + position_, n);
        position_ += n;
        return n;
    }

    filesize_t seek(int64_t offset, seek_origin origin) override {
        int64_t base = 0;
        switch (origin) {
        case seek_origin::begin:
            base = 0;
            break;
        case seek_origin::current:
            base = static_cast<int64_t>(position_);
            break;
        case seek_origin::end:
            base = static_cast<int64_t>(buffer.size());
            break;
        default:
            throw invalid_argument_exception("memory_byte_stream: invalid seek origin " + to_string(origin));
        }

        if (base + offset < 0)
            throw checksummed_io_exception("memory_byte_stream: seek before start of buffer");

        position_ = static_cast<filesize_t>(base + offset);
        return position_;
    }

    // sink writes always append
    filesize_t write(const const_span_t& data) override {
        buffer.insert(buffer.end(), data.begin(), data.end());
        return data.size();
    }

    void close() override {
        close_count_++;
    }
};
