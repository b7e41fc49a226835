#pragma once

#include "../include/byte_stream.hpp"
#include <fstream>
#include <string>

// A file on disk as a byte_source or byte_sink. Writes always append.
class std_byte_stream : public byte_source, public byte_sink {
public:
    explicit std_byte_stream(const std::string& path);
    ~std_byte_stream();

    filesize_t get_file_size();
    filesize_t read(const span_t& data) override;
    filesize_t seek(int64_t offset, seek_origin origin) override;
    filesize_t write(const const_span_t& data) override;
    void close() override;

private:
    std::fstream file_;
    std::string path_;
    bool is_open_ = false;

    void ensure_file_open() const;
};
