#include "../include/std_byte_stream.hpp"

std_byte_stream::std_byte_stream(const std::string& path)
    : path_(path)
{
    file_.open(path_, std::ios::in | std::ios::out | std::ios::binary);
    if (!file_.is_open()) {
        // Attempt to create the file if it doesn't exist
        file_.clear();
        file_.open(path_, std::ios::out | std::ios::binary);
        file_.close();
        file_.open(path_, std::ios::in | std::ios::out | std::ios::binary);
    }
    is_open_ = file_.is_open();
    if (!is_open_) throw checksummed_io_exception("Failed to open " + path_);
}

std_byte_stream::~std_byte_stream() {
    if (file_.is_open()) {
        file_.close();
    }
}

void std_byte_stream::ensure_file_open() const {
    if (!is_open_) throw closed_exception("File is not open");
}

filesize_t std_byte_stream::get_file_size() {
    ensure_file_open();
    auto current_pos = file_.tellg();
    file_.seekg(0, std::ios::end);
    filesize_t size = static_cast<filesize_t>(file_.tellg());
    file_.seekg(current_pos);
    return size;
}

filesize_t std_byte_stream::read(const span_t& data) {
    ensure_file_open();

    file_.read(reinterpret_cast<char*>(data.data()), data.size());
    auto n = static_cast<filesize_t>(file_.gcount());
    if (file_.bad())
    {
        throw checksummed_io_exception("Failed to read data");
    }
    if (file_.eof())
    {
        // a short read at the end of the file is not an error
        file_.clear();
    }
    else if (file_.fail())
    {
        throw checksummed_io_exception("Failed to read data");
    }
    return n;
}

filesize_t std_byte_stream::seek(int64_t offset, seek_origin origin) {
    ensure_file_open();

    std::ios::seekdir dir = std::ios::beg;
    switch (origin)
    {
    case seek_origin::begin:
        dir = std::ios::beg;
        break;
    case seek_origin::current:
        dir = std::ios::cur;
        break;
    case seek_origin::end:
        dir = std::ios::end;
        break;
    default:
        throw invalid_argument_exception("std_byte_stream: invalid seek origin " + to_string(origin));
    }

    file_.seekg(offset, dir);
    if (!file_.good())
    {
        file_.clear();
        throw checksummed_io_exception("Failed to seek to offset");
    }
    return static_cast<filesize_t>(file_.tellg());
}

filesize_t std_byte_stream::write(const const_span_t& data) {
    ensure_file_open();

    file_.seekp(0, std::ios::end);
    if (!file_.good()) throw checksummed_io_exception("Failed to seek to end of file");

    file_.write(reinterpret_cast<const char*>(data.data()), data.size());
    if (!file_.good())
    {
        throw checksummed_io_exception("Failed to write data");
    }
    return data.size();
}

void std_byte_stream::close() {
    ensure_file_open();

    is_open_ = false;
    file_.close();
    if (file_.fail())
    {
        throw checksummed_io_exception("Failed to close " + path_);
    }
}
