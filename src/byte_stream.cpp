#include "../include/byte_stream.hpp"
#include <string>

filesize_t read_full(byte_source& source, const span_t& data)
{
    filesize_t total = 0;
    while (total < data.size())
    {
        auto n = source.read(data.subspan(total));
        if (n == 0)
        {
            break;
        }
        total += n;
    }
    return total;
}

std::string to_string(seek_origin origin)
{
    switch (origin)
    {
    case seek_origin::begin:
        return "begin";
    case seek_origin::current:
        return "current";
    case seek_origin::end:
        return "end";
    }
    return std::to_string(static_cast<int>(origin));
}
