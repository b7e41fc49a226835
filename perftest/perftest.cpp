#include <chrono>
#include <cstdlib>
#include <iostream>
#include "../include/checksummed_reader.hpp"
#include "../include/checksummed_writer.hpp"
#include "../include/memory_byte_stream.hpp"

namespace
{
    double megabytes_per_second(filesize_t bytes, std::chrono::steady_clock::duration elapsed)
    {
        auto seconds = std::chrono::duration<double>(elapsed).count();
        if (seconds <= 0)
        {
            return 0;
        }
        return (bytes / (1024.0 * 1024.0)) / seconds;
    }
}

int main()
{
    const filesize_t content_size = 64 * 1024 * 1024;
    const filesize_t chunk_size = 4096;

    try
    {
        checksummed_stream_parameters params;
        memory_byte_stream stream;
        stream.buffer.reserve(checksum_framing(params.interval).physical_length(content_size));

        std::vector<uint8_t> chunk(chunk_size, 0);
        for (filesize_t i = 0; i < chunk_size; i++)
        {
            chunk[i] = static_cast<uint8_t>(i * 31 + 7);
        }

        auto start = std::chrono::steady_clock::now();
        {
            checksummed_writer writer(stream, params);
            for (filesize_t written = 0; written < content_size; written += chunk_size)
            {
                writer.write(chunk);
            }
            writer.close();
        }
        auto write_elapsed = std::chrono::steady_clock::now() - start;

        start = std::chrono::steady_clock::now();
        filesize_t total_read = 0;
        {
            stream.seek(0, seek_origin::begin);
            checksummed_reader reader(stream, params);
            std::vector<uint8_t> buffer(chunk_size);
            for (;;)
            {
                auto n = reader.read(buffer);
                if (n == 0)
                {
                    break;
                }
                total_read += n;
            }
        }
        auto read_elapsed = std::chrono::steady_clock::now() - start;

        start = std::chrono::steady_clock::now();
        filesize_t bad_blocks = 0;
        {
            checksummed_reader reader(stream, params);
            for (filesize_t offset = 0; offset < content_size; offset += params.interval)
            {
                reader.seek(static_cast<int64_t>(offset), seek_origin::begin);
                if (!reader.verify())
                {
                    bad_blocks++;
                }
            }
        }
        auto verify_elapsed = std::chrono::steady_clock::now() - start;

        std::cout << "physical size: " << stream.get_file_size() << std::endl;
        std::cout << "write:  " << megabytes_per_second(content_size, write_elapsed) << " MB/s" << std::endl;
        std::cout << "read:   " << megabytes_per_second(total_read, read_elapsed) << " MB/s" << std::endl;
        std::cout << "verify: " << megabytes_per_second(content_size, verify_elapsed) << " MB/s" << std::endl;

        if (total_read != content_size || bad_blocks != 0)
        {
            std::cerr << "read " << total_read << " bytes, " << bad_blocks << " bad blocks" << std::endl;
            return EXIT_FAILURE;
        }
    }
    catch (const std::exception& ex)
    {
        std::cerr << ex.what() << std::endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
