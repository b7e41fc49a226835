#include "pch.h"
#include <algorithm>
#include <filesystem>
#include "../include/checksummed_reader.hpp"
#include "../include/checksummed_writer.hpp"
#include "../include/std_byte_stream.hpp"
#include "test_streams.hpp"

namespace fs = std::filesystem;

class std_byte_stream_test : public ::testing::Test {
protected:
    fs::path file_path;

    void SetUp() override {
        file_path = fs::temp_directory_path() / "checksummed_io_test.data";
        fs::remove(file_path);
    }

    void TearDown() override {
        fs::remove(file_path);
    }
};

TEST_F(std_byte_stream_test, write_and_read_raw)
{
    {
        std_byte_stream fout(file_path.string());
        std::vector<uint8_t> bytes_out = { 1, 2, 3, 4, 5 };
        EXPECT_EQ(5, fout.write(bytes_out));
        EXPECT_EQ(3, fout.write(std::vector<uint8_t>{ 6, 7, 8 }));
        EXPECT_EQ(8, fout.get_file_size());
        fout.close();
        EXPECT_THROW(fout.close(), closed_exception);
    }
    {
        std_byte_stream fin(file_path.string());
        std::vector<uint8_t> bytes_in(16);
        EXPECT_EQ(8, fin.read(bytes_in));
        EXPECT_EQ(0, fin.read(bytes_in));
        for (int a = 0; a < 8; a++)
        {
            EXPECT_EQ(bytes_in[a], a + 1);
        }

        EXPECT_EQ(6, fin.seek(-2, seek_origin::end));
        EXPECT_EQ(2, fin.read(bytes_in));
        EXPECT_EQ(7, bytes_in[0]);
        EXPECT_EQ(3, fin.seek(3, seek_origin::begin));
        EXPECT_EQ(4, fin.seek(1, seek_origin::current));
    }
}

TEST_F(std_byte_stream_test, checksummed_file_round_trip)
{
    const filesize_t interval = 512;
    auto content = make_content(interval * 5 + 100);
    checksum_framing framing(interval);

    {
        std_byte_stream fout(file_path.string());
        checksummed_writer writer(fout, { interval });
        for (filesize_t offset = 0; offset < content.size(); offset += 300)
        {
            auto size = std::min<filesize_t>(300, content.size() - offset);
            writer.write(const_span_t(content).subspan(offset, size));
        }
        writer.close();
    }

    EXPECT_EQ(framing.physical_length(content.size()), fs::file_size(file_path));

    {
        std_byte_stream fin(file_path.string());
        checksummed_reader reader(fin, { interval });
        EXPECT_EQ(content, read_all(reader, 1000));

        for (filesize_t offset = 0; offset < content.size(); offset += interval)
        {
            reader.seek(static_cast<int64_t>(offset), seek_origin::begin);
            EXPECT_TRUE(reader.verify()) << "offset " << offset;
        }

        EXPECT_EQ(content.size(), reader.seek(0, seek_origin::end));
        reader.close();
        EXPECT_THROW(reader.read(content), closed_exception);
    }
}
