/**
 * @file log_gzip.hpp
 * @brief Gzip compression of retired log files using the miniz library
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

// Don't define macros like 'compress' that conflict with our code
#ifndef MINIZ_NO_ZLIB_COMPATIBLE_NAMES
#define MINIZ_NO_ZLIB_COMPATIBLE_NAMES
#endif
#include <miniz.h>

#include <cerrno>
#include <cstdint>
#include <string>
#include <vector>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include "log_errors.hpp"
#include "log_utils.hpp"
#include "log_writers.hpp"

namespace treelog
{

/**
 * @brief Compression collaborator invoked for retired log files
 */
class file_compressor
{
  public:
    virtual ~file_compressor() = default;

    /**
     * @brief Compress @p source_path
     * @return Path of the compressed file
     * @throws compression_error on failure
     */
    virtual std::string compress(const std::string &source_path) = 0;
};

namespace gzip
{

inline void put_le32(std::string &out, uint32_t value)
{
    for (int shift = 0; shift < 32; shift += 8) { out.push_back(static_cast<char>((value >> shift) & 0xff)); }
}

/**
 * @brief RFC 1952 member header: deflate, no optional fields, OS Unix
 */
inline std::string member_header(uint32_t mtime)
{
    std::string header{'\x1f', '\x8b', '\x08', '\x00'};
    put_le32(header, mtime);
    header.push_back('\x00');
    header.push_back('\x03');
    return header;
}

/**
 * @brief Streams one gzip member into a newly created file
 *
 * Data goes through miniz raw deflate while the CRC32 and the input size
 * are accumulated for the trailer. The destination must not exist. Once
 * open() has created it, the file is unlinked on destruction unless
 * finish() completed.
 */
class member_writer
{
  public:
    explicit member_writer(int level) : level_(level), out_(GZIP_BUFFER_SIZE) {}

    ~member_writer()
    {
        if (deflating_) mz_deflateEnd(&stream_);
        if (!finished_ && !path_.empty()) ::unlink(path_.c_str());
    }

    member_writer(const member_writer &)            = delete;
    member_writer &operator=(const member_writer &) = delete;

    void open(const std::string &path, uint32_t mtime)
    {
        file_descriptor fd(::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644));
        if (!fd) { throw compression_error(fmt::format("gzip {}: create destination: {}", path, detail::get_error_string(errno))); }
        fd_   = std::move(fd);
        path_ = path;

        if (mz_deflateInit2(&stream_, level_, MZ_DEFLATED, -MZ_DEFAULT_WINDOW_BITS, 8, MZ_DEFAULT_STRATEGY) != MZ_OK)
        {
            throw compression_error(fmt::format("gzip {}: deflate init failed", path_));
        }
        deflating_ = true;

        auto header = member_header(mtime);
        write_out(header.data(), header.size());
    }

    void append(const unsigned char *data, size_t len)
    {
        crc_ = mz_crc32(crc_, data, len);
        total_in_ += len;
        pump(data, len, MZ_NO_FLUSH);
    }

    void finish()
    {
        pump(nullptr, 0, MZ_FINISH);

        // ISIZE is the input size modulo 2^32
        std::string trailer;
        put_le32(trailer, static_cast<uint32_t>(crc_));
        put_le32(trailer, static_cast<uint32_t>(total_in_));
        write_out(trailer.data(), trailer.size());
        finished_ = true;
    }

  private:
    void pump(const unsigned char *data, size_t len, int flush)
    {
        stream_.next_in  = data;
        stream_.avail_in = static_cast<unsigned>(len);

        for (;;)
        {
            stream_.next_out  = out_.data();
            stream_.avail_out = static_cast<unsigned>(out_.size());

            int ret = mz_deflate(&stream_, flush);
            if (ret != MZ_OK && ret != MZ_STREAM_END && ret != MZ_BUF_ERROR)
            {
                throw compression_error(fmt::format("gzip {}: deflate failed ({})", path_, ret));
            }
            write_out(out_.data(), out_.size() - stream_.avail_out);

            bool done = (flush == MZ_FINISH) ? ret == MZ_STREAM_END : stream_.avail_out != 0;
            if (done) break;
        }
    }

    void write_out(const void *data, size_t len)
    {
        if (len == 0) return;
        if (int err = detail::write_all(fd_.get(), data, len))
        {
            throw compression_error(fmt::format("gzip {}: write: {}", path_, detail::get_error_string(err)));
        }
    }

    int level_;
    std::vector<unsigned char> out_;
    mz_stream stream_{};
    bool deflating_ = false;
    bool finished_  = false;
    std::string path_;
    file_descriptor fd_;
    mz_ulong crc_       = MZ_CRC32_INIT;
    uint64_t total_in_ = 0;
};

/**
 * @brief Compress @p src into the gzip file @p dst
 *
 * @param level miniz compression level, MZ_DEFAULT_COMPRESSION or 0-9
 * @throws compression_error naming the failing step; a partial @p dst is removed,
 *         an existing @p dst is left untouched
 */
inline void file_to_gzip(const std::string &src, const std::string &dst, int level = MZ_DEFAULT_COMPRESSION)
{
    file_descriptor in(::open(src.c_str(), O_RDONLY | O_CLOEXEC));
    if (!in) { throw compression_error(fmt::format("gzip {}: open source: {}", src, detail::get_error_string(errno))); }

    struct stat st{};
    uint32_t mtime = ::fstat(in.get(), &st) == 0 ? static_cast<uint32_t>(st.st_mtime) : 0;

    member_writer out(level);
    out.open(dst, mtime);

    std::vector<unsigned char> chunk(GZIP_BUFFER_SIZE);
    for (;;)
    {
        ssize_t n = ::read(in.get(), chunk.data(), chunk.size());
        if (n < 0 && errno == EINTR) continue;
        if (n < 0) { throw compression_error(fmt::format("gzip {}: read source: {}", src, detail::get_error_string(errno))); }
        if (n == 0) break;
        out.append(chunk.data(), static_cast<size_t>(n));
    }
    out.finish();
}

} // namespace gzip

/**
 * @brief Compress retired files to "<file>.gz" and remove the original
 */
class gzip_compressor final : public file_compressor
{
  public:
    explicit gzip_compressor(int level = MZ_DEFAULT_COMPRESSION, bool remove_source = true)
        : level_(level), remove_source_(remove_source)
    {
    }

    std::string compress(const std::string &source_path) override
    {
        std::string dst = source_path + ".gz";
        gzip::file_to_gzip(source_path, dst, level_);

        if (remove_source_ && ::unlink(source_path.c_str()) != 0)
        {
            throw compression_error("Compressed " + source_path + " but failed to remove it: " + detail::get_error_string(errno));
        }
        return dst;
    }

  private:
    int level_;
    bool remove_source_;
};

} // namespace treelog
