#include "nsm/Compressor.hpp"

#include <algorithm>
#include <ostream>
#include <string>
#include <thread>
#include <vector>
#include <zlib.h>
#include <zstd.h>
#include "nsm/Errors.hpp"

namespace nsm {

namespace {

constexpr size_t kChunkSize = 64 * 1024;

class ZstdCompressState : public CodecState {
public:
    ZstdCompressState() : ctx(ZSTD_createCCtx()) {
        if (!ctx) throw ArchiveError(ErrorCode::CompressionFailure, "zstd: failed to allocate compression context");
    }
    ~ZstdCompressState() override { ZSTD_freeCCtx(ctx); }
    void reset() override { ZSTD_CCtx_reset(ctx, ZSTD_reset_session_and_parameters); }

    ZSTD_CCtx* ctx;
};

class ZstdDecompressState : public CodecState {
public:
    ZstdDecompressState() : ctx(ZSTD_createDCtx()) {
        if (!ctx) throw ArchiveError(ErrorCode::DecompressionFailure, "zstd: failed to allocate decompression context");
    }
    ~ZstdDecompressState() override { ZSTD_freeDCtx(ctx); }
    void reset() override { ZSTD_DCtx_reset(ctx, ZSTD_reset_session_and_parameters); }

    ZSTD_DCtx* ctx;
};

class GzipDeflateState : public CodecState {
public:
    explicit GzipDeflateState(int level) {
        // windowBits 15 + 16 selects the gzip wrapper.
        if (deflateInit2(&stream, level, Z_DEFLATED, 15 + 16, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
            throw ArchiveError(ErrorCode::CompressionFailure, "gzip: deflateInit2 failed");
        }
    }
    ~GzipDeflateState() override { deflateEnd(&stream); }
    void reset() override { deflateReset(&stream); }

    z_stream stream{};
};

class GzipInflateState : public CodecState {
public:
    GzipInflateState() {
        if (inflateInit2(&stream, 15 + 16) != Z_OK) {
            throw ArchiveError(ErrorCode::DecompressionFailure, "gzip: inflateInit2 failed");
        }
    }
    ~GzipInflateState() override { inflateEnd(&stream); }
    void reset() override { inflateReset(&stream); }

    z_stream stream{};
};

void emit(std::ostream& dst, const char* data, size_t size, uint64_t& written) {
    if (size == 0) return;
    dst.write(data, static_cast<std::streamsize>(size));
    if (!dst) {
        throw ArchiveError(ErrorCode::ArchiveWriteFailure, "codec output stream rejected write");
    }
    written += size;
}

void emitBounded(std::ostream& dst, const char* data, size_t size, uint64_t& written, uint64_t maxOutput) {
    if (size > maxOutput - written) {
        throw ArchiveError(ErrorCode::DecompressionFailure,
                           "frame expands past the expected " + std::to_string(maxOutput) + " bytes");
    }
    emit(dst, data, size, written);
}

} // namespace

Compressor::Compressor() : Compressor(Options{}) {}

Compressor::Compressor(const Options& options)
    : options_(options), permits_(options.maxJobs == 0 ? defaultJobs() : options.maxJobs) {}

size_t Compressor::defaultJobs() {
    const unsigned hw = std::thread::hardware_concurrency();
    return std::max<size_t>(1, hw / 2);
}

uint64_t Compressor::compress(std::ostream& dst, std::string_view src, Algorithm algo) {
    auto permit = permits_.acquire();
    switch (algo) {
    case Algorithm::Zstd: return compressZstd(dst, src);
    case Algorithm::Gzip: return compressGzip(dst, src);
    }
    throw ArchiveError(ErrorCode::UnsupportedAlgorithm,
                       "unsupported compression algorithm tag " + std::to_string(static_cast<int>(algo)));
}

uint64_t Compressor::decompress(std::ostream& dst, std::string_view src, Algorithm algo, uint64_t maxOutput) {
    auto permit = permits_.acquire();
    switch (algo) {
    case Algorithm::Zstd: return decompressZstd(dst, src, maxOutput);
    case Algorithm::Gzip: return decompressGzip(dst, src, maxOutput);
    }
    throw ArchiveError(ErrorCode::UnsupportedAlgorithm,
                       "unsupported compression algorithm tag " + std::to_string(static_cast<int>(algo)));
}

uint64_t Compressor::compressZstd(std::ostream& dst, std::string_view src) {
    auto lease = pool_.checkout(Algorithm::Zstd, Direction::Compress,
                                [] { return std::make_unique<ZstdCompressState>(); });
    ZSTD_CCtx* ctx = lease.as<ZstdCompressState>().ctx;

    size_t rc = ZSTD_CCtx_setParameter(ctx, ZSTD_c_compressionLevel, options_.zstdLevel);
    if (ZSTD_isError(rc)) {
        throw ArchiveError(ErrorCode::CompressionFailure,
                           std::string("zstd: invalid compression level: ") + ZSTD_getErrorName(rc));
    }
    rc = ZSTD_CCtx_setPledgedSrcSize(ctx, src.size());
    if (ZSTD_isError(rc)) {
        throw ArchiveError(ErrorCode::CompressionFailure,
                           std::string("zstd: cannot set frame size: ") + ZSTD_getErrorName(rc));
    }

    std::vector<char> buffer(std::max(kChunkSize, ZSTD_CStreamOutSize()));
    ZSTD_inBuffer input{src.data(), src.size(), 0};
    uint64_t written = 0;
    for (;;) {
        ZSTD_outBuffer output{buffer.data(), buffer.size(), 0};
        size_t remaining = ZSTD_compressStream2(ctx, &output, &input, ZSTD_e_end);
        if (ZSTD_isError(remaining)) {
            throw ArchiveError(ErrorCode::CompressionFailure,
                               std::string("zstd: compression failed: ") + ZSTD_getErrorName(remaining));
        }
        emit(dst, buffer.data(), output.pos, written);
        if (remaining == 0) break;
    }
    lease.markClean();
    return written;
}

uint64_t Compressor::decompressZstd(std::ostream& dst, std::string_view src, uint64_t maxOutput) {
    auto lease = pool_.checkout(Algorithm::Zstd, Direction::Decompress,
                                [] { return std::make_unique<ZstdDecompressState>(); });
    ZSTD_DCtx* ctx = lease.as<ZstdDecompressState>().ctx;

    std::vector<char> buffer(std::max(kChunkSize, ZSTD_DStreamOutSize()));
    ZSTD_inBuffer input{src.data(), src.size(), 0};
    uint64_t written = 0;
    size_t hint = 1;
    while (hint != 0) {
        ZSTD_outBuffer output{buffer.data(), buffer.size(), 0};
        hint = ZSTD_decompressStream(ctx, &output, &input);
        if (ZSTD_isError(hint)) {
            throw ArchiveError(ErrorCode::DecompressionFailure,
                               std::string("zstd: corrupt frame: ") + ZSTD_getErrorName(hint));
        }
        emitBounded(dst, buffer.data(), output.pos, written, maxOutput);
        if (hint != 0 && input.pos == input.size && output.pos < output.size) {
            throw ArchiveError(ErrorCode::DecompressionFailure, "zstd: truncated frame");
        }
    }
    if (input.pos != input.size) {
        throw ArchiveError(ErrorCode::DecompressionFailure, "zstd: trailing bytes after frame");
    }
    lease.markClean();
    return written;
}

uint64_t Compressor::compressGzip(std::ostream& dst, std::string_view src) {
    const int level = options_.gzipLevel;
    auto lease = pool_.checkout(Algorithm::Gzip, Direction::Compress,
                                [level] { return std::make_unique<GzipDeflateState>(level); });
    z_stream& zs = lease.as<GzipDeflateState>().stream;

    std::vector<char> buffer(kChunkSize);
    uint64_t written = 0;
    size_t consumed = 0;
    int rc = Z_OK;
    while (rc != Z_STREAM_END) {
        if (zs.avail_in == 0 && consumed < src.size()) {
            const size_t take = std::min<size_t>(src.size() - consumed, 1u << 30);
            zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(src.data() + consumed));
            zs.avail_in = static_cast<uInt>(take);
            consumed += take;
        }
        const int flush = consumed == src.size() ? Z_FINISH : Z_NO_FLUSH;
        zs.next_out = reinterpret_cast<Bytef*>(buffer.data());
        zs.avail_out = static_cast<uInt>(buffer.size());
        rc = deflate(&zs, flush);
        if (rc == Z_STREAM_ERROR) {
            throw ArchiveError(ErrorCode::CompressionFailure, "gzip: deflate failed");
        }
        emit(dst, buffer.data(), buffer.size() - zs.avail_out, written);
    }
    lease.markClean();
    return written;
}

uint64_t Compressor::decompressGzip(std::ostream& dst, std::string_view src, uint64_t maxOutput) {
    auto lease = pool_.checkout(Algorithm::Gzip, Direction::Decompress,
                                [] { return std::make_unique<GzipInflateState>(); });
    z_stream& zs = lease.as<GzipInflateState>().stream;

    std::vector<char> buffer(kChunkSize);
    uint64_t written = 0;
    size_t consumed = 0;
    int rc = Z_OK;
    while (rc != Z_STREAM_END) {
        if (zs.avail_in == 0) {
            if (consumed == src.size()) {
                throw ArchiveError(ErrorCode::DecompressionFailure, "gzip: truncated frame");
            }
            const size_t take = std::min<size_t>(src.size() - consumed, 1u << 30);
            zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(src.data() + consumed));
            zs.avail_in = static_cast<uInt>(take);
            consumed += take;
        }
        zs.next_out = reinterpret_cast<Bytef*>(buffer.data());
        zs.avail_out = static_cast<uInt>(buffer.size());
        rc = inflate(&zs, Z_NO_FLUSH);
        if (rc != Z_OK && rc != Z_STREAM_END) {
            const char* detail = zs.msg ? zs.msg : "inflate error";
            throw ArchiveError(ErrorCode::DecompressionFailure, std::string("gzip: corrupt frame: ") + detail);
        }
        emitBounded(dst, buffer.data(), buffer.size() - zs.avail_out, written, maxOutput);
    }
    if (zs.avail_in != 0 || consumed != src.size()) {
        throw ArchiveError(ErrorCode::DecompressionFailure, "gzip: trailing bytes after frame");
    }
    lease.markClean();
    return written;
}

} // namespace nsm
