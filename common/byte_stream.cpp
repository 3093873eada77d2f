// ============================================================
// byte_stream.cpp -- File-backed byte source/sink
// ============================================================

#include "byte_stream.hpp"
#include "packet.hpp"
#include "utils.hpp"
#include <atomic>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <string>
#include <system_error>

namespace {

std::string errno_str(int err) {
    return std::string(std::strerror(err)) + " (errno=" + std::to_string(err) + ")";
}

} // namespace

// ============================================================
// FileSource
// ============================================================

FileSource::FileSource(const fs::path& path) : path_(path.string()) {
    std::error_code ec;
    if (fs::is_directory(path, ec)) {
        throw StreamError("Cannot read directory: " + path_, EISDIR);
    }
    fp_ = std::fopen(path_.c_str(), "rb");
    if (!fp_) {
        int err = errno;
        throw StreamError("Cannot open file: " + path_ + ": " + errno_str(err), err);
    }
}

FileSource::~FileSource() {
    if (fp_) std::fclose(fp_);
}

size_t FileSource::read(u8* buf, size_t max) {
    size_t n = std::fread(buf, 1, max, fp_);
    if (n < max && std::ferror(fp_)) {
        int err = errno;
        throw StreamError("Read failed: " + path_ + ": " + errno_str(err), err);
    }
    return n;
}

// ============================================================
// FileSink
// ============================================================

FileSink::FileSink(const fs::path& path, bool overwrite)
    : path_(path.string()), overwrite_(overwrite) {
    std::error_code ec;
    if (fs::is_directory(path, ec)) {
        throw StreamError("Cannot write directory: " + path_, EISDIR);
    }
    if (!overwrite_ && fs::exists(path, ec)) {
        throw StreamError("File exists: " + path_, EEXIST);
    }

    // "x" (C11): never reuse a staging file left behind by another upload
    static std::atomic<u64> staging_seq{0};
    for (int attempt = 0; attempt < 16; ++attempt) {
        temp_path_ = path_ + "." + std::to_string(staging_seq.fetch_add(1)) + ".part";
        fp_ = std::fopen(temp_path_.c_str(), "wbx");
        if (fp_ || errno != EEXIST) break;
    }
    if (!fp_) {
        int err = errno;
        throw StreamError("Cannot create file: " + temp_path_ + ": " + errno_str(err), err);
    }
}

FileSink::~FileSink() {
    if (!committed_) discard();
}

void FileSink::write(const u8* buf, size_t len) {
    if (!fp_) throw StreamError("Write after close: " + path_, EBADF);
    if (len == 0) return;
    size_t n = std::fwrite(buf, 1, len, fp_);
    if (n != len) {
        int err = errno;
        throw StreamError("Write failed: " + temp_path_ + ": " + errno_str(err), err);
    }
}

void FileSink::commit() {
    if (!fp_) throw StreamError("Commit after close: " + path_, EBADF);
    int rc = std::fflush(fp_);
    int err = errno;
    if (rc == 0) {
        rc = std::fclose(fp_);
        err = errno;
    } else {
        std::fclose(fp_);
    }
    fp_ = nullptr;
    if (rc != 0) {
        std::remove(temp_path_.c_str());
        throw StreamError("Flush failed: " + temp_path_ + ": " + errno_str(err), err);
    }

    std::error_code ec;
    if (!overwrite_ && fs::exists(path_, ec)) {
        std::remove(temp_path_.c_str());
        throw StreamError("File appeared during upload: " + path_, EEXIST);
    }
    fs::rename(temp_path_, path_, ec);
    if (ec) {
        std::remove(temp_path_.c_str());
        throw StreamError("Cannot replace " + path_ + ": " + ec.message(), ec.value());
    }
    committed_ = true;
}

void FileSink::discard() noexcept {
    if (committed_) return;
    if (fp_) {
        std::fclose(fp_);
        fp_ = nullptr;
    }
    if (!temp_path_.empty()) {
        std::remove(temp_path_.c_str());
        temp_path_.clear();
    }
}

// ============================================================
// FileStore
// ============================================================

FileStore::FileStore(std::string root_dir) : root_(std::move(root_dir)) {}

fs::path FileStore::resolve(const std::string& name) const {
    size_t start = name.find_first_not_of('/');
    if (start == std::string::npos) {
        throw PacketError(ParseError::INVALID_FILENAME, "empty filename");
    }
    for (unsigned char c : name) {
        if (c < 0x20 || c >= 0x7F) {
            throw PacketError(ParseError::INVALID_FILENAME,
                              "filename is not printable ASCII: '" + utils::printable(name) + "'");
        }
    }
    fs::path rel = fs::path(name.substr(start)).lexically_normal();
    for (const auto& part : rel) {
        if (part == "..") {
            throw PacketError(ParseError::INVALID_FILENAME,
                              "filename escapes the served directory: '" + name + "'");
        }
    }
    return fs::path(root_) / rel;
}

std::unique_ptr<ByteSource> FileStore::open_read(const std::string& name) {
    return std::make_unique<FileSource>(resolve(name));
}

std::unique_ptr<ByteSink> FileStore::open_write(const std::string& name, bool overwrite) {
    return std::make_unique<FileSink>(resolve(name), overwrite);
}
