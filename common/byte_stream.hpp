#pragma once

// ============================================================
// byte_stream.hpp -- Byte source/sink collaborators of a transfer
//   A ByteStore resolves a requested filename into a ByteSource
//   (read transfers) or a ByteSink (write transfers). FileStore
//   is the file-backed store rooted at the served directory.
// ============================================================

#include "platform.hpp"
#include <cstdio>
#include <string>
#include <memory>
#include <stdexcept>
#include <filesystem>

namespace fs = std::filesystem;

// Storage failure; carries the errno that caused it
class StreamError : public std::runtime_error {
public:
    StreamError(const std::string& what, int err)
        : std::runtime_error(what), err_(err) {}

    int error_number() const { return err_; }

private:
    int err_;
};

class ByteSource {
public:
    virtual ~ByteSource() = default;

    // Fill up to 'max' bytes. Returns fewer than 'max' only at end of
    // stream (0 = EOF). Throws StreamError.
    virtual size_t read(u8* buf, size_t max) = 0;
};

class ByteSink {
public:
    virtual ~ByteSink() = default;

    // Append 'len' bytes; throws StreamError
    virtual void write(const u8* buf, size_t len) = 0;

    // Flush and keep the result; throws StreamError
    virtual void commit() = 0;

    // Drop whatever was written. Never throws.
    virtual void discard() noexcept = 0;
};

class ByteStore {
public:
    virtual ~ByteStore() = default;

    // Throws PacketError(INVALID_FILENAME) for a name that can't be a
    // path, StreamError for anything the storage refuses.
    virtual std::unique_ptr<ByteSource> open_read(const std::string& name) = 0;

    // overwrite=false refuses an existing file with StreamError(EEXIST)
    virtual std::unique_ptr<ByteSink> open_write(const std::string& name, bool overwrite) = 0;
};

// ============================================================
// File-backed store
// ============================================================

class FileSource : public ByteSource {
public:
    explicit FileSource(const fs::path& path);
    ~FileSource() override;

    FileSource(const FileSource&) = delete;
    FileSource& operator=(const FileSource&) = delete;

    size_t read(u8* buf, size_t max) override;

private:
    std::FILE*  fp_{nullptr};
    std::string path_;
};

// Writes go to a "<name>.<n>.part" file beside the target; commit()
// renames it over the target, so an existing file is only replaced by
// a complete upload.
class FileSink : public ByteSink {
public:
    FileSink(const fs::path& path, bool overwrite);
    // Discards unless commit() succeeded
    ~FileSink() override;

    FileSink(const FileSink&) = delete;
    FileSink& operator=(const FileSink&) = delete;

    void write(const u8* buf, size_t len) override;
    void commit() override;
    void discard() noexcept override;

private:
    std::FILE*  fp_{nullptr};
    std::string path_;
    std::string temp_path_;
    bool        overwrite_{false};
    bool        committed_{false};
};

class FileStore : public ByteStore {
public:
    explicit FileStore(std::string root_dir);

    std::unique_ptr<ByteSource> open_read(const std::string& name) override;
    std::unique_ptr<ByteSink>   open_write(const std::string& name, bool overwrite) override;

    // Join a request name onto the root. Leading '/' are stripped so
    // "/boot.img" and "boot.img" name the same file.
    fs::path resolve(const std::string& name) const;

private:
    std::string root_;
};
