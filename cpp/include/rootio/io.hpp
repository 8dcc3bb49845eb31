// rootio – positional file I/O
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace rootio {

/// Owns an OS file descriptor. All reads and writes are positional, so
/// concurrent readers sharing one handle do not race on a file cursor.
class FileHandle {
public:
    FileHandle() = default;
    ~FileHandle();
    FileHandle(const FileHandle&) = delete;
    FileHandle& operator=(const FileHandle&) = delete;

    void     open(const std::string& path);     // read-only
    void     create(const std::string& path);   // read/write, truncates
    void     close();
    bool     is_open() const;
    bool     writable() const { return writable_; }
    uint64_t size() const { return size_; }

    void pread(void* dst, size_t n, uint64_t off) const;
    void pwrite(const void* src, size_t n, uint64_t off);
    void sync();

private:
#ifdef _WIN32
    void* handle_ = reinterpret_cast<void*>(static_cast<intptr_t>(-1));
#else
    int fd_ = -1;
#endif
    uint64_t size_     = 0;
    bool     writable_ = false;
};

} // namespace rootio
