// rootio – positional file I/O (POSIX and Windows)

#include "rootio/io.hpp"
#include "rootio/error.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <vector>

#ifdef _WIN32
#  define WIN32_LEAN_AND_MEAN
#  include <windows.h>
#else
#  include <fcntl.h>
#  include <sys/stat.h>
#  include <unistd.h>
#endif

namespace rootio {

namespace {

[[noreturn]] void io_fail(const std::string& msg) {
    fail(ErrorCode::kIOError, msg);
}

} // namespace

#ifndef _WIN32

// ── FileHandle (POSIX) ────────────────────────────────────────────────────

FileHandle::~FileHandle() {
    if (fd_ >= 0) ::close(fd_);
}

bool FileHandle::is_open() const { return fd_ >= 0; }

void FileHandle::open(const std::string& path) {
    fd_ = ::open(path.c_str(), O_RDONLY);
    if (fd_ < 0) io_fail("cannot open file: " + path + ": " + std::strerror(errno));
    struct stat st{};
    if (::fstat(fd_, &st) != 0) io_fail("fstat failed: " + path);
    size_     = static_cast<uint64_t>(st.st_size);
    writable_ = false;
}

void FileHandle::create(const std::string& path) {
    fd_ = ::open(path.c_str(), O_RDWR | O_CREAT | O_TRUNC, 0644);
    if (fd_ < 0) io_fail("cannot create file: " + path + ": " + std::strerror(errno));
    size_     = 0;
    writable_ = true;
}

void FileHandle::close() {
    if (fd_ < 0) return;
    int rc = ::close(fd_);
    fd_ = -1;
    if (rc != 0) io_fail(std::string("close failed: ") + std::strerror(errno));
}

void FileHandle::pread(void* dst, size_t n, uint64_t off) const {
    if (fd_ < 0) io_fail("pread on closed file");
    if (off + n > size_)
        io_fail("read of " + std::to_string(n) + " bytes at " + std::to_string(off)
                + " past end of file (" + std::to_string(size_) + ")");
    auto* p = static_cast<uint8_t*>(dst);
    size_t remaining = n;
    while (remaining > 0) {
        ssize_t r = ::pread(fd_, p, remaining, static_cast<off_t>(off));
        if (r < 0 && errno == EINTR) continue;
        if (r <= 0) io_fail("pread failed");
        p += r;
        off += static_cast<uint64_t>(r);
        remaining -= static_cast<size_t>(r);
    }
}

void FileHandle::pwrite(const void* src, size_t n, uint64_t off) {
    if (fd_ < 0 || !writable_) io_fail("pwrite on a file not open for writing");
    const auto* p = static_cast<const uint8_t*>(src);
    uint64_t pos = off;
    size_t remaining = n;
    while (remaining > 0) {
        ssize_t w = ::pwrite(fd_, p, remaining, static_cast<off_t>(pos));
        if (w < 0 && errno == EINTR) continue;
        if (w <= 0) io_fail(std::string("pwrite failed: ") + std::strerror(errno));
        p += w;
        pos += static_cast<uint64_t>(w);
        remaining -= static_cast<size_t>(w);
    }
    size_ = std::max(size_, off + n);
}

void FileHandle::sync() {
    if (fd_ < 0) io_fail("sync on closed file");
    if (::fsync(fd_) != 0) io_fail(std::string("fsync failed: ") + std::strerror(errno));
}

#else // ── FileHandle (Windows) ────────────────────────────────────────────

static void* const INVALID = reinterpret_cast<void*>(static_cast<intptr_t>(-1));

static std::vector<wchar_t> widen(const std::string& path) {
    int wlen = MultiByteToWideChar(CP_UTF8, 0, path.c_str(), -1, nullptr, 0);
    std::vector<wchar_t> wpath(wlen);
    MultiByteToWideChar(CP_UTF8, 0, path.c_str(), -1, wpath.data(), wlen);
    return wpath;
}

FileHandle::~FileHandle() {
    if (handle_ != INVALID) CloseHandle(handle_);
}

bool FileHandle::is_open() const { return handle_ != INVALID; }

void FileHandle::open(const std::string& path) {
    auto wpath = widen(path);
    handle_ = CreateFileW(wpath.data(), GENERIC_READ, FILE_SHARE_READ,
                          nullptr, OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL,
                          nullptr);
    if (handle_ == INVALID_HANDLE_VALUE) io_fail("cannot open file: " + path);
    LARGE_INTEGER sz;
    if (!GetFileSizeEx(handle_, &sz)) io_fail("GetFileSizeEx failed");
    size_     = static_cast<uint64_t>(sz.QuadPart);
    writable_ = false;
}

void FileHandle::create(const std::string& path) {
    auto wpath = widen(path);
    handle_ = CreateFileW(wpath.data(), GENERIC_READ | GENERIC_WRITE, 0,
                          nullptr, CREATE_ALWAYS, FILE_ATTRIBUTE_NORMAL,
                          nullptr);
    if (handle_ == INVALID_HANDLE_VALUE) io_fail("cannot create file: " + path);
    size_     = 0;
    writable_ = true;
}

void FileHandle::close() {
    if (handle_ == INVALID) return;
    BOOL ok = CloseHandle(handle_);
    handle_ = INVALID;
    if (!ok) io_fail("CloseHandle failed");
}

void FileHandle::pread(void* dst, size_t n, uint64_t off) const {
    if (off + n > size_) io_fail("read past end of file");
    OVERLAPPED ov{};
    ov.Offset     = static_cast<DWORD>(off & 0xFFFFFFFF);
    ov.OffsetHigh = static_cast<DWORD>(off >> 32);
    DWORD nread = 0;
    if (!ReadFile(handle_, dst, static_cast<DWORD>(n), &nread, &ov)
        || nread != static_cast<DWORD>(n))
        io_fail("ReadFile/pread failed");
}

void FileHandle::pwrite(const void* src, size_t n, uint64_t off) {
    if (!writable_) io_fail("pwrite on a file not open for writing");
    OVERLAPPED ov{};
    ov.Offset     = static_cast<DWORD>(off & 0xFFFFFFFF);
    ov.OffsetHigh = static_cast<DWORD>(off >> 32);
    DWORD nwritten = 0;
    if (!WriteFile(handle_, src, static_cast<DWORD>(n), &nwritten, &ov)
        || nwritten != static_cast<DWORD>(n))
        io_fail("WriteFile/pwrite failed");
    size_ = std::max(size_, off + n);
}

void FileHandle::sync() {
    if (!FlushFileBuffers(handle_)) io_fail("FlushFileBuffers failed");
}

#endif

} // namespace rootio
