// rootio – files and directories
#pragma once

#include "rootio/config.hpp"
#include "rootio/io.hpp"
#include "rootio/key.hpp"
#include "rootio/object.hpp"
#include "rootio/streamer.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace rootio {

class File;

constexpr int32_t kFileVersion   = 1062206;   // >= 1000000: 64-bit pointers
constexpr int32_t kBegin         = 100;
constexpr int32_t kDirRecordSize = 60;

struct FileHeader {
    int32_t  version     = kFileVersion;
    int32_t  begin       = kBegin;
    int64_t  end         = 0;
    int64_t  seek_free   = 0;
    int32_t  nbytes_free = 0;
    int32_t  nfree       = 0;
    int32_t  nbytes_name = 0;
    uint8_t  units       = 8;
    int32_t  compress    = 0;
    int64_t  seek_info   = 0;
    int32_t  nbytes_info = 0;
    uint16_t uuid_version = 1;
    uint8_t  uuid[16]     = {};

    bool is_big() const { return version >= 1000000; }
};

/// Unused byte range [first, last] of the file.
struct FreeSegment {
    int64_t first = 0;
    int64_t last  = 0;
};

// ── Directory ──────────────────────────────────────────────────────────────

/// Directories refer to their file weakly: once the File is gone every
/// access fails Error(kClosedHandle).
class Directory : public Object, public std::enable_shared_from_this<Directory> {
public:
    Directory(std::weak_ptr<File> file, Directory* parent, std::string name, std::string title);

    std::string class_name() const override { return top_ ? "TFile" : "TDirectory"; }

    const std::string& name() const { return name_; }
    const std::string& title() const { return title_; }
    /// Null for the top directory or once the parent is gone.
    std::shared_ptr<Directory> parent() const { return parent_.lock(); }
    /// Throws Error(kClosedHandle) when the file has been destroyed.
    std::shared_ptr<File> file() const;
    /// Slash-separated path from the top directory ("" for the top itself).
    const std::string& path() const { return path_; }
    int64_t            seek_dir() const { return seek_dir_; }

    /// Key index in insertion order.
    const std::vector<Key>& keys() const;

    /// Key `name` at `cycle`; cycle < 0 picks the highest one.
    const Key& key(const std::string& name, int16_t cycle = -1) const;

    /// Resolve "a/b/name" or "name;cycle". Throws Error(kNotFound).
    ObjectPtr get(const std::string& path);

    template <class T>
    std::shared_ptr<T> get_as(const std::string& path) {
        auto obj = std::dynamic_pointer_cast<T>(get(path));
        if (!obj) fail(ErrorCode::kInvalidArgument, "'" + path + "' has a different class");
        return obj;
    }

    /// Stream `obj` into a new key; returns its cycle.
    int16_t put(const std::string& name, const Object& obj, const std::string& title = "");

    /// Create (nested) sub-directories; "a/b" creates both levels as needed.
    std::shared_ptr<Directory> mkdir(const std::string& path, const std::string& title = "");

private:
    friend class File;

    std::shared_ptr<Directory> subdir(const std::string& name);
    void read_record(ReadBuffer& r);
    void write_record(WriteBuffer& w, const File& f) const;
    void read_keys();
    void write_keys(File& f);
    void check_open() const;

    std::weak_ptr<File>      file_;
    std::weak_ptr<Directory> parent_;
    bool                     top_;
    std::string              name_;
    std::string              title_;
    std::string              path_;

    uint32_t ctime_       = 0;
    uint32_t mtime_       = 0;
    int32_t  nbytes_keys_ = 0;
    int32_t  nbytes_name_ = 0;
    int64_t  seek_dir_    = 0;
    int64_t  seek_parent_ = 0;
    int64_t  seek_keys_   = 0;

    std::vector<Key>                                  keys_;
    std::map<std::string, std::shared_ptr<Directory>> dirs_;
};

using DirectoryPtr = std::shared_ptr<Directory>;

/// Called per key in pre-order. `obj` is null when the key could not be
/// decoded; `err` then holds the reason. Return false to stop the walk.
using WalkFn = std::function<bool(const std::string& path, const ObjectPtr& obj,
                                  const Error* err)>;

/// Depth-first, pre-order. Paths are relative to `dir` and carry the cycle
/// ("sub/name;1"). `cancelled` is polled before each key; a true answer
/// throws Error(kCancelled).
void walk(Directory& dir, const WalkFn& fn, const std::function<bool()>& cancelled = {});

// ── File ───────────────────────────────────────────────────────────────────

class File : public std::enable_shared_from_this<File> {
public:
    ~File();
    File(const File&) = delete;
    File& operator=(const File&) = delete;

    static std::shared_ptr<File> open(const std::string& path);
    static std::shared_ptr<File> create(const std::string& path);
    static std::shared_ptr<File> create(const std::string& path, const WriteOptions& opts);

    /// Finalize the file. Writers append the streamer infos, key indexes,
    /// free list and header; a failure leaves a partial file behind.
    void close();
    bool closed() const { return closed_; }
    bool writable() const { return handle_.writable(); }

    const std::string& path() const { return path_; }
    const FileHeader&  header() const { return header_; }
    Directory&         root();
    DirectoryPtr       root_ptr();
    const StreamerRegistry& registry() const { return registry_; }
    StreamerRegistry&  registry() { return registry_; }
    const WriteOptions& options() const { return options_; }
    const FileHandle&  handle() const;
    const std::vector<FreeSegment>& free_segments() const { return free_; }

    /// Fill in seek_key, version and keylen for a key appended next,
    /// `extra_len` bytes of which follow the key header.
    void prepare_key(Key& k, size_t extra_len) const;
    /// Append key header + `extra` + `stored` at end of file.
    void append(Key& k, const std::vector<uint8_t>& extra, const std::vector<uint8_t>& stored);

    /// Marshal `rec` and note its classes for the StreamerInfo record.
    std::vector<uint8_t> marshal(const Record& rec);

private:
    friend class Directory;

    File() = default;

    void write_at(int64_t pos, const std::vector<uint8_t>& bytes);
    void check_open() const;
    void check_writable() const;
    void read_header();
    void write_header();
    void read_streamer_infos();
    void write_streamer_infos();
    void read_free_segments();
    void write_free_segments();

    std::string           path_;
    FileHandle            handle_;
    FileHeader            header_;
    WriteOptions          options_;
    StreamerRegistry      registry_;
    std::set<std::string> used_classes_;
    std::vector<FreeSegment> free_;
    DirectoryPtr          root_;
    bool                  closed_ = false;
};

using FilePtr = std::shared_ptr<File>;

} // namespace rootio
