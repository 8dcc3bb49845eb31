// rootio – file header, directories, key indexes and free segments

#include "rootio/file.hpp"
#include "rootio/compress.hpp"
#include "rootio/log.hpp"
#include "rootio/tree.hpp"

#include <algorithm>
#include <cctype>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <random>

namespace rootio {

namespace {

constexpr char    kMagic[4]       = {'r', 'o', 'o', 't'};
constexpr int16_t kDirVersion     = 5;
constexpr int16_t kFreeVersion    = 1;
constexpr int32_t kHeaderMaxSize  = 4 + 4 + 4 + 8 + 8 + 4 + 4 + 4 + 1 + 4 + 8 + 4 + 2 + 16;
constexpr int32_t kStreamerCycle  = 1;

std::string basename(const std::string& path) {
    auto pos = path.find_last_of("/\\");
    if (pos == std::string::npos) return path;
    return path.substr(pos + 1);
}

bool is_directory_class(const std::string& cls) {
    return cls == "TDirectory" || cls == "TDirectoryFile";
}

uint32_t now() { return pack_datime(std::time(nullptr)); }

} // anon

// ── Directory ──────────────────────────────────────────────────────────────

Directory::Directory(std::weak_ptr<File> file, Directory* parent, std::string name,
                     std::string title)
    : file_(std::move(file)), top_(parent == nullptr), name_(std::move(name)),
      title_(std::move(title)) {
    ctime_ = mtime_ = now();
    if (parent) {
        parent_      = parent->weak_from_this();
        seek_parent_ = parent->seek_dir_;
        path_        = parent->path_.empty() ? name_ : parent->path_ + "/" + name_;
    }
}

std::shared_ptr<File> Directory::file() const {
    auto f = file_.lock();
    if (!f) fail(ErrorCode::kClosedHandle, "directory '" + name_ + "' outlived its file");
    return f;
}

void Directory::check_open() const { file()->check_open(); }

const std::vector<Key>& Directory::keys() const {
    check_open();
    return keys_;
}

const Key& Directory::key(const std::string& name, int16_t cycle) const {
    check_open();
    const Key* best = nullptr;
    for (const auto& k : keys_) {
        if (k.name != name) continue;
        if (cycle < 0) {
            if (!best || k.cycle > best->cycle) best = &k;
        } else if (k.cycle == cycle) {
            return k;
        }
    }
    if (!best) {
        std::string what = cycle < 0 ? name : name + ";" + std::to_string(cycle);
        fail(ErrorCode::kNotFound,
             "no key '" + what + "' in directory '" + (top_ ? name_ : path_) + "'");
    }
    return *best;
}

ObjectPtr Directory::get(const std::string& path) {
    check_open();
    auto slash = path.find('/');
    if (slash != std::string::npos) {
        std::string head = path.substr(0, slash);
        std::string rest = path.substr(slash + 1);
        if (head.empty()) return get(rest);
        if (rest.empty()) return subdir(head);
        return subdir(head)->get(rest);
    }

    std::string name  = path;
    int16_t     cycle = -1;
    auto semi = path.find(';');
    if (semi != std::string::npos) {
        name = path.substr(0, semi);
        std::string c = path.substr(semi + 1);
        bool digits = std::all_of(c.begin(), c.end(),
                                  [](unsigned char ch) { return std::isdigit(ch) != 0; });
        if (c.empty() || c.size() > 5 || !digits)
            fail(ErrorCode::kInvalidArgument, "bad cycle in '" + path + "'");
        int v = std::atoi(c.c_str());
        if (v > SHRT_MAX) fail(ErrorCode::kInvalidArgument, "bad cycle in '" + path + "'");
        cycle = static_cast<int16_t>(v);
    }

    const Key& k = key(name, cycle);
    if (is_directory_class(k.class_name)) return subdir(name);

    FilePtr                 f   = file();
    const StreamerRegistry& reg = f->registry();
    if (k.class_name != "TTree" && !reg.has_class(k.class_name))
        fail(ErrorCode::kUnknownClass, "'" + path + "' has unregistered class " + k.class_name);

    std::vector<uint8_t> payload = k.load(f->handle());
    ReadBuffer r(payload, k.keylen);
    Record rec = reg.unmarshal(r, k.class_name);
    r.check();
    trace() << "get " << name << ";" << k.cycle << " (" << k.class_name << ", "
            << k.objlen << " bytes)";

    if (k.class_name == "TTree") return Tree::from_record(f, rec);
    return std::make_shared<Record>(std::move(rec));
}

DirectoryPtr Directory::subdir(const std::string& name) {
    auto it = dirs_.find(name);
    if (it != dirs_.end()) return it->second;

    const Key& k = key(name);
    if (!is_directory_class(k.class_name))
        fail(ErrorCode::kInvalidDirectory, "'" + name + "' is a " + k.class_name
                                           + ", not a directory");

    std::vector<uint8_t> payload = k.load(file()->handle());
    ReadBuffer r(payload, k.seek_key + k.keylen);
    auto d = std::make_shared<Directory>(file_, this, k.name, k.title);
    d->read_record(r);
    r.check();
    d->read_keys();
    dirs_[name] = d;
    return d;
}

void Directory::read_record(ReadBuffer& r) {
    int16_t version = r.read_i16();
    ctime_       = r.read_u32();
    mtime_       = r.read_u32();
    nbytes_keys_ = r.read_i32();
    nbytes_name_ = r.read_i32();
    if (version > 1000) {
        seek_dir_    = r.read_i64();
        seek_parent_ = r.read_i64();
        seek_keys_   = r.read_i64();
    } else {
        seek_dir_    = r.read_i32();
        seek_parent_ = r.read_i32();
        seek_keys_   = r.read_i32();
    }
    r.read_u16();   // uuid version
    r.skip(16);
}

void Directory::write_record(WriteBuffer& w, const File& f) const {
    bool big = std::max({seek_dir_, seek_parent_, seek_keys_}) > kStartBigFile;
    w.write_i16(big ? kDirVersion + 1000 : kDirVersion);
    w.write_u32(ctime_);
    w.write_u32(mtime_);
    w.write_i32(nbytes_keys_);
    w.write_i32(nbytes_name_);
    if (big) {
        w.write_i64(seek_dir_);
        w.write_i64(seek_parent_);
        w.write_i64(seek_keys_);
    } else {
        w.write_i32(static_cast<int32_t>(seek_dir_));
        w.write_i32(static_cast<int32_t>(seek_parent_));
        w.write_i32(static_cast<int32_t>(seek_keys_));
    }
    w.write_u16(f.header().uuid_version);
    w.write_bytes(f.header().uuid, 16);
    if (!big) {
        static const uint8_t pad[12] = {};
        w.write_bytes(pad, sizeof(pad));
    }
}

void Directory::read_keys() {
    keys_.clear();
    if (seek_keys_ <= 0) {
        warning() << "directory '" << name_ << "' has no key index";
        return;
    }
    FilePtr           file = this->file();
    const FileHandle& f    = file->handle();
    Key idx = Key::read_at(f, seek_keys_);
    std::vector<uint8_t> payload = idx.load(f);
    ReadBuffer r(payload);
    int32_t n = r.read_i32();
    if (n < 0 || static_cast<size_t>(n) > r.remaining() / 18)
        r.set_error(ErrorCode::kCorruptBlock,
                    "key index of '" + name_ + "' claims " + std::to_string(n) + " keys");
    for (int32_t i = 0; i < n && r.ok(); ++i) {
        Key k;
        k.read(r);
        keys_.push_back(std::move(k));
    }
    r.check();
}

// Called from File::close, which may run inside ~File where file_ has expired.
void Directory::write_keys(File& f) {
    for (auto& d : dirs_) d.second->write_keys(f);

    WriteBuffer p;
    p.write_i32(static_cast<int32_t>(keys_.size()));
    for (const auto& k : keys_) k.write(p);

    Key idx;
    idx.class_name = class_name();
    idx.name       = name_;
    idx.title      = title_;
    idx.seek_pdir  = seek_dir_;
    idx.objlen     = static_cast<int32_t>(p.size());
    f.prepare_key(idx, 0);
    f.append(idx, {}, p.bytes());

    seek_keys_   = idx.seek_key;
    nbytes_keys_ = idx.nbytes;
    mtime_       = now();

    WriteBuffer rec;
    write_record(rec, f);
    f.write_at(seek_dir_ + nbytes_name_, rec.bytes());
}

int16_t Directory::put(const std::string& name, const Object& obj, const std::string& title) {
    FilePtr f = file();
    f->check_open();
    if (!f->writable())
        fail(ErrorCode::kInvalidDirectory, "cannot put '" + name + "': "
                                           + f->path() + " is open read-only");
    if (dynamic_cast<const Directory*>(&obj))
        fail(ErrorCode::kInvalidDirectory,
             "cannot put directory '" + name + "': sub-directories are created with mkdir");
    if (name.empty() || name.find_first_of("/;") != std::string::npos)
        fail(ErrorCode::kInvalidArgument, "bad key name '" + name + "'");

    Record       tree_rec;
    const Record* rec = nullptr;
    if (auto* t = dynamic_cast<const Tree*>(&obj)) {
        if (t->file() != f)
            fail(ErrorCode::kInvalidArgument,
                 "tree '" + t->name() + "' keeps its baskets in another file");
        tree_rec = t->to_record();
        rec = &tree_rec;
    } else if (auto* r = dynamic_cast<const Record*>(&obj)) {
        rec = r;
    } else {
        fail(ErrorCode::kUnknownClass, "no streamer for class " + obj.class_name());
    }

    int16_t cycle = 0;
    for (const auto& k : keys_) {
        if (k.name != name) continue;
        if (is_directory_class(k.class_name))
            fail(ErrorCode::kInvalidDirectory, "'" + name + "' names a directory");
        cycle = std::max(cycle, k.cycle);
    }
    if (cycle == SHRT_MAX) fail(ErrorCode::kInvalidArgument, "cycle overflow for '" + name + "'");

    std::vector<uint8_t> payload = f->marshal(*rec);
    std::vector<uint8_t> stored  = compress(f->options().compression, payload);

    Key k;
    k.class_name = rec->class_name();
    k.name       = name;
    k.title      = title;
    k.cycle      = static_cast<int16_t>(cycle + 1);
    k.objlen     = static_cast<int32_t>(payload.size());
    k.seek_pdir  = seek_dir_;
    f->prepare_key(k, 0);
    f->append(k, {}, stored);
    keys_.push_back(k);
    mtime_ = now();

    debug() << "put " << name << ";" << k.cycle << " (" << k.class_name << ", "
            << k.objlen << " -> " << stored.size() << " bytes)";
    return k.cycle;
}

DirectoryPtr Directory::mkdir(const std::string& path, const std::string& title) {
    FilePtr f = file();
    f->check_open();
    if (!f->writable())
        fail(ErrorCode::kInvalidDirectory, "cannot mkdir '" + path + "': "
                                           + f->path() + " is open read-only");

    auto slash = path.find('/');
    std::string name = path.substr(0, slash);
    std::string rest = slash == std::string::npos ? "" : path.substr(slash + 1);
    if (name.empty() || name.find(';') != std::string::npos)
        fail(ErrorCode::kInvalidArgument, "bad directory name '" + path + "'");

    bool exists = std::any_of(keys_.begin(), keys_.end(),
                              [&](const Key& k) { return k.name == name; });
    if (exists) {
        if (rest.empty())
            fail(ErrorCode::kInvalidDirectory, "'" + name + "' already exists");
        return subdir(name)->mkdir(rest, title);
    }

    auto d = std::make_shared<Directory>(file_, this, name, rest.empty() ? title : "");

    Key k;
    k.class_name = "TDirectory";
    k.name       = d->name_;
    k.title      = d->title_;
    k.seek_pdir  = seek_dir_;
    k.objlen     = kDirRecordSize;
    f->prepare_key(k, 0);

    d->seek_dir_    = k.seek_key;
    d->nbytes_name_ = k.keylen;
    d->seek_parent_ = seek_dir_;
    WriteBuffer rec;
    d->write_record(rec, *f);
    f->append(k, {}, rec.bytes());

    keys_.push_back(k);
    dirs_[name] = d;
    debug() << "mkdir " << d->path();

    if (!rest.empty()) return d->mkdir(rest, title);
    return d;
}

// ── walk ───────────────────────────────────────────────────────────────────

namespace {

bool walk_dir(Directory& dir, const std::string& prefix, const WalkFn& fn,
              const std::function<bool()>& cancelled) {
    // Copy: the callback may add keys.
    std::vector<Key> keys = dir.keys();
    for (const auto& k : keys) {
        if (cancelled && cancelled()) fail(ErrorCode::kCancelled, "walk cancelled");

        std::string key_path = k.name + ";" + std::to_string(k.cycle);
        ObjectPtr   obj;
        try {
            obj = dir.get(key_path);
        } catch (const Error& e) {
            if (e.code() != ErrorCode::kUnknownClass && e.code() != ErrorCode::kUnknownVersion)
                throw;
            if (!fn(prefix + key_path, nullptr, &e)) return false;
            continue;
        }
        if (!fn(prefix + key_path, obj, nullptr)) return false;

        if (auto sub = std::dynamic_pointer_cast<Directory>(obj))
            if (!walk_dir(*sub, prefix + k.name + "/", fn, cancelled)) return false;
    }
    return true;
}

} // anon

void walk(Directory& dir, const WalkFn& fn, const std::function<bool()>& cancelled) {
    walk_dir(dir, "", fn, cancelled);
}

// ── File ───────────────────────────────────────────────────────────────────

File::~File() {
    if (closed_) return;
    try {
        close();
    } catch (const std::exception& e) {
        error() << "closing " << path_ << " failed: " << e.what();
    }
}

FilePtr File::open(const std::string& path) {
    FilePtr f(new File());
    f->path_     = path;
    f->registry_ = StreamerRegistry::with_builtins();
    f->handle_.open(path);
    f->read_header();
    f->options_.compression = CompressionSettings::from_packed(f->header_.compress);

    Key top = Key::read_at(f->handle_, f->header_.begin);
    std::vector<uint8_t> payload = top.load(f->handle_);
    ReadBuffer r(payload, top.seek_key + top.keylen);
    std::string name  = r.read_string();
    std::string title = r.read_string();
    f->root_ = std::make_shared<Directory>(f, nullptr, name, title);
    r.set_pos(static_cast<int64_t>(f->header_.begin) + f->header_.nbytes_name);
    f->root_->read_record(r);
    r.check();

    f->read_streamer_infos();
    f->read_free_segments();
    f->root_->read_keys();

    debug() << "opened " << path << " (version " << f->header_.version << ", "
            << f->root_->keys_.size() << " keys, end " << f->header_.end << ")";
    return f;
}

FilePtr File::create(const std::string& path) {
    return create(path, default_write_options());
}

FilePtr File::create(const std::string& path, const WriteOptions& opts) {
    FilePtr f(new File());
    f->path_     = path;
    f->options_  = opts;
    f->registry_ = StreamerRegistry::with_builtins();
    f->handle_.create(path);

    FileHeader& h = f->header_;
    h.end      = h.begin;
    h.compress = opts.compression.packed();
    std::random_device rd;
    for (auto& b : h.uuid) b = static_cast<uint8_t>(rd());

    std::string name = basename(path);
    f->root_ = std::make_shared<Directory>(f, nullptr, name, opts.title);
    Directory& root = *f->root_;

    WriteBuffer strings;
    strings.write_string(name);
    strings.write_string(opts.title);

    Key k;
    k.class_name = "TFile";
    k.name       = name;
    k.title      = opts.title;
    k.objlen     = static_cast<int32_t>(strings.size()) + kDirRecordSize;
    f->prepare_key(k, 0);

    root.seek_dir_    = k.seek_key;
    root.nbytes_name_ = k.keylen + static_cast<int32_t>(strings.size());
    h.nbytes_name     = root.nbytes_name_;

    WriteBuffer payload;
    payload.write_bytes(strings.bytes().data(), strings.size());
    root.write_record(payload, *f);
    f->append(k, {}, payload.bytes());
    f->write_header();

    debug() << "created " << path << " (" << algorithm_name(opts.compression.algorithm)
            << ":" << opts.compression.level << ")";
    return f;
}

void File::close() {
    if (closed_) return;
    if (handle_.writable()) {
        try {
            write_streamer_infos();
            root_->write_keys(*this);
            write_free_segments();
            write_header();
            handle_.sync();
        } catch (...) {
            closed_ = true;
            throw;
        }
    }
    closed_ = true;
    handle_.close();
    debug() << "closed " << path_;
}

void File::check_open() const {
    if (closed_) fail(ErrorCode::kClosedHandle, path_ + " is closed");
}

void File::check_writable() const {
    check_open();
    if (!handle_.writable())
        fail(ErrorCode::kInvalidDirectory, path_ + " is open read-only");
}

Directory& File::root() {
    check_open();
    return *root_;
}

DirectoryPtr File::root_ptr() {
    check_open();
    return root_;
}

const FileHandle& File::handle() const {
    check_open();
    return handle_;
}

void File::prepare_key(Key& k, size_t extra_len) const {
    check_writable();
    k.seek_key = header_.end;
    k.version  = (k.seek_key > kStartBigFile || k.seek_pdir > kStartBigFile) ? 1004 : 4;
    if (k.datime == 0) k.datime = now();
    int64_t keylen = k.header_size() + static_cast<int64_t>(extra_len);
    if (keylen > SHRT_MAX)
        fail(ErrorCode::kInvalidArgument, "key header for '" + k.name + "' is too long");
    k.keylen = static_cast<int16_t>(keylen);
}

void File::append(Key& k, const std::vector<uint8_t>& extra, const std::vector<uint8_t>& stored) {
    check_writable();
    if (k.seek_key != header_.end)
        fail(ErrorCode::kInvalidArgument, "key '" + k.name + "' was not prepared at end of file");
    int64_t nbytes = static_cast<int64_t>(k.keylen) + static_cast<int64_t>(stored.size());
    if (nbytes > INT_MAX)
        fail(ErrorCode::kInvalidArgument, "payload of '" + k.name + "' exceeds 2 GiB");
    k.nbytes = static_cast<int32_t>(nbytes);

    WriteBuffer w;
    k.write(w);
    w.write_bytes(extra.data(), extra.size());
    if (static_cast<int64_t>(w.size()) != k.keylen)
        fail(ErrorCode::kInvalidArgument, "key header of '" + k.name + "' does not match keylen");
    w.write_bytes(stored.data(), stored.size());

    handle_.pwrite(w.bytes().data(), w.size(), static_cast<uint64_t>(k.seek_key));
    header_.end += nbytes;
}

void File::write_at(int64_t pos, const std::vector<uint8_t>& bytes) {
    check_writable();
    handle_.pwrite(bytes.data(), bytes.size(), static_cast<uint64_t>(pos));
}

std::vector<uint8_t> File::marshal(const Record& rec) {
    check_open();
    WriteBuffer w;
    registry_.marshal(w, rec, &used_classes_);
    w.check();
    return w.take();
}

// ── Header ─────────────────────────────────────────────────────────────────

void File::read_header() {
    uint8_t buf[kHeaderMaxSize] = {};
    size_t  n = static_cast<size_t>(std::min<uint64_t>(handle_.size(), sizeof(buf)));
    if (n < sizeof(kMagic))
        fail(ErrorCode::kCorruptBlock, path_ + " is too short to be a ROOT file");
    handle_.pread(buf, n, 0);

    ReadBuffer r(buf, n);
    char magic[4];
    r.read_bytes(magic, sizeof(magic));
    if (std::memcmp(magic, kMagic, sizeof(magic)) != 0)
        fail(ErrorCode::kCorruptBlock, path_ + ": bad magic");

    FileHeader& h = header_;
    h.version = r.read_i32();
    h.begin   = r.read_i32();
    if (h.is_big()) {
        h.end       = r.read_i64();
        h.seek_free = r.read_i64();
    } else {
        h.end       = r.read_i32();
        h.seek_free = r.read_i32();
    }
    h.nbytes_free = r.read_i32();
    h.nfree       = r.read_i32();
    h.nbytes_name = r.read_i32();
    h.units       = r.read_u8();
    h.compress    = r.read_i32();
    h.seek_info   = h.is_big() ? r.read_i64() : r.read_i32();
    h.nbytes_info = r.read_i32();
    h.uuid_version = r.read_u16();
    r.read_bytes(h.uuid, sizeof(h.uuid));
    if (!r.ok())
        fail(ErrorCode::kCorruptBlock, path_ + ": truncated file header");

    if (h.begin <= 0 || h.nbytes_name <= 0 || h.end < h.begin
        || static_cast<uint64_t>(h.end) > handle_.size())
        fail(ErrorCode::kCorruptBlock,
             path_ + ": inconsistent header (begin=" + std::to_string(h.begin)
             + " end=" + std::to_string(h.end) + " size=" + std::to_string(handle_.size()) + ")");
}

void File::write_header() {
    const FileHeader& h = header_;
    WriteBuffer w;
    w.write_bytes(kMagic, sizeof(kMagic));
    w.write_i32(h.version);
    w.write_i32(h.begin);
    w.write_i64(h.end);
    w.write_i64(h.seek_free);
    w.write_i32(h.nbytes_free);
    w.write_i32(h.nfree);
    w.write_i32(h.nbytes_name);
    w.write_u8(h.units);
    w.write_i32(h.compress);
    w.write_i64(h.seek_info);
    w.write_i32(h.nbytes_info);
    w.write_u16(h.uuid_version);
    w.write_bytes(h.uuid, sizeof(h.uuid));
    handle_.pwrite(w.bytes().data(), w.size(), 0);
}

// ── Streamer infos ─────────────────────────────────────────────────────────

void File::read_streamer_infos() {
    if (header_.seek_info <= 0) {
        debug() << path_ << ": no streamer infos, using built-in layouts";
        return;
    }
    Key k = Key::read_at(handle_, header_.seek_info);
    std::vector<uint8_t> payload = k.load(handle_);
    ReadBuffer r(payload, k.keylen);
    std::vector<StreamerInfo> infos = StreamerRegistry::read_list(r);
    for (auto& si : infos) registry_.merge(std::move(si));
    debug() << path_ << ": " << infos.size() << " streamer infos";
}

void File::write_streamer_infos() {
    WriteBuffer w;
    registry_.write_list(w, used_classes_);
    w.check();
    std::vector<uint8_t> payload = w.take();
    std::vector<uint8_t> stored  = compress(options_.compression, payload);

    Key k;
    k.class_name = "TList";
    k.name       = "StreamerInfo";
    k.title      = "Doubly linked list";
    k.cycle      = kStreamerCycle;
    k.seek_pdir  = header_.begin;
    k.objlen     = static_cast<int32_t>(payload.size());
    prepare_key(k, 0);
    append(k, {}, stored);
    header_.seek_info   = k.seek_key;
    header_.nbytes_info = k.nbytes;
}

// ── Free segments ──────────────────────────────────────────────────────────

void File::read_free_segments() {
    free_.clear();
    if (header_.seek_free <= 0 || header_.nfree <= 0) return;
    Key k = Key::read_at(handle_, header_.seek_free);
    std::vector<uint8_t> payload = k.load(handle_);
    ReadBuffer r(payload);
    while (r.ok() && r.remaining() > 0) {
        FreeSegment seg;
        int16_t version = r.read_i16();
        if (version > 1000) {
            seg.first = r.read_i64();
            seg.last  = r.read_i64();
        } else {
            seg.first = r.read_i32();
            seg.last  = r.read_i32();
        }
        if (r.ok()) free_.push_back(seg);
    }
    r.check();
}

void File::write_free_segments() {
    Key k;
    k.class_name = "TFile";
    k.name       = root_->name();
    k.title      = root_->title();
    k.seek_pdir  = header_.begin;

    // The trailing segment always ends past kStartBigFile: 64-bit form.
    FreeSegment seg;
    k.objlen = 2 + 8 + 8;
    prepare_key(k, 0);
    seg.first = k.seek_key + k.keylen + k.objlen;
    seg.last  = seg.first + kStartBigFile;

    WriteBuffer w;
    w.write_i16(kFreeVersion + 1000);
    w.write_i64(seg.first);
    w.write_i64(seg.last);
    append(k, {}, w.bytes());

    free_ = {seg};
    header_.seek_free   = k.seek_key;
    header_.nbytes_free = k.nbytes;
    header_.nfree       = 1;
}

} // namespace rootio
