// rootio – entry-wise tree writer

#include "rootio/writer.hpp"
#include "rootio/compress.hpp"
#include "rootio/log.hpp"

#include <climits>
#include <set>

namespace rootio {

namespace {

WriteOptions untitled(WriteOptions opts) {
    opts.title.clear();
    return opts;
}

} // anon

Writer::Writer(Directory& dir, const std::string& name, std::vector<WriteVar> vars)
    : Writer(dir, name, std::move(vars), untitled(dir.file()->options())) {}

Writer::Writer(Directory& dir, const std::string& name, std::vector<WriteVar> vars,
               const WriteOptions& opts)
    : dir_(dir.shared_from_this()), opts_(opts), vars_(std::move(vars)),
      tree_(dir.file(), name, opts.title) {
    if (!dir.file()->writable())
        fail(ErrorCode::kInvalidDirectory, "cannot write tree '" + name + "': "
                                           + dir.file()->path() + " is open read-only");
    if (vars_.empty())
        fail(ErrorCode::kInvalidArgument, "tree '" + name + "' needs at least one variable");
    if (opts_.basket_size <= 0 || opts_.basket_entries < 0)
        fail(ErrorCode::kInvalidArgument, "bad basket limits for tree '" + name + "'");

    std::set<std::string> leaf_names;
    for (size_t i = 0; i < vars_.size(); ++i) {
        const Leaf& leaf = vars_[i].leaf;
        if (leaf.name.empty() || !leaf_names.insert(leaf.name).second)
            fail(ErrorCode::kInvalidArgument, "duplicate or empty leaf name '" + leaf.name + "'");

        const std::string& bname = vars_[i].branch.empty() ? leaf.name : vars_[i].branch;
        size_t b = 0;
        while (b < tree_.branches_.size() && tree_.branches_[b].name != bname) ++b;
        if (b == tree_.branches_.size()) {
            Branch br;
            br.name         = bname;
            br.compress     = opts_.compression.packed();
            br.basket_size  = opts_.basket_size;
            br.basket_entry = {0};
            tree_.branches_.push_back(std::move(br));
            pending_.emplace_back();
            rows_.emplace_back();
        }

        Branch& br = tree_.branches_[b];
        Leaf    l  = leaf;
        l.offset   = br.entry_size();
        br.leaves.push_back(l);
        pending_[b].vars.push_back(i);
    }

    for (auto& br : tree_.branches_) {
        if (br.is_variable()) {
            br.entry_offset_len = kEntryOffsetLen;
            for (auto& l : br.leaves) l.offset = 0;
        }
    }
}

Writer::~Writer() {
    if (closed_) return;
    try {
        close();
    } catch (const std::exception& e) {
        error() << "closing tree writer '" << tree_.name() << "' failed: " << e.what();
    }
}

void Writer::write() {
    if (closed_) fail(ErrorCode::kClosedHandle, "tree writer '" + tree_.name() + "' is closed");

    // Encode every branch before touching any of them, so a failing encoder
    // leaves all branches at the same entry count.
    for (size_t b = 0; b < pending_.size(); ++b) {
        const Pending& p  = pending_[b];
        WriteBuffer&   row = rows_[b];
        row = WriteBuffer();
        for (size_t v : p.vars) vars_[v].encode(row);
        row.check();
        if (p.data.size() + row.size() > static_cast<size_t>(INT_MAX))
            fail(ErrorCode::kInvalidArgument, "basket of '" + tree_.branches_[b].name
                                              + "' overflows");
    }

    for (size_t b = 0; b < pending_.size(); ++b) {
        Pending& p  = pending_[b];
        Branch&  br = tree_.branches_[b];
        if (br.is_variable()) p.offsets.push_back(static_cast<int32_t>(p.data.size()));
        p.data.write_bytes(rows_[b].bytes().data(), rows_[b].size());
        ++p.nevbuf;
        ++br.entries;
    }
    ++tree_.entries_;

    for (size_t b = 0; b < pending_.size(); ++b) {
        const Pending& p = pending_[b];
        bool full = opts_.basket_entries > 0
                        ? p.nevbuf >= opts_.basket_entries
                        : p.data.size() >= static_cast<size_t>(opts_.basket_size);
        if (full) flush(b);
    }
}

void Writer::flush(size_t b) {
    Pending& p  = pending_[b];
    Branch&  br = tree_.branches_[b];
    if (p.nevbuf == 0) return;

    FilePtr file = dir_->file();
    Key k;
    k.class_name = "TBasket";
    k.name       = br.name;
    k.title      = tree_.name();
    k.seek_pdir  = dir_->seek_dir();
    file->prepare_key(k, kBasketHeaderSize);

    const int32_t keylen = k.keylen;
    const int32_t last   = keylen + static_cast<int32_t>(p.data.size());
    WriteBuffer payload;
    payload.write_bytes(p.data.bytes().data(), p.data.size());
    if (br.is_variable()) {
        payload.write_i32(p.nevbuf + 1);
        for (int32_t o : p.offsets) payload.write_i32(keylen + o);
        payload.write_i32(last);
    }

    WriteBuffer hdr;
    hdr.write_i16(kBasketVersion);
    hdr.write_i32(opts_.basket_size);
    hdr.write_i32(br.entry_size());
    hdr.write_i32(p.nevbuf);
    hdr.write_i32(last);
    hdr.write_u8(0);

    std::vector<uint8_t> stored = compress(opts_.compression, payload.bytes());
    k.objlen = static_cast<int32_t>(payload.size());
    file->append(k, hdr.bytes(), stored);

    br.basket_bytes.push_back(k.nbytes);
    br.basket_seek.push_back(k.seek_key);
    br.basket_entry.push_back(br.entries);
    br.tot_bytes += static_cast<int64_t>(k.objlen) + keylen;
    br.zip_bytes += k.nbytes;

    trace() << "flushed basket " << br.baskets() - 1 << " of " << br.name << ": "
            << p.nevbuf << " entries, " << k.objlen << " -> " << stored.size() << " bytes";

    p.data    = WriteBuffer();
    p.offsets.clear();
    p.nevbuf  = 0;
}

void Writer::close() {
    if (closed_) return;
    closed_ = true;
    for (size_t b = 0; b < pending_.size(); ++b) flush(b);
    dir_->put(tree_.name(), tree_, tree_.title());
    debug() << "wrote tree " << tree_.name() << ": " << tree_.entries() << " entries, "
            << tree_.branches().size() << " branches";
}

} // namespace rootio
