// rootio – tree metadata and basket inflation

#include "rootio/tree.hpp"
#include "rootio/file.hpp"
#include "rootio/io.hpp"
#include "rootio/log.hpp"

#include <algorithm>

namespace rootio {

namespace {

[[noreturn]] void corrupt(const Branch& br, size_t id, const std::string& msg) {
    fail(ErrorCode::kCorruptBasket,
         "basket " + std::to_string(id) + " of branch '" + br.name + "': " + msg);
}

int32_t as_i32(const Record& rec, const char* field) {
    return static_cast<int32_t>(value_to_i64(rec.at(field)));
}

std::vector<int64_t> with_trailing_zero(const std::vector<int64_t>& v) {
    std::vector<int64_t> out = v;
    out.push_back(0);
    return out;
}

} // anon

// ── Leaf ───────────────────────────────────────────────────────────────────

Value Leaf::read_value(ReadBuffer& r) const {
    if (type == FieldKind::kString) return r.read_string();
    if (is_variable()) {
        int32_t n = r.read_i32();
        if (!r.ok()) return Value{};
        return read_primitives(r, type, n);
    }
    if (len == 1) return read_primitive(r, type);
    return read_primitives(r, type, len);
}

void Leaf::skip(ReadBuffer& r) const {
    if (type == FieldKind::kString) {
        r.read_string();
    } else if (is_variable()) {
        int32_t n = r.read_i32();
        if (n < 0 || static_cast<uint64_t>(n) * len_type > r.remaining()) {
            r.set_error(ErrorCode::kCorruptBasket,
                        "leaf '" + name + "' holds " + std::to_string(n) + " elements");
            return;
        }
        r.skip(static_cast<size_t>(n) * len_type);
    } else {
        r.skip(static_cast<size_t>(fixed_size()));
    }
}

Record Leaf::to_record() const {
    Record rec("TLeaf");
    rec.set("fName", name)
       .set("fTitle", title)
       .set("fType", static_cast<int64_t>(type))
       .set("fLen", static_cast<int64_t>(len))
       .set("fLenType", static_cast<int64_t>(len_type))
       .set("fOffset", static_cast<int64_t>(offset))
       .set("fIsUnsigned", is_unsigned);
    return rec;
}

Leaf Leaf::from_record(const Record& rec) {
    Leaf l;
    l.name        = rec.get<std::string>("fName");
    l.title       = rec.get<std::string>("fTitle");
    l.type        = static_cast<FieldKind>(as_i32(rec, "fType"));
    l.len         = as_i32(rec, "fLen");
    l.len_type    = as_i32(rec, "fLenType");
    l.offset      = as_i32(rec, "fOffset");
    l.is_unsigned = value_to_i64(rec.at("fIsUnsigned")) != 0;

    bool ok = l.type == FieldKind::kString
                  ? l.len == 0 && l.len_type == 1
                  : is_primitive(l.type) && l.len_type == kind_size(l.type) && l.len >= 0;
    if (!ok || l.offset < 0)
        fail(ErrorCode::kCorruptBlock,
             "leaf '" + l.name + "' has an unsupported layout (type "
             + std::to_string(static_cast<int32_t>(l.type)) + ", len " + std::to_string(l.len)
             + ", size " + std::to_string(l.len_type) + ")");
    return l;
}

// ── Branch ─────────────────────────────────────────────────────────────────

BasketSpan Branch::span(size_t id) const {
    if (id >= baskets())
        fail(ErrorCode::kNotFound, "branch '" + name + "' has no basket " + std::to_string(id));
    return BasketSpan{basket_entry[id], basket_entry[id + 1]};
}

size_t Branch::find_basket(int64_t entry) const {
    if (entry < 0 || entry >= entries)
        fail(ErrorCode::kNotFound, "entry " + std::to_string(entry) + " outside branch '"
                                   + name + "' (" + std::to_string(entries) + " entries)");
    auto it = std::upper_bound(basket_entry.begin(), basket_entry.end(), entry);
    return static_cast<size_t>(it - basket_entry.begin()) - 1;
}

int32_t Branch::entry_size() const {
    if (is_variable()) return 0;
    int32_t n = 0;
    for (const auto& l : leaves) n += l.fixed_size();
    return n;
}

bool Branch::is_variable() const {
    return std::any_of(leaves.begin(), leaves.end(),
                       [](const Leaf& l) { return l.is_variable(); });
}

void Branch::validate() const {
    size_t nb = baskets();
    if (basket_bytes.size() != nb || basket_entry.size() != nb + 1)
        fail(ErrorCode::kCorruptBasket, "branch '" + name + "': basket tables disagree on "
                                        "the number of baskets");
    if (basket_entry.front() != 0)
        fail(ErrorCode::kCorruptBasket, "branch '" + name + "': first basket starts at entry "
                                        + std::to_string(basket_entry.front()));
    for (size_t i = 0; i < nb; ++i) {
        if (basket_entry[i + 1] <= basket_entry[i])
            corrupt(*this, i, "empty or overlapping entry span");
        if (basket_seek[i] <= 0 || basket_bytes[i] <= 0)
            corrupt(*this, i, "bad seek pointer or size");
    }
    if (basket_entry.back() != entries)
        fail(ErrorCode::kCorruptBasket, "branch '" + name + "': baskets cover "
                                        + std::to_string(basket_entry.back()) + " of "
                                        + std::to_string(entries) + " entries");
    if (leaves.empty())
        fail(ErrorCode::kCorruptBasket, "branch '" + name + "' has no leaves");
}

Record Branch::to_record() const {
    int64_t nb = static_cast<int64_t>(baskets());
    std::vector<int64_t> bytes(basket_bytes.begin(), basket_bytes.end());
    std::vector<RecordPtr> leaf_recs;
    for (const auto& l : leaves) leaf_recs.push_back(std::make_shared<Record>(l.to_record()));

    Record rec("TBranch");
    rec.set("fName", name)
       .set("fTitle", title)
       .set("fCompress", static_cast<int64_t>(compress))
       .set("fBasketSize", static_cast<int64_t>(basket_size))
       .set("fEntryOffsetLen", static_cast<int64_t>(entry_offset_len))
       .set("fWriteBasket", nb)
       .set("fEntries", entries)
       .set("fTotBytes", tot_bytes)
       .set("fZipBytes", zip_bytes)
       .set("fMaxBaskets", nb + 1)
       .set("fBasketBytes", with_trailing_zero(bytes))
       .set("fBasketEntry", basket_entry)
       .set("fBasketSeek", with_trailing_zero(basket_seek))
       .set("fLeaves", std::move(leaf_recs));
    return rec;
}

Branch Branch::from_record(const Record& rec) {
    Branch b;
    b.name             = rec.get<std::string>("fName");
    b.title            = rec.get<std::string>("fTitle");
    b.compress         = as_i32(rec, "fCompress");
    b.basket_size      = as_i32(rec, "fBasketSize");
    b.entry_offset_len = as_i32(rec, "fEntryOffsetLen");
    b.entries          = value_to_i64(rec.at("fEntries"));
    b.tot_bytes        = value_to_i64(rec.at("fTotBytes"));
    b.zip_bytes        = value_to_i64(rec.at("fZipBytes"));

    int32_t nb  = as_i32(rec, "fWriteBasket");
    int32_t max = as_i32(rec, "fMaxBaskets");
    const auto& bytes = rec.get<std::vector<int64_t>>("fBasketBytes");
    const auto& entry = rec.get<std::vector<int64_t>>("fBasketEntry");
    const auto& seek  = rec.get<std::vector<int64_t>>("fBasketSeek");
    if (nb < 0 || max < nb + 1 || bytes.size() < static_cast<size_t>(nb)
        || entry.size() < static_cast<size_t>(nb) + 1 || seek.size() < static_cast<size_t>(nb))
        fail(ErrorCode::kCorruptBasket, "branch '" + b.name + "': " + std::to_string(nb)
                                        + " baskets do not fit tables of " + std::to_string(max));

    for (int32_t i = 0; i < nb; ++i) b.basket_bytes.push_back(static_cast<int32_t>(bytes[i]));
    b.basket_seek.assign(seek.begin(), seek.begin() + nb);
    b.basket_entry.assign(entry.begin(), entry.begin() + nb + 1);

    for (const auto& l : rec.get<std::vector<RecordPtr>>("fLeaves"))
        if (l) b.leaves.push_back(Leaf::from_record(*l));
    return b;
}

// ── Tree ───────────────────────────────────────────────────────────────────

Tree::Tree(std::weak_ptr<File> file, std::string name, std::string title)
    : file_(std::move(file)), name_(std::move(name)), title_(std::move(title)) {}

std::shared_ptr<File> Tree::file() const {
    auto f = file_.lock();
    if (!f) fail(ErrorCode::kClosedHandle, "tree '" + name_ + "' outlived its file");
    return f;
}

const Branch& Tree::branch(const std::string& name) const {
    for (const auto& b : branches_)
        if (b.name == name) return b;
    fail(ErrorCode::kNotFound, "tree '" + name_ + "' has no branch '" + name + "'");
}

std::vector<const Leaf*> Tree::leaves() const {
    std::vector<const Leaf*> out;
    for (const auto& b : branches_)
        for (const auto& l : b.leaves) out.push_back(&l);
    return out;
}

Record Tree::to_record() const {
    int64_t tot = 0, zip = 0;
    std::vector<RecordPtr> branch_recs;
    for (const auto& b : branches_) {
        tot += b.tot_bytes;
        zip += b.zip_bytes;
        branch_recs.push_back(std::make_shared<Record>(b.to_record()));
    }
    Record rec("TTree");
    rec.set("fName", name_)
       .set("fTitle", title_)
       .set("fEntries", entries_)
       .set("fTotBytes", tot)
       .set("fZipBytes", zip)
       .set("fBranches", std::move(branch_recs));
    return rec;
}

TreePtr Tree::from_record(std::weak_ptr<File> file, const Record& rec) {
    auto t = std::make_shared<Tree>(file, rec.get<std::string>("fName"),
                                    rec.get<std::string>("fTitle"));
    t->entries_ = value_to_i64(rec.at("fEntries"));
    for (const auto& br : rec.get<std::vector<RecordPtr>>("fBranches")) {
        if (!br) continue;
        Branch b = Branch::from_record(*br);
        b.validate();
        if (b.entries != t->entries_)
            fail(ErrorCode::kCorruptBasket,
                 "branch '" + b.name + "' has " + std::to_string(b.entries)
                 + " entries, tree '" + t->name_ + "' has " + std::to_string(t->entries_));
        t->branches_.push_back(std::move(b));
    }
    return t;
}

// ── Basket ─────────────────────────────────────────────────────────────────

Basket Basket::inflate(const File& file, const Branch& branch, size_t id) {
    const FileHandle& f = file.handle();

    Basket b;
    b.id_   = id;
    b.span_ = branch.span(id);

    int64_t seek = branch.basket_seek[id];
    try {
        b.key_ = Key::read_at(f, seek);
    } catch (const Error& e) {
        if (e.code() != ErrorCode::kCorruptBlock) throw;
        corrupt(branch, id, e.what());
    }
    const Key& k = b.key_;
    if (k.header_size() + kBasketHeaderSize != k.keylen)
        corrupt(branch, id, "key length " + std::to_string(k.keylen)
                            + " leaves no room for the basket header");
    if (k.nbytes != branch.basket_bytes[id])
        corrupt(branch, id, "key holds " + std::to_string(k.nbytes) + " bytes, branch expects "
                            + std::to_string(branch.basket_bytes[id]));

    uint8_t hdr[kBasketHeaderSize];
    f.pread(hdr, sizeof(hdr), static_cast<uint64_t>(seek + k.keylen - kBasketHeaderSize));
    ReadBuffer h(hdr, sizeof(hdr));
    int16_t version = h.read_i16();
    b.bufsize_      = h.read_i32();
    b.nevsize_      = h.read_i32();
    int32_t nevbuf  = h.read_i32();
    b.last_         = h.read_i32();
    h.read_u8();   // flag
    if (version != kBasketVersion)
        debug() << "basket " << id << " of " << branch.name << ": header version " << version;
    if (nevbuf != b.span_.size())
        corrupt(branch, id, "holds " + std::to_string(nevbuf) + " entries, span says "
                            + std::to_string(b.span_.size()));

    try {
        b.payload_ = k.load(f);
    } catch (const Error& e) {
        if (e.code() != ErrorCode::kCorruptBlock) throw;
        corrupt(branch, id, e.what());
    }

    const int64_t keylen = k.keylen;
    const int64_t end    = keylen + static_cast<int64_t>(b.payload_.size());
    if (!branch.is_variable()) {
        int64_t data = static_cast<int64_t>(nevbuf) * b.nevsize_;
        if (b.nevsize_ != branch.entry_size() || b.last_ != keylen + data || data > end - keylen)
            corrupt(branch, id, "fixed entry layout does not match the basket header");
    } else {
        if (b.last_ < keylen || b.last_ + 4 > end)
            corrupt(branch, id, "offsets table position " + std::to_string(b.last_)
                                + " outside payload");
        ReadBuffer r(b.payload_, keylen);
        r.set_pos(b.last_);
        int32_t n = r.read_i32();
        if (n != nevbuf + 1)
            corrupt(branch, id, "offsets table holds " + std::to_string(n) + " entries, expected "
                                + std::to_string(nevbuf + 1));
        b.offsets_.resize(static_cast<size_t>(n));
        for (auto& o : b.offsets_) o = r.read_i32();
        if (!r.ok()) corrupt(branch, id, r.error());
        if (b.offsets_.front() < keylen || b.offsets_.back() != b.last_)
            corrupt(branch, id, "offsets table does not span the entry data");
        for (size_t i = 1; i < b.offsets_.size(); ++i)
            if (b.offsets_[i] <= b.offsets_[i - 1])
                corrupt(branch, id, "offsets not strictly increasing at " + std::to_string(i));
    }

    trace() << "inflated basket " << id << " of " << branch.name << " [" << b.span_.first
            << ", " << b.span_.last << ") " << k.stored_size() << " -> " << k.objlen << " bytes";
    return b;
}

ReadBuffer Basket::cursor(int64_t entry, const Branch& branch, size_t leaf) const {
    if (!span_.contains(entry))
        fail(ErrorCode::kInvalidArgument, "entry " + std::to_string(entry) + " not in basket "
                                          + std::to_string(id_));
    if (leaf >= branch.leaves.size())
        fail(ErrorCode::kInvalidArgument, "branch '" + branch.name + "' has no leaf "
                                          + std::to_string(leaf));

    ReadBuffer r(payload_, key_.keylen);
    int64_t i = entry - span_.first;
    if (offsets_.empty()) {
        r.set_pos(key_.keylen + i * nevsize_ + branch.leaves[leaf].offset);
    } else {
        r.set_pos(offsets_[static_cast<size_t>(i)]);
        for (size_t l = 0; l < leaf; ++l) branch.leaves[l].skip(r);
    }
    return r;
}

} // namespace rootio
