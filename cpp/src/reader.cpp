// rootio – entry-wise tree reader

#include "rootio/reader.hpp"
#include "rootio/file.hpp"
#include "rootio/log.hpp"

#include <algorithm>

namespace rootio {

namespace {

FieldKind canonical(FieldKind k) {
    if (k == FieldKind::kLong)  return FieldKind::kLong64;
    if (k == FieldKind::kULong) return FieldKind::kULong64;
    return k;
}

bool matches(const ReadVar& v, const Leaf& l) {
    switch (v.shape) {
        case VarShape::kAny:
            return true;
        case VarShape::kString:
            return l.type == FieldKind::kString;
        case VarShape::kScalar:
            return canonical(l.type) == canonical(v.kind) && l.len == 1;
        case VarShape::kFixed:
            return canonical(l.type) == canonical(v.kind) && l.len == v.len;
        case VarShape::kVariable:
            return canonical(l.type) == canonical(v.kind) && l.len == 0;
    }
    return false;
}

std::string describe(const Leaf& l) {
    std::string s = kind_name(l.type);
    if (l.type == FieldKind::kString) return s;
    if (l.is_variable()) return s + "[]";
    if (l.len > 1) return s + "[" + std::to_string(l.len) + "]";
    return s;
}

} // anon

const Value& ReadContext::value(size_t index) const {
    if (index >= values_.size())
        fail(ErrorCode::kInvalidArgument, "no read variable #" + std::to_string(index));
    return values_[index];
}

const Value& ReadContext::value(const std::string& name) const {
    for (size_t i = 0; i < vars_->size(); ++i)
        if ((*vars_)[i].name == name) return values_[i];
    fail(ErrorCode::kNotFound, "no read variable '" + name + "'");
}

Reader::Reader(TreePtr tree, std::vector<ReadVar> vars, ReaderOptions opts)
    : tree_(std::move(tree)), vars_(std::move(vars)), opts_(std::move(opts)) {
    if (!tree_) fail(ErrorCode::kInvalidArgument, "reader needs a tree");
    const auto& branches = tree_->branches();
    for (const auto& v : vars_) {
        Binding b;
        bool    found = false;
        for (size_t i = 0; i < branches.size() && !found; ++i) {
            for (size_t j = 0; j < branches[i].leaves.size(); ++j) {
                if (branches[i].leaves[j].name == v.name) {
                    b     = Binding{i, j};
                    found = true;
                    break;
                }
            }
        }
        for (size_t i = 0; i < branches.size() && !found; ++i) {
            if (branches[i].name == v.name && branches[i].leaves.size() == 1) {
                b     = Binding{i, 0};
                found = true;
            }
        }
        if (!found)
            fail(ErrorCode::kNotFound, "tree '" + tree_->name() + "' has no leaf '" + v.name + "'");

        const Leaf& leaf = branches[b.branch].leaves[b.leaf];
        if (!matches(v, leaf))
            fail(ErrorCode::kInvalidArgument,
                 "variable for '" + v.name + "' does not match leaf type " + describe(leaf));
        bindings_.push_back(b);
    }
}

const Basket& Reader::basket_for(size_t branch, int64_t entry) {
    auto it = cache_.find(branch);
    if (it != cache_.end() && it->second.span().contains(entry)) return it->second;

    if (opts_.cancelled && opts_.cancelled())
        fail(ErrorCode::kCancelled, "read of tree '" + tree_->name() + "' cancelled at entry "
                                    + std::to_string(entry));

    const Branch& br = tree_->branches()[branch];
    FilePtr       f  = tree_->file();
    Basket b = Basket::inflate(*f, br, br.find_basket(entry));
    ++inflated_;
    if (it != cache_.end()) {
        it->second = std::move(b);
        return it->second;
    }
    return cache_.emplace(branch, std::move(b)).first->second;
}

void Reader::read(const std::function<void(const ReadContext&)>& fn) {
    if (closed_) fail(ErrorCode::kClosedHandle, "reader of tree '" + tree_->name() + "' is closed");

    int64_t total = tree_->entries();
    int64_t begin = opts_.begin;
    int64_t end   = opts_.end < 0 ? total : std::min(opts_.end, total);
    if (begin < 0 || begin > end)
        fail(ErrorCode::kInvalidArgument, "bad entry range [" + std::to_string(begin) + ", "
                                          + std::to_string(end) + ")");

    ReadContext ctx;
    ctx.vars_ = &vars_;
    ctx.values_.resize(vars_.size());

    for (int64_t entry = begin; entry < end; ++entry) {
        for (size_t i = 0; i < vars_.size(); ++i) {
            const Binding& b  = bindings_[i];
            const Branch&  br = tree_->branches()[b.branch];
            ReadBuffer     r  = basket_for(b.branch, entry).cursor(entry, br, b.leaf);
            if (vars_[i].decode)
                vars_[i].decode(r);
            else
                ctx.values_[i] = br.leaves[b.leaf].read_value(r);
            if (!r.ok())
                fail(ErrorCode::kCorruptBasket, "entry " + std::to_string(entry) + " of '"
                                                + vars_[i].name + "': " + r.error());
        }
        ctx.entry_ = entry;
        fn(ctx);
    }
    debug() << "read " << (end - begin) << " entries of " << tree_->name() << ", "
            << inflated_ << " baskets inflated";
}

void Reader::close() {
    cache_.clear();
    closed_ = true;
}

} // namespace rootio
