// rootio – entry-wise tree reader
//
//   int32_t n; std::vector<double> xs;
//   rootio::Reader r(tree, {rootio::ReadVar::of("n", &n),
//                            rootio::ReadVar::of("xs", &xs)});
//   r.read([&](const rootio::ReadContext& ctx) { ... });
#pragma once

#include "rootio/tree.hpp"

#include <array>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace rootio {

/// Expected leaf shape of a bound variable.
enum class VarShape { kAny, kScalar, kFixed, kVariable, kString };

/// A leaf to read, either decoded into a caller-owned object or, with
/// `value()`, into a Value held by the ReadContext.
struct ReadVar {
    std::string name;
    VarShape    shape = VarShape::kAny;
    FieldKind   kind  = FieldKind::kInt;
    int32_t     len   = 0;
    std::function<void(ReadBuffer&)> decode;

    static ReadVar value(const std::string& name) {
        ReadVar v;
        v.name = name;
        return v;
    }

    template <class T>
    static ReadVar of(const std::string& name, T* dst) {
        ReadVar v = bind<T>(name, VarShape::kScalar, 1);
        v.decode  = [dst](ReadBuffer& r) { *dst = r.read<T>(); };
        return v;
    }

    template <class T, size_t N>
    static ReadVar of(const std::string& name, std::array<T, N>* dst) {
        ReadVar v = bind<T>(name, VarShape::kFixed, static_cast<int32_t>(N));
        v.decode  = [dst](ReadBuffer& r) { r.read_array(dst->data(), N); };
        return v;
    }

    template <class T>
    static ReadVar of(const std::string& name, std::vector<T>* dst) {
        ReadVar v = bind<T>(name, VarShape::kVariable, 0);
        v.decode  = [dst, name](ReadBuffer& r) {
            int32_t n = r.read_i32();
            if (n < 0 || static_cast<uint64_t>(n) * sizeof(T) > r.remaining()) {
                r.set_error(ErrorCode::kCorruptBasket,
                            "leaf '" + name + "' holds " + std::to_string(n) + " elements");
                return;
            }
            dst->resize(static_cast<size_t>(n));
            for (int32_t i = 0; i < n; ++i) (*dst)[static_cast<size_t>(i)] = r.read<T>();
        };
        return v;
    }

    static ReadVar of(const std::string& name, std::string* dst) {
        ReadVar v;
        v.name   = name;
        v.shape  = VarShape::kString;
        v.kind   = FieldKind::kString;
        v.decode = [dst](ReadBuffer& r) { *dst = r.read_string(); };
        return v;
    }

private:
    template <class T>
    static ReadVar bind(const std::string& name, VarShape shape, int32_t len) {
        ReadVar v;
        v.name  = name;
        v.shape = shape;
        v.kind  = kind_of<T>();
        v.len   = len;
        return v;
    }
};

struct ReaderOptions {
    int64_t               begin = 0;
    int64_t               end   = -1;   // -1: up to the last entry
    std::function<bool()> cancelled;    // polled at basket boundaries
};

class ReadContext {
public:
    int64_t entry() const { return entry_; }
    /// Value of the var at `index`, filled only for ReadVar::value() bindings.
    const Value& value(size_t index) const;
    const Value& value(const std::string& name) const;

private:
    friend class Reader;

    int64_t                     entry_ = 0;
    const std::vector<ReadVar>* vars_  = nullptr;
    std::vector<Value>          values_;
};

class Reader {
public:
    /// Throws kNotFound for an unknown leaf, kInvalidArgument when a bound
    /// variable does not match the leaf type. The reader shares ownership of
    /// `tree`; the tree's file must stay alive while reading.
    Reader(TreePtr tree, std::vector<ReadVar> vars, ReaderOptions opts = {});
    ~Reader() = default;
    Reader(const Reader&) = delete;
    Reader& operator=(const Reader&) = delete;

    /// Visit entries [begin, end) in order. Each branch keeps at most one
    /// inflated basket; crossing a basket boundary replaces it.
    void read(const std::function<void(const ReadContext&)>& fn);

    /// Drop cached baskets. Reading afterwards fails kClosedHandle.
    void close();

    size_t  cached_baskets() const { return cache_.size(); }
    int64_t baskets_inflated() const { return inflated_; }

private:
    struct Binding {
        size_t branch = 0;
        size_t leaf   = 0;
    };

    const Basket& basket_for(size_t branch, int64_t entry);

    TreePtr                  tree_;
    std::vector<ReadVar>     vars_;
    std::vector<Binding>     bindings_;
    ReaderOptions            opts_;
    std::map<size_t, Basket> cache_;   // branch index -> current basket
    int64_t                  inflated_ = 0;
    bool                     closed_   = false;
};

} // namespace rootio
