// rootio – entry-wise tree writer
#pragma once

#include "rootio/config.hpp"
#include "rootio/file.hpp"
#include "rootio/tree.hpp"

#include <array>
#include <cstdint>
#include <functional>
#include <limits>
#include <string>
#include <type_traits>
#include <vector>

namespace rootio {

/// A caller-owned object written as one leaf per entry. Vars that name the
/// same `branch` share one multi-leaf branch; otherwise the branch is named
/// after the leaf.
struct WriteVar {
    std::string branch;
    Leaf        leaf;
    std::function<void(WriteBuffer&)> encode;

    template <class T>
    static WriteVar of(const std::string& name, const T* src, const std::string& branch = "") {
        WriteVar v = bind<T>(name, 1, branch);
        v.encode   = [src](WriteBuffer& w) { w.write<T>(*src); };
        return v;
    }

    template <class T, size_t N>
    static WriteVar of(const std::string& name, const std::array<T, N>* src,
                       const std::string& branch = "") {
        WriteVar v = bind<T>(name, static_cast<int32_t>(N), branch);
        v.encode   = [src](WriteBuffer& w) { w.write_array(src->data(), N); };
        return v;
    }

    template <class T>
    static WriteVar of(const std::string& name, const std::vector<T>* src,
                       const std::string& branch = "") {
        WriteVar v = bind<T>(name, 0, branch);
        v.encode   = [src, name](WriteBuffer& w) {
            if (src->size() > static_cast<size_t>(std::numeric_limits<int32_t>::max()))
                fail(ErrorCode::kInvalidArgument, "leaf '" + name + "' is too long");
            w.write_i32(static_cast<int32_t>(src->size()));
            for (const auto& e : *src) w.write<T>(e);
        };
        return v;
    }

    static WriteVar of(const std::string& name, const std::string* src,
                       const std::string& branch = "") {
        WriteVar v;
        v.branch        = branch;
        v.leaf.name     = name;
        v.leaf.type     = FieldKind::kString;
        v.leaf.len      = 0;
        v.leaf.len_type = 1;
        v.encode        = [src](WriteBuffer& w) { w.write_string(*src); };
        return v;
    }

private:
    template <class T>
    static WriteVar bind(const std::string& name, int32_t len, const std::string& branch) {
        WriteVar v;
        v.branch           = branch;
        v.leaf.name        = name;
        v.leaf.type        = kind_of<T>();
        v.leaf.len         = len;
        v.leaf.len_type    = static_cast<int32_t>(sizeof(T));
        v.leaf.is_unsigned = is_unsigned(v.leaf.type);
        return v;
    }
};

class Writer {
public:
    /// Uses the file's write options.
    Writer(Directory& dir, const std::string& name, std::vector<WriteVar> vars);
    /// `opts.title` becomes the tree title.
    Writer(Directory& dir, const std::string& name, std::vector<WriteVar> vars,
           const WriteOptions& opts);
    ~Writer();
    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    /// Append one entry from the bound objects' current values. If an
    /// encoder throws, no branch records the entry.
    void write();
    /// Flush pending baskets and put the tree into the directory.
    void close();

    int64_t     entries() const { return tree_.entries(); }
    const Tree& tree() const { return tree_; }

private:
    struct Pending {
        WriteBuffer          data;
        std::vector<int32_t> offsets;
        int32_t              nevbuf = 0;
        std::vector<size_t>  vars;
    };

    void flush(size_t branch);

    DirectoryPtr             dir_;
    WriteOptions             opts_;
    std::vector<WriteVar>    vars_;
    Tree                     tree_;
    std::vector<Pending>     pending_;
    std::vector<WriteBuffer> rows_;   // current entry, one per branch
    bool                  closed_ = false;
};

} // namespace rootio
