// rootio – trees, branches, leaves and baskets
#pragma once

#include "rootio/bytes.hpp"
#include "rootio/key.hpp"
#include "rootio/object.hpp"
#include "rootio/streamer.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <type_traits>
#include <vector>

namespace rootio {

class File;

constexpr int16_t kBasketVersion    = 3;
constexpr int32_t kBasketHeaderSize = 2 + 4 + 4 + 4 + 4 + 1;
constexpr int32_t kEntryOffsetLen   = 1000;

/// Leaf kind of a C++ arithmetic type.
template <class T>
constexpr FieldKind kind_of() {
    static_assert(std::is_arithmetic<T>::value, "arithmetic type expected");
    if constexpr (std::is_same<T, bool>::value) return FieldKind::kBool;
    else if constexpr (std::is_same<T, float>::value) return FieldKind::kFloat;
    else if constexpr (std::is_floating_point<T>::value) return FieldKind::kDouble;
    else if constexpr (std::is_same<T, char>::value) return FieldKind::kChar;   // signed or not
    else if constexpr (std::is_signed<T>::value)
        return sizeof(T) == 1 ? FieldKind::kChar
             : sizeof(T) == 2 ? FieldKind::kShort
             : sizeof(T) == 4 ? FieldKind::kInt
                              : FieldKind::kLong64;
    else
        return sizeof(T) == 1 ? FieldKind::kUChar
             : sizeof(T) == 2 ? FieldKind::kUShort
             : sizeof(T) == 4 ? FieldKind::kUInt
                              : FieldKind::kULong64;
}

// ── Leaf ───────────────────────────────────────────────────────────────────

/// One typed column inside a branch. Fixed leaves hold `len` elements of
/// `len_type` bytes per entry. `len == 0` marks a variable leaf: an `i32 n`
/// prefix then n elements, or a length-prefixed string for kString.
struct Leaf {
    std::string name;
    std::string title;
    FieldKind   type        = FieldKind::kInt;
    int32_t     len         = 1;
    int32_t     len_type    = 4;
    int32_t     offset      = 0;
    bool        is_unsigned = false;

    bool    is_variable() const { return len == 0; }
    int32_t fixed_size() const { return len * len_type; }

    /// Decode this leaf's value for the entry at the cursor.
    Value read_value(ReadBuffer& r) const;
    /// Advance the cursor past this leaf's value.
    void  skip(ReadBuffer& r) const;

    Record      to_record() const;
    static Leaf from_record(const Record& rec);
};

// ── Branch ─────────────────────────────────────────────────────────────────

/// Entry range [first, last) held by one basket.
struct BasketSpan {
    int64_t first = 0;
    int64_t last  = 0;

    int64_t size() const { return last - first; }
    bool    contains(int64_t entry) const { return entry >= first && entry < last; }
};

struct Branch {
    std::string name;
    std::string title;
    int32_t     compress         = 0;
    int32_t     basket_size      = 32000;
    int32_t     entry_offset_len = 0;   // > 0 when entries carry an offsets table
    int64_t     entries          = 0;
    int64_t     tot_bytes        = 0;
    int64_t     zip_bytes        = 0;
    std::vector<Leaf> leaves;

    std::vector<int32_t> basket_bytes;   // one per basket
    std::vector<int64_t> basket_seek;    // one per basket
    std::vector<int64_t> basket_entry;   // baskets + 1, last == entries

    size_t     baskets() const { return basket_seek.size(); }
    BasketSpan span(size_t id) const;
    /// Basket holding `entry`. Throws Error(kNotFound) outside [0, entries).
    size_t     find_basket(int64_t entry) const;
    /// Bytes per entry for fixed branches, 0 for variable ones.
    int32_t    entry_size() const;
    bool       is_variable() const;
    /// Spans must start at 0, increase strictly and end at `entries`.
    void       validate() const;

    Record        to_record() const;
    static Branch from_record(const Record& rec);
};

// ── Tree ───────────────────────────────────────────────────────────────────

/// Baskets are read through the owning file, held weakly: once the File is
/// gone, reading fails Error(kClosedHandle).
class Tree : public Object {
public:
    Tree(std::weak_ptr<File> file, std::string name, std::string title = "");

    std::string class_name() const override { return "TTree"; }

    const std::string&         name() const { return name_; }
    const std::string&         title() const { return title_; }
    int64_t                    entries() const { return entries_; }
    const std::vector<Branch>& branches() const { return branches_; }
    const Branch&              branch(const std::string& name) const;
    std::vector<const Leaf*>   leaves() const;
    std::shared_ptr<File>      file() const;

    Record                       to_record() const;
    static std::shared_ptr<Tree> from_record(std::weak_ptr<File> file, const Record& rec);

private:
    friend class Writer;

    std::weak_ptr<File> file_;
    std::string         name_;
    std::string         title_;
    int64_t             entries_ = 0;
    std::vector<Branch> branches_;
};

using TreePtr = std::shared_ptr<Tree>;

// ── Basket ─────────────────────────────────────────────────────────────────

/// One inflated basket: the decompressed payload plus, for variable
/// branches, the per-entry offsets table. Positions are keylen-inclusive.
class Basket {
public:
    static Basket inflate(const File& file, const Branch& branch, size_t id);

    const Key&                  key() const { return key_; }
    size_t                      id() const { return id_; }
    BasketSpan                  span() const { return span_; }
    int32_t                     nevsize() const { return nevsize_; }
    int32_t                     last() const { return last_; }
    const std::vector<int32_t>& offsets() const { return offsets_; }

    /// Cursor positioned on leaf `leaf` of `entry`.
    ReadBuffer cursor(int64_t entry, const Branch& branch, size_t leaf) const;

private:
    Key                  key_;
    size_t               id_      = 0;
    BasketSpan           span_;
    int32_t              bufsize_ = 0;
    int32_t              nevsize_ = 0;
    int32_t              last_    = 0;
    std::vector<uint8_t> payload_;
    std::vector<int32_t> offsets_;
};

} // namespace rootio
