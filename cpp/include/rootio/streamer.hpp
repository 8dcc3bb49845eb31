// rootio – streamer infos: declarative class layouts and generic (un)marshalling
#pragma once

#include "rootio/bytes.hpp"
#include "rootio/object.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace rootio {

// ── Field kinds ────────────────────────────────────────────────────────────

/// On-disk type codes. Arrays add kOffsetL (fixed) or kOffsetP (variable)
/// to a primitive code.
enum class FieldKind : int32_t {
    kChar          = 1,
    kShort         = 2,
    kInt           = 3,
    kLong          = 4,
    kFloat         = 5,
    kDouble        = 8,
    kUChar         = 11,
    kUShort        = 12,
    kUInt          = 13,
    kULong         = 14,
    kLong64        = 16,
    kULong64       = 17,
    kBool          = 18,
    kObject        = 61,
    kObjectPointer = 63,
    kString        = 65,
    kContainer     = 300,
};

constexpr int32_t kOffsetL = 20;
constexpr int32_t kOffsetP = 40;

bool        is_primitive(FieldKind k);
bool        is_unsigned(FieldKind k);
bool        is_floating(FieldKind k);
int32_t     kind_size(FieldKind k);      // bytes per element, 0 if not fixed
const char* kind_name(FieldKind k);      // "int", "double", "string", ...
bool        kind_from_name(const std::string& name, FieldKind& out);

// ── Values ─────────────────────────────────────────────────────────────────

class Record;
using RecordPtr = std::shared_ptr<Record>;

/// Decoded field value. Signed integers widen to int64, unsigned to uint64,
/// floats to double; arrays and containers become vectors.
using Value = std::variant<std::monostate,
                           bool, int64_t, uint64_t, double, std::string, RecordPtr,
                           std::vector<bool>, std::vector<int64_t>,
                           std::vector<uint64_t>, std::vector<double>,
                           std::vector<std::string>, std::vector<RecordPtr>>;

bool values_equal(const Value& a, const Value& b);

int64_t  value_to_i64(const Value& v);
uint64_t value_to_u64(const Value& v);
double   value_to_f64(const Value& v);

/// Fixed-width codecs for a single primitive kind, shared with tree leaves.
Value read_primitive(ReadBuffer& r, FieldKind k);
Value read_primitives(ReadBuffer& r, FieldKind k, int64_t n);
void  write_primitive(WriteBuffer& w, FieldKind k, const Value& v);

/// A streamed object decoded without a compiled type: class, version and
/// named fields in declaration order.
class Record : public Object {
public:
    Record() = default;
    explicit Record(std::string cls, int16_t version = 0)
        : class_(std::move(cls)), version_(version) {}

    std::string class_name() const override { return class_; }
    int16_t     version() const { return version_; }
    void        set_version(int16_t v) { version_ = v; }

    Record&      set(const std::string& field, Value v);
    const Value* find(const std::string& field) const;
    const Value& at(const std::string& field) const;   // throws kNotFound

    template <class T>
    const T& get(const std::string& field) const {
        const Value& v = at(field);
        const T* p = std::get_if<T>(&v);
        if (!p) fail(ErrorCode::kInvalidArgument,
                     class_ + "." + field + ": unexpected value type");
        return *p;
    }

    const std::vector<std::pair<std::string, Value>>& fields() const { return fields_; }

    bool operator==(const Record& o) const;
    bool operator!=(const Record& o) const { return !(*this == o); }

private:
    std::string                                class_;
    int16_t                                    version_ = 0;
    std::vector<std::pair<std::string, Value>> fields_;
};

// ── Streamer infos ─────────────────────────────────────────────────────────

struct FieldDescriptor {
    std::string name;
    std::string title;
    int32_t     type      = 0;   // FieldKind code, plus kOffsetL/kOffsetP
    int32_t     array_len = 0;   // fixed arrays
    std::string count_name;      // variable arrays: earlier integer field
    std::string type_name;       // object class, or "vector<elem>" for containers

    FieldKind kind() const;
    bool      is_fixed_array() const { return type > kOffsetL && type < kOffsetP; }
    bool      is_var_array() const { return type > kOffsetP && type < kOffsetP + kOffsetL; }

    /// Element of a container: a primitive kind, kString, or kObject (+ class).
    std::pair<FieldKind, std::string> container_element() const;

    static FieldDescriptor scalar(const std::string& name, FieldKind k);
    static FieldDescriptor fixed_array(const std::string& name, FieldKind k, int32_t n);
    static FieldDescriptor var_array(const std::string& name, FieldKind k,
                                     const std::string& count);
    static FieldDescriptor string(const std::string& name);
    static FieldDescriptor object(const std::string& name, const std::string& cls);
    static FieldDescriptor pointer(const std::string& name, const std::string& cls);
    static FieldDescriptor container(const std::string& name, FieldKind elem,
                                     const std::string& cls = "");

    bool operator==(const FieldDescriptor& o) const;
};

struct StreamerInfo {
    std::string                  class_name;
    int16_t                      version  = 1;
    uint32_t                     checksum = 0;
    std::vector<FieldDescriptor> fields;

    uint32_t compute_checksum() const;
    bool     same_layout(const StreamerInfo& o) const;
};

/// Deepest nesting of embedded objects (un)marshalling accepts.
constexpr int kMaxObjectDepth = 64;

class StreamerRegistry {
public:
    StreamerRegistry() = default;

    /// Registry pre-loaded with TNamed, TObjString, TTree, TBranch, TLeaf.
    static StreamerRegistry with_builtins();

    /// Register a layout. A different layout under an existing
    /// (class, version) fails kInvalidArgument.
    void add(StreamerInfo si);
    /// Register or replace; used for layouts read from a file.
    void merge(StreamerInfo si);

    bool                has_class(const std::string& cls) const;
    const StreamerInfo& find(const std::string& cls, int16_t version) const;
    const StreamerInfo& latest(const std::string& cls) const;
    std::vector<const StreamerInfo*> infos() const;

    /// Encode with the latest layout of `rec.class_name()`. Classes touched
    /// (including nested ones) are added to `used`. Objects nested deeper
    /// than kMaxObjectDepth fail kInvalidArgument.
    void   marshal(WriteBuffer& w, const Record& rec,
                   std::set<std::string>* used = nullptr) const;
    /// Objects nested deeper than kMaxObjectDepth fail kCorruptBlock.
    Record unmarshal(ReadBuffer& r, const std::string& cls) const;

    /// StreamerInfo list payload (the "StreamerInfo" key).
    void write_list(WriteBuffer& w, const std::set<std::string>& classes) const;
    static std::vector<StreamerInfo> read_list(ReadBuffer& r);

private:
    void   marshal_at(WriteBuffer& w, const Record& rec, std::set<std::string>* used,
                      int depth) const;
    Record unmarshal_at(ReadBuffer& r, const std::string& cls, int depth) const;
    void   write_field(WriteBuffer& w, const FieldDescriptor& fd, const Value& v,
                       const Record& rec, std::set<std::string>* used, int depth) const;
    Value  read_field(ReadBuffer& r, const FieldDescriptor& fd, const Record& rec,
                      int depth) const;

    std::map<std::string, std::map<int16_t, StreamerInfo>> infos_;
};

} // namespace rootio
