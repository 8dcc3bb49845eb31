// rootio – streamer registry and generic record codec

#include "rootio/streamer.hpp"
#include "rootio/log.hpp"

#include <algorithm>

namespace rootio {

namespace {

constexpr int16_t kListVersion            = 5;
constexpr int16_t kStreamerInfoVersion    = 9;
constexpr int16_t kStreamerElementVersion = 4;
constexpr int16_t kContainerVersion       = 6;

[[noreturn]] void bad_value(const FieldDescriptor& fd, const std::string& why) {
    fail(ErrorCode::kInvalidArgument, "field '" + fd.name + "': " + why);
}

bool fits(ReadBuffer& r, FieldKind k, int64_t n) {
    int64_t sz = std::max<int32_t>(kind_size(k), 1);
    if (n < 0 || n * sz > static_cast<int64_t>(r.remaining())) {
        r.set_error(ErrorCode::kCorruptBlock,
                    "array of " + std::to_string(n) + " elements exceeds buffer");
        return false;
    }
    return true;
}

} // namespace

// ── Primitive codecs ──────────────────────────────────────────────────────

Value read_primitive(ReadBuffer& r, FieldKind k) {
    switch (k) {
        case FieldKind::kChar:    return static_cast<int64_t>(r.read_i8());
        case FieldKind::kShort:   return static_cast<int64_t>(r.read_i16());
        case FieldKind::kInt:     return static_cast<int64_t>(r.read_i32());
        case FieldKind::kLong:
        case FieldKind::kLong64:  return r.read_i64();
        case FieldKind::kUChar:   return static_cast<uint64_t>(r.read_u8());
        case FieldKind::kUShort:  return static_cast<uint64_t>(r.read_u16());
        case FieldKind::kUInt:    return static_cast<uint64_t>(r.read_u32());
        case FieldKind::kULong:
        case FieldKind::kULong64: return r.read_u64();
        case FieldKind::kFloat:   return static_cast<double>(r.read_f32());
        case FieldKind::kDouble:  return r.read_f64();
        case FieldKind::kBool:    return r.read_bool();
        default:
            r.set_error(ErrorCode::kCorruptBlock,
                        std::string("not a primitive kind: ") + kind_name(k));
            return Value{};
    }
}

void write_primitive(WriteBuffer& w, FieldKind k, const Value& v) {
    switch (k) {
        case FieldKind::kChar:    w.write_i8(static_cast<int8_t>(value_to_i64(v))); break;
        case FieldKind::kShort:   w.write_i16(static_cast<int16_t>(value_to_i64(v))); break;
        case FieldKind::kInt:     w.write_i32(static_cast<int32_t>(value_to_i64(v))); break;
        case FieldKind::kLong:
        case FieldKind::kLong64:  w.write_i64(value_to_i64(v)); break;
        case FieldKind::kUChar:   w.write_u8(static_cast<uint8_t>(value_to_u64(v))); break;
        case FieldKind::kUShort:  w.write_u16(static_cast<uint16_t>(value_to_u64(v))); break;
        case FieldKind::kUInt:    w.write_u32(static_cast<uint32_t>(value_to_u64(v))); break;
        case FieldKind::kULong:
        case FieldKind::kULong64: w.write_u64(value_to_u64(v)); break;
        case FieldKind::kFloat:   w.write_f32(static_cast<float>(value_to_f64(v))); break;
        case FieldKind::kDouble:  w.write_f64(value_to_f64(v)); break;
        case FieldKind::kBool:    w.write_bool(value_to_i64(v) != 0); break;
        default:
            fail(ErrorCode::kInvalidArgument,
                 std::string("not a primitive kind: ") + kind_name(k));
    }
}

Value read_primitives(ReadBuffer& r, FieldKind k, int64_t n) {
    if (!fits(r, k, n)) return Value{};
    size_t count = static_cast<size_t>(n);
    if (k == FieldKind::kBool) {
        std::vector<bool> v(count);
        for (size_t i = 0; i < count; ++i) v[i] = r.read_bool();
        return v;
    }
    if (is_floating(k)) {
        std::vector<double> v(count);
        for (size_t i = 0; i < count; ++i) v[i] = value_to_f64(read_primitive(r, k));
        return v;
    }
    if (is_unsigned(k)) {
        std::vector<uint64_t> v(count);
        for (size_t i = 0; i < count; ++i) v[i] = value_to_u64(read_primitive(r, k));
        return v;
    }
    std::vector<int64_t> v(count);
    for (size_t i = 0; i < count; ++i) v[i] = value_to_i64(read_primitive(r, k));
    return v;
}

namespace {

template <class Vec>
void write_each(WriteBuffer& w, FieldKind k, const Vec& vec) {
    for (const auto& e : vec) write_primitive(w, k, Value(e));
}

size_t prims_length(const FieldDescriptor& fd, const Value& v) {
    if (std::holds_alternative<std::monostate>(v)) return 0;
    if (auto* p = std::get_if<std::vector<int64_t>>(&v))  return p->size();
    if (auto* p = std::get_if<std::vector<uint64_t>>(&v)) return p->size();
    if (auto* p = std::get_if<std::vector<double>>(&v))   return p->size();
    if (auto* p = std::get_if<std::vector<bool>>(&v))     return p->size();
    bad_value(fd, "expected a numeric array");
}

void write_prims(WriteBuffer& w, const FieldDescriptor& fd, FieldKind k, const Value& v) {
    if (auto* p = std::get_if<std::vector<int64_t>>(&v))       write_each(w, k, *p);
    else if (auto* p = std::get_if<std::vector<uint64_t>>(&v)) write_each(w, k, *p);
    else if (auto* p = std::get_if<std::vector<double>>(&v))   write_each(w, k, *p);
    else if (auto* p = std::get_if<std::vector<bool>>(&v)) {
        for (bool b : *p) write_primitive(w, k, Value(b));
    } else if (!std::holds_alternative<std::monostate>(v)) {
        bad_value(fd, "expected a numeric array");
    }
}

// ── Descriptor names ──────────────────────────────────────────────────────

struct KindName {
    FieldKind   kind;
    const char* name;
};

constexpr KindName kKindNames[] = {
    {FieldKind::kChar, "char"},
    {FieldKind::kShort, "short"},
    {FieldKind::kInt, "int"},
    {FieldKind::kLong, "long"},
    {FieldKind::kFloat, "float"},
    {FieldKind::kDouble, "double"},
    {FieldKind::kUChar, "unsigned char"},
    {FieldKind::kUShort, "unsigned short"},
    {FieldKind::kUInt, "unsigned int"},
    {FieldKind::kULong, "unsigned long"},
    {FieldKind::kLong64, "Long64_t"},
    {FieldKind::kULong64, "ULong64_t"},
    {FieldKind::kBool, "bool"},
    {FieldKind::kObject, "object"},
    {FieldKind::kObjectPointer, "pointer"},
    {FieldKind::kString, "string"},
    {FieldKind::kContainer, "vector"},
};

const std::string kVectorPrefix = "vector<";

} // namespace

// ── Kinds ──────────────────────────────────────────────────────────────────

bool is_primitive(FieldKind k) {
    return static_cast<int32_t>(k) > 0 && static_cast<int32_t>(k) < kOffsetL
        && kind_size(k) > 0;
}

bool is_unsigned(FieldKind k) {
    switch (k) {
        case FieldKind::kUChar: case FieldKind::kUShort: case FieldKind::kUInt:
        case FieldKind::kULong: case FieldKind::kULong64:
            return true;
        default:
            return false;
    }
}

bool is_floating(FieldKind k) {
    return k == FieldKind::kFloat || k == FieldKind::kDouble;
}

int32_t kind_size(FieldKind k) {
    switch (k) {
        case FieldKind::kChar: case FieldKind::kUChar: case FieldKind::kBool:
            return 1;
        case FieldKind::kShort: case FieldKind::kUShort:
            return 2;
        case FieldKind::kInt: case FieldKind::kUInt: case FieldKind::kFloat:
            return 4;
        case FieldKind::kLong: case FieldKind::kULong: case FieldKind::kLong64:
        case FieldKind::kULong64: case FieldKind::kDouble:
            return 8;
        default:
            return 0;
    }
}

const char* kind_name(FieldKind k) {
    for (const auto& kn : kKindNames)
        if (kn.kind == k) return kn.name;
    return "?";
}

bool kind_from_name(const std::string& name, FieldKind& out) {
    for (const auto& kn : kKindNames) {
        if (name == kn.name) {
            out = kn.kind;
            return true;
        }
    }
    return false;
}

// ── Values ─────────────────────────────────────────────────────────────────

namespace {

struct ToI64 {
    int64_t operator()(bool b) const { return b ? 1 : 0; }
    int64_t operator()(int64_t v) const { return v; }
    int64_t operator()(uint64_t v) const { return static_cast<int64_t>(v); }
    int64_t operator()(double v) const { return static_cast<int64_t>(v); }
    int64_t operator()(std::monostate) const { return 0; }
    template <class T>
    int64_t operator()(const T&) const {
        fail(ErrorCode::kInvalidArgument, "value is not numeric");
    }
};

struct ToF64 {
    double operator()(bool b) const { return b ? 1.0 : 0.0; }
    double operator()(int64_t v) const { return static_cast<double>(v); }
    double operator()(uint64_t v) const { return static_cast<double>(v); }
    double operator()(double v) const { return v; }
    double operator()(std::monostate) const { return 0.0; }
    template <class T>
    double operator()(const T&) const {
        fail(ErrorCode::kInvalidArgument, "value is not numeric");
    }
};

bool records_equal(const RecordPtr& a, const RecordPtr& b) {
    if (!a || !b) return !a && !b;
    return *a == *b;
}

} // namespace

int64_t value_to_i64(const Value& v) { return std::visit(ToI64{}, v); }

uint64_t value_to_u64(const Value& v) {
    if (auto* p = std::get_if<uint64_t>(&v)) return *p;
    return static_cast<uint64_t>(std::visit(ToI64{}, v));
}

double value_to_f64(const Value& v) { return std::visit(ToF64{}, v); }

bool values_equal(const Value& a, const Value& b) {
    if (a.index() != b.index()) return false;
    if (auto* pa = std::get_if<RecordPtr>(&a))
        return records_equal(*pa, std::get<RecordPtr>(b));
    if (auto* pa = std::get_if<std::vector<RecordPtr>>(&a)) {
        const auto& pb = std::get<std::vector<RecordPtr>>(b);
        if (pa->size() != pb.size()) return false;
        for (size_t i = 0; i < pa->size(); ++i)
            if (!records_equal((*pa)[i], pb[i])) return false;
        return true;
    }
    return a == b;
}

Record& Record::set(const std::string& field, Value v) {
    for (auto& f : fields_) {
        if (f.first == field) {
            f.second = std::move(v);
            return *this;
        }
    }
    fields_.emplace_back(field, std::move(v));
    return *this;
}

const Value* Record::find(const std::string& field) const {
    for (const auto& f : fields_)
        if (f.first == field) return &f.second;
    return nullptr;
}

const Value& Record::at(const std::string& field) const {
    const Value* v = find(field);
    if (!v) fail(ErrorCode::kNotFound, class_ + " has no field '" + field + "'");
    return *v;
}

// Versions are not compared: marshalling always stamps the latest one.
bool Record::operator==(const Record& o) const {
    if (class_ != o.class_ || fields_.size() != o.fields_.size()) return false;
    for (size_t i = 0; i < fields_.size(); ++i) {
        if (fields_[i].first != o.fields_[i].first) return false;
        if (!values_equal(fields_[i].second, o.fields_[i].second)) return false;
    }
    return true;
}

// ── FieldDescriptor ────────────────────────────────────────────────────────

FieldKind FieldDescriptor::kind() const {
    if (is_fixed_array()) return static_cast<FieldKind>(type - kOffsetL);
    if (is_var_array())   return static_cast<FieldKind>(type - kOffsetP);
    return static_cast<FieldKind>(type);
}

std::pair<FieldKind, std::string> FieldDescriptor::container_element() const {
    std::string elem = type_name;
    if (elem.compare(0, kVectorPrefix.size(), kVectorPrefix) == 0 && elem.back() == '>')
        elem = elem.substr(kVectorPrefix.size(), elem.size() - kVectorPrefix.size() - 1);
    FieldKind k;
    if (kind_from_name(elem, k) && (is_primitive(k) || k == FieldKind::kString))
        return {k, std::string()};
    return {FieldKind::kObject, elem};
}

FieldDescriptor FieldDescriptor::scalar(const std::string& name, FieldKind k) {
    FieldDescriptor fd;
    fd.name = name;
    fd.type = static_cast<int32_t>(k);
    fd.type_name = kind_name(k);
    return fd;
}

FieldDescriptor FieldDescriptor::fixed_array(const std::string& name, FieldKind k, int32_t n) {
    FieldDescriptor fd = scalar(name, k);
    fd.type      = static_cast<int32_t>(k) + kOffsetL;
    fd.array_len = n;
    return fd;
}

FieldDescriptor FieldDescriptor::var_array(const std::string& name, FieldKind k,
                                           const std::string& count) {
    FieldDescriptor fd = scalar(name, k);
    fd.type       = static_cast<int32_t>(k) + kOffsetP;
    fd.count_name = count;
    return fd;
}

FieldDescriptor FieldDescriptor::string(const std::string& name) {
    return scalar(name, FieldKind::kString);
}

FieldDescriptor FieldDescriptor::object(const std::string& name, const std::string& cls) {
    FieldDescriptor fd;
    fd.name      = name;
    fd.type      = static_cast<int32_t>(FieldKind::kObject);
    fd.type_name = cls;
    return fd;
}

FieldDescriptor FieldDescriptor::pointer(const std::string& name, const std::string& cls) {
    FieldDescriptor fd = object(name, cls);
    fd.type = static_cast<int32_t>(FieldKind::kObjectPointer);
    return fd;
}

FieldDescriptor FieldDescriptor::container(const std::string& name, FieldKind elem,
                                           const std::string& cls) {
    FieldDescriptor fd;
    fd.name      = name;
    fd.type      = static_cast<int32_t>(FieldKind::kContainer);
    fd.type_name = kVectorPrefix + (elem == FieldKind::kObject ? cls : kind_name(elem)) + ">";
    return fd;
}

bool FieldDescriptor::operator==(const FieldDescriptor& o) const {
    return name == o.name && type == o.type && array_len == o.array_len
        && count_name == o.count_name && type_name == o.type_name;
}

// ── StreamerInfo ───────────────────────────────────────────────────────────

uint32_t StreamerInfo::compute_checksum() const {
    uint32_t id = 0;
    auto mix = [&id](const std::string& s) {
        for (unsigned char c : s) id = id * 3 + c;
    };
    mix(class_name);
    for (const auto& fd : fields) {
        mix(fd.name);
        mix(fd.type_name);
        id = id * 3 + static_cast<uint32_t>(fd.type);
        if (fd.is_fixed_array()) id = id * 3 + static_cast<uint32_t>(fd.array_len);
    }
    return id;
}

bool StreamerInfo::same_layout(const StreamerInfo& o) const {
    return class_name == o.class_name && version == o.version && fields == o.fields;
}

// ── StreamerRegistry ───────────────────────────────────────────────────────

StreamerRegistry StreamerRegistry::with_builtins() {
    static const StreamerRegistry builtins = [] {
        using FD = FieldDescriptor;
        StreamerRegistry reg;
        reg.add({"TNamed", 1, 0, {FD::string("fName"), FD::string("fTitle")}});
        reg.add({"TObjString", 1, 0, {FD::string("fString")}});
        reg.add({"TLeaf", 2, 0, {
            FD::string("fName"),
            FD::string("fTitle"),
            FD::scalar("fType", FieldKind::kInt),
            FD::scalar("fLen", FieldKind::kInt),
            FD::scalar("fLenType", FieldKind::kInt),
            FD::scalar("fOffset", FieldKind::kInt),
            FD::scalar("fIsUnsigned", FieldKind::kBool),
        }});
        reg.add({"TBranch", 13, 0, {
            FD::string("fName"),
            FD::string("fTitle"),
            FD::scalar("fCompress", FieldKind::kInt),
            FD::scalar("fBasketSize", FieldKind::kInt),
            FD::scalar("fEntryOffsetLen", FieldKind::kInt),
            FD::scalar("fWriteBasket", FieldKind::kInt),
            FD::scalar("fEntries", FieldKind::kLong64),
            FD::scalar("fTotBytes", FieldKind::kLong64),
            FD::scalar("fZipBytes", FieldKind::kLong64),
            FD::scalar("fMaxBaskets", FieldKind::kInt),
            FD::var_array("fBasketBytes", FieldKind::kInt, "fMaxBaskets"),
            FD::var_array("fBasketEntry", FieldKind::kLong64, "fMaxBaskets"),
            FD::var_array("fBasketSeek", FieldKind::kLong64, "fMaxBaskets"),
            FD::container("fLeaves", FieldKind::kObject, "TLeaf"),
        }});
        reg.add({"TTree", 20, 0, {
            FD::string("fName"),
            FD::string("fTitle"),
            FD::scalar("fEntries", FieldKind::kLong64),
            FD::scalar("fTotBytes", FieldKind::kLong64),
            FD::scalar("fZipBytes", FieldKind::kLong64),
            FD::container("fBranches", FieldKind::kObject, "TBranch"),
        }});
        return reg;
    }();
    return builtins;
}

void StreamerRegistry::add(StreamerInfo si) {
    if (si.checksum == 0) si.checksum = si.compute_checksum();
    auto& versions = infos_[si.class_name];
    auto it = versions.find(si.version);
    if (it != versions.end()) {
        if (!it->second.same_layout(si))
            fail(ErrorCode::kInvalidArgument,
                 "layout of " + si.class_name + " v" + std::to_string(si.version)
                 + " is already registered with a different shape");
        return;
    }
    versions.emplace(si.version, std::move(si));
}

void StreamerRegistry::merge(StreamerInfo si) {
    if (si.checksum == 0) si.checksum = si.compute_checksum();
    auto& versions = infos_[si.class_name];
    auto it = versions.find(si.version);
    if (it != versions.end() && !it->second.same_layout(si))
        debug() << "streamer: file layout replaces " << si.class_name
                << " v" << si.version;
    versions[si.version] = std::move(si);
}

bool StreamerRegistry::has_class(const std::string& cls) const {
    auto it = infos_.find(cls);
    return it != infos_.end() && !it->second.empty();
}

const StreamerInfo& StreamerRegistry::find(const std::string& cls, int16_t version) const {
    auto it = infos_.find(cls);
    if (it == infos_.end() || it->second.empty())
        fail(ErrorCode::kUnknownClass, "no streamer info for class " + cls);
    const auto& versions = it->second;
    auto v = versions.upper_bound(version);
    if (v == versions.begin())
        fail(ErrorCode::kUnknownVersion,
             cls + " v" + std::to_string(version) + " is older than every registered layout");
    --v;
    return v->second;
}

const StreamerInfo& StreamerRegistry::latest(const std::string& cls) const {
    auto it = infos_.find(cls);
    if (it == infos_.end() || it->second.empty())
        fail(ErrorCode::kUnknownClass, "no streamer info for class " + cls);
    return it->second.rbegin()->second;
}

std::vector<const StreamerInfo*> StreamerRegistry::infos() const {
    std::vector<const StreamerInfo*> out;
    for (const auto& c : infos_)
        for (const auto& v : c.second) out.push_back(&v.second);
    return out;
}

// ── Marshal ────────────────────────────────────────────────────────────────

void StreamerRegistry::marshal(WriteBuffer& w, const Record& rec,
                               std::set<std::string>* used) const {
    marshal_at(w, rec, used, 0);
}

void StreamerRegistry::marshal_at(WriteBuffer& w, const Record& rec,
                                  std::set<std::string>* used, int depth) const {
    if (depth > kMaxObjectDepth)
        fail(ErrorCode::kInvalidArgument, "objects of class " + rec.class_name()
                                          + " nest deeper than "
                                          + std::to_string(kMaxObjectDepth) + " levels");
    const StreamerInfo& si = latest(rec.class_name());
    if (used) used->insert(si.class_name);

    static const Value empty;
    int64_t mark = w.write_header(si.version);
    for (const auto& fd : si.fields) {
        const Value* v = rec.find(fd.name);
        write_field(w, fd, v ? *v : empty, rec, used, depth);
    }
    w.close_header(mark);
}

void StreamerRegistry::write_field(WriteBuffer& w, const FieldDescriptor& fd,
                                   const Value& v, const Record& rec,
                                   std::set<std::string>* used, int depth) const {
    const FieldKind k = fd.kind();

    if (fd.is_fixed_array()) {
        size_t n = prims_length(fd, v);
        if (n != static_cast<size_t>(fd.array_len))
            bad_value(fd, "fixed array holds " + std::to_string(n) + " elements, layout says "
                          + std::to_string(fd.array_len));
        write_prims(w, fd, k, v);
        return;
    }

    if (fd.is_var_array()) {
        size_t n = prims_length(fd, v);
        const Value* count = rec.find(fd.count_name);
        int64_t want = count ? value_to_i64(*count) : 0;
        if (static_cast<int64_t>(n) != want)
            bad_value(fd, "variable array holds " + std::to_string(n) + " elements, "
                          + fd.count_name + " says " + std::to_string(want));
        w.write_u8(1);
        write_prims(w, fd, k, v);
        return;
    }

    switch (k) {
        case FieldKind::kString: {
            if (std::holds_alternative<std::monostate>(v)) { w.write_string(""); return; }
            auto* s = std::get_if<std::string>(&v);
            if (!s) bad_value(fd, "expected a string");
            w.write_string(*s);
            return;
        }
        case FieldKind::kObject: {
            auto* p = std::get_if<RecordPtr>(&v);
            if (p && *p) {
                if ((*p)->class_name() != fd.type_name)
                    bad_value(fd, "expected " + fd.type_name + ", got " + (*p)->class_name());
                marshal_at(w, **p, used, depth + 1);
            } else if (!p && !std::holds_alternative<std::monostate>(v)) {
                bad_value(fd, "expected an object");
            } else {
                marshal_at(w, Record(fd.type_name), used, depth + 1);
            }
            return;
        }
        case FieldKind::kObjectPointer: {
            auto* p = std::get_if<RecordPtr>(&v);
            if (!p && !std::holds_alternative<std::monostate>(v))
                bad_value(fd, "expected an object pointer");
            if (!p || !*p) {
                w.write_u32(kNullTag);
                return;
            }
            int64_t mark = w.pos();
            w.write_u32(0);
            w.write_u32(kNewClassTag);
            w.write_cstring((*p)->class_name());
            marshal_at(w, **p, used, depth + 1);
            w.close_header(mark);
            return;
        }
        case FieldKind::kContainer: {
            auto elem = fd.container_element();
            int64_t mark = w.write_header(kContainerVersion);
            if (elem.first == FieldKind::kObject) {
                if (used) used->insert(elem.second);
                std::vector<RecordPtr> none;
                auto* objs = std::get_if<std::vector<RecordPtr>>(&v);
                if (!objs && !std::holds_alternative<std::monostate>(v))
                    bad_value(fd, "expected a vector of objects");
                const auto& items = objs ? *objs : none;
                w.write_i32(static_cast<int32_t>(items.size()));
                for (const auto& item : items) {
                    if (!item) bad_value(fd, "null element in object container");
                    marshal_at(w, *item, used, depth + 1);
                }
            } else if (elem.first == FieldKind::kString) {
                std::vector<std::string> none;
                auto* strs = std::get_if<std::vector<std::string>>(&v);
                if (!strs && !std::holds_alternative<std::monostate>(v))
                    bad_value(fd, "expected a vector of strings");
                const auto& items = strs ? *strs : none;
                w.write_i32(static_cast<int32_t>(items.size()));
                for (const auto& s : items) w.write_string(s);
            } else {
                w.write_i32(static_cast<int32_t>(prims_length(fd, v)));
                write_prims(w, fd, elem.first, v);
            }
            w.close_header(mark);
            return;
        }
        default:
            if (!is_primitive(k)) bad_value(fd, "unsupported type code " + std::to_string(fd.type));
            write_primitive(w, k, v);
    }
}

// ── Unmarshal ──────────────────────────────────────────────────────────────

Record StreamerRegistry::unmarshal(ReadBuffer& r, const std::string& cls) const {
    return unmarshal_at(r, cls, 0);
}

Record StreamerRegistry::unmarshal_at(ReadBuffer& r, const std::string& cls, int depth) const {
    if (depth > kMaxObjectDepth)
        fail(ErrorCode::kCorruptBlock, "objects of class " + cls + " nest deeper than "
                                       + std::to_string(kMaxObjectDepth) + " levels");
    ObjectHeader hdr = r.read_header();
    r.check();

    const StreamerInfo& si = find(cls, hdr.version);
    if (si.version != hdr.version)
        info() << "streamer: decoding " << cls << " v" << hdr.version
               << " with layout v" << si.version;

    Record rec(cls, hdr.version);
    for (const auto& fd : si.fields) {
        rec.set(fd.name, read_field(r, fd, rec, depth));
        if (!r.ok()) break;
    }
    r.check_header(hdr, cls);
    return rec;
}

Value StreamerRegistry::read_field(ReadBuffer& r, const FieldDescriptor& fd,
                                   const Record& rec, int depth) const {
    const FieldKind k = fd.kind();

    if (fd.is_fixed_array()) return read_primitives(r, k, fd.array_len);

    if (fd.is_var_array()) {
        const Value* count = rec.find(fd.count_name);
        if (!count) {
            r.set_error(ErrorCode::kCorruptBlock,
                        "count field '" + fd.count_name + "' of '" + fd.name + "' not read yet");
            return Value{};
        }
        uint8_t present = r.read_u8();
        if (!present) return read_primitives(r, k, 0);
        return read_primitives(r, k, value_to_i64(*count));
    }

    switch (k) {
        case FieldKind::kString:
            return r.read_string();
        case FieldKind::kObject:
            return std::make_shared<Record>(unmarshal_at(r, fd.type_name, depth + 1));
        case FieldKind::kObjectPointer: {
            int64_t  start = r.pos();
            uint32_t tag   = r.read_u32();
            if (!r.ok() || tag == kNullTag) return RecordPtr();
            if (!(tag & kByteCountMask) || r.read_u32() != kNewClassTag) {
                r.set_error(ErrorCode::kCorruptBlock,
                            "object pointer '" + fd.name + "' uses an unsupported class reference");
                return Value{};
            }
            std::string cls = r.read_cstring();
            r.check();
            auto obj = std::make_shared<Record>(unmarshal_at(r, cls, depth + 1));
            ObjectHeader outer;
            outer.start      = start;
            outer.byte_count = tag & ~kByteCountMask;
            r.check_header(outer, cls);
            return obj;
        }
        case FieldKind::kContainer: {
            auto         elem = fd.container_element();
            ObjectHeader hdr  = r.read_header();
            int32_t      n    = r.read_i32();
            Value        out;
            if (elem.first == FieldKind::kObject) {
                if (n < 0 || static_cast<size_t>(n) > r.remaining()) {
                    r.set_error(ErrorCode::kCorruptBlock, "bad container size");
                    return Value{};
                }
                std::vector<RecordPtr> items;
                items.reserve(static_cast<size_t>(n));
                for (int32_t i = 0; i < n && r.ok(); ++i)
                    items.push_back(
                        std::make_shared<Record>(unmarshal_at(r, elem.second, depth + 1)));
                out = std::move(items);
            } else if (elem.first == FieldKind::kString) {
                if (n < 0 || static_cast<size_t>(n) > r.remaining()) {
                    r.set_error(ErrorCode::kCorruptBlock, "bad container size");
                    return Value{};
                }
                std::vector<std::string> items(static_cast<size_t>(n));
                for (auto& s : items) s = r.read_string();
                out = std::move(items);
            } else {
                out = read_primitives(r, elem.first, n);
            }
            r.check_header(hdr, fd.type_name);
            return out;
        }
        default:
            return read_primitive(r, k);
    }
}

// ── Persistence ────────────────────────────────────────────────────────────

void StreamerRegistry::write_list(WriteBuffer& w, const std::set<std::string>& classes) const {
    int64_t list = w.write_header(kListVersion);
    w.write_string("");
    w.write_i32(static_cast<int32_t>(classes.size()));
    for (const auto& cls : classes) {
        const StreamerInfo& si = latest(cls);
        int64_t mark = w.write_header(kStreamerInfoVersion);
        w.write_string(si.class_name);
        w.write_i32(si.version);
        w.write_u32(si.checksum);
        w.write_i32(static_cast<int32_t>(si.fields.size()));
        for (const auto& fd : si.fields) {
            int64_t el = w.write_header(kStreamerElementVersion);
            w.write_string(fd.name);
            w.write_string(fd.title);
            w.write_i32(fd.type);
            w.write_i32(fd.array_len);
            w.write_string(fd.count_name);
            w.write_string(fd.type_name);
            w.close_header(el);
        }
        w.close_header(mark);
    }
    w.close_header(list);
}

std::vector<StreamerInfo> StreamerRegistry::read_list(ReadBuffer& r) {
    std::vector<StreamerInfo> out;
    ObjectHeader list = r.read_header();
    r.read_string();
    int32_t n = r.read_i32();
    if (n < 0 || static_cast<size_t>(n) > r.remaining())
        r.set_error(ErrorCode::kCorruptBlock, "bad streamer info count");
    for (int32_t i = 0; i < n && r.ok(); ++i) {
        ObjectHeader hdr = r.read_header();
        StreamerInfo si;
        si.class_name = r.read_string();
        si.version    = static_cast<int16_t>(r.read_i32());
        si.checksum   = r.read_u32();
        int32_t nf    = r.read_i32();
        if (nf < 0 || static_cast<size_t>(nf) > r.remaining()) {
            r.set_error(ErrorCode::kCorruptBlock, "bad field count for " + si.class_name);
            break;
        }
        for (int32_t j = 0; j < nf && r.ok(); ++j) {
            ObjectHeader el = r.read_header();
            FieldDescriptor fd;
            fd.name       = r.read_string();
            fd.title      = r.read_string();
            fd.type       = r.read_i32();
            fd.array_len  = r.read_i32();
            fd.count_name = r.read_string();
            fd.type_name  = r.read_string();
            r.check_header(el, "TStreamerElement");
            si.fields.push_back(std::move(fd));
        }
        r.check_header(hdr, "TStreamerInfo");
        out.push_back(std::move(si));
    }
    r.check_header(list, "TList");
    r.check();
    return out;
}

} // namespace rootio
