#include "test_util.hpp"
#include "rootio/streamer.hpp"
#include "rootio/tree.hpp"

#include <memory>
#include <string>
#include <utility>
#include <vector>

using namespace rootio;
using FD = FieldDescriptor;

namespace {

StreamerInfo event_layout() {
    return {"Event", 2, 0, {
        FD::scalar("run", FieldKind::kInt),
        FD::scalar("energy", FieldKind::kDouble),
        FD::scalar("flags", FieldKind::kUShort),
        FD::scalar("good", FieldKind::kBool),
        FD::fixed_array("pos", FieldKind::kFloat, 3),
        FD::scalar("nhits", FieldKind::kInt),
        FD::var_array("hits", FieldKind::kLong64, "nhits"),
        FD::string("label"),
        FD::object("meta", "TNamed"),
        FD::pointer("parent", "TNamed"),
        FD::pointer("missing", "TNamed"),
        FD::container("weights", FieldKind::kDouble),
        FD::container("tags", FieldKind::kString),
        FD::container("children", FieldKind::kObject, "TNamed"),
    }};
}

RecordPtr named(const std::string& name, const std::string& title) {
    auto r = std::make_shared<Record>("TNamed");
    r->set("fName", name).set("fTitle", title);
    return r;
}

Record sample_event() {
    Record ev("Event");
    ev.set("run", int64_t(42))
      .set("energy", 13.5)
      .set("flags", uint64_t(7))
      .set("good", true)
      .set("pos", std::vector<double>{1.0, 2.5, -3.0})
      .set("nhits", int64_t(3))
      .set("hits", std::vector<int64_t>{10, 20, -30})
      .set("label", std::string("first"))
      .set("meta", named("m", "meta title"))
      .set("parent", named("p", ""))
      .set("missing", RecordPtr())
      .set("weights", std::vector<double>{0.5, 0.25})
      .set("tags", std::vector<std::string>{"a", "bb"})
      .set("children", std::vector<RecordPtr>{named("c1", "x"), named("c2", "y")});
    return ev;
}

StreamerRegistry event_registry() {
    StreamerRegistry reg = StreamerRegistry::with_builtins();
    reg.add(event_layout());
    return reg;
}

/// Bytes of `rec`, and the bytes of the record decoded from them.
std::pair<std::vector<uint8_t>, std::vector<uint8_t>> reencode(const StreamerRegistry& reg,
                                                               const Record& rec) {
    WriteBuffer first;
    reg.marshal(first, rec);
    first.check();
    ReadBuffer r(first.bytes());
    Record decoded = reg.unmarshal(r, rec.class_name());
    r.check();
    WriteBuffer second;
    reg.marshal(second, decoded);
    second.check();
    return {first.take(), second.take()};
}

} // anon

TEST(StreamerTest, BuiltinsCoverTreeClasses) {
    auto reg = StreamerRegistry::with_builtins();
    for (const char* cls : {"TNamed", "TObjString", "TLeaf", "TBranch", "TTree"})
        EXPECT_TRUE(reg.has_class(cls)) << cls;
    EXPECT_FALSE(reg.has_class("Event"));
}

TEST(StreamerTest, RecordSurvivesMarshalling) {
    auto reg = event_registry();
    Record ev = sample_event();

    std::set<std::string> used;
    WriteBuffer w;
    reg.marshal(w, ev, &used);
    ASSERT_TRUE(w.ok());
    EXPECT_EQ(used.count("Event"), 1u);
    EXPECT_EQ(used.count("TNamed"), 1u);

    ReadBuffer r(w.bytes());
    Record got = reg.unmarshal(r, "Event");
    r.check();
    EXPECT_EQ(r.remaining(), 0u);
    EXPECT_EQ(got.version(), 2);
    EXPECT_EQ(got, ev);
    EXPECT_EQ(got.get<std::string>("label"), "first");
    EXPECT_FALSE(got.get<RecordPtr>("missing"));
}

TEST(StreamerTest, DecodedEventReencodesIdentically) {
    auto reg   = event_registry();
    auto bytes = reencode(reg, sample_event());
    EXPECT_FALSE(bytes.first.empty());
    EXPECT_EQ(bytes.second, bytes.first);
}

TEST(StreamerTest, TreeRecordsReencodeIdentically) {
    Leaf n;
    n.name = "n";
    Leaf v;
    v.name     = "v";
    v.type     = FieldKind::kFloat;
    v.len      = 0;
    v.len_type = 4;

    Branch b;
    b.name             = "b";
    b.entries          = 7;
    b.entry_offset_len = kEntryOffsetLen;
    b.tot_bytes        = 300;
    b.zip_bytes        = 200;
    b.leaves           = {n, v};
    b.basket_bytes     = {120, 80};
    b.basket_seek      = {100, 220};
    b.basket_entry     = {0, 4, 7};

    Record tree("TTree");
    tree.set("fName", std::string("t"))
        .set("fTitle", std::string("title"))
        .set("fEntries", int64_t(7))
        .set("fTotBytes", int64_t(300))
        .set("fZipBytes", int64_t(200))
        .set("fBranches", std::vector<RecordPtr>{std::make_shared<Record>(b.to_record())});

    auto reg = StreamerRegistry::with_builtins();
    for (const Record& rec : {v.to_record(), b.to_record(), tree}) {
        auto bytes = reencode(reg, rec);
        EXPECT_EQ(bytes.second, bytes.first) << rec.class_name();
    }
}

TEST(StreamerTest, UnsetFieldsEncodeAsDefaults) {
    auto reg = StreamerRegistry::with_builtins();
    Record rec("TNamed");
    rec.set("fName", std::string("only-name"));

    WriteBuffer w;
    reg.marshal(w, rec);
    ReadBuffer r(w.bytes());
    Record got = reg.unmarshal(r, "TNamed");
    r.check();
    EXPECT_EQ(got.get<std::string>("fName"), "only-name");
    EXPECT_EQ(got.get<std::string>("fTitle"), "");
}

TEST(StreamerTest, CountMismatchIsRejected) {
    auto reg = event_registry();
    Record ev = sample_event();
    ev.set("nhits", int64_t(5));
    WriteBuffer w;
    EXPECT_ROOTIO_ERROR(reg.marshal(w, ev), ErrorCode::kInvalidArgument);
}

TEST(StreamerTest, FixedArrayLengthIsChecked) {
    auto reg = event_registry();
    Record ev = sample_event();
    ev.set("pos", std::vector<double>{1.0});
    WriteBuffer w;
    EXPECT_ROOTIO_ERROR(reg.marshal(w, ev), ErrorCode::kInvalidArgument);
}

TEST(StreamerTest, NewerVersionDecodesWithClosestLayout) {
    StreamerRegistry old_reg;
    old_reg.add({"Point", 1, 0, {FD::scalar("x", FieldKind::kDouble),
                                 FD::scalar("y", FieldKind::kDouble)}});
    StreamerRegistry new_reg = old_reg;
    new_reg.add({"Point", 2, 0, {FD::scalar("x", FieldKind::kDouble),
                                 FD::scalar("y", FieldKind::kDouble),
                                 FD::scalar("z", FieldKind::kDouble)}});

    Record p("Point");
    p.set("x", 1.0).set("y", 2.0).set("z", 3.0);
    WriteBuffer w;
    new_reg.marshal(w, p);
    w.write_i32(99);

    ReadBuffer r(w.bytes());
    Record got = old_reg.unmarshal(r, "Point");
    r.check();
    EXPECT_EQ(got.version(), 2);
    EXPECT_EQ(got.fields().size(), 2u);
    EXPECT_EQ(got.get<double>("y"), 2.0);
    EXPECT_EQ(r.read_i32(), 99);
}

TEST(StreamerTest, OlderThanEveryLayoutFails) {
    StreamerRegistry reg;
    reg.add({"Point", 3, 0, {FD::scalar("x", FieldKind::kDouble)}});

    WriteBuffer w;
    int64_t mark = w.write_header(1);
    w.write_f64(1.0);
    w.close_header(mark);

    ReadBuffer r(w.bytes());
    EXPECT_ROOTIO_ERROR(reg.unmarshal(r, "Point"), ErrorCode::kUnknownVersion);
}

TEST(StreamerTest, UnknownClassFails) {
    auto reg = StreamerRegistry::with_builtins();
    Record rec("Nope");
    WriteBuffer w;
    EXPECT_ROOTIO_ERROR(reg.marshal(w, rec), ErrorCode::kUnknownClass);
    EXPECT_ROOTIO_ERROR(reg.latest("Nope"), ErrorCode::kUnknownClass);
}

TEST(StreamerTest, ConflictingLayoutIsRejected) {
    auto reg = event_registry();
    EXPECT_NO_THROW(reg.add(event_layout()));

    StreamerInfo other = event_layout();
    other.fields.pop_back();
    EXPECT_ROOTIO_ERROR(reg.add(other), ErrorCode::kInvalidArgument);

    reg.merge(other);
    EXPECT_EQ(reg.find("Event", 2).fields.size(), other.fields.size());
}

TEST(StreamerTest, ChecksumTracksLayout) {
    StreamerInfo a = event_layout();
    StreamerInfo b = event_layout();
    EXPECT_EQ(a.compute_checksum(), b.compute_checksum());
    b.fields[0].name = "runNumber";
    EXPECT_NE(a.compute_checksum(), b.compute_checksum());
    EXPECT_FALSE(a.same_layout(b));
}

TEST(StreamerTest, ListKeepsLayouts) {
    auto reg = event_registry();
    WriteBuffer w;
    reg.write_list(w, {"Event", "TNamed"});

    ReadBuffer r(w.bytes());
    auto infos = StreamerRegistry::read_list(r);
    ASSERT_EQ(infos.size(), 2u);
    EXPECT_EQ(infos[0].class_name, "Event");
    EXPECT_TRUE(infos[0].same_layout(reg.latest("Event")));
    EXPECT_EQ(infos[0].checksum, reg.latest("Event").checksum);
    EXPECT_EQ(infos[1].class_name, "TNamed");

    StreamerRegistry fresh;
    for (auto& si : infos) fresh.merge(si);
    WriteBuffer enc;
    reg.marshal(enc, sample_event());
    ReadBuffer dec(enc.bytes());
    EXPECT_EQ(fresh.unmarshal(dec, "Event"), sample_event());
}

TEST(StreamerTest, TruncatedRecordIsCorrupt) {
    auto reg = event_registry();
    WriteBuffer w;
    reg.marshal(w, sample_event());
    std::vector<uint8_t> cut(w.bytes().begin(), w.bytes().begin() + 20);

    ReadBuffer r(cut);
    reg.unmarshal(r, "Event");
    EXPECT_FALSE(r.ok());
}

TEST(StreamerTest, KindNames) {
    FieldKind k;
    ASSERT_TRUE(kind_from_name("double", k));
    EXPECT_EQ(k, FieldKind::kDouble);
    EXPECT_STREQ(kind_name(FieldKind::kULong64), "ULong64_t");
    EXPECT_EQ(kind_size(FieldKind::kShort), 2);
    EXPECT_TRUE(is_unsigned(FieldKind::kUChar));
    EXPECT_TRUE(is_floating(FieldKind::kFloat));
    EXPECT_FALSE(is_primitive(FieldKind::kString));
}

TEST(StreamerTest, ValueConversions) {
    EXPECT_EQ(value_to_i64(Value(uint64_t(5))), 5);
    EXPECT_EQ(value_to_f64(Value(int64_t(-2))), -2.0);
    EXPECT_EQ(value_to_u64(Value(true)), 1u);
    EXPECT_ROOTIO_ERROR(value_to_i64(Value(std::string("x"))), ErrorCode::kInvalidArgument);
}

TEST(StreamerTest, NestingDepthIsBounded) {
    StreamerRegistry reg;
    reg.add({"Node", 1, 0, {FD::object("child", "Node")}});

    // Version-only headers: each two bytes open one more nested Node.
    std::vector<uint8_t> chain;
    for (int i = 0; i < 100000; ++i) {
        chain.push_back(0);
        chain.push_back(1);
    }
    ReadBuffer r(chain);
    EXPECT_ROOTIO_ERROR(reg.unmarshal(r, "Node"), ErrorCode::kCorruptBlock);

    WriteBuffer w;
    EXPECT_ROOTIO_ERROR(reg.marshal(w, Record("Node")), ErrorCode::kInvalidArgument);
}

TEST(StreamerTest, ShallowPointerChainsStillDecode) {
    StreamerRegistry reg;
    reg.add({"Link", 1, 0, {FD::scalar("id", FieldKind::kInt), FD::pointer("next", "Link")}});

    RecordPtr head;
    for (int64_t id = 10; id > 0; --id) {
        auto link = std::make_shared<Record>("Link");
        link->set("id", id).set("next", head);
        head = link;
    }
    WriteBuffer w;
    reg.marshal(w, *head);
    ReadBuffer r(w.bytes());
    Record got = reg.unmarshal(r, "Link");
    r.check();
    EXPECT_EQ(got, *head);
}
