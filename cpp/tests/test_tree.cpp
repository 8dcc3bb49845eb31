#include "test_util.hpp"
#include "rootio/file.hpp"
#include "rootio/io.hpp"
#include "rootio/reader.hpp"
#include "rootio/writer.hpp"

#include <array>
#include <fstream>
#include <string>
#include <vector>

using namespace rootio;
using rootio::test::TempFileTest;

class TreeTest : public TempFileTest {
protected:
    /// events: i (int32), x (double), v (vector<float>); n entries.
    void write_events(int n, const WriteOptions& opts) {
        auto f = File::create(path_, opts);
        int32_t            i = 0;
        double             x = 0;
        std::vector<float> v;
        Writer w(f->root(), "events",
                 {WriteVar::of("i", &i), WriteVar::of("x", &x), WriteVar::of("v", &v)});
        for (int e = 0; e < n; ++e) {
            i = e;
            x = e * 0.5;
            v.assign(static_cast<size_t>(e % 4), static_cast<float>(e));
            w.write();
        }
        EXPECT_EQ(w.entries(), n);
        w.close();
        f->close();
    }

    static WriteOptions quarters() {
        WriteOptions opts;
        opts.compression    = {Algorithm::kZLIB, 1};
        opts.basket_entries = 2500;
        return opts;
    }

    void patch(int64_t pos, const std::vector<char>& bytes) {
        std::fstream io(path_, std::ios::in | std::ios::out | std::ios::binary);
        io.seekp(pos);
        io.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    }
};

TEST_F(TreeTest, TenThousandEntriesInFourBaskets) {
    write_events(10000, quarters());

    auto f = File::open(path_);
    ASSERT_EQ(f->root().keys().size(), 1u);
    EXPECT_EQ(f->root().keys()[0].class_name, "TTree");

    auto tree = f->root().get_as<Tree>("events");
    EXPECT_EQ(tree->entries(), 10000);
    ASSERT_EQ(tree->branches().size(), 3u);
    for (const auto& b : tree->branches()) {
        EXPECT_EQ(b.baskets(), 4u) << b.name;
        EXPECT_EQ(b.basket_entry, (std::vector<int64_t>{0, 2500, 5000, 7500, 10000}));
        EXPECT_EQ(b.compress, 101);
    }
    EXPECT_FALSE(tree->branch("x").is_variable());
    EXPECT_TRUE(tree->branch("v").is_variable());
    EXPECT_EQ(tree->branch("v").entry_offset_len, kEntryOffsetLen);

    int32_t            i = -1;
    double             x = -1;
    std::vector<float> v;
    Reader r(tree, {ReadVar::of("i", &i), ReadVar::of("x", &x), ReadVar::of("v", &v)});

    int64_t seen = 0, bad = 0;
    r.read([&](const ReadContext& ctx) {
        int64_t e = ctx.entry();
        bool ok = i == e && x == e * 0.5 && v.size() == static_cast<size_t>(e % 4);
        for (float f : v) ok = ok && f == static_cast<float>(e);
        if (!ok) ++bad;
        ++seen;
    });
    EXPECT_EQ(seen, 10000);
    EXPECT_EQ(bad, 0);
    EXPECT_EQ(r.baskets_inflated(), 12);
    EXPECT_LE(r.cached_baskets(), 3u);
}

TEST_F(TreeTest, FlushesOnBasketBytes) {
    WriteOptions opts;
    opts.compression = {Algorithm::kZLIB, 0};
    opts.basket_size = 1000;
    {
        auto f = File::create(path_, opts);
        int64_t n = 0;
        Writer w(f->root(), "t", {WriteVar::of("n", &n)});
        for (n = 0; n < 1000; ++n) w.write();
    }

    auto f    = File::open(path_);
    auto tree = f->root().get_as<Tree>("t");
    const Branch& b = tree->branch("n");
    EXPECT_EQ(b.baskets(), 8u);
    EXPECT_EQ(b.span(0).size(), 125);
    EXPECT_EQ(b.zip_bytes, b.tot_bytes);
}

TEST_F(TreeTest, BasketHeadersDescribeTheirEntries) {
    write_events(100, WriteOptions());

    auto f    = File::open(path_);
    auto tree = f->root().get_as<Tree>("events");

    const Branch& x  = tree->branch("x");
    Basket        bx = Basket::inflate(*f, x, 0);
    EXPECT_EQ(bx.key().class_name, "TBasket");
    EXPECT_EQ(bx.key().name, "x");
    EXPECT_EQ(bx.key().title, "events");
    EXPECT_EQ(bx.key().keylen, bx.key().header_size() + kBasketHeaderSize);
    EXPECT_EQ(bx.nevsize(), 8);
    EXPECT_EQ(bx.last(), bx.key().keylen + 100 * 8);
    EXPECT_TRUE(bx.offsets().empty());

    const Branch& v  = tree->branch("v");
    Basket        bv = Basket::inflate(*f, v, 0);
    EXPECT_EQ(bv.nevsize(), 0);
    ASSERT_EQ(bv.offsets().size(), 101u);
    EXPECT_EQ(bv.offsets().front(), bv.key().keylen);
    EXPECT_EQ(bv.offsets().back(), bv.last());
}

TEST_F(TreeTest, MultiLeafBranchesAndArrays) {
    {
        auto f = File::create(path_);
        float                  px = 0, py = 0;
        std::array<int16_t, 3> idx{};
        std::string            label;
        Writer w(f->root(), "tracks",
                 {WriteVar::of("px", &px, "p"), WriteVar::of("py", &py, "p"),
                  WriteVar::of("idx", &idx), WriteVar::of("label", &label)});
        for (int e = 0; e < 50; ++e) {
            px    = static_cast<float>(e);
            py    = static_cast<float>(-e);
            idx   = {static_cast<int16_t>(e), static_cast<int16_t>(e + 1), static_cast<int16_t>(e + 2)};
            label = "track-" + std::to_string(e);
            w.write();
        }
    }

    auto f    = File::open(path_);
    auto tree = f->root().get_as<Tree>("tracks");
    ASSERT_EQ(tree->branches().size(), 3u);
    const Branch& p = tree->branch("p");
    ASSERT_EQ(p.leaves.size(), 2u);
    EXPECT_EQ(p.leaves[1].offset, 4);
    EXPECT_EQ(p.entry_size(), 8);
    EXPECT_EQ(tree->leaves().size(), 4u);

    float                  py = 0;
    std::array<int16_t, 3> idx{};
    std::string            label;
    Reader r(tree, {ReadVar::of("py", &py), ReadVar::of("idx", &idx), ReadVar::of("label", &label),
                     ReadVar::value("px")});
    int bad = 0;
    r.read([&](const ReadContext& ctx) {
        int64_t e = ctx.entry();
        if (py != static_cast<float>(-e)) ++bad;
        if (idx[2] != e + 2) ++bad;
        if (label != "track-" + std::to_string(e)) ++bad;
        if (value_to_f64(ctx.value("px")) != static_cast<double>(e)) ++bad;
    });
    EXPECT_EQ(bad, 0);
}

TEST_F(TreeTest, ReadsEntryRange) {
    write_events(10000, quarters());
    auto f    = File::open(path_);
    auto tree = f->root().get_as<Tree>("events");

    ReaderOptions opts;
    opts.begin = 2490;
    opts.end   = 2510;
    Reader r(tree, {ReadVar::value("i")}, opts);

    std::vector<int64_t> got;
    r.read([&](const ReadContext& ctx) { got.push_back(value_to_i64(ctx.value(size_t(0)))); });
    ASSERT_EQ(got.size(), 20u);
    EXPECT_EQ(got.front(), 2490);
    EXPECT_EQ(got.back(), 2509);
    EXPECT_EQ(r.baskets_inflated(), 2);

    ReaderOptions bad;
    bad.begin = 20;
    bad.end   = 10;
    Reader rb(tree, {ReadVar::value("i")}, bad);
    EXPECT_ROOTIO_ERROR(rb.read([](const ReadContext&) {}), ErrorCode::kInvalidArgument);
}

TEST_F(TreeTest, CancelAtBasketBoundary) {
    write_events(10000, quarters());
    auto f    = File::open(path_);
    auto tree = f->root().get_as<Tree>("events");

    int64_t       seen = 0;
    ReaderOptions opts;
    opts.cancelled = [&] { return seen >= 2500; };
    Reader r(tree, {ReadVar::value("x")}, opts);
    EXPECT_ROOTIO_ERROR(r.read([&](const ReadContext&) { ++seen; }), ErrorCode::kCancelled);
    EXPECT_EQ(seen, 2500);
}

TEST_F(TreeTest, BindingErrors) {
    write_events(10, WriteOptions());
    auto f    = File::open(path_);
    auto tree = f->root().get_as<Tree>("events");

    double             d = 0;
    int32_t            i = 0;
    std::vector<float> v;
    EXPECT_ROOTIO_ERROR(Reader(tree, {ReadVar::of("i", &d)}), ErrorCode::kInvalidArgument);
    EXPECT_ROOTIO_ERROR(Reader(tree, {ReadVar::of("v", &i)}), ErrorCode::kInvalidArgument);
    EXPECT_ROOTIO_ERROR(Reader(tree, {ReadVar::of("nope", &i)}), ErrorCode::kNotFound);
    EXPECT_NO_THROW(Reader(tree, {ReadVar::of("v", &v)}));

    Reader r(tree, {ReadVar::of("i", &i)});
    r.close();
    EXPECT_ROOTIO_ERROR(r.read([](const ReadContext&) {}), ErrorCode::kClosedHandle);
}

TEST_F(TreeTest, WriterErrors) {
    auto    f = File::create(path_);
    int32_t a = 0;
    EXPECT_ROOTIO_ERROR(Writer(f->root(), "t", {}), ErrorCode::kInvalidArgument);
    EXPECT_ROOTIO_ERROR(Writer(f->root(), "t", {WriteVar::of("a", &a), WriteVar::of("a", &a)}),
                        ErrorCode::kInvalidArgument);

    Writer w(f->root(), "t", {WriteVar::of("a", &a)});
    w.write();
    w.close();
    EXPECT_ROOTIO_ERROR(w.write(), ErrorCode::kClosedHandle);
    f->close();

    auto ro = File::open(path_);
    EXPECT_ROOTIO_ERROR(Writer(ro->root(), "t2", {WriteVar::of("a", &a)}),
                        ErrorCode::kInvalidDirectory);
}

TEST_F(TreeTest, TreesInSubdirectoriesKeepTheirTitle) {
    {
        auto f = File::create(path_);
        auto d = f->root().mkdir("run1");
        WriteOptions opts = f->options();
        opts.title = "calibration";
        uint8_t c = 0;
        Writer w(*d, "calib", {WriteVar::of("c", &c)}, opts);
        for (int e = 0; e < 3; ++e) {
            c = static_cast<uint8_t>(200 + e);
            w.write();
        }
    }

    auto f    = File::open(path_);
    auto tree = f->root().get_as<Tree>("run1/calib");
    EXPECT_EQ(tree->title(), "calibration");
    EXPECT_TRUE(tree->branch("c").leaves[0].is_unsigned);

    std::vector<uint64_t> got;
    Reader r(tree, {ReadVar::value("c")});
    r.read([&](const ReadContext& ctx) { got.push_back(value_to_u64(ctx.value("c"))); });
    EXPECT_EQ(got, (std::vector<uint64_t>{200, 201, 202}));
}

TEST_F(TreeTest, EmptyTree) {
    {
        auto f = File::create(path_);
        double x = 0;
        Writer w(f->root(), "empty", {WriteVar::of("x", &x)});
    }
    auto f    = File::open(path_);
    auto tree = f->root().get_as<Tree>("empty");
    EXPECT_EQ(tree->entries(), 0);
    EXPECT_EQ(tree->branch("x").baskets(), 0u);

    int calls = 0;
    Reader r(tree, {ReadVar::value("x")});
    r.read([&](const ReadContext&) { ++calls; });
    EXPECT_EQ(calls, 0);
}

TEST_F(TreeTest, BasketHeaderMismatchIsCorrupt) {
    write_events(10000, quarters());
    int64_t seek   = 0;
    int16_t keylen = 0;
    {
        auto f    = File::open(path_);
        auto tree = f->root().get_as<Tree>("events");
        seek   = tree->branch("i").basket_seek[1];
        keylen = Key::read_at(f->handle(), seek).keylen;
    }
    // nevbuf sits after version, bufsize and nevsize.
    patch(seek + keylen - kBasketHeaderSize + 10, {0, 0, 0, 1});

    auto    f    = File::open(path_);
    auto    tree = f->root().get_as<Tree>("events");
    int32_t i    = 0;
    Reader  r(tree, {ReadVar::of("i", &i)});
    int64_t seen = 0;
    EXPECT_ROOTIO_ERROR(r.read([&](const ReadContext&) { ++seen; }), ErrorCode::kCorruptBasket);
    EXPECT_EQ(seen, 2500);
}

TEST_F(TreeTest, DamagedCompressedBasketIsCorrupt) {
    WriteOptions opts;
    opts.compression = {Algorithm::kZLIB, 5};
    {
        auto f = File::create(path_, opts);
        int32_t k = 7;
        Writer w(f->root(), "flat", {WriteVar::of("k", &k)});
        for (int e = 0; e < 5000; ++e) w.write();
    }

    int64_t seek = 0;
    Key     key;
    {
        auto f    = File::open(path_);
        auto tree = f->root().get_as<Tree>("flat");
        seek = tree->branch("k").basket_seek[0];
        key  = Key::read_at(f->handle(), seek);
    }
    ASSERT_TRUE(key.is_compressed());
    ASSERT_GT(key.stored_size(), 16);
    patch(seek + key.keylen + 12, {'\x55', '\x55', '\x55', '\x55'});

    auto f    = File::open(path_);
    auto tree = f->root().get_as<Tree>("flat");
    EXPECT_ROOTIO_ERROR(Basket::inflate(*f, tree->branch("k"), 0), ErrorCode::kCorruptBasket);
}

TEST_F(TreeTest, TreeOutlivingItsFileFailsClosedHandle) {
    write_events(10, quarters());
    TreePtr      tree;
    DirectoryPtr root;
    {
        auto f = File::open(path_);
        tree   = f->root().get_as<Tree>("events");
        root   = f->root_ptr();
    }
    EXPECT_EQ(tree->entries(), 10);
    EXPECT_ROOTIO_ERROR(tree->file(), ErrorCode::kClosedHandle);

    int32_t i = 0;
    Reader  r(tree, {ReadVar::of("i", &i)});
    EXPECT_ROOTIO_ERROR(r.read([](const ReadContext&) {}), ErrorCode::kClosedHandle);
    EXPECT_ROOTIO_ERROR(root->keys(), ErrorCode::kClosedHandle);
    EXPECT_ROOTIO_ERROR(root->get("events"), ErrorCode::kClosedHandle);
}

TEST_F(TreeTest, ReaderKeepsItsTreeAlive) {
    write_events(10, quarters());
    auto    f   = File::open(path_);
    int32_t i   = 0;
    int64_t sum = 0;
    Reader  r(f->root().get_as<Tree>("events"), {ReadVar::of("i", &i)});
    r.read([&](const ReadContext&) { sum += i; });
    EXPECT_EQ(sum, 45);
}

TEST_F(TreeTest, ThrowingEncoderDropsTheWholeEntry) {
    {
        auto f = File::create(path_);
        int32_t            a = 0;
        int32_t            b = 0;
        std::vector<float> v;

        WriteVar checked = WriteVar::of("b", &b);
        auto     encode  = checked.encode;
        checked.encode   = [&b, encode](WriteBuffer& w) {
            if (b == 3) fail(ErrorCode::kInvalidArgument, "b must not be 3");
            encode(w);
        };
        Writer w(f->root(), "t", {WriteVar::of("a", &a), WriteVar::of("v", &v), checked});
        for (int e = 0; e < 5; ++e) {
            a = b = e;
            v.assign(static_cast<size_t>(e), 1.5f);
            if (e == 3)
                EXPECT_ROOTIO_ERROR(w.write(), ErrorCode::kInvalidArgument);
            else
                w.write();
        }
        EXPECT_EQ(w.entries(), 4);
    }

    auto f    = File::open(path_);
    auto tree = f->root().get_as<Tree>("t");
    EXPECT_EQ(tree->entries(), 4);
    for (const auto& br : tree->branches()) EXPECT_EQ(br.entries, 4) << br.name;

    int32_t              a = 0;
    std::vector<float>   v;
    std::vector<int32_t> as;
    std::vector<size_t>  sizes;
    Reader r(tree, {ReadVar::of("a", &a), ReadVar::of("v", &v)});
    r.read([&](const ReadContext&) {
        as.push_back(a);
        sizes.push_back(v.size());
    });
    EXPECT_EQ(as, (std::vector<int32_t>{0, 1, 2, 4}));
    EXPECT_EQ(sizes, (std::vector<size_t>{0, 1, 2, 4}));
}

TEST_F(TreeTest, PlainCharIsACharLeaf) {
    static_assert(kind_of<char>() == FieldKind::kChar, "char maps to kChar");
    static_assert(kind_of<signed char>() == FieldKind::kChar, "signed char maps to kChar");
    static_assert(kind_of<unsigned char>() == FieldKind::kUChar, "unsigned char maps to kUChar");
    {
        auto f = File::create(path_);
        char c = 0;
        Writer w(f->root(), "t", {WriteVar::of("c", &c)});
        for (char v : {'a', '\x7f', '\x01'}) {
            c = v;
            w.write();
        }
    }

    auto f    = File::open(path_);
    auto tree = f->root().get_as<Tree>("t");
    const Leaf& leaf = tree->branch("c").leaves[0];
    EXPECT_EQ(leaf.type, FieldKind::kChar);
    EXPECT_FALSE(leaf.is_unsigned);

    char        c = 0;
    std::string got;
    Reader r(tree, {ReadVar::of("c", &c)});
    r.read([&](const ReadContext&) { got.push_back(c); });
    EXPECT_EQ(got, "a\x7f\x01");
}
