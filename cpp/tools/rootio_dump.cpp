// rootio_dump – print the entries of a tree, or export them as msgpack.

#include "rootio/rootio.hpp"
#include <msgpack.hpp>
#include <cinttypes>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <type_traits>
#include <variant>

namespace {

struct Printer {
    std::string operator()(std::monostate) const { return "null"; }
    std::string operator()(bool v) const { return v ? "true" : "false"; }
    std::string operator()(int64_t v) const { return std::to_string(v); }
    std::string operator()(uint64_t v) const { return std::to_string(v); }
    std::string operator()(double v) const {
        char b[32];
        std::snprintf(b, sizeof(b), "%g", v);
        return b;
    }
    std::string operator()(const std::string& v) const { return "\"" + v + "\""; }
    std::string operator()(const rootio::RecordPtr& v) const {
        return v ? "<" + v->class_name() + ">" : "null";
    }
    template <class T>
    std::string operator()(const std::vector<T>& v) const {
        std::string s = "[";
        for (size_t i = 0; i < v.size(); ++i) {
            if (i > 0) s += ", ";
            s += (*this)(static_cast<T>(v[i]));
        }
        return s + "]";
    }
};

using Packer = msgpack::packer<msgpack::sbuffer>;

void pack_value(Packer& pk, const rootio::Value& v);

void pack_record(Packer& pk, const rootio::RecordPtr& rec) {
    if (!rec) {
        pk.pack_nil();
        return;
    }
    pk.pack_map(static_cast<uint32_t>(rec->fields().size()));
    for (const auto& f : rec->fields()) {
        pk.pack(f.first);
        pack_value(pk, f.second);
    }
}

void pack_value(Packer& pk, const rootio::Value& v) {
    std::visit([&pk](const auto& x) {
        using T = std::decay_t<decltype(x)>;
        if constexpr (std::is_same<T, std::monostate>::value) pk.pack_nil();
        else if constexpr (std::is_same<T, rootio::RecordPtr>::value) pack_record(pk, x);
        else if constexpr (std::is_same<T, std::vector<rootio::RecordPtr>>::value) {
            pk.pack_array(static_cast<uint32_t>(x.size()));
            for (const auto& r : x) pack_record(pk, r);
        } else pk.pack(x);
    }, v);
}

} // anon

int main(int argc, char** argv) {
    int64_t     limit   = -1;
    const char* mp_path = nullptr;
    const char* args[2] = {nullptr, nullptr};
    int         nargs   = 0;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--limit") == 0 && i + 1 < argc)
            limit = std::atoll(argv[++i]);
        else if (std::strcmp(argv[i], "--msgpack") == 0 && i + 1 < argc)
            mp_path = argv[++i];
        else if (nargs < 2)
            args[nargs++] = argv[i];
    }

    if (nargs < 2) {
        std::fprintf(stderr,
                     "Usage: rootio_dump <file.root> <tree> [--limit N] [--msgpack out.mp]\n");
        return 1;
    }

    try {
        auto file = rootio::File::open(args[0]);
        auto tree = file->root().get_as<rootio::Tree>(args[1]);

        std::vector<rootio::ReadVar> vars;
        std::vector<std::string>     names;
        for (const rootio::Leaf* l : tree->leaves()) {
            vars.push_back(rootio::ReadVar::value(l->name));
            names.push_back(l->name);
        }

        rootio::ReaderOptions opts;
        if (limit >= 0) opts.end = limit;
        int64_t total = limit >= 0 && limit < tree->entries() ? limit : tree->entries();

        msgpack::sbuffer sbuf;
        Packer           pk(&sbuf);
        if (mp_path) pk.pack_array(static_cast<uint32_t>(total));
        else std::printf("Tree %s: %" PRId64 " entries, showing %" PRId64 "\n",
                         tree->name().c_str(), tree->entries(), total);

        rootio::Reader reader(tree, std::move(vars), opts);
        reader.read([&](const rootio::ReadContext& ctx) {
            if (mp_path) {
                pk.pack_map(static_cast<uint32_t>(names.size()));
                for (size_t i = 0; i < names.size(); ++i) {
                    pk.pack(names[i]);
                    pack_value(pk, ctx.value(i));
                }
                return;
            }
            std::printf("  [%" PRId64 "]", ctx.entry());
            for (size_t i = 0; i < names.size(); ++i)
                std::printf("  %s=%s", names[i].c_str(),
                            std::visit(Printer{}, ctx.value(i)).c_str());
            std::printf("\n");
        });

        if (mp_path) {
            FILE* out = std::fopen(mp_path, "wb");
            if (!out) {
                std::fprintf(stderr, "Error: cannot open output file: %s\n", mp_path);
                return 1;
            }
            size_t written = std::fwrite(sbuf.data(), 1, sbuf.size(), out);
            std::fclose(out);
            if (written != sbuf.size()) {
                std::fprintf(stderr, "Error: short write to %s\n", mp_path);
                return 1;
            }
            std::printf("Wrote %" PRId64 " entries (%zu bytes) -> %s\n",
                        total, sbuf.size(), mp_path);
        }

    } catch (const std::exception& e) {
        std::fprintf(stderr, "Error: %s\n", e.what());
        return 1;
    }
    return 0;
}
