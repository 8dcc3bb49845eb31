// rootio_ls – list every key of a file, recursively (--json for machine output).

#include "rootio/rootio.hpp"
#include <nlohmann/json.hpp>
#include <cinttypes>
#include <cstdio>
#include <cstring>
#include <string>

using json = nlohmann::json;

namespace {

struct Options {
    bool json_out = false;
    bool trees    = false;
};

std::string leaf_type(const rootio::Leaf& l) {
    std::string s = rootio::kind_name(l.type);
    if (l.type == rootio::FieldKind::kString) return s;
    if (l.is_variable()) return s + "[]";
    if (l.len > 1) return s + "[" + std::to_string(l.len) + "]";
    return s;
}

json tree_json(const rootio::Tree& t) {
    json branches = json::array();
    for (const auto& b : t.branches()) {
        json leaves = json::array();
        for (const auto& l : b.leaves)
            leaves.push_back({{"name", l.name}, {"type", leaf_type(l)}});
        branches.push_back({{"name", b.name},
                            {"baskets", b.baskets()},
                            {"tot_bytes", b.tot_bytes},
                            {"zip_bytes", b.zip_bytes},
                            {"leaves", leaves}});
    }
    return {{"entries", t.entries()}, {"branches", branches}};
}

void list(rootio::Directory& dir, const std::string& prefix, const Options& opt, json& out) {
    for (const auto& k : dir.keys()) {
        std::string path = prefix + k.name + ";" + std::to_string(k.cycle);
        bool is_dir = k.class_name == "TDirectory" || k.class_name == "TDirectoryFile";

        rootio::TreePtr tree;
        if (opt.trees && k.class_name == "TTree")
            tree = dir.get_as<rootio::Tree>(k.name + ";" + std::to_string(k.cycle));

        if (opt.json_out) {
            json e = {{"path", path},
                      {"class", k.class_name},
                      {"title", k.title},
                      {"cycle", k.cycle},
                      {"nbytes", k.nbytes},
                      {"objlen", k.objlen}};
            if (tree) e["tree"] = tree_json(*tree);
            out.push_back(e);
        } else {
            std::printf("%-12s  %-40s  nbytes=%-8d  objlen=%-8d  %s\n",
                        k.class_name.c_str(), path.c_str(), k.nbytes, k.objlen, k.title.c_str());
            if (tree) {
                std::printf("    entries=%" PRId64 "\n", tree->entries());
                for (const auto& b : tree->branches()) {
                    std::printf("    %-24s baskets=%-4zu zip=%-10" PRId64 " tot=%" PRId64 "\n",
                                b.name.c_str(), b.baskets(), b.zip_bytes, b.tot_bytes);
                    for (const auto& l : b.leaves)
                        std::printf("      %-22s %s\n", l.name.c_str(), leaf_type(l).c_str());
                }
            }
        }

        if (is_dir) {
            auto sub = dir.get_as<rootio::Directory>(k.name);
            list(*sub, prefix + k.name + "/", opt, out);
        }
    }
}

} // anon

int main(int argc, char** argv) {
    Options     opt;
    const char* path = nullptr;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--json") == 0)
            opt.json_out = true;
        else if (std::strcmp(argv[i], "--trees") == 0)
            opt.trees = true;
        else
            path = argv[i];
    }

    if (!path) {
        std::fprintf(stderr, "Usage: rootio_ls <file.root> [--json] [--trees]\n");
        return 1;
    }

    try {
        auto file = rootio::File::open(path);
        json out  = json::array();
        list(file->root(), "", opt, out);
        if (opt.json_out) std::printf("%s\n", out.dump(2).c_str());
    } catch (const std::exception& e) {
        std::fprintf(stderr, "Error: %s\n", e.what());
        return 1;
    }
    return 0;
}
