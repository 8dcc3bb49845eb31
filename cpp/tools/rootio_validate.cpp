// rootio_validate – inflate every key and basket of a file (--hash prints BLAKE3 digests).

#include "rootio/rootio.hpp"
#include <blake3.h>
#include <cstdio>
#include <cstring>
#include <string>

namespace {

struct Stats {
    int keys    = 0;
    int baskets = 0;
    int errors  = 0;
};

std::string blake3_hex(const std::vector<uint8_t>& data) {
    blake3_hasher hasher;
    blake3_hasher_init(&hasher);
    blake3_hasher_update(&hasher, data.data(), data.size());
    uint8_t out[BLAKE3_OUT_LEN];
    blake3_hasher_finalize(&hasher, out, BLAKE3_OUT_LEN);
    std::string hex;
    char b[3];
    for (uint8_t c : out) {
        std::snprintf(b, sizeof(b), "%02x", c);
        hex += b;
    }
    return hex;
}

void check_tree(rootio::File& file, const rootio::Tree& tree, const std::string& path,
                Stats& st) {
    for (const auto& br : tree.branches()) {
        try {
            br.validate();
        } catch (const std::exception& e) {
            std::printf("  FAIL  %s/%s: %s\n", path.c_str(), br.name.c_str(), e.what());
            ++st.errors;
            continue;
        }
        for (size_t id = 0; id < br.baskets(); ++id) {
            try {
                rootio::Basket::inflate(file, br, id);
                ++st.baskets;
            } catch (const std::exception& e) {
                std::printf("  FAIL  %s/%s basket %zu: %s\n",
                            path.c_str(), br.name.c_str(), id, e.what());
                ++st.errors;
            }
        }
    }
}

void check_dir(rootio::File& file, rootio::Directory& dir, const std::string& prefix,
               bool hash, Stats& st) {
    for (const auto& k : dir.keys()) {
        std::string path = prefix + k.name + ";" + std::to_string(k.cycle);
        try {
            auto payload = k.load(file.handle());
            ++st.keys;
            if (hash)
                std::printf("  OK    %-40s %s\n", path.c_str(), blake3_hex(payload).c_str());
            else
                std::printf("  OK    %-40s %zu bytes\n", path.c_str(), payload.size());

            if (k.class_name == "TDirectory" || k.class_name == "TDirectoryFile") {
                auto sub = dir.get_as<rootio::Directory>(k.name);
                check_dir(file, *sub, prefix + k.name + "/", hash, st);
            } else if (k.class_name == "TTree") {
                auto tree = dir.get_as<rootio::Tree>(k.name + ";" + std::to_string(k.cycle));
                check_tree(file, *tree, path, st);
            }
        } catch (const std::exception& e) {
            std::printf("  FAIL  %s: %s\n", path.c_str(), e.what());
            ++st.errors;
        }
    }
}

} // anon

int main(int argc, char** argv) {
    bool        hash = false;
    const char* path = nullptr;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--hash") == 0)
            hash = true;
        else
            path = argv[i];
    }

    if (!path) {
        std::fprintf(stderr, "Usage: rootio_validate <file.root> [--hash]\n");
        return 1;
    }

    try {
        auto  file = rootio::File::open(path);
        Stats st;
        check_dir(*file, file->root(), "", hash, st);

        if (st.errors > 0) {
            std::printf("\n%d error(s).\n", st.errors);
            return 1;
        }
        std::printf("\n%d key(s), %d basket(s) verified OK.\n", st.keys, st.baskets);

    } catch (const std::exception& e) {
        std::fprintf(stderr, "Error: %s\n", e.what());
        return 1;
    }
    return 0;
}
