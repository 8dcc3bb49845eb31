// rootio_extract_key – write the decompressed payload of one key to a file.

#include "rootio/rootio.hpp"
#include <cstdio>
#include <cstdlib>
#include <string>

int main(int argc, char** argv) {
    if (argc < 4) {
        std::fprintf(stderr,
                     "Usage: rootio_extract_key <file.root> "
                     "\"<dir/name[;cycle]>\" <out.bin>\n");
        return 1;
    }

    try {
        auto file = rootio::File::open(argv[1]);

        std::string          path = argv[2];
        rootio::Directory*   dir  = &file->root();
        rootio::DirectoryPtr sub;
        auto slash = path.find_last_of('/');
        if (slash != std::string::npos) {
            sub  = file->root().get_as<rootio::Directory>(path.substr(0, slash));
            dir  = sub.get();
            path = path.substr(slash + 1);
        }
        int cycle = -1;
        auto semi = path.find(';');
        if (semi != std::string::npos) {
            cycle = std::atoi(path.c_str() + semi + 1);
            path  = path.substr(0, semi);
        }

        const rootio::Key& k = dir->key(path, static_cast<int16_t>(cycle));
        auto data = k.load(file->handle());

        FILE* out = std::fopen(argv[3], "wb");
        if (!out) {
            std::fprintf(stderr, "Error: cannot open output file: %s\n", argv[3]);
            return 1;
        }
        size_t written = std::fwrite(data.data(), 1, data.size(), out);
        std::fclose(out);
        if (written != data.size()) {
            std::fprintf(stderr, "Error: short write to %s\n", argv[3]);
            return 1;
        }

        std::printf("Extracted %zu bytes of %s '%s;%d' -> %s\n",
                    data.size(), k.class_name.c_str(), k.name.c_str(), k.cycle, argv[3]);

    } catch (const std::exception& e) {
        std::fprintf(stderr, "Error: %s\n", e.what());
        return 1;
    }
    return 0;
}
