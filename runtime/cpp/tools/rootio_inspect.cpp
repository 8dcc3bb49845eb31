// rootio_inspect – print file header, top-level keys and streamer infos.

#include "rootio/rootio.hpp"
#include <cinttypes>
#include <cstdio>

int main(int argc, char** argv) {
    if (argc < 2) {
        std::fprintf(stderr, "Usage: rootio_inspect <file.root>\n");
        return 1;
    }

    try {
        auto file = rootio::File::open(argv[1]);
        const auto& hdr = file->header();

        std::printf("UUID     : ");
        for (int i = 0; i < 16; ++i) std::printf("%02x", hdr.uuid[i]);
        std::printf("\n");

        std::printf("Version  : %d%s\n", hdr.version, hdr.is_big() ? " (64-bit)" : "");
        std::printf("Begin    : %d  End=%" PRId64 "\n", hdr.begin, hdr.end);
        std::printf("Free     : seek=%" PRId64 "  nbytes=%d  segments=%zu\n",
                    hdr.seek_free, hdr.nbytes_free, file->free_segments().size());
        std::printf("Info     : seek=%" PRId64 "  nbytes=%d\n", hdr.seek_info, hdr.nbytes_info);
        auto cs = rootio::CompressionSettings::from_packed(hdr.compress);
        std::printf("Compress : %s level %d\n", rootio::algorithm_name(cs.algorithm), cs.level);

        const auto& keys = file->root().keys();
        std::printf("\nKeys (%zu):\n", keys.size());
        for (size_t i = 0; i < keys.size(); ++i) {
            const auto& k = keys[i];
            std::printf("  [%zu] %-12s  %s;%d  seek=%-10" PRId64
                        "  nbytes=%-8d  objlen=%-8d  keylen=%d\n",
                        i, k.class_name.c_str(), k.name.c_str(), k.cycle,
                        k.seek_key, k.nbytes, k.objlen, k.keylen);
        }

        auto infos = file->registry().infos();
        std::printf("\nStreamer infos (%zu):\n", infos.size());
        for (const auto* si : infos) {
            std::printf("  %-16s v%-3d checksum=0x%08x  fields=%zu\n",
                        si->class_name.c_str(), si->version, si->checksum, si->fields.size());
        }

    } catch (const std::exception& e) {
        std::fprintf(stderr, "Error: %s\n", e.what());
        return 1;
    }
    return 0;
}
