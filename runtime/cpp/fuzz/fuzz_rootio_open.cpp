/**
 * LibFuzzer target for rootio file parsing.
 * Writes fuzz input to a temp file and opens it with rootio::File to exercise
 * header, StreamerInfo, key index, object and basket decoding.
 * Build with: -fsanitize=fuzzer
 *
 * Build:
 *   cmake -S . -B build -DROOTIO_BUILD_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++
 *   cmake --build build --target fuzz_rootio_open
 * Run:
 *   ./build/fuzz_rootio_open /path/to/corpus [options]
 */
#include "rootio/rootio.hpp"

#include <cstdio>
#include <fstream>
#include <string>
#include <vector>
#include <unistd.h>

static const size_t kMaxFuzzInput = 1024 * 1024;  // 1 MB max to avoid filling disk

namespace {

void read_tree(const rootio::TreePtr& tree) {
    std::vector<rootio::ReadVar> vars;
    for (const rootio::Leaf* l : tree->leaves()) vars.push_back(rootio::ReadVar::value(l->name));
    if (vars.empty()) return;
    rootio::ReaderOptions opts;
    opts.end = 64;
    rootio::Reader r(tree, std::move(vars), opts);
    r.read([](const rootio::ReadContext&) {});
}

} // anon

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    if (data == nullptr || size > kMaxFuzzInput)
        return 0;

    std::string tmpl = "/tmp/rootio_fuzz_XXXXXX";
    std::vector<char> v(tmpl.begin(), tmpl.end());
    v.push_back('\0');
    int fd = mkstemp(v.data());
    if (fd < 0) return 0;
    std::string path(v.data());
    close(fd);

    std::ofstream out(path, std::ios::binary);
    if (!out || !out.write(reinterpret_cast<const char*>(data), size)) {
        std::remove(path.c_str());
        return 0;
    }
    out.close();

    try {
        auto file = rootio::File::open(path);
        rootio::walk(file->root(), [](const std::string&, const rootio::ObjectPtr& obj,
                                      const rootio::Error*) {
            if (auto tree = std::dynamic_pointer_cast<rootio::Tree>(obj)) read_tree(tree);
            return true;
        });
        file->close();
    } catch (const rootio::Error&) {
        // Expected for invalid inputs
    }

    std::remove(path.c_str());
    return 0;
}
