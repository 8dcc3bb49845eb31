/**
 * rootio C API: thin wrapper around rootio::File.
 * Exceptions are caught and converted to status codes; last error via rootio_error_string().
 */
#include "rootio/rootio_capi.h"
#include "rootio/file.hpp"
#include "rootio/tree.hpp"

#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>
#include <vector>

namespace {

thread_local std::string g_last_error;

void set_error(const std::string& msg) {
    g_last_error = msg;
}

int status_of(const rootio::Error& e) {
    return static_cast<int>(e.code()) + 1;
}

// The handle owns one reference to the file.
struct Handle {
    rootio::FilePtr file;
};

rootio::File* file_of(rootio_handle_t h) {
    return reinterpret_cast<Handle*>(h)->file.get();
}

// "a/b/name;cycle" -> directory + key.
const rootio::Key& resolve_key(rootio::File& f, const std::string& path) {
    rootio::Directory* dir  = &f.root();
    std::string        leaf = path;
    rootio::DirectoryPtr sub;
    auto slash = path.find_last_of('/');
    if (slash != std::string::npos) {
        sub  = f.root().get_as<rootio::Directory>(path.substr(0, slash));
        dir  = sub.get();
        leaf = path.substr(slash + 1);
    }
    int16_t cycle = -1;
    auto semi = leaf.find(';');
    if (semi != std::string::npos) {
        cycle = static_cast<int16_t>(std::atoi(leaf.c_str() + semi + 1));
        leaf  = leaf.substr(0, semi);
    }
    return dir->key(leaf, cycle);
}

bool copy_string(const std::string& s, char* buf, size_t size) {
    if (!buf) return true;
    if (s.size() >= size) return false;
    std::memcpy(buf, s.data(), s.size());
    buf[s.size()] = '\0';
    return true;
}

} // namespace

extern "C" {

rootio_handle_t rootio_open(const char* path) {
    if (!path) {
        set_error("path is NULL");
        return nullptr;
    }
    try {
        std::unique_ptr<Handle> handle(new Handle{rootio::File::open(path)});
        return reinterpret_cast<rootio_handle_t>(handle.release());
    } catch (const std::exception& e) {
        set_error(e.what());
        return nullptr;
    } catch (...) {
        set_error("unknown error");
        return nullptr;
    }
}

void rootio_close(rootio_handle_t h) {
    if (!h) return;
    std::unique_ptr<Handle> handle(reinterpret_cast<Handle*>(h));
    try {
        handle->file->close();
    } catch (const std::exception& e) {
        set_error(e.what());
    }
}

uint32_t rootio_key_count(rootio_handle_t h) {
    if (!h) {
        set_error("handle is NULL");
        return 0;
    }
    try {
        return static_cast<uint32_t>(file_of(h)->root().keys().size());
    } catch (const std::exception& e) {
        set_error(e.what());
        return 0;
    }
}

int rootio_key_info(rootio_handle_t h, uint32_t i, char* name_buf, size_t name_size,
                    char* class_buf, size_t class_size, int16_t* cycle_out,
                    uint64_t* objlen_out) {
    if (!h) {
        set_error("handle is NULL");
        return ROOTIO_INVALID_ARGUMENT;
    }
    try {
        const auto& keys = file_of(h)->root().keys();
        if (i >= keys.size()) {
            set_error("key index out of range");
            return ROOTIO_NOT_FOUND;
        }
        const rootio::Key& k = keys[i];
        if (!copy_string(k.name, name_buf, name_size)
            || !copy_string(k.class_name, class_buf, class_size)) {
            set_error("buffer too small");
            return ROOTIO_BUFFER_TOO_SMALL;
        }
        if (cycle_out) *cycle_out = k.cycle;
        if (objlen_out) *objlen_out = static_cast<uint64_t>(k.objlen);
        return ROOTIO_OK;
    } catch (const rootio::Error& e) {
        set_error(e.what());
        return status_of(e);
    } catch (const std::exception& e) {
        set_error(e.what());
        return ROOTIO_INTERNAL;
    }
}

int rootio_key_bytes(rootio_handle_t h, const char* path, uint8_t* buffer,
                     uint64_t buffer_size, uint64_t* size_out) {
    if (!h || !path) {
        set_error("handle or path is NULL");
        return ROOTIO_INVALID_ARGUMENT;
    }
    try {
        rootio::File&        f = *file_of(h);
        const rootio::Key&   k = resolve_key(f, path);
        std::vector<uint8_t> payload = k.load(f.handle());
        if (size_out) *size_out = payload.size();
        if (!buffer || buffer_size < payload.size()) {
            set_error("buffer too small");
            return ROOTIO_BUFFER_TOO_SMALL;
        }
        if (!payload.empty()) std::memcpy(buffer, payload.data(), payload.size());
        return ROOTIO_OK;
    } catch (const rootio::Error& e) {
        set_error(e.what());
        return status_of(e);
    } catch (const std::exception& e) {
        set_error(e.what());
        return ROOTIO_INTERNAL;
    }
}

int64_t rootio_tree_entries(rootio_handle_t h, const char* path) {
    if (!h || !path) {
        set_error("handle or path is NULL");
        return -1;
    }
    try {
        return file_of(h)->root().get_as<rootio::Tree>(path)->entries();
    } catch (const std::exception& e) {
        set_error(e.what());
        return -1;
    }
}

const char* rootio_error_string(void) {
    return g_last_error.c_str();
}

} // extern "C"
