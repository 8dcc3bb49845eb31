// rootio – key record (directory entry header)
#pragma once

#include "rootio/bytes.hpp"

#include <cstdint>
#include <ctime>
#include <string>
#include <vector>

namespace rootio {

class FileHandle;

/// Seek pointers beyond this offset need the 64-bit key/directory layout.
constexpr int64_t kStartBigFile = 2000000000;

/// ROOT-style packed date: (year-1995)<<26 | month<<22 | day<<17 | h<<12 | m<<6 | s.
uint32_t    pack_datime(std::time_t t);
std::time_t unpack_datime(uint32_t d);

struct Key {
    int32_t     nbytes    = 0;   // keylen + stored payload size
    int16_t     version   = 4;   // +1000 when seeks are 64-bit
    int32_t     objlen    = 0;   // uncompressed payload size
    uint32_t    datime    = 0;
    int16_t     keylen    = 0;
    int16_t     cycle     = 1;
    int64_t     seek_key  = 0;
    int64_t     seek_pdir = 0;
    std::string class_name;
    std::string name;
    std::string title;

    bool    is_big() const { return version > 1000; }
    int32_t stored_size() const { return nbytes - keylen; }
    bool    is_compressed() const { return objlen != stored_size(); }

    /// Size of the header as `write()` would emit it.
    int32_t header_size() const;

    void read(ReadBuffer& r);
    void write(WriteBuffer& w) const;

    /// Read the header stored at `pos`.
    static Key read_at(const FileHandle& f, int64_t pos);

    /// Read the stored payload and inflate it to `objlen` bytes.
    std::vector<uint8_t> load(const FileHandle& f) const;
};

} // namespace rootio
