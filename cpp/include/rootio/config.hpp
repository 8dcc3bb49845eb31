// rootio – writer configuration
#pragma once

#include "rootio/compress.hpp"

#include <cstdint>
#include <string>

namespace rootio {

/// File-scoped write settings. Trees inherit them unless a Writer is given
/// its own copy.
struct WriteOptions {
    CompressionSettings compression;
    int32_t             basket_size    = 32000;   // bytes per basket before a flush
    int64_t             basket_entries = 0;       // if > 0, flush on entry count instead
    std::string         title;
};

/// Defaults, with ROOTIO_COMPRESSION ("zstd:5", "lz4", or packed "505") applied.
WriteOptions default_write_options();

/// Parse "alg[:level]" or a packed integer. Throws Error(kInvalidArgument).
CompressionSettings parse_compression(const std::string& text);

/// JSON document:
///   { "compression": { "algorithm": "zstd", "level": 3 },
///     "basket_size": 32000, "basket_entries": 0, "title": "..." }
/// Keys that are absent keep their default; unknown keys are ignored.
WriteOptions parse_write_options(const std::string& json_text);
WriteOptions load_write_options(const std::string& path);

} // namespace rootio
