// rootio v0.1 – reader/writer for ROOT-style object containers
// Cross-platform: macOS, Linux, Windows (MSVC)
#pragma once

#define ROOTIO_VERSION_MAJOR 0
#define ROOTIO_VERSION_MINOR 1
#define ROOTIO_VERSION_PATCH 0

#include "rootio/bytes.hpp"
#include "rootio/compress.hpp"
#include "rootio/config.hpp"
#include "rootio/error.hpp"
#include "rootio/file.hpp"
#include "rootio/key.hpp"
#include "rootio/log.hpp"
#include "rootio/reader.hpp"
#include "rootio/streamer.hpp"
#include "rootio/tree.hpp"
#include "rootio/writer.hpp"
