// rootio – writer configuration (JSON + environment)
#include "rootio/config.hpp"
#include "rootio/error.hpp"
#include "rootio/log.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace rootio {

namespace {

bool all_digits(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s)
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    return true;
}

int parse_level(const std::string& s) {
    if (!all_digits(s) || s.size() > 2)
        fail(ErrorCode::kInvalidArgument, "bad compression level '" + s + "'");
    return std::atoi(s.c_str());
}

Algorithm algorithm_or_fail(const std::string& name) {
    Algorithm alg;
    if (!parse_algorithm(name, alg))
        fail(ErrorCode::kInvalidArgument, "unknown compression algorithm '" + name + "'");
    return alg;
}

WriteOptions from_document(const json& doc, WriteOptions opts) {
    if (!doc.is_object())
        fail(ErrorCode::kInvalidArgument, "write options must be a JSON object");

    if (doc.contains("compression")) {
        auto& c = doc["compression"];
        if (c.is_number_integer()) {
            opts.compression = CompressionSettings::from_packed(c.get<int32_t>());
        } else if (c.is_string()) {
            opts.compression = parse_compression(c.get<std::string>());
        } else if (c.is_object()) {
            if (c.contains("algorithm"))
                opts.compression.algorithm = algorithm_or_fail(c["algorithm"].get<std::string>());
            if (c.contains("level"))
                opts.compression.level = c["level"].get<int>();
        } else {
            fail(ErrorCode::kInvalidArgument, "'compression' must be an object, string or integer");
        }
        if (opts.compression.level < 0 || opts.compression.level > 99)
            fail(ErrorCode::kInvalidArgument,
                 "compression level " + std::to_string(opts.compression.level) + " out of range");
    }

    opts.basket_size    = doc.value("basket_size", opts.basket_size);
    opts.basket_entries = doc.value("basket_entries", opts.basket_entries);
    opts.title          = doc.value("title", opts.title);

    if (opts.basket_size <= 0)
        fail(ErrorCode::kInvalidArgument, "basket_size must be positive");
    if (opts.basket_entries < 0)
        fail(ErrorCode::kInvalidArgument, "basket_entries must not be negative");
    return opts;
}

} // anon

CompressionSettings parse_compression(const std::string& text) {
    if (all_digits(text)) return CompressionSettings::from_packed(std::atoi(text.c_str()));

    CompressionSettings cs;
    auto colon = text.find(':');
    cs.algorithm = algorithm_or_fail(text.substr(0, colon));
    if (colon != std::string::npos)
        cs.level = parse_level(text.substr(colon + 1));
    else if (cs.algorithm == Algorithm::kInherit)
        cs.level = 0;
    return cs;
}

WriteOptions default_write_options() {
    WriteOptions opts;
    if (const char* env = std::getenv("ROOTIO_COMPRESSION")) {
        opts.compression = parse_compression(env);
        debug() << "config: ROOTIO_COMPRESSION=" << env << " -> "
                << algorithm_name(opts.compression.algorithm) << ":" << opts.compression.level;
    }
    return opts;
}

WriteOptions parse_write_options(const std::string& json_text) {
    json doc;
    try {
        doc = json::parse(json_text);
    } catch (const json::exception& e) {
        fail(ErrorCode::kInvalidArgument, std::string("bad write options: ") + e.what());
    }
    try {
        return from_document(doc, default_write_options());
    } catch (const json::exception& e) {
        fail(ErrorCode::kInvalidArgument, std::string("bad write options: ") + e.what());
    }
}

WriteOptions load_write_options(const std::string& path) {
    std::ifstream ifs(path);
    if (!ifs) fail(ErrorCode::kIOError, "cannot open " + path);
    std::string text((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    return parse_write_options(text);
}

} // namespace rootio
