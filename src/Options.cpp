/**
 * @file Options.cpp
 * @brief Options-file loading
 *
 * JSON files are read with nlohmann::json, TOML files with toml++ and then
 * converted to the same JSON tree before the keys are applied.
 */

#include "mpjson/Options.hpp"
#include "mpjson/Errors.hpp"
#include "mpjson/Json.hpp"
#include "mpjson/Util.hpp"

#include <toml++/toml.hpp>

#include <cstdint>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace mpjson {

namespace {

// Option values are strings, integers, floats, booleans, arrays and tables.
// TOML dates and times have no option to feed and are rejected.
Json toml_to_json(const toml::node& node, const std::string& path) {
    if (const auto* table = node.as_table()) {
        Json obj = Json::object();
        for (const auto& [key, val] : *table) {
            obj[std::string(key.str())] = toml_to_json(val, path);
        }
        return obj;
    }
    if (const auto* array = node.as_array()) {
        Json arr = Json::array();
        for (const auto& elem : *array) {
            arr.push_back(toml_to_json(elem, path));
        }
        return arr;
    }
    if (const auto* s = node.as_string()) return Json(s->get());
    if (const auto* i = node.as_integer()) return Json(i->get());
    if (const auto* f = node.as_floating_point()) return Json(f->get());
    if (const auto* b = node.as_boolean()) return Json(b->get());

    throw OptionsError("Options file '" + path + "' holds a TOML date or time, which no option accepts");
}

Json load_toml_file(const std::string& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw FileNotFoundError(path);
    }

    try {
        return toml_to_json(toml::parse_file(path), path);
    } catch (const toml::parse_error& e) {
        throw ParseError(
            path,
            static_cast<int>(e.source().begin.line),
            static_cast<int>(e.source().begin.column),
            std::string(e.description())
        );
    }
}

Json load_json_tree(const std::string& path) {
    const std::string content = read_file(path);
    try {
        return Json::parse(content);
    } catch (const Json::parse_error& e) {
        throw ParseError(path, 0, 0, e.what());
    }
}

void apply_options(CodecOptions& options, const Json& tree, const std::string& path) {
    if (!tree.is_object()) {
        throw OptionsError("Options file '" + path + "' must hold an object at the top level");
    }

    if (auto it = tree.find("cached_strings"); it != tree.end()) {
        if (!it->is_array()) {
            throw OptionsError("'cached_strings' in '" + path + "' must be an array of strings");
        }
        for (const auto& elem : *it) {
            if (!elem.is_string()) {
                throw OptionsError("'cached_strings' in '" + path + "' must be an array of strings");
            }
            options.cached_strings.insert(elem.get<std::string>());
        }
    }

    if (auto it = tree.find("max_depth"); it != tree.end()) {
        if (it->is_number_unsigned()) {
            options.max_depth = static_cast<std::size_t>(it->get<std::uint64_t>());
        } else if (it->is_number_integer() && it->get<std::int64_t>() >= 0) {
            options.max_depth = static_cast<std::size_t>(it->get<std::int64_t>());
        } else {
            throw OptionsError("'max_depth' in '" + path + "' must be a non-negative integer");
        }
    }

    if (auto it = tree.find("isolated_int_cache"); it != tree.end()) {
        if (!it->is_boolean()) {
            throw OptionsError("'isolated_int_cache' in '" + path + "' must be a boolean");
        }
        if (it->get<bool>()) {
            options.int_cache = std::make_shared<SmallIntCache>();
        }
    }
}

} // anonymous namespace

CodecOptions load_options_file(const std::string& path) {
    const std::string ext = file_extension(path);

    Json tree;
    if (ext == ".json") {
        tree = load_json_tree(path);
    } else if (ext == ".toml") {
        tree = load_toml_file(path);
    } else {
        throw OptionsError(
            "Unsupported options file type: " + ext + " (expected .json or .toml)"
        );
    }

    CodecOptions options;
    apply_options(options, tree, path);
    return options;
}

} // namespace mpjson
