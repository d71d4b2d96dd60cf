#include <cxxopts.hpp>
#include <fstream>
#include <iostream>
#include <sstream>
#include "mpjson/Codec.hpp"
#include "mpjson/Errors.hpp"
#include "mpjson/Json.hpp"
#include "mpjson/Options.hpp"
#include "mpjson/Util.hpp"

using namespace mpjson;

namespace {

std::string read_input(const std::string& path) {
    if (path == "-") {
        std::ostringstream ss;
        ss << std::cin.rdbuf();
        if (std::cin.bad()) throw IoError("Failed to read standard input");
        return ss.str();
    }
    return read_file(path);
}

// Writes to --out when given, otherwise to stdout.
void write_output(const std::string& out, const std::string& data) {
    if (out.empty()) {
        std::cout.write(data.data(), static_cast<std::streamsize>(data.size()));
        std::cout.flush();
        if (!std::cout) throw IoError("Failed to write standard output");
        return;
    }
    std::ofstream ofs(out, std::ios::binary);
    if (!ofs) throw IoError("Cannot write to " + out);
    Sink sink(ofs);
    sink.write(data.data(), data.size());
    sink.flush();
}

} // anonymous namespace

int main(int argc, char** argv) {
    try {
        cxxopts::Options options("mpjson", "Convert JSON documents to MessagePack and back");
        options.positional_help("COMMAND INPUT");

        options.add_options()
            ("o,out", "Write output to FILE instead of stdout", cxxopts::value<std::string>()->default_value(""))
            ("l,list", "Treat input as a sequence of values")
            ("indent", "JSON indent for decode (-1 = compact)", cxxopts::value<int>()->default_value("2"))
            ("options", "Path to JSON/TOML codec options file", cxxopts::value<std::string>())
            ("cache-strings", "Comma-separated strings to share while decoding", cxxopts::value<std::string>()->default_value(""))
            ("max-depth", "Maximum container nesting (0 = unbounded)", cxxopts::value<std::size_t>())
            ("v,verbose", "Print a summary to stderr")
            ("h,help", "Show help");

        // Command + input captured as positional strings
        options.add_options()
            ("command", "Subcommand", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"command"});

        auto result = options.parse(argc, argv);
        if (result.count("help") || !result.count("command")) {
            std::cout << options.help() << "\n";
            std::cout << "Commands: encode INPUT.json | decode INPUT.msgpack   (INPUT may be '-' for stdin)\n";
            return 0;
        }

        auto cmdv = result["command"].as<std::vector<std::string>>();
        if (cmdv.size() < 2) {
            std::cerr << "Error: insufficient arguments for command '" << cmdv[0] << "'\n";
            return 1;
        }
        const std::string cmd = cmdv[0];
        const std::string input = cmdv[1];
        const std::string out = result["out"].as<std::string>();
        const bool list = result.count("list") > 0;
        const bool verbose = result.count("verbose") > 0;

        // Options file first, flags override it
        CodecOptions codec_options;
        if (result.count("options")) {
            codec_options = load_options_file(result["options"].as<std::string>());
        }
        for (const auto& s : split(result["cache-strings"].as<std::string>(), ',')) {
            codec_options.cached_strings.insert(s);
        }
        if (result.count("max-depth")) {
            codec_options.max_depth = result["max-depth"].as<std::size_t>();
        }
        Codec codec(std::move(codec_options));

        // ENCODE
        if (cmd == "encode") {
            Value doc = parse_json(read_input(input), input);
            Sink sink;
            std::size_t count = 1;
            if (list) {
                if (!doc.is_array()) {
                    std::cerr << "Error: --list expects a JSON array, got " << type_name(doc) << "\n";
                    return 1;
                }
                codec.encode_list(sink, doc.as_array());
                count = doc.size();
            } else {
                codec.encode(sink, doc);
            }
            write_output(out, sink.bytes());
            if (verbose) {
                std::cerr << "Encoded " << count << " value(s) into " << sink.bytes_written() << " bytes\n";
            }
            return 0;
        }

        // DECODE
        if (cmd == "decode") {
            const std::string bytes = read_input(input);
            Value doc;
            std::size_t count = 1;
            if (list) {
                Source source(bytes);
                auto values = codec.decode_list(source);
                count = values.size();
                doc = values.empty() ? Value::empty_array() : Value::array(std::move(values));
            } else {
                doc = codec.from_msgpack(bytes);
            }
            write_output(out, dump_json(doc, result["indent"].as<int>()) + "\n");
            if (verbose) {
                std::cerr << "Decoded " << count << " value(s) from " << bytes.size() << " bytes\n";
            }
            return 0;
        }

        std::cerr << "Unknown command: " << cmd << "\n";
        return 1;

    } catch (const DecodeError& de) {
        std::cerr << "Error: invalid MessagePack input: " << de.what() << "\n";
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
