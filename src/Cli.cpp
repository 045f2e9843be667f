/**
 * @file Cli.cpp
 * @brief Implementation of the diffx command line
 */

#include "diffx/Cli.hpp"
#include "diffx/Diff.hpp"
#include "diffx/Errors.hpp"
#include "diffx/Loader.hpp"
#include "diffx/Options.hpp"
#include "diffx/Output.hpp"

#include <cxxopts.hpp>

#include <iostream>
#include <string>
#include <vector>

namespace diffx {
namespace cli {

namespace {

cxxopts::Options build_options() {
    cxxopts::Options options("diffx", "Structural diff for JSON, YAML, TOML, INI, XML and CSV");
    options.positional_help("OLD NEW");

    options.add_options()
        ("f,format", "Input format for both files (json, yaml, toml, ini, xml, csv)",
            cxxopts::value<std::string>())
        ("o,output", "Output format (native, json, yaml)", cxxopts::value<std::string>())
        ("epsilon", "Tolerance for numeric comparison", cxxopts::value<double>())
        ("array-id-key", "Match array elements by this key", cxxopts::value<std::string>())
        ("ignore-keys-regex", "Skip object keys matching this regex", cxxopts::value<std::string>())
        ("path", "Only report paths containing this text", cxxopts::value<std::string>())
        ("w,ignore-whitespace", "Ignore whitespace differences in strings")
        ("i,ignore-case", "Ignore case differences in strings")
        ("brief", "Only report whether the inputs differ")
        ("q,quiet", "Print nothing; exit status only")
        ("max-depth", "Maximum traversal depth", cxxopts::value<std::size_t>())
        ("c,config", "Options document (JSON, YAML or TOML)", cxxopts::value<std::string>())
        ("h,help", "Show help")
        ("version", "Show version");

    options.add_options()
        ("files", "Input files", cxxopts::value<std::vector<std::string>>());

    options.parse_positional({"files"});
    return options;
}

/**
 * @brief Collect options given as flags; unset flags stay unset
 */
RawDiffOptions raw_options_from_flags(const cxxopts::ParseResult& result) {
    RawDiffOptions raw;
    if (result.count("output")) raw.output_format = result["output"].as<std::string>();
    if (result.count("epsilon")) raw.epsilon = result["epsilon"].as<double>();
    if (result.count("array-id-key")) raw.array_id_key = result["array-id-key"].as<std::string>();
    if (result.count("ignore-keys-regex")) {
        raw.ignore_keys_regex = result["ignore-keys-regex"].as<std::string>();
    }
    if (result.count("path")) raw.path_filter = result["path"].as<std::string>();
    if (result.count("ignore-whitespace")) raw.ignore_whitespace = true;
    if (result.count("ignore-case")) raw.ignore_case = true;
    if (result.count("brief")) raw.brief_mode = true;
    if (result.count("quiet")) raw.quiet_mode = true;
    if (result.count("max-depth")) raw.max_depth = result["max-depth"].as<std::size_t>();
    return raw;
}

} // anonymous namespace

int run(int argc, char** argv, std::istream& in, std::ostream& out, std::ostream& err) {
    try {
        cxxopts::Options options = build_options();
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            out << options.help() << "\n";
            return kExitSame;
        }
        if (result.count("version")) {
            out << "diffx " << kVersion << "\n";
            return kExitSame;
        }

        std::vector<std::string> files;
        if (result.count("files")) {
            files = result["files"].as<std::vector<std::string>>();
        }
        if (files.size() != 2) {
            err << "Error: expected two input files (OLD NEW)\n";
            err << options.help() << "\n";
            return kExitError;
        }
        const std::string& old_path = files[0];
        const std::string& new_path = files[1];
        if (old_path == kStdinPath && new_path == kStdinPath) {
            err << "Error: standard input can be used for only one side\n";
            return kExitError;
        }

        // Options document first, then flags on top; validate before reading inputs
        RawDiffOptions raw;
        if (result.count("config")) {
            raw = raw_options_from_value(load_document(result["config"].as<std::string>(),
                                                       std::nullopt, in));
        }
        raw = merge_raw_options(raw, raw_options_from_flags(result));
        const DiffOptions diff_options = validate_options(raw);

        std::optional<InputFormat> format;
        if (result.count("format")) {
            format = parse_input_format_name(result["format"].as<std::string>());
        }

        const Value old_doc = load_document(old_path, format, in);
        const Value new_doc = load_document(new_path, format, in);

        const DiffReport report = compare(old_doc, new_doc, diff_options);
        const int status = report.differs ? kExitDifferent : kExitSame;

        if (diff_options.quiet_mode()) {
            return status;
        }
        if (diff_options.brief_mode()) {
            if (report.differs) {
                out << "Files " << old_path << " and " << new_path << " differ\n";
            }
            return status;
        }

        const std::string text = format_output(report.entries, diff_options.output_format());
        out << text;
        if (!text.empty() && text.back() != '\n') {
            out << "\n";
        }
        return status;

    } catch (const std::exception& ex) {
        err << "Error: " << ex.what() << "\n";
        return kExitError;
    }
}

} // namespace cli
} // namespace diffx
