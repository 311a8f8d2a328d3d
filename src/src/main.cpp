#include <hron/cli_args.h>
#include <hron/hron.h>
#include <hron/json.h>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unistd.h>

#ifndef HRON_VERSION
#define HRON_VERSION "1.0.0"
#endif

namespace {

void print_help() {
    std::cout << "hron - Convert between JSON and HRON, a compact schema-annotated notation\n"
                 "\n"
                 "USAGE:\n"
                 "  hron [options] --encode [<input.json> [<output.hron>]]\n"
                 "  hron [options] --decode [<input.hron> [<output.json>]]\n"
                 "\n"
                 "  With no input file the document is read from stdin.\n"
                 "  With no output file the result is written to stdout.\n"
                 "\n"
                 "OPTIONS:\n"
                 "  -h, --help        Show this help message\n"
                 "  -v, --version     Show program version information\n"
                 "  -e, --encode      Encode a JSON document as HRON\n"
                 "  -d, --decode      Decode a HRON document into JSON\n"
                 "  --indent <n>      Spaces per nesting level (default 2, 0 for one line)\n"
                 "  --color           Colorize HRON written to stdout\n"
                 "  --verbose         Print decode stage diagnostics to stderr\n"
                 "\n"
                 "EXAMPLES:\n"
                 "  cat data.json | hron --encode\n"
                 "  hron --encode data.json data.hron\n"
                 "  cat data.hron | hron --decode\n"
                 "  hron --decode data.hron data.json\n";
}

bool read_input(const std::string& path, std::string& content) {
    if (path.empty()) {
        if (isatty(fileno(stdin))) {
            std::cerr << "error: no input; pipe a document into stdin or pass a file\n";
            return false;
        }
        content.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
        return true;
    }
    std::ifstream in(path);
    if (!in) {
        std::cerr << "error: cannot open file: " << path << "\n";
        return false;
    }
    content.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    return true;
}

}  // namespace

int main(int argc, char** argv) {
    using hron::cli::CliArgs;

    std::unique_ptr<CliArgs> args;
    try {
        args = std::make_unique<CliArgs>(argc, const_cast<const char**>(argv));
    } catch (const std::invalid_argument& e) {
        std::cerr << "error: " << e.what() << "\n";
        std::cerr << "Run 'hron --help' for usage.\n";
        return 2;
    }

    switch (args->getAction()) {
        case CliArgs::Action::HELP:
            print_help();
            return 0;
        case CliArgs::Action::VERSION:
            std::cout << "hron " << HRON_VERSION << "\n";
            return 0;
        case CliArgs::Action::ENCODE:
        case CliArgs::Action::DECODE:
            break;
    }

    std::string content;
    if (not read_input(args->getInputPath(), content)) return 2;

    const bool to_stdout = args->getOutputPath().empty();
    std::string out;
    try {
        if (args->getAction() == CliArgs::Action::ENCODE) {
            hron::StringifyOptions options;
            options.indent = args->getIndent();
            options.colorize = args->colorize() and to_stdout;
            out = hron::stringify(hron::parse_json(content), options);
        } else {
            hron::ParseOptions options;
            options.verbose = args->verbose();
            out = hron::dump_json(hron::parse(content, options), args->getIndent());
        }
    } catch (const hron::Error& e) {
        std::cerr << "error [" << hron::error_kind_name(e.kind) << "]: " << e.what() << "\n";
        return 1;
    } catch (const hron::JsonParseError& e) {
        std::cerr << "json parse error: " << e.what() << "\n";
        return 1;
    }

    if (to_stdout) {
        std::cout << out << "\n";
        return 0;
    }
    std::ofstream out_file(args->getOutputPath());
    if (!out_file) {
        std::cerr << "error: cannot open output: " << args->getOutputPath() << "\n";
        return 2;
    }
    out_file << out << "\n";
    if (args->verbose()) std::cerr << "[hron] wrote " << args->getOutputPath() << "\n";
    return 0;
}
