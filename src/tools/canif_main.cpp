#include <canif/canif.hpp>

#include <charconv>
#include <cstdio>
#include <iostream>
#include <iterator>
#include <string>
#include <string_view>

namespace {

    struct CliOptions {
        canif::PrinterOptions printer {};
        bool indent_given = false;
        bool flatten = false;
        bool json_output = false;
        bool single_document = false;
    };

    void print_usage(const char* argv0) {
        std::fprintf(stderr, "\nusage: %s [-i N | -f] [-j] [-T] [--single-document] [--ensure-ascii] < input\n", argv0);
        std::fprintf(stderr, "\nPretty-print JSON and JSON-ish data read from stdin.\n\n");
        std::fprintf(stderr, "  -i, --indent N              indent each level by N spaces (0 means flat, single-line output)\n");
        std::fprintf(stderr, "  -f, --flatten               flatten output (equivalent to -i 0)\n");
        std::fprintf(stderr, "  -j, --json-output           convert data to valid JSON if it wasn't already (e.g. None becomes null)\n");
        std::fprintf(stderr, "  -T, --no-trailing-commas    don't insert trailing commas after the last item in a sequence\n");
        std::fprintf(stderr, "      --single-document       the input must hold exactly one document\n");
        std::fprintf(stderr, "      --ensure-ascii          escape non-ASCII characters in JSON output\n");
        std::fprintf(stderr, "\n");
    }

    bool parse_indent(const std::string_view text, std::uint32_t& out) {
        const auto [p, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
        return ec == std::errc {} && p == text.data() + text.size();
    }

    // Returns false on a usage error.
    bool parse_command_line(const int argc, char** argv, CliOptions& opt) {
        for (int i = 1; i < argc; i++) {
            const std::string_view arg = argv[i];

            if (arg == "-i" || arg == "--indent") {
                if (i + 1 >= argc || !parse_indent(argv[++i], opt.printer.indent))
                    return false;
                opt.indent_given = true;
            } else if (arg.starts_with("--indent=")) {
                if (!parse_indent(arg.substr(9), opt.printer.indent))
                    return false;
                opt.indent_given = true;
            } else if (arg == "-f" || arg == "--flatten") {
                opt.flatten = true;
            } else if (arg == "-j" || arg == "--json-output") {
                opt.json_output = true;
            } else if (arg == "-T" || arg == "--no-trailing-commas") {
                opt.printer.trailing_commas = false;
            } else if (arg == "--single-document") {
                opt.single_document = true;
            } else if (arg == "--ensure-ascii") {
                opt.printer.ensure_ascii = true;
            } else {
                std::fprintf(stderr, "canif: unrecognized argument: %s\n", argv[i]);
                return false;
            }
        }

        if (opt.indent_given && opt.flatten) {
            std::fprintf(stderr, "canif: -f/--flatten not allowed with -i/--indent\n");
            return false;
        }
        if (opt.flatten)
            opt.printer.indent = 0;
        return true;
    }

    template <class Printer>
    canif::ParseError run(const std::string_view text, const CliOptions& opt) {
        Printer printer(canif::StreamSink {&std::cout}, opt.printer);
        auto err = canif::translate(printer, text, opt.single_document);
        if (!printer.finish())
            err.set(canif::ErrorCode::WriterFailed, text.size(), "failed to write to stdout");
        return err;
    }

} // namespace

int main(int argc, char** argv) {
    CliOptions opt {};
    if (!parse_command_line(argc, argv, opt)) {
        print_usage(argv[0]);
        return 2;
    }

    std::ios::sync_with_stdio(false);
    const std::string text {std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>()};

    const auto err = opt.json_output ? run<canif::JsonPrinter<canif::StreamSink>>(text, opt) : run<canif::VerbatimPrinter<canif::StreamSink>>(text, opt);

    if (!err.ok()) {
        std::cerr << "ParserError: " << err.to_string() << "\n";
        if (err.code != canif::ErrorCode::WriterFailed)
            std::cerr << canif::format_error(text, err);
        return 1;
    }
    return 0;
}
