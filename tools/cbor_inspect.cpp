#include "cbor_stream/cbor_decoder.h"
#include "cbor_stream/cbor_diagnostic.h"
#include "cbor_stream/cbor_format.h"

#include <cstdio>
#include <fmt/format.h>
#include <fstream>
#include <iostream>
#include <string>
#include <string_view>

using namespace cbor::stream;

namespace {

// One line per top level item, printed as soon as it is complete
template <typename Options> int inspect(std::istream &in) {
    auto dec = make_decoder<Options>(in);

    while (true) {
        auto done = dec.exhausted();
        if (!done) {
            fmt::print(stderr, "error: {}\n", done.error());
            return 1;
        }
        if (*done) {
            return 0;
        }

        fmt::memory_buffer out;
        if (auto item = diagnostic_notation(dec, out); !item) {
            if (out.size() > 0) {
                fmt::print("{}\n", fmt::to_string(out));
            }
            fmt::print(stderr, "error: {}\n", item.error());
            return 1;
        }
        fmt::print("{}\n", fmt::to_string(out));
    }
}

void print_usage(std::string_view program) {
    fmt::print(stderr, "cbor_inspect {}\n", CBOR_STREAM_VERSION);
    fmt::print(stderr, "Usage: {} [--legacy-floats] [file]\n", program);
    fmt::print(stderr, "Prints each CBOR item of the file (or stdin) in diagnostic notation.\n");
}

} // namespace

int main(int argc, char **argv) {
    bool             legacy_floats = false;
    std::string_view path;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg == "--legacy-floats") {
            legacy_floats = true;
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (path.empty()) {
            path = arg;
        } else {
            print_usage(argv[0]);
            return 2;
        }
    }

    std::ifstream file;
    std::istream *in = &std::cin;
    if (!path.empty() && path != "-") {
        file.open(std::string(path), std::ios::binary);
        if (!file) {
            fmt::print(stderr, "Failed to open {}\n", path);
            return 2;
        }
        in = &file;
    }

    return legacy_floats ? inspect<legacy_options>(*in) : inspect<default_options>(*in);
}
