/**
 * @file rhmap_cli.cpp
 * @brief Command-line driver for the ordered robin-hood map
 *
 * Applies a script of map operations to an in-memory table and prints the
 * result of each one:
 * - Point operations (put, get, del)
 * - Ordered scans in both directions
 * - Bucket placement, statistics and invariant checks
 *
 * Usage: rhmap [options] [script]
 */

#include <rhmap/rhmap.hpp>
#include <cctype>
#include <charconv>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

using namespace rhmap;

// Exit codes for consistent error handling
constexpr int EXIT_SUCCESS_CODE = 0;
constexpr int EXIT_ERROR_CODE = 1;
constexpr int EXIT_INVALID_ARGS = 2;
constexpr int EXIT_FILE_ERROR = 3;
constexpr int EXIT_MAP_FULL = 4;

void usage() {
    std::cerr << R"(rhmap - fixed-capacity hash map kept in ascending key order

USAGE:
    rhmap [options] [script]        Read commands from script (default: stdin)

COMMANDS (one per line, '#' starts a comment):
    put <key> <value>               Insert or overwrite a key
    get <key>                       Print the value for a key
    del <key>                       Remove a key and print its value
    bucket <key>                    Print the ideal bucket of a key
    scan                            Print all entries in ascending order
    rscan                           Print all entries in descending order
    stats                           Show table statistics
    check                           Verify table invariants

OPTIONS:
    --capacity <n>                  Nominal capacity, a power of two (default: 1024)
    --overflow <n>                  Extra slots past the capacity (default: derived)
    --hasher prefix32|prefix64      Order-preserving prefix width (default: prefix32)
    --keep-going                    Continue after a failing command

Keys and values may contain \xHH escapes; byte 0xFF is reserved.

EXAMPLES:
    printf 'put apple 1\nput banana 2\nscan\n' | rhmap --capacity 16
    rhmap --capacity 65536 --hasher prefix64 ops.txt
)";
}

struct cli_options {
    map_config cfg{};
    std::string hasher{"prefix32"};
    std::optional<std::string> script;
    bool keep_going{false};
};

std::optional<uint64_t> parse_number(std::string_view text) {
    uint64_t v = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), v);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return v;
}

// Decode \xHH and \\ escapes
std::optional<std::string> unescape(std::string_view text) {
    std::string out;
    out.reserve(text.size());

    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] != '\\') {
            out.push_back(text[i]);
            continue;
        }
        if (i + 1 < text.size() && text[i + 1] == '\\') {
            out.push_back('\\');
            ++i;
            continue;
        }
        if (i + 3 < text.size() && text[i + 1] == 'x') {
            unsigned byte = 0;
            auto first = text.data() + i + 2;
            auto [ptr, ec] = std::from_chars(first, first + 2, byte, 16);
            if (ec != std::errc{} || ptr != first + 2) {
                return std::nullopt;
            }
            out.push_back(static_cast<char>(byte));
            i += 3;
            continue;
        }
        return std::nullopt;
    }
    return out;
}

// Print non-printable bytes as \xHH so output can be fed back as input
std::string escape(std::string_view bytes) {
    std::ostringstream os;
    for (unsigned char c : bytes) {
        if (c == '\\') {
            os << "\\\\";
        } else if (std::isprint(c) && c != ' ') {
            os << static_cast<char>(c);
        } else {
            os << "\\x" << std::hex << std::setw(2) << std::setfill('0')
               << static_cast<unsigned>(c) << std::dec;
        }
    }
    return os.str();
}

int fail(error e) {
    std::cerr << "error: " << error_message(e) << "\n";
    return e == error::map_full ? EXIT_MAP_FULL : EXIT_ERROR_CODE;
}

int bad_usage(std::string_view message) {
    std::cerr << "error: " << message << "\n";
    return EXIT_INVALID_ARGS;
}

template<typename Map>
void print_stats(const Map& map) {
    auto s = map.statistics();
    std::cout << "capacity:          " << s.capacity.value << "\n"
              << "table slots:       " << s.table_slots.value << "\n"
              << "used slots:        " << s.used_slots << "\n"
              << "load factor:       " << std::fixed << std::setprecision(3) << s.load_factor << "\n"
              << "max displacement:  " << s.max_displacement << "\n"
              << "mean displacement: " << s.mean_displacement << "\n";
    std::cout.unsetf(std::ios::floatfield);
}

/**
 * @brief Execute one script line
 * @return process exit code for the line; EXIT_INVALID_ARGS for a malformed command
 */
template<typename Map>
int execute(Map& map, std::string_view line) {
    std::istringstream in{std::string{line}};
    std::string cmd;
    in >> cmd;

    std::string raw_key;

    if (cmd == "put") {
        std::string raw_value;
        if (!(in >> raw_key >> std::ws) || !std::getline(in, raw_value) || raw_value.empty()) {
            return bad_usage("usage: put <key> <value>");
        }
        auto key = unescape(raw_key);
        auto value = unescape(raw_value);
        if (!key || !value) {
            return bad_usage("malformed escape sequence");
        }
        if (auto s = map.put(*key, *value); !s) {
            return fail(s.error());
        }
        std::cout << "OK\n";
        return EXIT_SUCCESS_CODE;
    }

    if (cmd == "get" || cmd == "del" || cmd == "bucket") {
        if (!(in >> raw_key)) {
            return bad_usage("usage: " + cmd + " <key>");
        }
        auto key = unescape(raw_key);
        if (!key) {
            return bad_usage("malformed escape sequence");
        }

        if (cmd == "bucket") {
            if (!is_valid_key(*key)) {
                return fail(error::invalid_key);
            }
            std::cout << map.ideal_bucket(*key).value << "\n";
            return EXIT_SUCCESS_CODE;
        }

        auto report = [&](const auto& r) {
            if (r) {
                std::cout << escape(*r) << "\n";
                return EXIT_SUCCESS_CODE;
            }
            if (r.error() == error::key_not_found) {
                std::cout << "(not found)\n";
                return EXIT_SUCCESS_CODE;
            }
            return fail(r.error());
        };

        if (cmd == "get") {
            return report(map.get(*key));
        }
        return report(map.remove(*key));
    }

    if (cmd == "scan" || cmd == "rscan") {
        auto print = [](const entry_view& e) {
            std::cout << e.index.value << "\t" << escape(e.key) << "\t" << escape(e.value) << "\n";
        };
        if (cmd == "scan") {
            for (const auto& e : map.scan_ascending()) print(e);
        } else {
            for (const auto& e : map.scan_descending()) print(e);
        }
        return EXIT_SUCCESS_CODE;
    }

    if (cmd == "stats") {
        print_stats(map);
        return EXIT_SUCCESS_CODE;
    }

    if (cmd == "check") {
        if (auto s = map.check_invariants(); !s) {
            return fail(s.error());
        }
        std::cout << "OK\n";
        return EXIT_SUCCESS_CODE;
    }

    return bad_usage("unknown command '" + cmd + "'");
}

template<typename Map>
int run(const cli_options& opts, std::istream& in) {
    auto map = Map::create(opts.cfg);
    if (!map) {
        std::cerr << "error: " << error_message(map.error()) << "\n";
        return EXIT_INVALID_ARGS;
    }

    int rc = EXIT_SUCCESS_CODE;
    std::string line;
    size_t line_no = 0;

    while (std::getline(in, line)) {
        ++line_no;
        auto first = line.find_first_not_of(" \t\r");
        if (first == std::string::npos || line[first] == '#') {
            continue;
        }
        if (line.back() == '\r') {
            line.pop_back();
        }

        auto line_rc = execute(*map, std::string_view{line}.substr(first));
        if (line_rc != EXIT_SUCCESS_CODE) {
            std::cerr << "  at line " << line_no << "\n";
            if (rc == EXIT_SUCCESS_CODE) {
                rc = line_rc;
            }
            if (!opts.keep_going) {
                return rc;
            }
        }
    }

    return rc;
}

int main(int argc, char* argv[]) {
    cli_options opts;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            usage();
            return EXIT_SUCCESS_CODE;
        }

        if (arg == "--keep-going") {
            opts.keep_going = true;
            continue;
        }

        if (arg == "--capacity" || arg == "--overflow" || arg == "--hasher") {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " requires a value\n";
                return EXIT_INVALID_ARGS;
            }
            std::string_view val = argv[++i];

            if (arg == "--hasher") {
                if (val != "prefix32" && val != "prefix64") {
                    std::cerr << "Error: unknown hasher '" << val << "'\n";
                    return EXIT_INVALID_ARGS;
                }
                opts.hasher = std::string{val};
                continue;
            }

            auto n = parse_number(val);
            if (!n) {
                std::cerr << "Error: " << arg << " expects a number, got '" << val << "'\n";
                return EXIT_INVALID_ARGS;
            }
            if (arg == "--capacity") {
                opts.cfg.capacity = slot_count{*n};
            } else {
                opts.cfg.overflow = static_cast<std::size_t>(*n);
            }
            continue;
        }

        if (arg.starts_with("--") || opts.script) {
            std::cerr << "Error: unexpected argument '" << arg << "'\n";
            usage();
            return EXIT_INVALID_ARGS;
        }
        opts.script = std::string{arg};
    }

    std::ifstream file;
    if (opts.script) {
        file.open(*opts.script);
        if (!file) {
            std::cerr << "Error: cannot open " << *opts.script << "\n";
            return EXIT_FILE_ERROR;
        }
    }
    std::istream& in = opts.script ? static_cast<std::istream&>(file) : std::cin;

    if (opts.hasher == "prefix64") {
        return run<wide_ordered_map>(opts, in);
    }
    return run<ordered_map>(opts, in);
}
