#include "ast/term_printer.hpp"
#include "common/config.hpp"
#include "common/diagnostic.hpp"
#include "common/utf8.hpp"
#include "decode/structured_token.hpp"
#include "lexer/lexer.hpp"
#include "parser/parser.hpp"
#include "report/normalizer.hpp"
#include "report/session.hpp"
#include "report/warning.hpp"

#include <fmt/format.h>

#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <variant>
#include <vector>

namespace {

void print_usage(std::string_view program) {
    fmt::print("Usage: {} [options] <command> [arguments]\n", program);
    fmt::print("\nCommands:\n");
    fmt::print("  parse-error <line> <file> <prefix> <token> [<suffix>]\n");
    fmt::print("                  Normalize a parser failure and report it\n");
    fmt::print("  compile-error <line> <file> <message>\n");
    fmt::print("                  Report a compile error\n");
    fmt::print("  warn [<line> <file>] <text>\n");
    fmt::print("                  Report a warning\n");
    fmt::print("  decode <token>  Decode a serialized token and print it\n");
    fmt::print("\nA <line> of 'none' means no specific line.\n");
    fmt::print("\nOptions:\n");
    fmt::print("  --help          Show this help message\n");
    fmt::print("  --version       Show version information\n");
    fmt::print("  --ansi          Color the warning prefix\n");
    fmt::print("  --no-ansi       Do not color the warning prefix (default)\n");
    fmt::print("  --dump-tokens   Dump lexer tokens before decoding\n");
}

void print_version() {
    fmt::print("parsediag 0.3.0\n");
    fmt::print("Compiler front-end diagnostic reporter\n");
}

/// Parse a line argument. "none" is the absent line.
bool parse_line(std::string_view text, std::optional<uint32_t>& line) {
    if (text == "none") {
        line = std::nullopt;
        return true;
    }
    uint32_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        fmt::print(stderr, "error: invalid line '{}'\n", text);
        return false;
    }
    line = value;
    return true;
}

int dump_tokens(std::string_view text) {
    parsediag::Lexer lexer(text);
    auto tokens = lexer.tokenize_all();
    if (!tokens) {
        fmt::print(stderr, "error: {}\n", tokens.error());
        return 1;
    }
    for (const auto& tok : tokens.value()) {
        fmt::print("{:>4} {:10s} '{}'\n", tok.offset + 1,
                   parsediag::token_kind_to_string(tok.kind), tok.text);
    }
    return 0;
}

int run_decode(std::string_view text) {
    auto decoded = parsediag::parse_term_text(text);
    if (!decoded) {
        fmt::print(stderr, "error: {}\n", decoded.error());
        return 1;
    }
    fmt::print("{}\n", parsediag::ast::term_to_string(decoded.value()));

    auto token = parsediag::decode_structured_token(text);
    if (!token) {
        fmt::print("not a structured token: {}\n", token.error());
        return 0;
    }
    if (const auto* sigil = std::get_if<parsediag::SigilToken>(&token.value())) {
        std::string letter;
        parsediag::append_utf8(letter, sigil->sigil);
        fmt::print("sigil ~{} content '{}'\n", letter, sigil->content.value_or(""));
    } else if (const auto* alias = std::get_if<parsediag::AliasToken>(&token.value())) {
        fmt::print("alias {}\n", alias->name);
    } else {
        fmt::print("list of {}\n", std::get<parsediag::ListToken>(token.value()).elements.size());
    }
    return 0;
}

int run_command(const std::vector<std::string_view>& args, bool show_tokens) {
    std::string_view command = args[0];

    if (command == "decode" && args.size() == 2) {
        if (show_tokens && dump_tokens(args[1]) != 0) {
            return 1;
        }
        return run_decode(args[1]);
    }

    if (command == "parse-error" && (args.size() == 5 || args.size() == 6)) {
        std::optional<uint32_t> line;
        if (!parse_line(args[1], line)) return 1;
        auto prefix = args.size() == 6
                          ? parsediag::ErrorPrefix::wrapping(std::string(args[3]),
                                                             std::string(args[5]))
                          : parsediag::ErrorPrefix::plain(std::string(args[3]));
        parsediag::parse_error(line, args[2], prefix, args[4]);
    }

    if (command == "compile-error" && args.size() == 4) {
        std::optional<uint32_t> line;
        if (!parse_line(args[1], line)) return 1;
        parsediag::LocationMeta meta;
        meta.line = line;
        parsediag::compile_error(meta, args[2], args[3]);
    }

    if (command == "warn" && args.size() == 2) {
        parsediag::warn(args[1]);
        return 0;
    }

    if (command == "warn" && args.size() == 4) {
        std::optional<uint32_t> line;
        if (!parse_line(args[1], line)) return 1;
        parsediag::warn(line, args[2], args[3]);
        return 0;
    }

    fmt::print(stderr, "error: unknown command or wrong arguments: '{}'\n", command);
    return 1;
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    parsediag::ReporterConfig config;
    bool show_tokens = false;
    std::vector<std::string_view> args;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (!args.empty()) {
            // Everything after the command is an argument, dashes included
            args.push_back(arg);
        } else if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--version") {
            print_version();
            return 0;
        } else if (arg == "--ansi") {
            config.ansi_enabled = true;
        } else if (arg == "--no-ansi") {
            config.ansi_enabled = false;
        } else if (arg == "--dump-tokens") {
            show_tokens = true;
        } else if (!arg.empty() && arg[0] == '-') {
            fmt::print(stderr, "error: unknown option '{}'\n", arg);
            return 1;
        } else {
            args.push_back(arg);
        }
    }

    if (args.empty()) {
        fmt::print(stderr, "error: no command\n");
        return 1;
    }

    parsediag::configure(config);

    parsediag::WarningCollector collector;
    parsediag::SessionScope scope(collector);

    int rc = 0;
    try {
        rc = run_command(args, show_tokens);
    } catch (const parsediag::DiagnosticError& e) {
        fmt::print(stderr, "{}\n", parsediag::format_diagnostic(e.diagnostic()));
        return 1;
    } catch (const parsediag::TermDecodeError& e) {
        fmt::print(stderr, "internal error: cannot decode token: {}\n", e.what());
        return 2;
    }

    if (collector.warning_count() > 0) {
        fmt::print(stderr, "{} warning(s)\n", collector.warning_count());
    }
    return rc;
}
