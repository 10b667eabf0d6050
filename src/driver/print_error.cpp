#include "driver/Driver.h"
#include "analysis/Diagnostic.h"
#include <cstring>
#include <string>
#include <string_view>

#include <unistd.h>

namespace pyjudge::driver {
    static void write_str(const std::string_view strView) {
        std::size_t done = 0;
        while (done < strView.size()) {
            const ssize_t n = ::write(STDERR_FILENO, strView.data() + done, strView.size() - done);
            if (n <= 0) { return; }
            done += static_cast<std::size_t>(n);
        }
    }

    static void write_int(const int value) {
        write_str(std::to_string(value));
    }

    // ANSI fragments
    static constexpr std::string_view kRed = "\033[31m";
    static constexpr std::string_view kBold = "\033[1m";
    static constexpr std::string_view kReset = "\033[0m";

    static void print_header(const analysis::Diagnostic &diag, const bool color) {
        if (diag.file.empty()) { return; }
        if (color) { write_str(kBold); }
        write_str(diag.file);
        write_str(":");
        write_int(diag.line);
        write_str(":");
        write_int(diag.col);
        write_str(": ");
        if (color) { write_str(kReset); }
    }

    static void print_label(const bool color) {
        if (color) {
            write_str(kRed);
            write_str("error: ");
            write_str(kReset);
        } else { write_str("error: "); }
    }

    // Source line from the submission text; lines split on '\n' with '\r' dropped.
    static bool find_line(const std::string &source, const int lineNo, std::string_view &line) {
        std::size_t start = 0;
        for (int cur = 1; cur < lineNo; ++cur) {
            const auto nl = source.find('\n', start);
            if (nl == std::string::npos) { return false; }
            start = nl + 1;
        }
        if (start > source.size()) { return false; }
        auto end = source.find('\n', start);
        if (end == std::string::npos) { end = source.size(); }
        line = std::string_view(source).substr(start, end - start);
        if (!line.empty() && line.back() == '\r') { line.remove_suffix(1); }
        return true;
    }

    static void print_source_with_caret(const analysis::Diagnostic &diag, const std::string &source) {
        if (diag.line <= 0 || diag.col <= 0) { return; }
        std::string_view lineStr;
        if (!find_line(source, diag.line, lineStr)) { return; }
        write_str("  ");
        write_str(lineStr);
        write_str("\n");
        write_str("  ");
        for (int i = 1; i < diag.col; ++i) {
            // keep tabs so the caret lines up under tab-indented code
            const auto idx = static_cast<std::size_t>(i - 1);
            write_str(idx < lineStr.size() && lineStr[idx] == '\t' ? "\t" : " ");
        }
        write_str("^\n");
    }

    /***
     * Name: pyjudge::driver::Driver::print_error
     * Purpose: Compiler-style "file:line:col: error: msg" with the source line and a caret.
     */
    void Driver::print_error(const analysis::Diagnostic &diag, const std::string &source, const bool color) {
        print_header(diag, color);
        print_label(color);
        write_str(diag.message);
        write_str("\n");
        print_source_with_caret(diag, source);
    }
} // namespace pyjudge::driver
