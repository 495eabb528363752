#include "sandbox/output_parser.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <sstream>

namespace remex::sandbox {
namespace {

// Scanners below are linear in the line length; captured lines can be as
// long as the whole output cap.

bool IsDigit(char ch) {
    return std::isdigit(static_cast<unsigned char>(ch)) != 0;
}

bool IsPathChar(char ch) {
    return std::isalnum(static_cast<unsigned char>(ch)) != 0 ||
        ch == '_' || ch == '-' || ch == '/' || ch == '.';
}

// Drops ESC[<digits;...><letter> colour sequences.
std::string StripAnsiColours(const std::string& line) {
    if (line.find('\x1b') == std::string::npos) {
        return line;
    }
    std::string out;
    out.reserve(line.size());
    std::size_t i = 0;
    while (i < line.size()) {
        if (line[i] == '\x1b' && i + 1 < line.size() && line[i + 1] == '[') {
            std::size_t j = i + 2;
            while (j < line.size() && (IsDigit(line[j]) || line[j] == ';')) {
                ++j;
            }
            if (j < line.size() && std::isalpha(static_cast<unsigned char>(line[j]))) {
                i = j + 1;
                continue;
            }
        }
        out.push_back(line[i++]);
    }
    return out;
}

// Reads a run of digits at `pos`; returns false when there is none.
bool ReadNumber(const std::string& text, std::size_t& pos, int& value) {
    const auto begin = pos;
    long long number = 0;
    while (pos < text.size() && IsDigit(text[pos])) {
        if (number < 1000000000) {
            number = number * 10 + (text[pos] - '0');
        }
        ++pos;
    }
    if (pos == begin) {
        return false;
    }
    value = static_cast<int>(std::min<long long>(number, 1000000000));
    return true;
}

// "<source>:L:C", "<source>(L,C)" or "<source>:L" after optional whitespace.
std::optional<SourceTag> ParseSourceTag(const std::string& line) {
    static const std::string kSource = "<source>";
    std::size_t pos = 0;
    while (pos < line.size() && std::isspace(static_cast<unsigned char>(line[pos]))) {
        ++pos;
    }
    if (line.compare(pos, kSource.size(), kSource) != 0) {
        return std::nullopt;
    }
    pos += kSource.size();
    if (pos >= line.size() || (line[pos] != ':' && line[pos] != '(')) {
        return std::nullopt;
    }
    ++pos;
    SourceTag tag{};
    if (!ReadNumber(line, pos, tag.line)) {
        return std::nullopt;
    }
    if (pos + 1 < line.size() && (line[pos] == ':' || line[pos] == ',') && IsDigit(line[pos + 1])) {
        ++pos;
        ReadNumber(line, pos, tag.column);
    }
    return tag;
}

// First "at <path>:<line>" in the line.
std::optional<SourceTag> ParseAtFileLine(const std::string& line) {
    static const std::string kAt = "at ";
    auto at = line.find(kAt);
    while (at != std::string::npos) {
        auto pos = at + kAt.size();
        const auto path_begin = pos;
        while (pos < line.size() && IsPathChar(line[pos])) {
            ++pos;
        }
        const auto path_end = pos;
        if (pos < line.size() && line[pos] == ':') {
            ++pos;
            SourceTag tag{};
            if (ReadNumber(line, pos, tag.line)) {
                tag.file = line.substr(path_begin, path_end - path_begin);
                return tag;
            }
        }
        at = line.find(kAt, at + 1);
    }
    return std::nullopt;
}

bool HasOption(const std::vector<LineParseOption>& options, LineParseOption option) {
    return std::find(options.begin(), options.end(), option) != options.end();
}

}  // namespace

std::vector<OutputLine> ParseOutput(const std::string& text, const std::vector<LineParseOption>& options) {
    std::vector<OutputLine> result;
    if (text.empty()) {
        return result;
    }
    const bool at_file_line = HasOption(options, LineParseOption::kAtFileLine);

    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        OutputLine output{};
        output.text = line;

        const auto filtered = StripAnsiColours(line);
        output.tag = ParseSourceTag(filtered);
        if (!output.tag && at_file_line) {
            output.tag = ParseAtFileLine(filtered);
        }
        result.push_back(std::move(output));
    }
    return result;
}

std::vector<std::string> SplitArguments(const std::string& text) {
    std::vector<std::string> args;
    std::string current;
    bool in_token = false;
    char quote = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        const char ch = text[i];
        if (quote == '\'') {
            if (ch == '\'') {
                quote = 0;
            } else {
                current.push_back(ch);
            }
            continue;
        }
        if (ch == '\\' && i + 1 < text.size() && (quote == 0 || text[i + 1] == '"' || text[i + 1] == '\\')) {
            current.push_back(text[++i]);
            in_token = true;
            continue;
        }
        if (quote == '"') {
            if (ch == '"') {
                quote = 0;
            } else {
                current.push_back(ch);
            }
            continue;
        }
        if (ch == '"' || ch == '\'') {
            quote = ch;
            in_token = true;
            continue;
        }
        if (std::isspace(static_cast<unsigned char>(ch))) {
            if (in_token) {
                args.push_back(current);
                current.clear();
                in_token = false;
            }
            continue;
        }
        current.push_back(ch);
        in_token = true;
    }
    if (in_token) {
        args.push_back(current);
    }
    return args;
}

std::vector<std::string> ResolveArgs(const queue::ExecutionParams& params) {
    if (const auto* text = std::get_if<std::string>(&params.args)) {
        return SplitArguments(*text);
    }
    return std::get<std::vector<std::string>>(params.args);
}

}  // namespace remex::sandbox
