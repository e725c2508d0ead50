/**
 * @file protocol.cpp
 * @brief Request parsing and response header encoding
 */

#include "rawxfer/core/protocol.h"

#include "rawxfer/core/logging.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <regex>
#include <sstream>
#include <vector>

namespace rawxfer {

namespace {

auto split_tokens(std::string_view text) -> std::vector<std::string_view> {
    std::vector<std::string_view> tokens;
    std::size_t pos = 0;
    while (pos < text.size()) {
        while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) {
            ++pos;
        }
        auto start = pos;
        while (pos < text.size() && !std::isspace(static_cast<unsigned char>(text[pos]))) {
            ++pos;
        }
        if (pos > start) {
            tokens.push_back(text.substr(start, pos - start));
        }
    }
    return tokens;
}

auto parse_size(std::string_view token) -> std::optional<uint64_t> {
    if (!token.empty() && token.front() == '+') {
        token.remove_prefix(1);
    }
    if (token.empty()) {
        return std::nullopt;
    }
    uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), value);
    if (ec != std::errc{} || ptr != token.data() + token.size()) {
        return std::nullopt;
    }
    return value;
}

auto upper(std::string_view text) -> std::string {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

/**
 * @brief Minimal JSON reader for response headers
 *
 * Understands the full value grammar so unknown members can be skipped, but
 * only materializes strings and unsigned integers.
 */
class json_scanner {
public:
    explicit json_scanner(std::string_view text) : text_(text) {}

    void skip_ws() {
        while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_]))) {
            ++pos_;
        }
    }

    auto peek() -> char {
        skip_ws();
        return pos_ < text_.size() ? text_[pos_] : '\0';
    }

    auto consume(char expected) -> bool {
        if (peek() != expected) {
            return false;
        }
        ++pos_;
        return true;
    }

    auto at_end() -> bool {
        skip_ws();
        return pos_ == text_.size();
    }

    auto read_string() -> std::optional<std::string> {
        if (!consume('"')) {
            return std::nullopt;
        }
        std::string out;
        while (pos_ < text_.size()) {
            char c = text_[pos_++];
            if (c == '"') {
                return out;
            }
            if (c != '\\') {
                out += c;
                continue;
            }
            if (pos_ >= text_.size()) {
                return std::nullopt;
            }
            char esc = text_[pos_++];
            switch (esc) {
                case '"': out += '"'; break;
                case '\\': out += '\\'; break;
                case '/': out += '/'; break;
                case 'b': out += '\b'; break;
                case 'f': out += '\f'; break;
                case 'n': out += '\n'; break;
                case 'r': out += '\r'; break;
                case 't': out += '\t'; break;
                case 'u': {
                    auto cp = read_hex4();
                    if (!cp) {
                        return std::nullopt;
                    }
                    uint32_t code = *cp;
                    if (code >= 0xD800 && code <= 0xDBFF &&
                        text_.substr(pos_, 2) == "\\u") {
                        pos_ += 2;
                        auto low = read_hex4();
                        if (!low || *low < 0xDC00 || *low > 0xDFFF) {
                            return std::nullopt;
                        }
                        code = 0x10000 + ((code - 0xD800) << 10) + (*low - 0xDC00);
                    }
                    append_utf8(out, code);
                    break;
                }
                default:
                    return std::nullopt;
            }
        }
        return std::nullopt;
    }

    auto read_unsigned() -> std::optional<uint64_t> {
        skip_ws();
        auto start = pos_;
        while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) {
            ++pos_;
        }
        if (pos_ == start) {
            return std::nullopt;
        }
        // Reject fractions and exponents
        if (pos_ < text_.size() &&
            (text_[pos_] == '.' || text_[pos_] == 'e' || text_[pos_] == 'E')) {
            return std::nullopt;
        }
        uint64_t value = 0;
        auto [ptr, ec] = std::from_chars(text_.data() + start, text_.data() + pos_, value);
        if (ec != std::errc{}) {
            return std::nullopt;
        }
        return value;
    }

    auto skip_value() -> bool {
        char c = peek();
        if (c == '"') {
            return read_string().has_value();
        }
        if (c == '{' || c == '[') {
            char close = c == '{' ? '}' : ']';
            ++pos_;
            if (consume(close)) {
                return true;
            }
            while (true) {
                if (c == '{') {
                    if (!read_string() || !consume(':')) {
                        return false;
                    }
                }
                if (!skip_value()) {
                    return false;
                }
                if (consume(close)) {
                    return true;
                }
                if (!consume(',')) {
                    return false;
                }
            }
        }
        auto start = pos_;
        while (pos_ < text_.size() &&
               (std::isalnum(static_cast<unsigned char>(text_[pos_])) ||
                text_[pos_] == '-' || text_[pos_] == '+' || text_[pos_] == '.')) {
            ++pos_;
        }
        return pos_ > start;
    }

private:
    auto read_hex4() -> std::optional<uint32_t> {
        if (pos_ + 4 > text_.size()) {
            return std::nullopt;
        }
        uint32_t value = 0;
        auto [ptr, ec] = std::from_chars(text_.data() + pos_, text_.data() + pos_ + 4, value, 16);
        if (ec != std::errc{} || ptr != text_.data() + pos_ + 4) {
            return std::nullopt;
        }
        pos_ += 4;
        return value;
    }

    std::string_view text_;
    std::size_t pos_ = 0;
};

auto invalid_response(const std::string& what) -> unexpected {
    return unexpected{error{error_code::invalid_response, what}};
}

auto parse_file_entry(json_scanner& scanner) -> result<file_entry> {
    std::optional<std::string> filename;
    std::optional<uint64_t> filesize;

    if (!scanner.consume('{')) {
        return invalid_response("Response data is not an object");
    }
    if (!scanner.consume('}')) {
        while (true) {
            auto key = scanner.read_string();
            if (!key || !scanner.consume(':')) {
                return invalid_response("Malformed response data object");
            }
            if (*key == "filename") {
                filename = scanner.read_string();
                if (!filename) {
                    return invalid_response("Response filename is not a string");
                }
            } else if (*key == "filesize") {
                filesize = scanner.read_unsigned();
                if (!filesize) {
                    return invalid_response("Response filesize is not a non-negative integer");
                }
            } else if (!scanner.skip_value()) {
                return invalid_response("Malformed response data object");
            }

            if (scanner.consume('}')) {
                break;
            }
            if (!scanner.consume(',')) {
                return invalid_response("Malformed response data object");
            }
        }
    }

    if (!filename || !filesize) {
        return invalid_response("Missing filename or filesize in server response data");
    }
    return file_entry{std::move(*filename), *filesize};
}

}  // namespace

auto is_valid_filename(std::string_view filename) -> bool {
    static const std::regex allowed(R"(^[A-Za-z0-9_.\-]+$)");

    if (filename.empty() || filename == "." || filename.find("..") != std::string_view::npos) {
        return false;
    }
    return std::regex_match(filename.begin(), filename.end(), allowed);
}

auto parse_request(std::string_view header) -> result<request> {
    auto tokens = split_tokens(header);
    if (tokens.size() < 3) {
        return unexpected{error{error_code::malformed_request,
                                wire_message(error_code::malformed_request)}};
    }

    if (!is_valid_filename(tokens[1])) {
        return unexpected{error{error_code::invalid_filename,
                                wire_message(error_code::invalid_filename)}};
    }

    auto size = parse_size(tokens[2]);
    if (!size) {
        return unexpected{error{error_code::invalid_size,
                                wire_message(error_code::invalid_size)}};
    }

    request req;
    auto command = upper(tokens[0]);
    if (command == "UPLOAD") {
        req.command = command_type::upload;
    } else if (command == "GET") {
        req.command = command_type::get;
    } else {
        return unexpected{error{error_code::invalid_command,
                                wire_message(error_code::invalid_command)}};
    }
    req.filename = std::string(tokens[1]);
    req.declared_size = *size;
    return req;
}

auto format_request(command_type command,
                    std::string_view filename,
                    uint64_t declared_size) -> std::string {
    std::string line(to_string(command));
    line += ' ';
    line += filename;
    line += ' ';
    line += std::to_string(declared_size);
    return line;
}

auto wire_message(error_code code) -> std::string {
    switch (code) {
        case error_code::malformed_request:
            return "Invalid command format";
        case error_code::invalid_filename:
            return "Invalid filename";
        case error_code::invalid_size:
            return "Invalid file size";
        case error_code::invalid_command:
            return "Invalid command";
        case error_code::header_too_large:
            return "Request header too large";
        case error_code::file_not_found:
            return "File not found";
        case error_code::size_mismatch:
            return "File size smaller than received data";
        case error_code::incomplete_transfer:
            return "Incomplete file received";
        default:
            return to_string(code);
    }
}

// ============================================================================
// response_header
// ============================================================================

auto response_header::ok_message(std::string text) -> response_header {
    return response_header{response_status::ok, std::move(text), std::nullopt};
}

auto response_header::ok_file(std::string filename, uint64_t filesize) -> response_header {
    return response_header{response_status::ok, {}, file_entry{std::move(filename), filesize}};
}

auto response_header::failure(std::string text) -> response_header {
    return response_header{response_status::error, std::move(text), std::nullopt};
}

auto response_header::to_json() const -> std::string {
    std::ostringstream oss;
    oss << "{\"status\": \"" << rawxfer::to_string(status) << "\", \"data\": ";
    if (file) {
        oss << "{\"filename\": \"" << escape_json_string(file->filename)
            << "\", \"filesize\": " << file->filesize << "}";
    } else {
        oss << "\"" << escape_json_string(message) << "\"";
    }
    oss << "}";
    return oss.str();
}

auto response_header::parse(std::string_view json) -> result<response_header> {
    json_scanner scanner(json);
    if (!scanner.consume('{')) {
        return invalid_response("Response header is not a JSON object");
    }

    std::optional<response_status> status;
    response_header header;
    bool has_data = false;

    if (!scanner.consume('}')) {
        while (true) {
            auto key = scanner.read_string();
            if (!key || !scanner.consume(':')) {
                return invalid_response("Malformed response header");
            }

            if (*key == "status") {
                auto value = scanner.read_string();
                if (!value) {
                    return invalid_response("Response status is not a string");
                }
                if (*value == "OK") {
                    status = response_status::ok;
                } else if (*value == "ERROR") {
                    status = response_status::error;
                } else {
                    return invalid_response("Unknown response status: " + *value);
                }
            } else if (*key == "data") {
                has_data = true;
                if (scanner.peek() == '{') {
                    auto entry = parse_file_entry(scanner);
                    if (!entry) {
                        return unexpected{entry.error()};
                    }
                    header.file = std::move(entry.value());
                } else if (scanner.peek() == '"') {
                    auto value = scanner.read_string();
                    if (!value) {
                        return invalid_response("Malformed response data string");
                    }
                    header.message = std::move(*value);
                } else if (!scanner.skip_value()) {
                    return invalid_response("Malformed response data");
                }
            } else if (!scanner.skip_value()) {
                return invalid_response("Malformed response header");
            }

            if (scanner.consume('}')) {
                break;
            }
            if (!scanner.consume(',')) {
                return invalid_response("Malformed response header");
            }
        }
    }

    if (!scanner.at_end()) {
        return invalid_response("Trailing characters after response header");
    }
    if (!status || !has_data) {
        return invalid_response("Response header needs status and data");
    }

    header.status = *status;
    return header;
}

}  // namespace rawxfer
