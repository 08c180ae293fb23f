#include <loom/engine/fetcher.h>

#include <cctype>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace loom::engine {
namespace {

constexpr char kHex[] = "0123456789ABCDEF";

int hex_value(char ch) {
    const char* hit = std::strchr(kHex, std::toupper(static_cast<unsigned char>(ch)));
    return ch != '\0' && hit ? static_cast<int>(hit - kHex) : -1;
}

bool percent_decode(const std::string& input, std::string& output, std::string& err) {
    output.clear();
    output.reserve(input.size());
    std::size_t i = 0;
    while (i < input.size()) {
        if (input[i] != '%') {
            output += input[i++];
            continue;
        }
        const int high = i + 1 < input.size() ? hex_value(input[i + 1]) : -1;
        const int low = i + 2 < input.size() ? hex_value(input[i + 2]) : -1;
        if (high < 0 || low < 0) {
            err = "Malformed %-escape in file URL path";
            return false;
        }
        output += static_cast<char>(high * 16 + low);
        i += 3;
    }
    return true;
}

std::string lowercase(std::string text) {
    for (char& ch : text) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    return text;
}

bool is_unreserved_path_char(char ch) {
    return std::isalnum(static_cast<unsigned char>(ch)) || ch == '-' || ch == '.' ||
           ch == '_' || ch == '~';
}

std::string strip_query_and_fragment(const std::string& value) {
    const std::size_t pos = value.find_first_of("?#");
    return pos == std::string::npos ? value : value.substr(0, pos);
}

}  // namespace

bool has_scheme(const std::string& value) {
    const std::size_t colon = value.find(':');
    if (colon == std::string::npos || colon < 2) {
        return false;
    }
    if (!std::isalpha(static_cast<unsigned char>(value[0]))) {
        return false;
    }
    for (std::size_t i = 1; i < colon; ++i) {
        const char ch = value[i];
        if (!std::isalnum(static_cast<unsigned char>(ch)) && ch != '+' && ch != '-' && ch != '.') {
            return false;
        }
    }
    return true;
}

bool is_file_url(const std::string& value) {
    return value.size() >= 5 && lowercase(value.substr(0, 5)) == "file:";
}

bool file_url_to_path(const std::string& file_url, std::string& path, std::string& err) {
    path.clear();
    err.clear();

    if (!is_file_url(file_url)) {
        err = "URL is not a file URL";
        return false;
    }

    std::string remainder = strip_query_and_fragment(file_url.substr(5));
    std::string raw_path;
    if (remainder.rfind("//", 0) == 0) {
        const std::size_t slash = remainder.find('/', 2);
        const std::string host = remainder.substr(2, slash == std::string::npos
                                                         ? std::string::npos
                                                         : slash - 2);
        if (!host.empty() && host != "localhost") {
            err = "Unsupported file URL host: " + host;
            return false;
        }
        raw_path = slash == std::string::npos ? "/" : remainder.substr(slash);
    } else {
        raw_path = remainder;
    }

    if (raw_path.empty() || raw_path.front() != '/') {
        err = "File URL path must be absolute";
        return false;
    }
    return percent_decode(raw_path, path, err);
}

std::string path_to_file_url(const std::string& path) {
    std::string url = "file://";
    for (const char ch : path) {
        if (is_unreserved_path_char(ch) || ch == '/' || ch == ':') {
            url += ch;
        } else {
            const auto byte = static_cast<unsigned char>(ch);
            url += {'%', kHex[byte >> 4], kHex[byte & 0x0F]};
        }
    }
    return url;
}

std::string content_type_for_path(const std::string& path) {
    const std::string ext = lowercase(std::filesystem::path(path).extension().string());
    if (ext == ".html" || ext == ".htm") return "text/html";
    if (ext == ".xhtml") return "application/xhtml+xml";
    if (ext == ".css") return "text/css";
    if (ext == ".txt") return "text/plain";
    if (ext == ".png") return "image/png";
    if (ext == ".jpg" || ext == ".jpeg") return "image/jpeg";
    if (ext == ".gif") return "image/gif";
    return "";
}

bool resolve_file_reference(const std::string& ref, const std::string& base,
                            std::string& path, std::string& err) {
    path.clear();
    err.clear();

    std::filesystem::path resolved;
    if (is_file_url(ref)) {
        std::string decoded;
        if (!file_url_to_path(ref, decoded, err)) {
            return false;
        }
        resolved = decoded;
    } else if (has_scheme(ref)) {
        err = "Unsupported URL scheme: " + ref;
        return false;
    } else {
        std::string plain_ref;
        if (!percent_decode(strip_query_and_fragment(ref), plain_ref, err)) {
            return false;
        }
        resolved = plain_ref;
        if (resolved.is_relative() && !base.empty()) {
            std::filesystem::path base_path;
            if (is_file_url(base)) {
                std::string decoded;
                if (!file_url_to_path(base, decoded, err)) {
                    return false;
                }
                base_path = decoded;
            } else {
                base_path = base;
            }
            resolved = base_path.parent_path() / resolved;
        }
    }

    if (resolved.is_relative()) {
        std::error_code ec;
        resolved = std::filesystem::absolute(resolved, ec);
        if (ec) {
            err = "Unable to resolve path: " + ec.message();
            return false;
        }
    }
    path = resolved.lexically_normal().generic_string();
    return true;
}

FetchResponse FileFetcher::fetch(const std::string& url, const std::string& base_url) {
    FetchResponse response;

    std::string path;
    std::string err;
    if (!resolve_file_reference(url, base_url, path, err)) {
        response.error = err;
        return response;
    }
    response.url = path_to_file_url(path);

    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        response.status = 404;
        response.error = "File not found: " + path;
        return response;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        response.status = 403;
        response.error = "Unable to open file: " + path;
        return response;
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();

    response.ok = true;
    response.status = 200;
    response.content_type = content_type_for_path(path);
    response.body = buffer.str();
    return response;
}

}  // namespace loom::engine
