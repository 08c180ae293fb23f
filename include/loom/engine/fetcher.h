#pragma once

#include <string>

namespace loom::engine {

struct FetchResponse {
    bool ok = false;
    int status = 0;
    std::string content_type;
    std::string body;
    std::string url;    // final URL, the base for resources of this response
    std::string error;
};

// Supplies bytes for pages and stylesheets. Called on the pipeline worker
// thread; relative references are resolved against base_url here.
class Fetcher {
public:
    virtual ~Fetcher() = default;
    virtual FetchResponse fetch(const std::string& url, const std::string& base_url) = 0;
};

// Serves local files, addressed by path or file:// URL.
class FileFetcher : public Fetcher {
public:
    FetchResponse fetch(const std::string& url, const std::string& base_url) override;
};

bool is_file_url(const std::string& value);

// True when value starts with a URL scheme ("http:", "data:", ...). Single
// letters are taken as drive names, not schemes.
bool has_scheme(const std::string& value);

bool file_url_to_path(const std::string& file_url, std::string& path, std::string& err);
std::string path_to_file_url(const std::string& path);

// Content type by file extension; empty when unknown.
std::string content_type_for_path(const std::string& path);

// Resolves a reference against a base (file URL or path) to an absolute,
// normalized path.
bool resolve_file_reference(const std::string& ref, const std::string& base,
                            std::string& path, std::string& err);

}  // namespace loom::engine
