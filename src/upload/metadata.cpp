#include "nexus/upload/metadata.hpp"

#include "nexus/core/digest.hpp"

#include <spdlog/spdlog.h>

#include <sstream>

namespace nexus::upload {

namespace {

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = s.find_last_not_of(" \t");
    return s.substr(first, last - first + 1);
}

std::string last_segment(std::string url) {
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    const auto query = url.find('?');
    if (query != std::string::npos) {
        url.erase(query);
    }
    const auto slash = url.find_last_of('/');
    return slash == std::string::npos ? url : url.substr(slash + 1);
}

} // namespace

std::map<std::string, std::string> parse_upload_metadata(const std::string& header) {
    std::map<std::string, std::string> result;
    std::stringstream ss(header);
    std::string pair;

    while (std::getline(ss, pair, ',')) {
        pair = trim(pair);
        if (pair.empty()) {
            continue;
        }

        const auto space = pair.find(' ');
        if (space == std::string::npos) {
            result[pair] = "";
            continue;
        }

        const std::string key = pair.substr(0, space);
        auto value = core::base64_decode(trim(pair.substr(space + 1)));
        if (!value) {
            spdlog::warn("Dropping Upload-Metadata key '{}': value is not valid base64", key);
            continue;
        }
        result[key] = std::move(*value);
    }
    return result;
}

std::string sanitize_filename(const std::string& name, const std::string& fallback) {
    std::string base = name;
    const auto slash = base.find_last_of("/\\");
    if (slash != std::string::npos) {
        base = base.substr(slash + 1);
    }
    base = trim(base);
    if (base.empty() || base == "." || base == "..") {
        return fallback;
    }
    return base;
}

std::string make_fingerprint(const std::string& filename,
                             std::uint64_t size,
                             const std::optional<std::string>& last_modified) {
    std::string fp = filename + "-" + std::to_string(size);
    if (last_modified && !last_modified->empty()) {
        fp += "-" + *last_modified;
    }
    return fp;
}

std::string make_final_fingerprint(const std::string& filename,
                                   std::uint64_t size,
                                   const std::vector<std::string>& part_ids) {
    std::string fp = "final:" + filename + "-" + std::to_string(size) + "-";
    for (std::size_t i = 0; i < part_ids.size(); ++i) {
        if (i > 0) {
            fp += "+";
        }
        fp += part_ids[i];
    }
    return fp;
}

Result<ConcatDirective, Error> parse_concat_header(const std::string& value) {
    ConcatDirective directive;
    const std::string text = trim(value);

    if (text == "partial") {
        directive.partial = true;
        return Ok<ConcatDirective, Error>(directive);
    }

    const std::string prefix = "final;";
    if (text.compare(0, prefix.size(), prefix) != 0) {
        return Fail<ConcatDirective>(ErrorCode::Validation, "unsupported Upload-Concat value: " + text);
    }

    std::stringstream ss(text.substr(prefix.size()));
    std::string url;
    while (ss >> url) {
        auto id = last_segment(url);
        if (id.empty()) {
            return Fail<ConcatDirective>(ErrorCode::Validation, "empty upload reference in Upload-Concat");
        }
        directive.final_parts.push_back(std::move(id));
    }

    if (directive.final_parts.empty()) {
        return Fail<ConcatDirective>(ErrorCode::Validation, "Upload-Concat final lists no uploads");
    }
    return Ok<ConcatDirective, Error>(directive);
}

} // namespace nexus::upload
