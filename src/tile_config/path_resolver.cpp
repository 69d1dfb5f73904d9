#include "tile_config/path_resolver.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>

#include <fmt/format.h>

#include "tile_config/errors.hpp"

namespace tile_config {

namespace {

bool is_scheme_char(char value) {
    const auto character = static_cast<unsigned char>(value);
    return std::isalnum(character) != 0 || value == '+' || value == '-' || value == '.';
}

bool starts_with(std::string_view text, std::string_view prefix) {
    return text.substr(0, prefix.size()) == prefix;
}

void drop_last_segment(std::string& output) {
    const std::size_t slash = output.rfind('/');
    if (slash == std::string::npos) {
        output.clear();
    } else {
        output.erase(slash);
    }
}

// RFC 3986 section 5.2.4.
std::string remove_dot_segments(std::string_view path) {
    std::string input{path};
    std::string output{};
    while (!input.empty()) {
        if (starts_with(input, "../")) {
            input.erase(0, 3);
        } else if (starts_with(input, "./")) {
            input.erase(0, 2);
        } else if (starts_with(input, "/./")) {
            input.erase(0, 2);
        } else if (input == "/.") {
            input = "/";
        } else if (starts_with(input, "/../")) {
            input.erase(0, 3);
            drop_last_segment(output);
        } else if (input == "/..") {
            input = "/";
            drop_last_segment(output);
        } else if (input == "." || input == "..") {
            input.clear();
        } else {
            const std::size_t next_slash = input.find('/', input.front() == '/' ? 1 : 0);
            const std::size_t length = next_slash == std::string::npos ? input.size() : next_slash;
            output.append(input, 0, length);
            input.erase(0, length);
        }
    }
    return output;
}

std::string merge_paths(const ParsedUrl& base, std::string_view reference_path) {
    if (!base.netloc.empty() && base.path.empty()) {
        return "/" + std::string{reference_path};
    }
    const std::size_t slash = base.path.rfind('/');
    if (slash == std::string::npos) {
        return std::string{reference_path};
    }
    return base.path.substr(0, slash + 1) + std::string{reference_path};
}

std::string compose(const ParsedUrl& url) {
    std::string text{};
    if (!url.scheme.empty()) {
        text += url.scheme + ":";
    }
    if (!url.netloc.empty() || url.scheme == "file") {
        text += "//" + url.netloc;
    }
    text += url.path;
    if (!url.query.empty()) {
        text += "?" + url.query;
    }
    if (!url.fragment.empty()) {
        text += "#" + url.fragment;
    }
    return text;
}

}  // namespace

ParsedUrl parse_url(std::string_view text) {
    ParsedUrl parsed{};
    std::string_view remainder = text;

    const std::size_t colon = remainder.find(':');
    if (colon != std::string_view::npos && colon > 0
        && std::isalpha(static_cast<unsigned char>(remainder.front())) != 0
        && std::all_of(remainder.begin(), remainder.begin() + static_cast<std::ptrdiff_t>(colon), is_scheme_char)) {
        const std::string_view rest = remainder.substr(colon + 1);
        // "host:8080" is a port, not a scheme.
        const bool rest_is_port = !rest.empty()
            && std::all_of(rest.begin(), rest.end(), [](char value) { return std::isdigit(static_cast<unsigned char>(value)) != 0; });
        if (!rest_is_port) {
            parsed.scheme.assign(remainder.substr(0, colon));
            std::transform(parsed.scheme.begin(), parsed.scheme.end(), parsed.scheme.begin(), [](unsigned char value) {
                return static_cast<char>(std::tolower(value));
            });
            remainder = rest;
        }
    }

    if (starts_with(remainder, "//")) {
        remainder.remove_prefix(2);
        const std::size_t netloc_end = remainder.find_first_of("/?#");
        parsed.netloc.assign(remainder.substr(0, netloc_end));
        remainder = netloc_end == std::string_view::npos ? std::string_view{} : remainder.substr(netloc_end);
    }

    const std::size_t hash = remainder.find('#');
    if (hash != std::string_view::npos) {
        parsed.fragment.assign(remainder.substr(hash + 1));
        remainder = remainder.substr(0, hash);
    }

    const std::size_t question = remainder.find('?');
    if (question != std::string_view::npos) {
        parsed.query.assign(remainder.substr(question + 1));
        remainder = remainder.substr(0, question);
    }

    parsed.path.assign(remainder);
    return parsed;
}

std::string url_join(std::string_view base, std::string_view reference) {
    if (base.empty()) {
        return std::string{reference};
    }
    if (reference.empty()) {
        return std::string{base};
    }

    const ParsedUrl parsed_base = parse_url(base);
    const ParsedUrl parsed_reference = parse_url(reference);

    if (!parsed_reference.scheme.empty() && parsed_reference.scheme != parsed_base.scheme) {
        return std::string{reference};
    }

    ParsedUrl target{};
    target.scheme = parsed_base.scheme;
    target.fragment = parsed_reference.fragment;

    if (!parsed_reference.netloc.empty()) {
        target.netloc = parsed_reference.netloc;
        target.path = remove_dot_segments(parsed_reference.path);
        target.query = parsed_reference.query;
        return compose(target);
    }

    target.netloc = parsed_base.netloc;
    if (parsed_reference.path.empty()) {
        target.path = parsed_base.path;
        target.query = parsed_reference.query.empty() ? parsed_base.query : parsed_reference.query;
    } else if (parsed_reference.path.front() == '/') {
        target.path = remove_dot_segments(parsed_reference.path);
        target.query = parsed_reference.query;
    } else {
        target.path = remove_dot_segments(merge_paths(parsed_base, parsed_reference.path));
        target.query = parsed_reference.query;
    }
    return compose(target);
}

std::string enforced_local_path(std::string_view relpath, std::string_view dirpath, std::string_view context) {
    const ParsedUrl parsed_dir = parse_url(dirpath);
    const ParsedUrl parsed_rel = parse_url(relpath);

    if (!parsed_rel.scheme.empty() && parsed_rel.scheme != "file") {
        throw ConfigurationError(fmt::format(
            R"({} path must be a local file path, absolute or "file://", not "{}".)", context, relpath
        ));
    }

    if (!parsed_dir.scheme.empty() && parsed_dir.scheme != "file" && parsed_rel.scheme != "file") {
        throw ConfigurationError(fmt::format(
            R"({} path must start with "file://" in a remote configuration ("{}" relative to {}))",
            context,
            relpath,
            dirpath
        ));
    }

    if (parsed_rel.scheme == "file") {
        return parsed_rel.path;
    }

    if (parsed_dir.scheme == "file") {
        return url_join(parsed_dir.path, parsed_rel.path);
    }

    return (std::filesystem::path{std::string{dirpath}} / std::string{relpath}).string();
}

}  // namespace tile_config
