#include "tile_config/class_loader.hpp"

#include <dlfcn.h>

#include <algorithm>
#include <cctype>
#include <string_view>
#include <tuple>
#include <utility>

#include <fmt/format.h>

#include "tile_config/errors.hpp"
#include "tile_config/logging.hpp"

namespace tile_config {

namespace {

struct SpecifierParts final {
    std::string module{};
    std::string symbol{};
};

[[noreturn]] void fail_import(const std::string& specifier, const std::string& reason) {
    throw ConfigurationError(fmt::format("Tried to import {}, but: {}", specifier, reason));
}

bool is_identifier(const std::string& text) {
    if (text.empty()) {
        return false;
    }
    const auto first = static_cast<unsigned char>(text.front());
    if (std::isalpha(first) == 0 && text.front() != '_') {
        return false;
    }
    return std::all_of(text.begin(), text.end(), [](char value) {
        return std::isalnum(static_cast<unsigned char>(value)) != 0 || value == '_';
    });
}

SpecifierParts split_specifier(const std::string& specifier) {
    SpecifierParts parts{};
    const std::size_t colon = specifier.find(':');
    if (colon != std::string::npos) {
        parts.module = specifier.substr(0, colon);
        parts.symbol = specifier.substr(colon + 1);
    } else {
        // Legacy dotted form: everything before the last dot is the module.
        const std::size_t dot = specifier.rfind('.');
        if (dot == std::string::npos) {
            fail_import(specifier, "no module named in specifier");
        }
        parts.module = specifier.substr(0, dot);
        parts.symbol = specifier.substr(dot + 1);
    }
    if (parts.module.empty()) {
        fail_import(specifier, "no module named in specifier");
    }
    if (!is_identifier(parts.symbol)) {
        fail_import(specifier, fmt::format("\"{}\" is not a valid symbol name", parts.symbol));
    }
    return parts;
}

bool names_file(const std::string& module) {
    constexpr std::string_view k_suffix{".so"};
    const bool has_suffix = module.size() > k_suffix.size()
        && module.compare(module.size() - k_suffix.size(), k_suffix.size(), k_suffix) == 0;
    return has_suffix || module.find('/') != std::string::npos;
}

std::string library_file_name(const std::string& module) {
    std::string file_name{module};
    std::replace(file_name.begin(), file_name.end(), '.', '_');
    return "lib" + file_name + ".so";
}

}  // namespace

void ClassLoader::LibraryCloser::operator()(void* handle) const noexcept {
    if (handle != nullptr) {
        dlclose(handle);
    }
}

ClassLoader& ClassLoader::instance() {
    static ClassLoader shared_loader{};
    return shared_loader;
}

void ClassLoader::add_search_directory(std::filesystem::path directory) {
    std::scoped_lock lock(mutex_);
    if (std::find(list_search_directories_.begin(), list_search_directories_.end(), directory)
        != list_search_directories_.end()) {
        return;
    }
    list_search_directories_.push_back(std::move(directory));
}

ResolvedSymbol ClassLoader::resolve(const std::string& specifier) {
    std::unique_lock lock(mutex_);
    if (const auto iter_symbol = map_symbols_.find(specifier); iter_symbol != map_symbols_.end()) {
        return iter_symbol->second;
    }

    SpecifierParts parts = split_specifier(specifier);
    auto iter_module = map_modules_.find(parts.module);
    if (iter_module == map_modules_.end()) {
        const std::filesystem::path path_library = locate_library(parts.module);

        // Plugin initializers run inside dlopen and may resolve symbols themselves.
        lock.unlock();
        LibraryHandle handle = open_library(specifier, path_library);
        lock.lock();

        bool inserted = false;
        std::tie(iter_module, inserted) = map_modules_.try_emplace(parts.module, std::move(handle));
        if (inserted) {
            get_logger()->info("Loaded plugin module {} from {}", parts.module, path_library.string());
        }
    }

    dlerror();
    void* address = dlsym(iter_module->second.get(), parts.symbol.c_str());
    if (const char* error = dlerror(); error != nullptr) {
        fail_import(specifier, error);
    }
    if (address == nullptr) {
        fail_import(specifier, fmt::format("{} in {} came up null", parts.symbol, parts.module));
    }

    ResolvedSymbol resolved{specifier, std::move(parts.module), std::move(parts.symbol), address};
    const auto [iter_symbol, inserted] = map_symbols_.emplace(specifier, std::move(resolved));
    if (inserted) {
        get_logger()->debug("Resolved {} from module {}", specifier, iter_symbol->second.module);
    }
    return iter_symbol->second;
}

std::size_t ClassLoader::size() const {
    std::scoped_lock lock(mutex_);
    return map_symbols_.size();
}

std::size_t ClassLoader::module_count() const {
    std::scoped_lock lock(mutex_);
    return map_modules_.size();
}

ClassLoader::LibraryHandle ClassLoader::open_library(const std::string& specifier, const std::filesystem::path& path_library) {
    dlerror();
    LibraryHandle handle{dlopen(path_library.c_str(), RTLD_NOW | RTLD_LOCAL)};
    if (!handle) {
        const char* error = dlerror();
        fail_import(specifier, error != nullptr ? error : fmt::format("unable to load {}", path_library.string()));
    }
    return handle;
}

std::filesystem::path ClassLoader::locate_library(const std::string& module) const {
    if (names_file(module)) {
        return std::filesystem::path{module};
    }
    const std::string file_name = library_file_name(module);
    for (const auto& directory : list_search_directories_) {
        std::error_code error_exists;
        const std::filesystem::path candidate = directory / file_name;
        if (std::filesystem::exists(candidate, error_exists)) {
            return candidate;
        }
    }
    // Left to the system loader's search path.
    return std::filesystem::path{file_name};
}

ResolvedSymbol load_class_path(const std::string& specifier) {
    return ClassLoader::instance().resolve(specifier);
}

}  // namespace tile_config
