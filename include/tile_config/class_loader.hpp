// === Class Loader ============================================================
//
// Resolves "module:symbol" (or legacy "module.path.Symbol") specifiers to
// symbols exported by shared libraries. This is how configuration names cache
// and provider backends that are not built into the library: a plugin ships
// as lib<module>.so and exports a C-linkage constructor.
//
// Resolutions are memoized process-wide. Each module is opened once and stays
// loaded for the lifetime of the registry, so a plugin's static
// initialization runs exactly once no matter how often it is named. The
// registry lock is released while a module is being opened, so a plugin's
// initializers may themselves resolve specifiers.

#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace tile_config {

/** @brief A symbol found in a plugin library. */
struct ResolvedSymbol final {
    std::string specifier{};  /**< Specifier as written in configuration. */
    std::string module{};     /**< Module part of the specifier. */
    std::string symbol{};     /**< Exported symbol name. */
    void* address{};          /**< Symbol address; never null once resolved. */

    /** @brief Reinterpret the address as a function pointer of type `Function`. */
    template <typename Function>
    [[nodiscard]] Function as() const noexcept {
        return reinterpret_cast<Function>(address);
    }
};

/** @brief Append-only registry of plugin libraries and resolved symbols. */
class ClassLoader final {
  public:
    ClassLoader() = default;
    ~ClassLoader() = default;
    ClassLoader(const ClassLoader&) = delete;
    ClassLoader& operator=(const ClassLoader&) = delete;

    /** @brief Registry shared by every build in the process. */
    static ClassLoader& instance();

    /** @brief Directory searched (in insertion order) before the system loader path. */
    void add_search_directory(std::filesystem::path directory);

    /**
     * @brief Resolve a specifier, loading its module on first use.
     *
     * @throws ConfigurationError when the module cannot be loaded, the symbol
     *         is missing or malformed, or the symbol resolves to null.
     */
    [[nodiscard]] ResolvedSymbol resolve(const std::string& specifier);

    /** @brief Number of memoized specifiers. */
    [[nodiscard]] std::size_t size() const;
    /** @brief Number of loaded modules. */
    [[nodiscard]] std::size_t module_count() const;

  private:
    struct LibraryCloser final {
        void operator()(void* handle) const noexcept;
    };
    using LibraryHandle = std::unique_ptr<void, LibraryCloser>;

    static LibraryHandle open_library(const std::string& specifier, const std::filesystem::path& path_library);
    [[nodiscard]] std::filesystem::path locate_library(const std::string& module) const;

    mutable std::mutex mutex_;
    std::vector<std::filesystem::path> list_search_directories_;
    std::map<std::string, LibraryHandle> map_modules_;
    std::map<std::string, ResolvedSymbol> map_symbols_;
};

/** @brief Resolve `specifier` through the process-wide registry. */
ResolvedSymbol load_class_path(const std::string& specifier);

}  // namespace tile_config
