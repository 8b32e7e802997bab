/*!
 * \file abi.hpp
 * \brief C++ ABI helpers for readable type names in diagnostics
 * \copyright Copyright (C) The deco authors
 */

#ifndef DECO_META_ABI_HPP
#define DECO_META_ABI_HPP

#include <cstddef>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <typeinfo>
#include <unordered_map>

#ifndef _MSC_VER
#include <cxxabi.h>
#include <dlfcn.h>
#endif

namespace deco::meta {

/*!
 * \brief Configuration options for the ABI utilities
 */
struct AbiConfig {
    static constexpr std::size_t max_cache_size = 1024;
};

/*!
 * \brief Exception class for ABI-related errors
 */
class AbiException : public std::runtime_error {
public:
    explicit AbiException(const std::string& message)
        : std::runtime_error(message) {}
};

/*!
 * \brief Helper class for C++ name demangling
 */
class DemangleHelper {
public:
    /*!
     * \brief Demangle a type at compile time
     * \tparam T The type to demangle
     * \return A human-readable string representation of the type
     */
    template <typename T>
    static auto demangleType() -> std::string {
        return demangleInternal(typeid(T).name());
    }

    /*!
     * \brief Demangle the dynamic type of an instance
     * \tparam T The static type of the instance
     * \param instance An instance of the type
     * \return A human-readable string representation of the dynamic type
     */
    template <typename T>
    static auto demangleType(const T& instance) -> std::string {
        return demangleInternal(typeid(instance).name());
    }

    /*!
     * \brief Demangle a raw symbol or type name
     * \param mangled_name The mangled name to demangle
     * \return The demangled name, or the input when it is not a mangled name
     */
    static auto demangle(std::string_view mangled_name) -> std::string {
        return demangleInternal(mangled_name);
    }

    /*!
     * \brief Name of the function starting at \p address, as a programmer
     * would spell it: no namespace qualification, no parameter list.
     * \return nullopt when the address is not the entry of an exported
     * symbol (internal linkage, or the executable was not linked with
     * -rdynamic)
     */
    static auto functionName(const void* address)
        -> std::optional<std::string> {
#ifdef _MSC_VER
        (void)address;
        return std::nullopt;
#else
        Dl_info info;
        if (address == nullptr || dladdr(address, &info) == 0 ||
            info.dli_sname == nullptr || info.dli_saddr != address) {
            return std::nullopt;
        }
        return unqualifiedName(demangleInternal(info.dli_sname));
#endif
    }

    /*!
     * \brief "ns::Type::run(int) const" becomes "run"; template arguments
     * of the last component are kept and a leading return type (present
     * on function template symbols) is dropped.
     */
    static auto unqualifiedName(std::string_view name) -> std::string {
        while (!name.empty() && name.back() == ' ') {
            name.remove_suffix(1);
        }
        if (name.ends_with(" const")) {
            name.remove_suffix(6);
        }

        // Drop the trailing parameter list.
        if (!name.empty() && name.back() == ')') {
            int depth = 0;
            for (std::size_t i = name.size(); i-- > 0;) {
                if (name[i] == ')') {
                    ++depth;
                } else if (name[i] == '(' && --depth == 0) {
                    name = name.substr(0, i);
                    break;
                }
            }
        }

        // Keep what follows the last top-level "::" or space.
        std::size_t start = 0;
        int depth = 0;
        for (std::size_t i = 0; i + 1 < name.size(); ++i) {
            char c = name[i];
            if (c == '<' || c == '(') {
                ++depth;
            } else if ((c == '>' || c == ')') && depth > 0) {
                --depth;
            } else if (depth == 0 && c == ':' && name[i + 1] == ':') {
                start = i + 2;
                ++i;
            } else if (depth == 0 && c == ' ') {
                start = i + 1;
            }
        }
        return std::string(name.substr(start));
    }

    static void clearCache() {
        std::unique_lock lock(cacheMutex_);
        cache_.clear();
    }

    static std::size_t cacheSize() {
        std::shared_lock lock(cacheMutex_);
        return cache_.size();
    }

private:
    static auto demangleInternal(std::string_view mangled_name)
        -> std::string {
        std::string cacheKey(mangled_name);

        {
            std::shared_lock readLock(cacheMutex_);
            if (auto it = cache_.find(cacheKey); it != cache_.end()) {
                return it->second;
            }
        }

        std::string demangled;

#ifdef _MSC_VER
        // typeid names are already readable with MSVC.
        demangled = cacheKey;
#else
        int status = -1;
        std::unique_ptr<char, void (*)(void*)> demangledName(
            abi::__cxa_demangle(cacheKey.c_str(), nullptr, nullptr, &status),
            std::free);

        if (status == 0 && demangledName) {
            demangled = demangledName.get();
        } else if (status == -1) {
            throw AbiException("Memory allocation failure during demangling");
        } else {
            demangled = cacheKey;
        }
#endif

        std::unique_lock writeLock(cacheMutex_);
        if (cache_.size() >= AbiConfig::max_cache_size) {
            auto it = cache_.begin();
            std::size_t count = 0;
            const std::size_t limit = AbiConfig::max_cache_size / 2;
            while (count < limit && it != cache_.end()) {
                it = cache_.erase(it);
                ++count;
            }
        }
        cache_[cacheKey] = demangled;

        return demangled;
    }

    static inline std::unordered_map<std::string, std::string> cache_;
    static inline std::shared_mutex cacheMutex_;
};

}  // namespace deco::meta

#endif  // DECO_META_ABI_HPP
