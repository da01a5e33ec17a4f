#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <string>
#include <vector>

// Comparison bits of an rpm dependency (RPMSENSE_*). Other bits are ignored.
inline constexpr std::uint32_t DEP_LESS = 1 << 1;
inline constexpr std::uint32_t DEP_GREATER = 1 << 2;
inline constexpr std::uint32_t DEP_EQUAL = 1 << 3;

// Capabilities provided by rpm itself, never written to the synthesis.
inline constexpr std::string_view RPMLIB_PREFIX = "rpmlib(";

// Returns "name", "name[<op> version]", or nullopt for an rpmlib capability.
// Throws InvalidDependencyError when both less and greater are set.
std::optional<std::string> format_dependency(const std::string& name, const std::string& version, std::uint32_t flags);

// Parallel name/version/flags arrays as stored in an rpm header.
std::vector<std::string> format_dependency_list(const std::vector<std::string>& names,
                                                const std::vector<std::string>& versions,
                                                const std::vector<std::uint32_t>& flags);
