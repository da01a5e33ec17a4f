#include "dependency.hpp"
#include "exception.hpp"
#include "localization.hpp"

std::optional<std::string> format_dependency(const std::string& name, const std::string& version, std::uint32_t flags) {
    if (name.starts_with(RPMLIB_PREFIX)) {
        return std::nullopt;
    }
    if (version.empty()) {
        return name;
    }

    const std::uint32_t sense = flags & (DEP_LESS | DEP_GREATER | DEP_EQUAL);
    if ((sense & DEP_LESS) && (sense & DEP_GREATER)) {
        throw InvalidDependencyError(string_format("error.invalid_dep_flags", name, flags));
    }

    std::string op;
    if (sense == DEP_EQUAL) {
        op = "==";
    } else {
        if (sense & DEP_LESS) op = "<";
        if (sense & DEP_GREATER) op = ">";
        if (sense & DEP_EQUAL) op += "=";
    }
    // A version without an operator carries no constraint
    if (op.empty()) {
        return name;
    }
    return name + "[" + op + " " + version + "]";
}

std::vector<std::string> format_dependency_list(const std::vector<std::string>& names,
                                                const std::vector<std::string>& versions,
                                                const std::vector<std::uint32_t>& flags) {
    if (versions.size() != names.size() || flags.size() != names.size()) {
        throw GenhdlistException(string_format("error.dep_arrays_mismatch", names.size(), versions.size(), flags.size()));
    }
    std::vector<std::string> tokens;
    tokens.reserve(names.size());
    for (size_t i = 0; i < names.size(); ++i) {
        if (auto token = format_dependency(names[i], versions[i], flags[i])) {
            tokens.push_back(std::move(*token));
        }
    }
    return tokens;
}
