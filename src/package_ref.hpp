#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

struct PackageReference {
    std::string name;                   // lower-cased
    std::optional<std::string> version; // only set for "=="
};

// Splits "name<op>version" on the first recognized operator.
// Throws PipwallException when the name part is empty.
PackageReference parse_package_spec(const std::string& package_spec);

// Reads a requirements file: one specifier per line, '#' starts a comment.
std::vector<std::string> parse_requirements_file(const std::filesystem::path& path);
