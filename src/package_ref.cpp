#include "package_ref.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <array>
#include <fstream>
#include <string_view>

namespace {

// "===" must be tried before "==" or it would leave a stray "=" on the version
constexpr std::array<std::string_view, 8> SPEC_OPERATORS = {"===", "==", ">=", "<=", "!=", "~=", ">", "<"};

} // namespace

PackageReference parse_package_spec(const std::string& package_spec) {
    PackageReference ref;
    std::string name_part = package_spec;

    for (const auto op : SPEC_OPERATORS) {
        if (const auto pos = package_spec.find(op); pos != std::string::npos) {
            name_part = package_spec.substr(0, pos);
            if (op == "===" || op == "==") {
                // "a==1.0,<2" still pins 1.0; anything after a comma is a range clause
                std::string rest = package_spec.substr(pos + op.size());
                if (const auto comma = rest.find(','); comma != std::string::npos) {
                    rest = rest.substr(0, comma);
                }
                rest = trim(rest);
                if (!rest.empty()) {
                    ref.version = std::move(rest);
                }
            }
            break;
        }
    }

    ref.name = to_lower(trim(name_part));
    if (ref.name.empty()) {
        throw PipwallException(string_format("error.empty_package_name", package_spec));
    }
    return ref;
}

std::vector<std::string> parse_requirements_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw PipwallException(string_format("error.requirements_not_found", path.string()));
    }

    std::vector<std::string> packages;
    std::string line;
    while (std::getline(file, line)) {
        if (const auto hash = line.find('#'); hash != std::string::npos) {
            line.erase(hash);
        }
        line = trim(line);
        if (!line.empty()) {
            packages.push_back(line);
        }
    }
    return packages;
}
