#include "wsbridge/path_util.hpp"
#include "wsbridge/core/constants.hpp"
#include "wsbridge/errors.hpp"

#include <cctype>
#include <vector>

namespace wsbridge {

bool is_valid_tenant(const std::string& tenant) {
    if (tenant.empty() || tenant.size() > constants::MAX_TENANT_ID_LENGTH) return false;
    if (tenant[0] == '.' || tenant[0] == '-') return false;
    if (tenant == constants::SYSTEM_CONFIG_OWNER) return false;  // reserved row owner
    if (tenant == constants::SHARED_PREFIX_SEGMENT) return false;  // shared area
    for (unsigned char c : tenant) {
        if (!std::isalnum(c) && c != '.' && c != '_' && c != '-') return false;
    }
    return true;
}

void validate_tenant(const std::string& tenant) {
    if (!is_valid_tenant(tenant)) {
        throw ValidationError("Invalid tenant identifier: '" + tenant + "'");
    }
}

std::string normalize_relative_path(const std::string& path) {
    if (path.find('\0') != std::string::npos) {
        throw ValidationError("Invalid path: embedded NUL character");
    }

    std::vector<std::string> segments;
    size_t pos = 0;
    while (pos <= path.size()) {
        size_t slash = path.find('/', pos);
        if (slash == std::string::npos) slash = path.size();
        std::string segment = path.substr(pos, slash - pos);
        pos = slash + 1;

        if (segment.empty() || segment == ".") continue;
        if (segment == "..") {
            throw ValidationError("Invalid path: traversal segment in '" + path + "'");
        }
        segments.push_back(std::move(segment));
    }

    std::string result;
    for (size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) result += '/';
        result += segments[i];
    }
    return result;
}

std::string normalize_prefix(const std::string& prefix) {
    auto normalized = normalize_relative_path(prefix);
    if (!normalized.empty()) normalized += '/';
    return normalized;
}

std::string join_path(const std::string& a, const std::string& b) {
    if (a.empty()) return b;
    if (b.empty()) return a;
    if (a.back() == '/') return a + b;
    return a + "/" + b;
}

std::string base_name(const std::string& path) {
    std::string trimmed = path;
    while (!trimmed.empty() && trimmed.back() == '/') trimmed.pop_back();
    auto slash = trimmed.rfind('/');
    return slash == std::string::npos ? trimmed : trimmed.substr(slash + 1);
}

}  // namespace wsbridge
