#pragma once

#include <string>

namespace wsbridge {

/// True if `tenant` is a well-formed tenant identifier:
/// 1-64 chars of [A-Za-z0-9._-], not starting with '.' or '-', and neither
/// the reserved system owner name nor the shared area segment.
bool is_valid_tenant(const std::string& tenant);

/// Throws ValidationError if `tenant` is malformed.
void validate_tenant(const std::string& tenant);

/// Normalize a slash-separated relative path: drops empty and "." segments,
/// strips leading/trailing slashes. Throws ValidationError on ".." segments
/// or embedded NUL characters. Returns "" for the root.
std::string normalize_relative_path(const std::string& path);

/// Normalize a key prefix to "" or "a/b/" form. Same rejection rules.
std::string normalize_prefix(const std::string& prefix);

/// Join two relative paths with a single '/'. Either side may be empty.
std::string join_path(const std::string& a, const std::string& b);

/// Last segment of a slash-separated path ("a/b/c.txt" -> "c.txt").
std::string base_name(const std::string& path);

}  // namespace wsbridge
