#pragma once
#include <string>

namespace cfg::pathu {

// Resolve href relative to base_dir and the directory containing the "owner" xml file.
std::string ResolveHref(const std::string& owner_xml_path,
                        const std::string& base_dir,
                        const std::string& href);

// Return directory portion of a path.
std::string Dirname(const std::string& path);

// Normalize (lexically) a path.
std::string Normalize(const std::string& p);

// Throw std::runtime_error naming `what` and the owner file when path is not a regular file.
void RequireFile(const std::string& path, const std::string& what, const std::string& owner_xml_path);

} // namespace cfg::pathu
