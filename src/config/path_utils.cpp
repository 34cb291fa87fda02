#include "config/path_utils.h"

#include <filesystem>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace cfg::pathu {

std::string Dirname(const std::string& path) {
  fs::path p(path);
  return p.has_parent_path() ? p.parent_path().string() : std::string(".");
}

std::string Normalize(const std::string& p) {
  return fs::path(p).lexically_normal().string();
}

std::string ResolveHref(const std::string& owner_xml_path,
                        const std::string& base_dir,
                        const std::string& href) {
  if (href.empty()) {
    throw std::runtime_error("ResolveHref: empty href in " + owner_xml_path);
  }

  fs::path href_p(href);
  if (href_p.is_absolute()) {
    return Normalize(href_p.string());
  }

  const fs::path owner_dir = fs::path(Dirname(owner_xml_path));

  // baseDir is relative to the owner file's directory (or absolute)
  fs::path base = owner_dir;
  if (!base_dir.empty()) {
    const fs::path b(base_dir);
    base = b.is_absolute() ? b : owner_dir / b;
  }
  return Normalize((base / href_p).string());
}

void RequireFile(const std::string& path, const std::string& what, const std::string& owner_xml_path) {
  std::error_code ec;
  if (!fs::is_regular_file(fs::path(path), ec)) {
    throw std::runtime_error(what + " not found: " + path + " (referenced from " + owner_xml_path + ")");
  }
}

} // namespace cfg::pathu
