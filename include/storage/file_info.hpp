#ifndef NETFILE_STORAGE_FILE_INFO_HPP
#define NETFILE_STORAGE_FILE_INFO_HPP

#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

namespace netfile {
namespace storage {

// Directory flag inside FileInfo::mode, the permission bits occupy the low bits
constexpr std::uint32_t MODE_DIR = 1u << 31;

// Snapshot of a handle's metadata, sent over the wire on stat requests
struct FileInfo {
  std::string name;
  std::int64_t size = 0;
  // Nanoseconds since the Unix epoch
  std::int64_t modtime = 0;
  std::uint32_t mode = 0;
  bool is_dir = false;
};

void to_json(nlohmann::json& j, const FileInfo& info);
void from_json(const nlohmann::json& j, FileInfo& info);

// Encodes/decodes the JSON document exchanged by OPTIONS requests
std::string encode_file_info(const FileInfo& info);
FileInfo decode_file_info(const std::string& document);

} // namespace storage
} // namespace netfile

#endif // NETFILE_STORAGE_FILE_INFO_HPP
