#include "storage/file_info.hpp"
#include "error/netfile_error.hpp"

namespace netfile {
namespace storage {

void to_json(nlohmann::json& j, const FileInfo& info) {
  j = nlohmann::json{
    {"name", info.name},
    {"size", info.size},
    {"modtime", info.modtime},
    {"mode", info.mode},
    {"isdir", info.is_dir}
  };
}

void from_json(const nlohmann::json& j, FileInfo& info) {
  j.at("name").get_to(info.name);
  j.at("size").get_to(info.size);
  j.at("modtime").get_to(info.modtime);
  j.at("mode").get_to(info.mode);
  j.at("isdir").get_to(info.is_dir);
}

std::string encode_file_info(const FileInfo& info) {
  return nlohmann::json(info).dump();
}

FileInfo decode_file_info(const std::string& document) {
  try {
    return nlohmann::json::parse(document).get<FileInfo>();
  } catch (const nlohmann::json::exception& e) {
    throw Error(ErrorKind::PROTOCOL_VIOLATION,
                std::string("FileInfo: Failed to decode file info: ") + e.what());
  }
}

} // namespace storage
} // namespace netfile
