#pragma once

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <system_error>

namespace linetrim::util {
namespace fs = std::filesystem;

inline fs::path make_tmp_path(const fs::path& out_path) {
  fs::path tmp = out_path;
  tmp += ".tmp";
  return tmp;
}

// Rename a finished temp file over the target. Falls back to remove+rename on
// filesystems where rename does not replace an existing path.
inline void atomic_rename_over(const fs::path& tmp_path, const fs::path& out_path) {
  std::error_code ec;
  fs::rename(tmp_path, out_path, ec);
  if (!ec) return;

  fs::remove(out_path, ec);
  ec.clear();
  fs::rename(tmp_path, out_path, ec);
  if (ec) {
    throw std::runtime_error("atomic rename failed: '" + tmp_path.string() + "' -> '" + out_path.string() + "' (" + ec.message() + ")");
  }
}

// Write `out_path` through "<out_path>.tmp" so readers never observe a half-written
// document. Files are opened in binary mode: line lists are written byte-exact.
template <typename WriteFn>
inline void atomic_write_text(const fs::path& out_path, WriteFn&& fn) {
  const fs::path tmp = make_tmp_path(out_path);
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs) throw std::runtime_error("failed to open temp file for atomic write: " + tmp.string());
    fn(ofs);
    ofs.flush();
    if (!ofs) {
      ofs.close();
      std::error_code ec;
      fs::remove(tmp, ec);
      throw std::runtime_error("failed while writing temp file: " + tmp.string());
    }
  }
  atomic_rename_over(tmp, out_path);
}

// Slurp a whole file into memory (binary). Throws on open/read failure.
inline std::string read_file_bytes(const fs::path& path) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) throw std::runtime_error("failed to open file: " + path.string());
  std::string data;
  std::error_code ec;
  const auto sz = fs::file_size(path, ec);
  if (!ec) data.reserve(static_cast<std::size_t>(sz));
  char buf[1 << 15];
  while (ifs) {
    ifs.read(buf, static_cast<std::streamsize>(sizeof(buf)));
    const std::streamsize got = ifs.gcount();
    if (got <= 0) break;
    data.append(buf, static_cast<std::size_t>(got));
  }
  if (ifs.bad()) throw std::runtime_error("failed while reading file: " + path.string());
  return data;
}

} // namespace linetrim::util
