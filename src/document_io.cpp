#include "document_io.hpp"
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#include <cstring>
#include "config.hpp"
#include "posix_fd.hpp"

std::vector<Cells> parse_document(std::string_view text, char delimiter) {
  std::vector<Cells> out;
  size_t n = text.size();
  size_t start = 0;
  for (size_t i = 0; i < n; ++i) {
    if (text[i] == '\n') {
      size_t end = i;
      if (end > start && text[end - 1] == '\r') end--;
      out.push_back(split_cells(text.substr(start, end - start), delimiter));
      start = i + 1;
    }
  }
  // a trailing '\n' ends in an empty last line, which write_document restores
  if (start <= n) {
    size_t end = n;
    if (end > start && text[end - 1] == '\r') end--;
    out.push_back(split_cells(text.substr(start, end - start), delimiter));
  }
  return out;
}

bool read_document(const std::filesystem::path& path,
                   char delimiter,
                   std::vector<Cells>& out_lines,
                   std::string& msg) {
  out_lines.clear();
  UniqueFd fd(::open(path.string().c_str(), O_RDONLY));
  if (!fd.valid()) { msg = std::string("can not open file: ") + path.string(); return false; }
  struct stat st{};
  if (::fstat(fd.get(), &st) != 0) { msg = std::string("can not read file stat: ") + path.string(); return false; }
  size_t n = static_cast<size_t>(st.st_size);
  if (n == 0) {
    out_lines.push_back(Cells{std::string()});
    msg = std::string("opened file: ") + path.string();
    return true;
  }
  MappedFile mem;
  if (!mem.map(fd.get(), n)) { msg = std::string("can not mmap file: ") + path.string(); return false; }
  out_lines = parse_document(std::string_view(mem.data(), mem.size()), delimiter);
  msg = std::string("opened file: ") + path.string() + " (" + std::to_string(out_lines.size()) + " lines)";
  return true;
}

bool write_document(const std::filesystem::path& path,
                    const std::vector<Cells>& lines,
                    char delimiter,
                    std::string& msg) {
  std::filesystem::path tmp = path;
  tmp += ".tmp";
  UniqueFd ufd(::open(tmp.string().c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644));
  if (!ufd.valid()) {
    msg = std::string("write file failed: ") + tmp.string();
    return false;
  }
  std::vector<char> buf(static_cast<size_t>(ET_WRITE_CHUNK_SIZE));
  size_t used = 0;
  auto write_span = [&](const char* p, size_t len) -> bool {
    while (len > 0) {
      ssize_t w = ::write(ufd.get(), p, len);
      if (w < 0) { msg = std::string("write file failed: ") + tmp.string(); return false; }
      p += w;
      len -= static_cast<size_t>(w);
    }
    return true;
  };
  auto flush_buf = [&]() -> bool {
    bool ok = write_span(buf.data(), used);
    used = 0;
    return ok;
  };
  for (size_t i = 0; i < lines.size(); ++i) {
    std::string s = join_cells(lines[i], delimiter);
    if (i + 1 < lines.size()) s.push_back('\n');
    if (s.size() > buf.size() - used) {
      if (used > 0 && !flush_buf()) return false;
      if (s.size() >= buf.size()) {
        if (!write_span(s.data(), s.size())) return false;
        continue;
      }
    }
    std::memcpy(buf.data() + used, s.data(), s.size());
    used += s.size();
  }
  if (used > 0 && !flush_buf()) return false;
#if defined(__APPLE__)
  if (::fsync(ufd.get()) != 0) { msg = std::string("write file failed: ") + tmp.string(); return false; }
#else
  if (::fdatasync(ufd.get()) != 0) { msg = std::string("write file failed: ") + tmp.string(); return false; }
#endif
  ufd.reset();
  std::error_code ec;
  std::filesystem::rename(tmp, path, ec);
  if (ec) { msg = std::string("write file failed: ") + path.string(); return false; }
  msg = std::string("saved file: ") + path.string();
  return true;
}
