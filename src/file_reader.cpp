#include "file_reader.hpp"
#include <sys/stat.h>
#include <fcntl.h>
#include "posix_fd.hpp"

bool mmap_readlines(const std::filesystem::path& path,
                    std::vector<std::string>& out_lines,
                    std::string& msg) {
  out_lines.clear();
  UniqueFd fd(::open(path.string().c_str(), O_RDONLY));
  if (!fd.valid()) { msg = std::string("can not open file: ") + path.string(); return false; }
  struct stat st{};
  if (::fstat(fd.get(), &st) != 0) { msg = std::string("can not read file stat: ") + path.string(); return false; }
  size_t n = static_cast<size_t>(st.st_size);
  if (n == 0) return true;
  ReadOnlyMapping map(fd.get(), n);
  if (!map.valid()) { msg = std::string("can not mmap file: ") + path.string(); return false; }
  map.advise_sequential();
  const char* data = map.data();

  size_t start = 0;
  for (size_t i = 0; i < n; ++i) {
    if (data[i] != '\n') continue;
    size_t end = i;
    if (end > start && data[end - 1] == '\r') end--;
    out_lines.emplace_back(data + start, end - start);
    start = i + 1;
  }
  // last line without trailing newline
  if (start < n) {
    size_t end = n;
    if (data[end - 1] == '\r') end--;
    out_lines.emplace_back(data + start, end - start);
  }
  return true;
}
