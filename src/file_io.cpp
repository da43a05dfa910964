#include "file_io.hpp"
#include <sys/mman.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include "config.hpp"
#include "posix_fd.hpp"

static std::string errno_text() { return std::string(std::strerror(errno)); }

bool read_whole_file(const std::filesystem::path& path, std::string& out, std::string& msg) {
  UniqueFd fd(::open(path.c_str(), O_RDONLY));
  if (!fd.valid()) { msg = "can not open file: " + path.string() + " (" + errno_text() + ")"; return false; }
  struct stat st{};
  if (::fstat(fd.get(), &st) != 0) { msg = "can not read file stat: " + path.string(); return false; }
  if (!S_ISREG(st.st_mode)) { msg = "not a regular file: " + path.string(); return false; }
  size_t n = static_cast<size_t>(st.st_size);
  if (n == 0) {
    out.clear();
    msg = "opened file: " + path.string();
    return true;
  }
  void* mem = ::mmap(nullptr, n, PROT_READ, MAP_PRIVATE, fd.get(), 0);
  if (mem == MAP_FAILED) { msg = "can not mmap file: " + path.string(); return false; }
  const char* data = static_cast<const char*>(mem);
  (void)::madvise(mem, n, MADV_SEQUENTIAL);
  std::string bytes(data, n);
  ::munmap(mem, n);
  out.swap(bytes);
  msg = "opened file: " + path.string();
  return true;
}

bool write_whole_file(const std::filesystem::path& path, std::string_view bytes, std::string& msg) {
  std::filesystem::path tmp = path;
  tmp += ".tmp";
  UniqueFd ufd(::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644));
  if (!ufd.valid()) {
    msg = "write file failed: " + tmp.string() + " (" + errno_text() + ")";
    return false;
  }
  auto fail = [&](const std::string& what) {
    msg = what;
    ufd.reset();
    std::error_code ec;
    std::filesystem::remove(tmp, ec);
    return false;
  };
  const char* p = bytes.data();
  size_t remain = bytes.size();
  while (remain > 0) {
    size_t chunk = std::min<size_t>(remain, static_cast<size_t>(FN_WRITE_CHUNK_SIZE));
    ssize_t w = ::write(ufd.get(), p, chunk);
    if (w < 0) {
      if (errno == EINTR) continue;
      return fail("write file failed: " + tmp.string() + " (" + errno_text() + ")");
    }
    p += w;
    remain -= static_cast<size_t>(w);
  }
#if defined(__APPLE__)
  if (::fsync(ufd.get()) != 0) return fail("write file failed: " + tmp.string());
#else
  if (::fdatasync(ufd.get()) != 0) return fail("write file failed: " + tmp.string());
#endif
  if (!ufd.reset()) return fail("write file failed: " + tmp.string());
  std::error_code ec;
  std::filesystem::rename(tmp, path, ec);
  if (ec) return fail("write file failed: " + path.string() + " (" + ec.message() + ")");
  msg = "saved file: " + path.string();
  return true;
}
