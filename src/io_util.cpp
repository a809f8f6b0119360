#include "tabrescue/io_util.h"

#include "tabrescue/error.h"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <memory>
#include <sys/stat.h>

// Windows compatibility for S_ISREG macro
#ifdef _WIN32
#ifndef S_ISREG
#define S_ISREG(m) (((m) & _S_IFMT) == _S_IFREG)
#endif
#endif

namespace tabrescue {

namespace {

struct FileCloser {
  void operator()(std::FILE* fp) const {
    if (fp)
      std::fclose(fp);
  }
};

using FilePtr = std::unique_ptr<std::FILE, FileCloser>;

} // namespace

RawBytes load_file(const std::string& filename) {
  // Check if the path is a regular file (not a directory or special file)
  struct stat path_stat;
  if (stat(filename.c_str(), &path_stat) != 0) {
    throw IoError("could not open " + filename + ": " + std::strerror(errno));
  }
  if (!S_ISREG(path_stat.st_mode)) {
    throw IoError("could not open " + filename + ": not a regular file");
  }

  FilePtr fp(std::fopen(filename.c_str(), "rb"));
  if (!fp) {
    throw IoError("could not open " + filename + ": " + std::strerror(errno));
  }

  RawBytes data(static_cast<size_t>(path_stat.st_size));
  size_t readb = data.empty() ? 0 : std::fread(data.data(), 1, data.size(), fp.get());
  if (readb != data.size() || std::ferror(fp.get())) {
    throw IoError("could not read " + filename);
  }
  return data;
}

RawBytes read_stdin() {
  // Read stdin in chunks since we don't know the size upfront
  const size_t chunk_size = 64 * 1024;
  RawBytes data;
  data.reserve(chunk_size * 16);

  std::vector<uint8_t> buffer(chunk_size);
  while (true) {
    size_t bytes_read = std::fread(buffer.data(), 1, chunk_size, stdin);
    if (bytes_read > 0) {
      data.insert(data.end(), buffer.begin(), buffer.begin() + bytes_read);
    }
    if (bytes_read < chunk_size) {
      if (std::ferror(stdin)) {
        throw IoError("could not read from stdin");
      }
      break; // EOF reached
    }
  }
  return data;
}

} // namespace tabrescue
