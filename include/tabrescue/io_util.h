/**
 * @file io_util.h
 * @brief Whole-file and stdin loading for the ingestion pipeline.
 *
 * The input is bounded by its size on disk; it is read completely into memory
 * before decoding starts. File handles are owned by a scoped guard, so they
 * are closed on every exit path including read failures.
 */

#ifndef TABRESCUE_IO_UTIL_H
#define TABRESCUE_IO_UTIL_H

#include <cstdint>
#include <string>
#include <vector>

namespace tabrescue {

/// Unmodified file content. Never mutated after loading.
using RawBytes = std::vector<uint8_t>;

/**
 * @brief Load a regular file completely into memory.
 *
 * @param filename The path to the file to load.
 * @return The file contents (possibly empty).
 * @throws IoError If the path is not a regular file or cannot be read.
 */
RawBytes load_file(const std::string& filename);

/**
 * @brief Read all data from stdin.
 *
 * @return The bytes read (possibly empty).
 * @throws IoError If reading fails.
 */
RawBytes read_stdin();

} // namespace tabrescue

#endif // TABRESCUE_IO_UTIL_H
