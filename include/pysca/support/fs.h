/***
 * Name: pysca::support (fs)
 * Purpose: Minimal file IO helpers for reading source files and writing logs.
 * Inputs: Paths and string buffers
 * Outputs: File contents to/from disk
 * Theory of Operation: Thin wrappers over fstream to centralize error handling.
 *   Streams are scoped to each call so handles are released on every path.
 */
#pragma once

#include <string>
#include <vector>

namespace pysca {
namespace support {

/*** ReadFile: Read entire file (binary) into out. Return true on success. */
bool ReadFile(const std::string& path, std::string& out, std::string& err);

/*** WriteFile: Write entire string to path, truncating. Return true on success. */
bool WriteFile(const std::string& path, const std::string& data, std::string& err);

/***
 * CollectSources: Resolve `root` into the sorted list of Python files to analyze.
 * A regular file ending in ".py" yields itself; a directory yields every "*.py"
 * beneath it (recursive). Anything else fails with err set.
 */
bool CollectSources(const std::string& root, std::vector<std::string>& out, std::string& err);

}  // namespace support
}  // namespace pysca
