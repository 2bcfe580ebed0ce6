#ifndef _library__directory__hpp__included__
#define _library__directory__hpp__included__

#include <string>
#include <cstdint>

namespace directory
{
/**
 * Get size of a file.
 *
 * Returns: The size, or (uintmax_t)-1 if it can't be determined.
 */
uintmax_t size(const std::string& path);
bool exists(const std::string& filename);
bool is_regular(const std::string& filename);
bool is_directory(const std::string& filename);
/**
 * Create a directory and its parents if they don't exist.
 *
 * Returns: True if the directory exists afterwards.
 */
bool ensure_exists(const std::string& path);
/**
 * Join a directory and a file name.
 */
std::string join(const std::string& dir, const std::string& name);
}

#endif
