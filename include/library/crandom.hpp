#ifndef _library__random__hpp__included__
#define _library__random__hpp__included__

#include <cstdlib>
#include <cstdint>

namespace crandom
{
/**
 * Initialize random number generator.
 *
 * Throws std::runtime_error: Can't initialize RNG.
 */
	void init();
/**
 * Generate random bits. Automatically initializes the generator if not already initialized.
 *
 * Parameter buffer: The buffer to fill.
 * Parameter buffersize: Number of bytes to fill.
 * Throws std::runtime_error: Can't initialize RNG or read from it.
 */
	void generate(void* buffer, size_t buffersize);
/**
 * Generate a random 32-bit value.
 *
 * Throws std::runtime_error: Can't initialize RNG or read from it.
 */
	uint32_t generate_u32();
}

#endif
