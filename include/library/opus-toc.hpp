#ifndef _library__opus_toc__hpp__included__
#define _library__opus_toc__hpp__included__

#include <cstdint>

namespace opus
{
/**
 * Decoded Opus packet table-of-contents byte.
 *
 * Only the two low bits of the configuration are used (as duration class), the stereo flag is bit 2
 * and frame count code is the high nibble. Frame count code 3 counts as a single frame.
 */
struct toc_info
{
	uint8_t config;
	bool stereo;
	uint8_t frame_count_code;
	uint32_t frames;
	uint32_t duration_ms;
	uint32_t samples_per_frame;
	uint32_t samples_per_packet;
};

/**
 * Parse TOC byte.
 *
 * Parameter toc: The first byte of Opus packet.
 * Parameter rate: The sampling rate in Hz.
 * Returns: The decoded TOC.
 */
toc_info parse_toc(uint8_t toc, uint32_t rate) throw();
}

#endif
