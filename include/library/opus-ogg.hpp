#ifndef _library__opus_ogg__hpp__included__
#define _library__opus_ogg__hpp__included__

#include <cstdint>
#include <string>
#include <vector>
#include "ogg.hpp"

namespace opus
{
/**
 * OggOpus header structure.
 */
struct ogg_header
{
/**
 * Create header for mapping family 0 (mono or stereo).
 */
	ogg_header() throw();
	uint8_t version;
	uint8_t channels;
	uint16_t preskip;
	uint32_t rate;
	int16_t gain;
	uint8_t map_family;
	uint8_t streams;
	uint8_t coupled;
	uint8_t chanmap[255];
/**
 * Parse packet as OggOpus header.
 *
 * Parameter packet: The packet to parse.
 * Throws std::runtime_error: Not valid OggOpus header packet.
 */
	void parse(const std::vector<uint8_t>& packet);
/**
 * Parse page as OggOpus header page.
 *
 * The page must be BOS page with granulepos 0 carrying exactly one complete packet.
 *
 * Parameter page: The page to parse.
 * Throws std::runtime_error: Not valid OggOpus header page.
 */
	void parse(const ogg::page& page);
/**
 * Serialize OggOpus header as a packet.
 *
 * Returns: The serialized packet (19 bytes for mapping family 0).
 * Throws std::runtime_error: Not valid OggOpus header.
 */
	std::vector<uint8_t> serialize() const;
};

/**
 * OggOpus tags structure
 */
struct ogg_tags
{
	std::string vendor;
	std::vector<std::string> comments;
/**
 * Parse packet as OggOpus comment.
 *
 * Parameter packet: The packet to parse.
 * Throws std::runtime_error: Not valid OggOpus comment packet.
 */
	void parse(const std::vector<uint8_t>& packet);
/**
 * Parse page as OggOpus comment page.
 *
 * The page must be non-BOS page with granulepos 0, starting with complete packet.
 *
 * Parameter page: The page to parse.
 * Throws std::runtime_error: Not valid OggOpus comment page.
 */
	void parse(const ogg::page& page);
/**
 * Serialize OggOpus comments as a packet.
 *
 * Returns: The serialized packet.
 * Throws std::runtime_error: Field too long.
 */
	std::vector<uint8_t> serialize() const;
};
}
#endif
