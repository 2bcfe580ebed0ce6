#ifndef _library__ogg__hpp__included__
#define _library__ogg__hpp__included__

#include <cstdint>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <iostream>
#include <utility>
#include <vector>
#include "bytesink.hpp"

namespace ogg
{
/**
 * Page checksum variants.
 *
 * CRC_REFLECTED: Table generated by shifting right with polynomial 0x04C11DB7, bytes folded in at the low end.
 * CRC_RFC3533: The checksum libogg computes (MSB-first, polynomial 0x04C11DB7).
 *
 * Both start from 0 and have no final xor.
 */
enum checksum_variant
{
	CRC_REFLECTED,
	CRC_RFC3533
};

/**
 * Page header type flags.
 */
const uint8_t PAGE_CONTINUED = 0x01;
const uint8_t PAGE_BOS = 0x02;
const uint8_t PAGE_EOS = 0x04;

/**
 * Update page checksum.
 *
 * Parameter chain: The previous checksum value (0 to start).
 * Parameter data: The data to fold in.
 * Parameter size: Number of bytes to fold in.
 * Parameter variant: The checksum variant.
 * Returns: The updated checksum.
 */
uint32_t checksum(uint32_t chain, const uint8_t* data, size_t size, checksum_variant variant = CRC_REFLECTED)
	throw();

/**
 * Compute checksum over several buffers, treated as one contiguous byte stream.
 *
 * Parameter parts: The buffers (pointer and length) in order.
 * Parameter variant: The checksum variant.
 * Returns: The checksum.
 */
uint32_t checksum(const std::vector<std::pair<const uint8_t*, size_t>>& parts,
	checksum_variant variant = CRC_REFLECTED) throw();

/**
 * Compute lacing values for packet of given size.
 *
 * A packet with length divisible by 255 (including empty one) gets a terminating 0 value.
 *
 * Parameter size: The packet size.
 * Returns: The lacing values.
 */
std::vector<uint8_t> lacing_values(size_t size);

/**
 * Per-stream page writing state.
 */
struct stream_state
{
	stream_state() throw();
	uint32_t serial;
	uint32_t sequence;
	uint64_t granulepos;
	uint8_t channels;
	uint32_t rate;
	uint16_t preskip;
};

/**
 * A page in Ogg bitstream.
 */
class page
{
public:
/**
 * Create a new blank page.
 */
	page() throw();
/**
 * Create a page, reading a buffer.
 *
 * The buffer must hold the whole page (use scan() first). The checksum may be of either variant, the
 * matching one can be read with get_checksum_variant().
 *
 * Parameter buffer: The buffer to read.
 * Parameter advance: Filled with number of bytes read.
 * Throws std::runtime_error: Bad page.
 */
	page(const char* buffer, size_t& advance);
/**
 * Scan a buffer for pages.
 *
 * Parameter buffer: The buffer to scan.
 * Parameter bufferlen: The length of buffer. Should be at least 65307, unless there's not that much available.
 * Parameter eof: If set, assume the buffer is everything that is available.
 * Parameter advance: Filled with how many bytes to advance if page is found, otherwise how many bytes to
 *	discard.
 * Returns: True if a page was found, false if not.
 */
	static bool scan(const char* buffer, size_t bufferlen, bool eof, size_t& advance) throw();
/**
 * Get the continue flag of the page.
 */
	bool get_continue() const throw() { return flag_continue; }
/**
 * Set the continue flag of the page.
 */
	void set_continue(bool c) throw() { flag_continue = c; }
/**
 * Get the BOS flag of the page.
 */
	bool get_bos() const throw() { return flag_bos; }
/**
 * Set the BOS flag of the page.
 */
	void set_bos(bool b) throw() { flag_bos = b; }
/**
 * Get the EOS flag of the page.
 */
	bool get_eos() const throw() { return flag_eos; }
/**
 * Set the EOS flag of the page.
 */
	void set_eos(bool e) throw() { flag_eos = e; }
/**
 * Get the header type byte.
 */
	uint8_t get_header_type() const throw();
/**
 * Set all flags from header type byte.
 */
	void set_header_type(uint8_t type) throw();
/**
 * Get the granulepos of the page.
 */
	uint64_t get_granulepos() const throw() { return granulepos; }
/**
 * Set the granulepos of the page.
 */
	void set_granulepos(uint64_t g) throw() { granulepos = g; }
/**
 * Get stream identifier.
 */
	uint32_t get_stream() const throw() { return stream; }
/**
 * Set stream identifier.
 */
	void set_stream(uint32_t s) throw() { stream = s; }
/**
 * Get page sequence number.
 */
	uint32_t get_sequence() const throw() { return sequence; }
/**
 * Set page sequence number.
 */
	void set_sequence(uint32_t s) throw() { sequence = s; }
/**
 * Get number of segments (lacing values) in page.
 */
	uint8_t get_segment_count() const throw() { return segment_count; }
/**
 * Get lacing value.
 */
	uint8_t get_segment(size_t idx) const throw() { return segments[idx]; }
/**
 * Get number of packets (including partial ones) in page.
 */
	uint8_t get_packet_count() const throw() { return packet_count; }
/**
 * Get the packet.
 *
 * Parameter packet: The index of packet.
 * Returns: Pointer to packet data and its length.
 */
	std::pair<const uint8_t*, uint32_t> get_packet(size_t packet) const throw()
	{
		if(packet >= packet_count)
			return std::make_pair(reinterpret_cast<const uint8_t*>(NULL), 0);
		return std::make_pair(data + packets[packet], packets[packet + 1] - packets[packet]);
	}
/**
 * Get the last packet incomplete flag.
 */
	bool get_last_packet_incomplete() const throw() { return last_incomplete; }
/**
 * Get the payload size.
 */
	uint32_t get_data_size() const throw() { return data_count; }
/**
 * Get the checksum variant the page was read with.
 */
	checksum_variant get_checksum_variant() const throw() { return variant; }
/**
 * Append lacing values and matching payload.
 *
 * The last lacing value determines if the final packet is completed on this page.
 *
 * Parameter _data: The payload for the lacing values.
 * Parameter lacing: The lacing values.
 * Parameter count: Number of lacing values.
 * Returns: True on success, false if the page doesn't have room.
 */
	bool append_segments(const uint8_t* _data, const uint8_t* lacing, size_t count) throw();
/**
 * Get number of bytes the page serializes to.
 */
	size_t serialize_size() const throw() { return 27 + segment_count + data_count; }
/**
 * Serialize the page.
 *
 * Parameter buffer: Buffer to serialize to. Must have serialize_size() bytes space.
 * Parameter _variant: The checksum variant to use.
 */
	void serialize(char* buffer, checksum_variant _variant = CRC_REFLECTED) const throw();
/**
 * The special granule pos for nothing.
 */
	const static uint64_t granulepos_none;
/**
 * Get debugging id for stream.
 */
	std::string stream_debug_id() const;
/**
 * Get debugging id for page.
 */
	std::string page_debug_id() const;
private:
	uint8_t version;
	bool flag_continue;
	bool flag_bos;
	bool flag_eos;
	bool last_incomplete;
	checksum_variant variant;
	uint64_t granulepos;
	uint32_t stream;
	uint32_t sequence;
	uint8_t segment_count;
	uint8_t packet_count;
	uint16_t data_count;
	uint8_t data[65025];
	uint8_t segments[255];
	uint16_t packets[256];
};

/**
 * Serialize page and write it out.
 *
 * Parameter sink: The sink to write to.
 * Parameter p: The page to write.
 * Parameter variant: The checksum variant.
 * Returns: The number of bytes written.
 * Throws std::runtime_error: Write failed.
 */
size_t put_page(byte_sink& sink, const page& p, checksum_variant variant = CRC_REFLECTED);

/**
 * Write a packet as a run of pages.
 *
 * A packet needing at most 255 lacing values goes to a single page. Longer ones spill to continuation
 * pages: the follow-up pages have the continued flag, the pages the packet doesn't end on have granule
 * position granulepos_none and no EOS flag, and only the first page keeps the BOS flag. Each page takes
 * one sequence number. The sequence number is only advanced for pages that were written.
 *
 * Parameter sink: The sink to write to.
 * Parameter packet: The packet data (may be NULL if len is 0).
 * Parameter len: The packet length.
 * Parameter header_type: The header flags for the page.
 * Parameter granule: The granule position of the page the packet ends on.
 * Parameter state: The stream state (serial and sequence used, sequence updated).
 * Parameter variant: The checksum variant.
 * Returns: The number of bytes written.
 * Throws std::runtime_error: Write failed.
 */
size_t write_page(byte_sink& sink, const uint8_t* packet, size_t len, uint8_t header_type, uint64_t granule,
	stream_state& state, checksum_variant variant = CRC_REFLECTED);

/**
 * Ogg stream reader.
 */
class stream_reader
{
public:
/**
 * Constructor.
 */
	stream_reader() throw();
/**
 * Destructor.
 */
	virtual ~stream_reader() throw();
/**
 * Read some data.
 *
 * Parameter buffer: The buffer to store the data to.
 * Parameter size: The maximum size to read.
 * Returns: The number of bytes actually read. 0 on EOF.
 */
	virtual size_t read(char* buffer, size_t size) = 0;
/**
 * Read a page from stream.
 *
 * Parameter page: The page is assigned here if successful.
 * Returns: True if page was obtained, false if not.
 */
	bool get_page(page& page);
/**
 * Set stream to send errors to.
 */
	void set_errors_to(std::ostream& os);
/**
 * Get offset of last page.
 */
	uint64_t get_last_offset() { return last_offset; }
/**
 * Get number of bytes skipped while resyncing.
 */
	uint64_t get_skipped() { return skipped; }
private:
	stream_reader(const stream_reader&);
	stream_reader& operator=(const stream_reader&);
	void fill_buffer();
	void discard_buffer(size_t amount);
	bool eof;
	char buffer[65536];
	size_t left;
	std::ostream* errors_to;
	uint64_t start_offset;
	uint64_t last_offset;
	uint64_t skipped;
};

/**
 * Ogg stream reader based on std::istream.
 */
class stream_reader_iostreams : public stream_reader
{
public:
/**
 * Constructor.
 *
 * Parameter stream: The stream to read the data from.
 */
	stream_reader_iostreams(std::istream& stream);
/**
 * Destructor.
 */
	~stream_reader_iostreams() throw();

	size_t read(char* buffer, size_t size);
private:
	std::istream& is;
};
}

#endif
