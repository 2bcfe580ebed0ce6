#ifndef _oggopus_writer__hpp__included__
#define _oggopus_writer__hpp__included__

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "library/bytesink.hpp"
#include "library/ogg.hpp"

namespace opus
{
/**
 * Container writer settings.
 */
struct writer_options
{
	writer_options();
	uint8_t channels;
	uint32_t rate;
	uint16_t preskip;
	int16_t gain;
	std::string vendor;
	std::vector<std::string> comments;
	ogg::checksum_variant checksum;
/**
 * Use serial instead of random serial number.
 */
	bool fixed_serial;
	uint32_t serial;
};

/**
 * Counters returned on finalize.
 */
struct writer_summary
{
	writer_summary() throw() : bytes(0), packets(0), granulepos(0) {}
	uint64_t bytes;
	uint64_t packets;
	uint64_t granulepos;
};

/**
 * Writer of Opus packets into Ogg container (one logical stream per file).
 *
 * Lifecycle: unopened -> init() -> initialized -> write_packet() -> streaming -> finalize() -> finalized.
 * Not thread-safe: one thread owns a writer.
 */
class ogg_writer
{
public:
	enum state_t
	{
		UNOPENED,
		INITIALIZED,
		STREAMING,
		FINALIZED
	};
/**
 * Create writer writing to a file. The file is created on init().
 *
 * Parameter track_id: Name of the track (for messages).
 * Parameter path: The output file.
 * Parameter options: The stream settings.
 */
	ogg_writer(const std::string& track_id, const std::string& path,
		const writer_options& options = writer_options());
/**
 * Create writer writing to a sink. The sink is closed on finalize().
 *
 * Parameter track_id: Name of the track (for messages).
 * Parameter sink: The sink to write to. Must outlive the writer.
 * Parameter options: The stream settings.
 */
	ogg_writer(const std::string& track_id, byte_sink& sink, const writer_options& options = writer_options());
/**
 * Destructor. Complains if the stream was left unfinalized.
 */
	~ogg_writer() throw();
/**
 * Open the output and write OpusHead and OpusTags pages.
 *
 * Throws std::logic_error: Already initialized.
 * Throws std::runtime_error: I/O error or bad options.
 */
	void init();
/**
 * Write an Opus packet on its own page.
 *
 * Parameter data: The packet.
 * Parameter len: The packet length.
 * Returns: True if written, false if rejected as empty.
 * Throws std::logic_error: Not initialized or already finalized.
 * Throws std::runtime_error: I/O error.
 */
	bool write_packet(const uint8_t* data, size_t len);
	bool write_packet(const std::vector<uint8_t>& packet);
/**
 * Write the EOS page and close the output.
 *
 * Returns: The counters.
 * Throws std::logic_error: Not initialized or already finalized.
 * Throws std::runtime_error: I/O error (the writer is finalized anyway).
 */
	writer_summary finalize();
/**
 * Get lifecycle state.
 */
	state_t get_state() const throw() { return state; }
/**
 * Get stream state (serial, sequence, granulepos...).
 */
	const ogg::stream_state& get_stream_state() const throw() { return sstate; }
/**
 * Get bytes written so far.
 */
	uint64_t get_bytes_written() const throw() { return bytes; }
/**
 * Get audio packets written so far.
 */
	uint64_t get_packets_written() const throw() { return packets; }
private:
	ogg_writer(const ogg_writer&);
	ogg_writer& operator=(const ogg_writer&);
	void note_toc(const uint8_t* data, size_t len);
	std::string track_id;
	std::string path;
	writer_options options;
	std::unique_ptr<byte_sink> owned_sink;
	byte_sink* sink;
	ogg::stream_state sstate;
	state_t state;
	uint64_t bytes;
	uint64_t packets;
	std::vector<uint8_t> first_tocs;
};
}

#endif
