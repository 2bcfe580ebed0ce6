#include "core/oggopus-writer.hpp"
#include "core/messages.hpp"
#include "library/crandom.hpp"
#include "library/opus-ogg.hpp"
#include "library/opus-toc.hpp"
#include "library/string.hpp"
#include <iomanip>
#include <stdexcept>

namespace opus
{
namespace
{
	const size_t logged_tocs = 10;

	std::string hexbyte(uint8_t b)
	{
		return (stringfmt() << "0x" << std::hex << std::setw(2) << std::setfill('0')
			<< static_cast<unsigned>(b)).str();
	}
}

writer_options::writer_options()
{
	channels = 2;
	rate = 48000;
	preskip = 0;
	gain = 0;
	vendor = "oggrec";
	checksum = ogg::CRC_REFLECTED;
	fixed_serial = false;
	serial = 0;
}

ogg_writer::ogg_writer(const std::string& _track_id, const std::string& _path, const writer_options& _options)
	: track_id(_track_id), path(_path), options(_options)
{
	sink = NULL;
	state = UNOPENED;
	bytes = 0;
	packets = 0;
}

ogg_writer::ogg_writer(const std::string& _track_id, byte_sink& _sink, const writer_options& _options)
	: track_id(_track_id), options(_options)
{
	sink = &_sink;
	state = UNOPENED;
	bytes = 0;
	packets = 0;
}

ogg_writer::~ogg_writer() throw()
{
	if(state != INITIALIZED && state != STREAMING)
		return;
	messages << "Opus track " << track_id << ": destroyed without finalize, stream has no EOS page"
		<< std::endl;
	if(owned_sink) {
		try {
			owned_sink->close();
		} catch(std::exception& e) {
			messages << "Opus track " << track_id << ": " << e.what() << std::endl;
		}
	}
}

void ogg_writer::init()
{
	if(state != UNOPENED)
		throw std::logic_error("Opus writer already initialized");
	ogg_header header;
	header.channels = options.channels;
	header.preskip = options.preskip;
	header.rate = options.rate;
	header.gain = options.gain;
	header.map_family = 0;
	header.coupled = (options.channels == 2) ? 1 : 0;
	ogg_tags tags;
	tags.vendor = options.vendor;
	tags.comments = options.comments;
	//Serialize before touching the output, so bad options leave nothing behind.
	std::vector<uint8_t> hpacket = header.serialize();
	std::vector<uint8_t> tpacket = tags.serialize();

	if(!sink) {
		owned_sink.reset(new byte_sink_file(path));
		sink = owned_sink.get();
	}
	sstate = ogg::stream_state();
	sstate.serial = options.fixed_serial ? options.serial : crandom::generate_u32();
	sstate.channels = options.channels;
	sstate.rate = options.rate;
	sstate.preskip = options.preskip;
	bytes = 0;
	packets = 0;
	try {
		bytes += ogg::write_page(*sink, &hpacket[0], hpacket.size(), ogg::PAGE_BOS, 0, sstate,
			options.checksum);
		bytes += ogg::write_page(*sink, &tpacket[0], tpacket.size(), 0, 0, sstate, options.checksum);
		sink->flush();
	} catch(...) {
		if(owned_sink) {
			sink = NULL;
			owned_sink.reset();
		}
		throw;
	}
	state = INITIALIZED;
	messages << "Opus track " << track_id << ": initialized";
	if(path != "")
		messages << " '" << path << "'";
	messages << " serial=" << sstate.serial << " channels=" << static_cast<unsigned>(sstate.channels)
		<< " rate=" << sstate.rate << std::endl;
}

void ogg_writer::note_toc(const uint8_t* data, size_t len)
{
	if(first_tocs.size() >= logged_tocs)
		return;
	if(first_tocs.empty()) {
		toc_info t = parse_toc(data[0], sstate.rate);
		messages << "Opus track " << track_id << ": first packet " << len << " bytes, TOC "
			<< hexbyte(data[0]) << " config=" << static_cast<unsigned>(t.config)
			<< " stereo=" << (t.stereo ? "yes" : "no") << " frames=" << t.frames
			<< " duration=" << t.duration_ms << "ms samples=" << t.samples_per_packet << std::endl;
	}
	first_tocs.push_back(data[0]);
	if(first_tocs.size() == logged_tocs) {
		std::string list;
		for(auto i : first_tocs)
			list = list + " " + hexbyte(i);
		messages << "Opus track " << track_id << ": first " << logged_tocs << " TOC bytes:" << list
			<< std::endl;
	}
}

bool ogg_writer::write_packet(const uint8_t* data, size_t len)
{
	if(state == UNOPENED)
		throw std::logic_error("Opus writer not initialized");
	if(state == FINALIZED)
		throw std::logic_error("Opus writer already finalized");
	if(!data || !len) {
		messages << "Opus track " << track_id << ": ignoring empty packet" << std::endl;
		return false;
	}
	toc_info t = parse_toc(data[0], sstate.rate);
	uint64_t granule = sstate.granulepos + t.samples_per_packet;
	size_t pagebytes = ogg::write_page(*sink, data, len, 0, granule, sstate, options.checksum);
	sink->flush();
	bytes += pagebytes;
	sstate.granulepos = granule;
	packets++;
	state = STREAMING;
	note_toc(data, len);
	return true;
}

bool ogg_writer::write_packet(const std::vector<uint8_t>& packet)
{
	return write_packet(packet.empty() ? NULL : &packet[0], packet.size());
}

writer_summary ogg_writer::finalize()
{
	if(state == UNOPENED)
		throw std::logic_error("Opus writer not initialized");
	if(state == FINALIZED)
		throw std::logic_error("Opus writer already finalized");
	state = FINALIZED;
	try {
		bytes += ogg::write_page(*sink, NULL, 0, ogg::PAGE_EOS, sstate.granulepos, sstate,
			options.checksum);
		sink->flush();
		sink->close();
	} catch(std::exception& e) {
		messages << "Opus track " << track_id << ": error finalizing: " << e.what() << std::endl;
		throw;
	}
	writer_summary s;
	s.bytes = bytes;
	s.packets = packets;
	s.granulepos = sstate.granulepos;
	messages << "Opus track " << track_id << ": finalized, " << s.packets << " packets, " << s.bytes
		<< " bytes, granulepos " << s.granulepos << std::endl;
	return s;
}
}
