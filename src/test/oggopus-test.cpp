#include "core/messages.hpp"
#include "core/oggopus-writer.hpp"
#include "library/opus-ogg.hpp"
#include "library/serialization.hpp"
#include "testrun.hpp"
#include <cstring>
#include <fstream>
#include <memory>
#include <sstream>

namespace
{
	class failing_sink : public byte_sink
	{
	public:
		failing_sink(size_t _allowed, size_t _flushes_allowed = static_cast<size_t>(-1))
			: allowed(_allowed), flushes_allowed(_flushes_allowed), writes(0), flushes(0) {}
		void write(const char* buffer, size_t size)
		{
			if(writes >= allowed)
				throw std::runtime_error("Simulated write failure");
			writes++;
		}
		void flush()
		{
			if(flushes >= flushes_allowed)
				throw std::runtime_error("Simulated flush failure");
			flushes++;
		}
	private:
		size_t allowed;
		size_t flushes_allowed;
		size_t writes;
		size_t flushes;
	};

	opus::writer_options fixed_options()
	{
		opus::writer_options o;
		o.fixed_serial = true;
		o.serial = 0xCAFEBABE;
		return o;
	}

	std::vector<uint8_t> opus_packet(uint8_t toc, size_t size)
	{
		std::vector<uint8_t> p(size, 0x5A);
		p[0] = toc;
		return p;
	}

	std::vector<std::shared_ptr<ogg::page>> read_pages(const std::string& data)
	{
		std::istringstream is(data);
		std::unique_ptr<ogg::stream_reader_iostreams> r(new ogg::stream_reader_iostreams(is));
		std::vector<std::shared_ptr<ogg::page>> ret;
		while(true) {
			std::shared_ptr<ogg::page> p(new ogg::page);
			if(!r->get_page(*p))
				break;
			ret.push_back(p);
		}
		return ret;
	}

	template<typename T> bool throws(std::function<void()> f)
	{
		try {
			f();
			return false;
		} catch(T& e) {
			return true;
		}
	}

	std::string page_bytes(const std::string& data, size_t offset, size_t& size)
	{
		size_t segs = static_cast<uint8_t>(data[offset + 26]);
		size = 27 + segs;
		for(size_t i = 0; i < segs; i++)
			size += static_cast<uint8_t>(data[offset + 27 + i]);
		return data.substr(offset, size);
	}
}

struct test tests[] = {
	{"OpusHead serializes to 19 bytes", []() {
		opus::ogg_header h;
		h.channels = 2;
		h.preskip = 312;
		h.rate = 48000;
		h.gain = -256;
		std::vector<uint8_t> p = h.serialize();
		return p.size() == 19 && !memcmp(&p[0], "OpusHead", 8) && p[8] == 1 && p[9] == 2 &&
			serialization::u16l(&p[10]) == 312 && serialization::u32l(&p[12]) == 48000 &&
			serialization::s16l(&p[16]) == -256 && p[18] == 0;
	}},{"OpusHead round trip", []() {
		opus::ogg_header h;
		h.channels = 1;
		h.coupled = 0;
		h.preskip = 80;
		h.rate = 16000;
		opus::ogg_header g;
		g.parse(h.serialize());
		return g.channels == 1 && g.preskip == 80 && g.rate == 16000 && g.coupled == 0 && g.streams == 1;
	}},{"OpusHead bad magic", []() {
		std::vector<uint8_t> p = opus::ogg_header().serialize();
		p[0] = 'X';
		return throws<std::runtime_error>([&p]() { opus::ogg_header h; h.parse(p); });
	}},{"OpusHead truncated", []() {
		std::vector<uint8_t> p = opus::ogg_header().serialize();
		p.resize(15);
		return throws<std::runtime_error>([&p]() { opus::ogg_header h; h.parse(p); });
	}},{"OpusHead zero channels", []() {
		std::vector<uint8_t> p = opus::ogg_header().serialize();
		p[9] = 0;
		return throws<std::runtime_error>([&p]() { opus::ogg_header h; h.parse(p); });
	}},{"OpusHead 3 channels needs mapping", []() {
		opus::ogg_header h;
		h.channels = 3;
		return throws<std::runtime_error>([&h]() { h.serialize(); });
	}},{"OpusTags round trip", []() {
		opus::ogg_tags t;
		t.vendor = "test vendor";
		t.comments.push_back("TITLE=x");
		t.comments.push_back("");
		std::vector<uint8_t> p = t.serialize();
		opus::ogg_tags u;
		u.parse(p);
		return p.size() == 8 + 4 + 11 + 4 + 4 + 7 + 4 && u.vendor == "test vendor" &&
			u.comments.size() == 2 && u.comments[0] == "TITLE=x" && u.comments[1] == "";
	}},{"OpusTags truncated", []() {
		opus::ogg_tags t;
		t.vendor = "v";
		t.comments.push_back("A=B");
		std::vector<uint8_t> p = t.serialize();
		p.resize(p.size() - 1);
		return throws<std::runtime_error>([&p]() { opus::ogg_tags u; u.parse(p); });
	}},{"header pages", []() {
		std::ostringstream os;
		byte_sink_iostreams sink(os);
		opus::writer_options o = fixed_options();
		o.vendor = "vendor-x";
		o.comments.push_back("ENCODER=test");
		o.comments.push_back("ARTIST=someone");
		opus::ogg_writer w("t1", sink, o);
		w.init();
		std::string d = os.str();
		size_t s1;
		std::string p1 = page_bytes(d, 0, s1);
		//First page: OpusHead, BOS, single 19 byte segment.
		if(p1.size() != 27 + 1 + 19 || p1[5] != 0x02 || (uint8_t)p1[26] != 1 || (uint8_t)p1[27] != 19)
			return false;
		if(p1.substr(28, 8) != "OpusHead" || serialization::u64l(&p1[6]) != 0 ||
			serialization::u32l(&p1[18]) != 0 || serialization::u32l(&p1[14]) != 0xCAFEBABE)
			return false;
		auto pages = read_pages(d);
		if(pages.size() != 2)
			return false;
		opus::ogg_header h;
		h.parse(*pages[0]);
		opus::ogg_tags t;
		t.parse(*pages[1]);
		return h.channels == 2 && h.rate == 48000 && h.preskip == 0 && t.vendor == "vendor-x" &&
			t.comments.size() == 2 && pages[1]->get_header_type() == 0 && pages[1]->get_sequence() == 1 &&
			w.get_stream_state().sequence == 2 && w.get_state() == opus::ogg_writer::INITIALIZED &&
			w.get_bytes_written() == d.size();
	}},{"scenario: three 20ms packets", []() {
		std::ostringstream os;
		byte_sink_iostreams sink(os);
		opus::writer_options o = fixed_options();
		o.channels = 2;
		o.rate = 48000;
		o.preskip = 0;
		opus::ogg_writer w("t1", sink, o);
		w.init();
		for(unsigned i = 0; i < 3; i++)
			w.write_packet(opus_packet(0x01, 60));
		opus::writer_summary s = w.finalize();
		return s.granulepos == 2880 && s.packets == 3 && s.bytes == os.str().size();
	}},{"granule is cumulative", []() {
		std::ostringstream os;
		byte_sink_iostreams sink(os);
		opus::ogg_writer w("t1", sink, fixed_options());
		w.init();
		uint8_t tocs[] = {0x01, 0x00, 0x03, 0x11, 0x31, 0x02, 0x45};
		uint64_t expected[] = {960, 1440, 4320, 6240, 7200, 9120, 10080};
		for(unsigned i = 0; i < sizeof(tocs); i++)
			w.write_packet(opus_packet(tocs[i], 10 + i));
		w.finalize();
		auto pages = read_pages(os.str());
		if(pages.size() != 2 + sizeof(tocs) + 1)
			return false;
		for(unsigned i = 0; i < sizeof(tocs); i++) {
			ogg::page& p = *pages[2 + i];
			if(p.get_granulepos() != expected[i] || p.get_header_type() != 0 || p.get_sequence() != 2 + i ||
				p.get_packet(0).second != 10 + i)
				return false;
		}
		ogg::page& e = *pages.back();
		return e.get_eos() && e.get_granulepos() == 10080 && e.get_packet(0).second == 0 &&
			e.get_segment_count() == 1;
	}},{"empty packet is a no-op", []() {
		std::ostringstream os;
		byte_sink_iostreams sink(os);
		opus::ogg_writer w("t1", sink, fixed_options());
		w.init();
		size_t before = os.str().size();
		uint32_t seq = w.get_stream_state().sequence;
		bool r = w.write_packet(std::vector<uint8_t>());
		bool r2 = w.write_packet(NULL, 0);
		return !r && !r2 && os.str().size() == before && w.get_stream_state().sequence == seq &&
			w.get_packets_written() == 0 && w.get_state() == opus::ogg_writer::INITIALIZED;
	}},{"write before init", []() {
		std::ostringstream os;
		byte_sink_iostreams sink(os);
		opus::ogg_writer w("t1", sink, fixed_options());
		return throws<std::logic_error>([&w]() { w.write_packet(opus_packet(1, 3)); }) &&
			throws<std::logic_error>([&w]() { w.finalize(); }) && os.str().empty();
	}},{"init twice", []() {
		std::ostringstream os;
		byte_sink_iostreams sink(os);
		opus::ogg_writer w("t1", sink, fixed_options());
		w.init();
		return throws<std::logic_error>([&w]() { w.init(); });
	}},{"use after finalize", []() {
		std::ostringstream os;
		byte_sink_iostreams sink(os);
		opus::ogg_writer w("t1", sink, fixed_options());
		w.init();
		w.finalize();
		size_t size = os.str().size();
		return throws<std::logic_error>([&w]() { w.finalize(); }) &&
			throws<std::logic_error>([&w]() { w.write_packet(opus_packet(1, 3)); }) &&
			os.str().size() == size && w.get_state() == opus::ogg_writer::FINALIZED;
	}},{"write failure propagates", []() {
		failing_sink sink(3);
		opus::ogg_writer w("t1", sink, fixed_options());
		w.init();
		w.write_packet(opus_packet(1, 3));
		return throws<std::runtime_error>([&w]() { w.write_packet(opus_packet(1, 3)); }) &&
			w.get_packets_written() == 1 && w.get_stream_state().granulepos == 960;
	}},{"init failure propagates", []() {
		failing_sink sink(0);
		opus::ogg_writer w("t1", sink, fixed_options());
		return throws<std::runtime_error>([&w]() { w.init(); }) &&
			w.get_state() == opus::ogg_writer::UNOPENED;
	}},{"flush failure fails the packet", []() {
		failing_sink sink(100, 1);
		opus::ogg_writer w("t1", sink, fixed_options());
		w.init();
		uint64_t header = w.get_bytes_written();
		return throws<std::runtime_error>([&w]() { w.write_packet(opus_packet(1, 3)); }) &&
			w.get_packets_written() == 0 && w.get_stream_state().granulepos == 0 &&
			w.get_bytes_written() == header;
	}},{"header flush failure fails init", []() {
		failing_sink sink(100, 0);
		opus::ogg_writer w("t1", sink, fixed_options());
		return throws<std::runtime_error>([&w]() { w.init(); }) &&
			w.get_state() == opus::ogg_writer::UNOPENED;
	}},{"full device fails init", []() {
		opus::ogg_writer w("t1", "/dev/full", fixed_options());
		return throws<std::runtime_error>([&w]() { w.init(); }) &&
			w.get_state() == opus::ogg_writer::UNOPENED;
	}},{"large packet spans pages", []() {
		std::ostringstream os;
		byte_sink_iostreams sink(os);
		opus::ogg_writer w("t1", sink, fixed_options());
		w.init();
		w.write_packet(opus_packet(0x01, 70000));
		opus::writer_summary s = w.finalize();
		auto pages = read_pages(os.str());
		return pages.size() == 5 && pages[2]->get_granulepos() == ogg::page::granulepos_none &&
			pages[3]->get_continue() && pages[3]->get_granulepos() == 960 && s.granulepos == 960 &&
			pages[4]->get_sequence() == 4;
	}},{"rfc3533 checksums", []() {
		std::ostringstream os;
		byte_sink_iostreams sink(os);
		opus::writer_options o = fixed_options();
		o.checksum = ogg::CRC_RFC3533;
		opus::ogg_writer w("t1", sink, o);
		w.init();
		w.write_packet(opus_packet(0x01, 30));
		w.finalize();
		auto pages = read_pages(os.str());
		if(pages.size() != 4)
			return false;
		for(auto& i : pages)
			if(i->get_checksum_variant() != ogg::CRC_RFC3533)
				return false;
		return true;
	}},{"random serial", []() {
		std::ostringstream os;
		byte_sink_iostreams sink(os);
		opus::ogg_writer w("t1", sink);
		w.init();
		w.finalize();
		auto pages = read_pages(os.str());
		return pages.size() == 3 && pages[0]->get_stream() == w.get_stream_state().serial &&
			pages[2]->get_stream() == w.get_stream_state().serial;
	}},{"first TOC bytes are logged", []() {
		std::ostringstream log;
		messages_relay_class::set_stream(log);
		std::ostringstream os;
		byte_sink_iostreams sink(os);
		opus::ogg_writer w("logged", sink, fixed_options());
		w.init();
		for(unsigned i = 0; i < 12; i++)
			w.write_packet(opus_packet(0x01 | ((i % 2) << 2), 5));
		w.finalize();
		messages_relay_class::set_stream(std::cerr);
		std::string l = log.str();
		return l.find("first packet 5 bytes, TOC 0x01") != std::string::npos &&
			l.find("first 10 TOC bytes: 0x01 0x05 0x01 0x05") != std::string::npos &&
			l.find("finalized, 12 packets") != std::string::npos;
	}},{"file output", []() {
		std::string path = "oggopus-test.opus.tmp";
		opus::ogg_writer w("t1", path, fixed_options());
		w.init();
		w.write_packet(opus_packet(0x03, 100));
		opus::writer_summary s = w.finalize();
		std::ifstream f(path.c_str(), std::ios_base::binary);
		std::ostringstream data;
		data << f.rdbuf();
		auto pages = read_pages(data.str());
		return pages.size() == 4 && s.bytes == data.str().size() && s.granulepos == 2880;
	}},{NULL, std::function<bool()>()}
};

int main()
{
	return run_tests(tests);
}
