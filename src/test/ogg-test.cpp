#include "library/ogg.hpp"
#include "library/serialization.hpp"
#include "testrun.hpp"
#include <cstring>
#include <memory>
#include <sstream>

namespace
{
	const uint32_t polynomial = 0x04C11DB7;

	//Bit-at-a-time versions of both checksum variants.
	uint32_t reflected_reference(const uint8_t* data, size_t size)
	{
		uint32_t crc = 0;
		for(size_t i = 0; i < size; i++) {
			crc ^= data[i];
			for(unsigned j = 0; j < 8; j++)
				crc = (crc & 1) ? ((crc >> 1) ^ polynomial) : (crc >> 1);
		}
		return crc;
	}

	uint32_t msb_reference(const uint8_t* data, size_t size)
	{
		uint32_t crc = 0;
		for(size_t i = 0; i < size; i++) {
			crc ^= static_cast<uint32_t>(data[i]) << 24;
			for(unsigned j = 0; j < 8; j++)
				crc = (crc & 0x80000000U) ? ((crc << 1) ^ polynomial) : (crc << 1);
		}
		return crc;
	}

	std::vector<uint8_t> make_packet(size_t size, uint8_t seed)
	{
		std::vector<uint8_t> p(size);
		for(size_t i = 0; i < size; i++)
			p[i] = static_cast<uint8_t>(seed + i * 7);
		return p;
	}

	std::string write_packet(size_t size, uint8_t type, uint64_t granule, ogg::stream_state& st,
		ogg::checksum_variant variant = ogg::CRC_REFLECTED)
	{
		std::ostringstream os;
		byte_sink_iostreams sink(os);
		std::vector<uint8_t> p = make_packet(size, 1);
		size_t w = ogg::write_page(sink, p.empty() ? NULL : &p[0], size, type, granule, st, variant);
		std::string out = os.str();
		if(w != out.size())
			throw std::runtime_error("write_page returned wrong byte count");
		return out;
	}

	std::vector<std::shared_ptr<ogg::page>> read_pages(const std::string& data, uint64_t* skipped = NULL)
	{
		std::istringstream is(data);
		std::unique_ptr<ogg::stream_reader_iostreams> r(new ogg::stream_reader_iostreams(is));
		std::ostringstream errors;
		r->set_errors_to(errors);
		std::vector<std::shared_ptr<ogg::page>> ret;
		while(true) {
			std::shared_ptr<ogg::page> p(new ogg::page);
			if(!r->get_page(*p))
				break;
			ret.push_back(p);
		}
		if(skipped)
			*skipped = r->get_skipped();
		return ret;
	}

	ogg::stream_state make_state()
	{
		ogg::stream_state st;
		st.serial = 0x12345678;
		return st;
	}
}

struct test tests[] = {
	{"checksum of empty input is zero", []() {
		uint8_t x = 0;
		return ogg::checksum(0, &x, 0) == 0 && ogg::checksum(0, &x, 0, ogg::CRC_RFC3533) == 0;
	}},{"reflected checksum matches bitwise reference", []() {
		std::vector<uint8_t> d = make_packet(1000, 33);
		return ogg::checksum(0, &d[0], d.size()) == reflected_reference(&d[0], d.size());
	}},{"rfc3533 checksum check value", []() {
		const char* s = "123456789";
		return ogg::checksum(0, reinterpret_cast<const uint8_t*>(s), 9, ogg::CRC_RFC3533) == 0x89A1897FU;
	}},{"rfc3533 checksum matches bitwise reference", []() {
		std::vector<uint8_t> d = make_packet(777, 5);
		return ogg::checksum(0, &d[0], d.size(), ogg::CRC_RFC3533) == msb_reference(&d[0], d.size());
	}},{"variants differ", []() {
		std::vector<uint8_t> d = make_packet(64, 9);
		return ogg::checksum(0, &d[0], d.size()) != ogg::checksum(0, &d[0], d.size(), ogg::CRC_RFC3533);
	}},{"checksum over parts equals checksum over whole", []() {
		std::vector<uint8_t> d = make_packet(300, 2);
		std::vector<std::pair<const uint8_t*, size_t>> parts;
		parts.push_back(std::make_pair(&d[0], 27));
		parts.push_back(std::make_pair(&d[27], 3));
		parts.push_back(std::make_pair(&d[30], 270));
		return ogg::checksum(parts) == ogg::checksum(0, &d[0], d.size()) &&
			ogg::checksum(parts, ogg::CRC_RFC3533) == ogg::checksum(0, &d[0], d.size(), ogg::CRC_RFC3533);
	}},{"lacing of empty packet", []() {
		std::vector<uint8_t> l = ogg::lacing_values(0);
		return l.size() == 1 && l[0] == 0;
	}},{"lacing of 255 byte packet", []() {
		std::vector<uint8_t> l = ogg::lacing_values(255);
		return l.size() == 2 && l[0] == 255 && l[1] == 0;
	}},{"lacing of 510 byte packet", []() {
		std::vector<uint8_t> l = ogg::lacing_values(510);
		return l.size() == 3 && l[0] == 255 && l[1] == 255 && l[2] == 0;
	}},{"lacing of 300 byte packet", []() {
		std::vector<uint8_t> l = ogg::lacing_values(300);
		return l.size() == 2 && l[0] == 255 && l[1] == 45;
	}},{"page layout", []() {
		ogg::stream_state st = make_state();
		st.sequence = 7;
		std::string p = write_packet(100, 0, 0x0102030405060708ULL, st);
		const uint8_t* b = reinterpret_cast<const uint8_t*>(p.data());
		if(p.size() != 27 + 1 + 100) return false;
		if(memcmp(b, "OggS", 4) || b[4] != 0 || b[5] != 0) return false;
		if(serialization::u64l(b + 6) != 0x0102030405060708ULL) return false;
		if(serialization::u32l(b + 14) != 0x12345678) return false;
		if(serialization::u32l(b + 18) != 7) return false;
		if(b[26] != 1 || b[27] != 100) return false;
		std::vector<uint8_t> d = make_packet(100, 1);
		return !memcmp(b + 28, &d[0], 100) && st.sequence == 8 && st.granulepos == 0;
	}},{"page checksum matches reference with zeroed field", []() {
		ogg::stream_state st = make_state();
		std::string p = write_packet(700, ogg::PAGE_BOS, 5, st);
		std::vector<uint8_t> b(p.begin(), p.end());
		uint32_t claimed = serialization::u32l(&b[22]);
		serialization::u32l(&b[22], 0);
		return claimed == reflected_reference(&b[0], b.size());
	}},{"rfc3533 page checksum", []() {
		ogg::stream_state st = make_state();
		std::string p = write_packet(50, 0, 5, st, ogg::CRC_RFC3533);
		std::vector<uint8_t> b(p.begin(), p.end());
		uint32_t claimed = serialization::u32l(&b[22]);
		serialization::u32l(&b[22], 0);
		return claimed == msb_reference(&b[0], b.size());
	}},{"255 byte packet segment table", []() {
		ogg::stream_state st = make_state();
		std::string p = write_packet(255, 0, 0, st);
		return p.size() == 27 + 2 + 255 && (uint8_t)p[26] == 2 && (uint8_t)p[27] == 255 && (uint8_t)p[28] == 0;
	}},{"510 byte packet segment table", []() {
		ogg::stream_state st = make_state();
		std::string p = write_packet(510, 0, 0, st);
		return p.size() == 27 + 3 + 510 && (uint8_t)p[26] == 3 && (uint8_t)p[27] == 255 &&
			(uint8_t)p[28] == 255 && (uint8_t)p[29] == 0;
	}},{"empty EOS page", []() {
		ogg::stream_state st = make_state();
		std::string p = write_packet(0, ogg::PAGE_EOS, 960, st);
		return p.size() == 28 && (uint8_t)p[5] == 0x04 && (uint8_t)p[26] == 1 && (uint8_t)p[27] == 0 &&
			st.sequence == 1;
	}},{"page parses back", []() {
		ogg::stream_state st = make_state();
		std::string p = write_packet(600, ogg::PAGE_BOS, 42, st);
		size_t adv;
		std::unique_ptr<ogg::page> pg(new ogg::page(p.data(), adv));
		auto pk = pg->get_packet(0);
		std::vector<uint8_t> d = make_packet(600, 1);
		return adv == p.size() && pg->get_bos() && !pg->get_eos() && !pg->get_continue() &&
			pg->get_granulepos() == 42 && pg->get_stream() == 0x12345678 && pg->get_sequence() == 0 &&
			pg->get_packet_count() == 1 && pk.second == 600 && !memcmp(pk.first, &d[0], 600) &&
			!pg->get_last_packet_incomplete() && pg->get_checksum_variant() == ogg::CRC_REFLECTED;
	}},{"rfc3533 page parses back", []() {
		ogg::stream_state st = make_state();
		std::string p = write_packet(20, 0, 42, st, ogg::CRC_RFC3533);
		size_t adv;
		std::unique_ptr<ogg::page> pg(new ogg::page(p.data(), adv));
		return pg->get_checksum_variant() == ogg::CRC_RFC3533;
	}},{"corrupt page is rejected", []() {
		ogg::stream_state st = make_state();
		std::string p = write_packet(100, 0, 42, st);
		p[60] ^= 1;
		size_t adv;
		try {
			std::unique_ptr<ogg::page> pg(new ogg::page(p.data(), adv));
			return false;
		} catch(std::runtime_error& e) {
			return true;
		}
	}},{"packet spanning two pages", []() {
		ogg::stream_state st = make_state();
		//65025 bytes need 256 lacing values: 255 full ones and a terminating zero.
		std::string p = write_packet(65025, ogg::PAGE_EOS, 1000, st);
		auto pages = read_pages(p);
		if(pages.size() != 2 || st.sequence != 2) return false;
		ogg::page& a = *pages[0];
		ogg::page& b = *pages[1];
		return a.get_segment_count() == 255 && a.get_last_packet_incomplete() && !a.get_continue() &&
			!a.get_eos() && a.get_granulepos() == ogg::page::granulepos_none && a.get_sequence() == 0 &&
			b.get_segment_count() == 1 && b.get_segment(0) == 0 && b.get_continue() && b.get_eos() &&
			b.get_granulepos() == 1000 && b.get_sequence() == 1;
	}},{"packet spanning pages reassembles", []() {
		ogg::stream_state st = make_state();
		std::string p = write_packet(70000, ogg::PAGE_BOS, 77, st);
		auto pages = read_pages(p);
		if(pages.size() != 2) return false;
		if(!pages[0]->get_bos() || pages[1]->get_bos()) return false;
		std::vector<uint8_t> got;
		for(auto& i : pages) {
			auto pk = i->get_packet(0);
			got.insert(got.end(), pk.first, pk.first + pk.second);
		}
		return got == make_packet(70000, 1) && pages[1]->get_segment_count() == 20;
	}},{"reader resyncs after garbage", []() {
		ogg::stream_state st = make_state();
		std::string p = "garbage" + write_packet(10, ogg::PAGE_BOS, 0, st);
		p = p + "x" + write_packet(20, 0, 960, st);
		uint64_t skipped;
		auto pages = read_pages(p, &skipped);
		return pages.size() == 2 && skipped == 8 && pages[0]->get_sequence() == 0 &&
			pages[1]->get_sequence() == 1 && pages[1]->get_packet(0).second == 20;
	}},{"reader skips damaged page", []() {
		ogg::stream_state st = make_state();
		std::string a = write_packet(10, ogg::PAGE_BOS, 0, st);
		std::string b = write_packet(20, 0, 960, st);
		std::string c = write_packet(30, ogg::PAGE_EOS, 1920, st);
		b[40] ^= 0x55;
		auto pages = read_pages(a + b + c);
		return pages.size() == 2 && pages[0]->get_sequence() == 0 && pages[1]->get_sequence() == 2;
	}},{"scan wants more data for partial page", []() {
		ogg::stream_state st = make_state();
		std::string p = write_packet(100, 0, 0, st);
		size_t adv;
		bool found = ogg::page::scan(p.data(), 60, false, adv);
		bool found_full = ogg::page::scan(p.data(), p.size(), false, adv);
		return !found && found_full && adv == 0;
	}},{"header type round trip", []() {
		ogg::page p;
		p.set_header_type(ogg::PAGE_CONTINUED | ogg::PAGE_EOS);
		return p.get_continue() && !p.get_bos() && p.get_eos() && p.get_header_type() == 0x05;
	}},{NULL, std::function<bool()>()}
};

int main()
{
	return run_tests(tests);
}
