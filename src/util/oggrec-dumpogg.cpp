#include "library/ogg.hpp"
#include "library/opus-ogg.hpp"
#include <cstring>
#include <iostream>
#include <fstream>
#include <memory>

namespace
{
	void dump_header(const ogg::page& p)
	{
		auto pp = p.get_packet(0);
		std::vector<uint8_t> packet(pp.first, pp.first + pp.second);
		if(packet.size() >= 8 && !memcmp(&packet[0], "OpusHead", 8)) {
			opus::ogg_header h;
			try {
				h.parse(p);
			} catch(std::exception& e) {
				std::cout << "  Bad OpusHead: " << e.what() << std::endl;
				return;
			}
			std::cout << "  OpusHead: version " << static_cast<unsigned>(h.version) << " channels "
				<< static_cast<unsigned>(h.channels) << " preskip " << h.preskip << " rate " << h.rate
				<< " gain " << h.gain << " mapping " << static_cast<unsigned>(h.map_family) << std::endl;
		} else if(packet.size() >= 8 && !memcmp(&packet[0], "OpusTags", 8)) {
			opus::ogg_tags t;
			try {
				t.parse(p);
			} catch(std::exception& e) {
				std::cout << "  Bad OpusTags: " << e.what() << std::endl;
				return;
			}
			std::cout << "  OpusTags: vendor '" << t.vendor << "', " << t.comments.size() << " comments"
				<< std::endl;
			for(auto& i : t.comments)
				std::cout << "    " << i << std::endl;
		}
	}
}

int main(int argc, char** argv)
{
	if(argc != 2) {
		std::cerr << "Filename needed." << std::endl;
		return 1;
	}
	std::ifstream s(argv[1], std::ios_base::binary);
	if(!s) {
		std::cerr << "Can't open '" << argv[1] << "'" << std::endl;
		return 2;
	}
	ogg::stream_reader_iostreams r(s);
	r.set_errors_to(std::cout);
	std::unique_ptr<ogg::page> _p(new ogg::page);
	ogg::page& p = *_p;
	uint64_t pages = 0;
	try {
		while(r.get_page(p)) {
			std::cout << "Ogg page @" << r.get_last_offset() << ": " << p.page_debug_id()
				<< " Flags: " << (p.get_continue() ? "CONTINUE " : "")
				<< (p.get_bos() ? "BOS " : "") << (p.get_eos() ? "EOS " : "")
				<< "granulepos=" << p.get_granulepos()
				<< " crc=" << (p.get_checksum_variant() == ogg::CRC_RFC3533 ? "rfc3533" : "reflected")
				<< std::endl;
			size_t pc = p.get_packet_count();
			for(size_t i = 0; i < pc; i++) {
				auto pp = p.get_packet(i);
				std::cout << "Packet #" << i << ": " << pp.second << " bytes";
				if(i == 0 && p.get_continue())
					std::cout << " <continued>";
				if(i + 1 == pc && p.get_last_packet_incomplete())
					std::cout << " <incomplete>";
				std::cout << std::endl;
			}
			if(pages < 2 && pc > 0 && !p.get_continue())
				dump_header(p);
			pages++;
		}
	} catch(std::exception& e) {
		std::cerr << "Error reading '" << argv[1] << "': " << e.what() << std::endl;
		return 3;
	}
	std::cout << "End of Ogg stream (" << pages << " pages, " << r.get_skipped() << " bytes skipped)."
		<< std::endl;
	return 0;
}
