#include "core/messages.hpp"
#include "core/recording.hpp"
#include "library/string.hpp"
#include <iostream>

namespace
{
	void usage()
	{
		std::cerr << "Syntax: oggrec-rawtoopus [<options>] <input.raw> <output.opus>" << std::endl;
		std::cerr << "--channels=<n>: Channel count (1 or 2, default 2)" << std::endl;
		std::cerr << "--rate=<hz>: Input sample rate (default 48000)" << std::endl;
		std::cerr << "--preskip=<samples>: Pre-skip (default 0)" << std::endl;
		std::cerr << "--gain=<q7.8>: Output gain (default 0)" << std::endl;
		std::cerr << "--vendor=<text>: Vendor string (default oggrec)" << std::endl;
		std::cerr << "--comment=<key=value>: Add comment (may be repeated)" << std::endl;
		std::cerr << "--serial=<n>: Fixed stream serial (default random)" << std::endl;
		std::cerr << "--crc=<reflected|rfc3533>: Page checksum (default reflected)" << std::endl;
	}

	bool option(const std::string& a, const std::string& name, std::string& value)
	{
		std::string prefix = "--" + name + "=";
		if(a.length() < prefix.length() || a.substr(0, prefix.length()) != prefix)
			return false;
		value = a.substr(prefix.length());
		return true;
	}
}

int main(int argc, char** argv)
{
	opus::writer_options options;
	std::vector<std::string> files;
	try {
		for(int i = 1; i < argc; i++) {
			std::string a = argv[i];
			std::string v;
			if(option(a, "channels", v))
				options.channels = parse_value<uint8_t>(v);
			else if(option(a, "rate", v))
				options.rate = parse_value<uint32_t>(v);
			else if(option(a, "preskip", v))
				options.preskip = parse_value<uint16_t>(v);
			else if(option(a, "gain", v))
				options.gain = parse_value<int16_t>(v);
			else if(option(a, "vendor", v))
				options.vendor = v;
			else if(option(a, "comment", v))
				options.comments.push_back(v);
			else if(option(a, "serial", v)) {
				options.fixed_serial = true;
				options.serial = parse_value<uint32_t>(v);
			} else if(option(a, "crc", v)) {
				if(v == "reflected")
					options.checksum = ogg::CRC_REFLECTED;
				else if(v == "rfc3533")
					options.checksum = ogg::CRC_RFC3533;
				else
					throw std::runtime_error("Unknown checksum '" + v + "'");
			} else if(a.length() > 2 && a.substr(0, 2) == "--")
				throw std::runtime_error("Unknown option '" + a + "'");
			else
				files.push_back(a);
		}
	} catch(std::exception& e) {
		std::cerr << e.what() << std::endl;
		usage();
		return 1;
	}
	if(files.size() != 2) {
		usage();
		return 1;
	}
	try {
		opus::writer_summary s = recording::export_oggopus(files[0], files[1], options);
		std::cout << files[1] << ": " << s.packets << " packets, " << s.bytes << " bytes, granulepos "
			<< s.granulepos << std::endl;
	} catch(std::exception& e) {
		messages << "Export failed: " << e.what() << std::endl;
		return 2;
	}
	return 0;
}
