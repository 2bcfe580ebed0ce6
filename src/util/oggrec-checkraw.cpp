#include "library/rawdump.hpp"
#include <iostream>

int main(int argc, char** argv)
{
	bool all = false;
	bool any = false;
	int bad = 0;
	for(int i = 1; i < argc; i++) {
		std::string a = argv[i];
		if(a == "--all") {
			all = true;
			continue;
		}
		any = true;
		rawdump::validation v = all ? rawdump::validate_all(a) : rawdump::validate(a);
		if(!v.valid) {
			std::cout << a << ": INVALID: " << v.error << std::endl;
			bad++;
			continue;
		}
		std::cout << a << ": ok, " << v.size << " bytes, first record " << v.first_length << " bytes";
		if(all)
			std::cout << ", " << v.records << " records";
		if(v.suspicious)
			std::cout << " (suspiciously large first record)";
		std::cout << std::endl;
	}
	if(!any) {
		std::cerr << "Syntax: oggrec-checkraw [--all] <file>..." << std::endl;
		return 2;
	}
	return bad ? 1 : 0;
}
