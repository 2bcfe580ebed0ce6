#include "directory.hpp"
#include <boost/filesystem.hpp>

#ifdef BOOST_FILESYSTEM3
namespace boost_fs = boost::filesystem3;
#else
namespace boost_fs = boost::filesystem;
#endif

namespace directory
{
uintmax_t size(const std::string& path)
{
	boost::system::error_code ec;
	uintmax_t s = boost_fs::file_size(boost_fs::path(path), ec);
	if(ec)
		return static_cast<uintmax_t>(-1);
	return s;
}

bool exists(const std::string& filename)
{
	boost::system::error_code ec;
	return boost_fs::exists(boost_fs::path(filename), ec);
}

bool is_regular(const std::string& filename)
{
	boost::system::error_code ec;
	boost_fs::file_status stat = status(boost_fs::path(filename), ec);
	return !ec && is_regular_file(stat);
}

bool is_directory(const std::string& filename)
{
	boost::system::error_code ec;
	return boost_fs::is_directory(boost_fs::path(filename), ec);
}

bool ensure_exists(const std::string& path)
{
	boost::system::error_code ec;
	boost_fs::path p(path);
	if(boost_fs::create_directories(p, ec))
		return true;
	return boost_fs::is_directory(p, ec);
}

std::string join(const std::string& dir, const std::string& name)
{
	if(dir.empty())
		return name;
	return (boost_fs::path(dir) / name).string();
}
}
