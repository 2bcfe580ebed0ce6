#include "core/recording.hpp"
#include "core/messages.hpp"
#include "library/directory.hpp"
#include "library/string.hpp"
#include <fstream>

namespace recording
{
track_options::track_options()
{
	directory = ".";
	export_opus = false;
	max_queued = rawdump::writer::default_max_queued;
}

track_result::track_result()
{
	records = 0;
	bytes = 0;
	exported = false;
}

opus::writer_summary export_oggopus(const std::string& raw_path, const std::string& opus_path,
	const opus::writer_options& options)
{
	std::ifstream s(raw_path.c_str(), std::ios_base::binary);
	if(!s)
		(stringfmt() << "Can't open '" << raw_path << "'").throwex();
	rawdump::reader r(s);
	rawdump::record rec;
	opus::ogg_writer w(raw_path, opus_path, options);
	w.init();
	while(true) {
		try {
			if(!r.next(rec))
				break;
		} catch(std::exception& e) {
			messages << "Export of '" << raw_path << "': " << e.what() << ", stopping there" << std::endl;
			break;
		}
		w.write_packet(rec.payload);
	}
	return w.finalize();
}

track::track(const track_options& _options)
	: options(_options)
{
	if(options.track_id == "")
		throw std::runtime_error("Track id can't be empty");
	if(!directory::ensure_exists(options.directory))
		(stringfmt() << "Can't create directory '" << options.directory << "'").throwex();
	raw_path = directory::join(options.directory, options.track_id + ".raw");
	stopped = false;
	result.track_id = options.track_id;
	result.raw_path = raw_path;
	dump.reset(new rawdump::writer(raw_path, options.max_queued));
	messages << "Track " << options.track_id << ": recording to '" << raw_path << "'" << std::endl;
}

track::~track() throw()
{
	stop();
}

threads::future<void> track::packet(const std::vector<uint8_t>& data, uint64_t timestamp)
{
	return dump->enqueue(data, timestamp);
}

threads::future<void> track::packet(const std::vector<uint8_t>& data)
{
	return dump->enqueue(data);
}

bool track::is_stopped()
{
	threads::alock h(stop_lock);
	return stopped;
}

track_result track::stop()
{
	threads::alock h(stop_lock);
	if(stopped)
		return result;
	stopped = true;
	try {
		dump->close();
	} catch(std::exception& e) {
		result.error = e.what();
	}
	if(dump->is_failed() && result.error == "")
		result.error = dump->get_error();
	result.records = dump->get_records_written();
	result.bytes = dump->get_bytes_written();
	result.check = rawdump::validate(raw_path);
	if(!result.check.valid)
		messages << "Track " << options.track_id << ": raw dump '" << raw_path << "' is invalid: "
			<< result.check.error << std::endl;
	else if(result.check.suspicious)
		messages << "Track " << options.track_id << ": first record of '" << raw_path << "' is "
			<< result.check.first_length << " bytes, suspiciously large" << std::endl;
	else
		messages << "Track " << options.track_id << ": raw dump '" << raw_path << "' ok, "
			<< result.check.size << " bytes" << std::endl;
	if(options.export_opus && result.check.valid) {
		std::string opus_path = directory::join(options.directory, options.track_id + ".opus");
		try {
			result.summary = export_oggopus(raw_path, opus_path, options.container);
			result.opus_path = opus_path;
			result.exported = true;
		} catch(std::exception& e) {
			messages << "Track " << options.track_id << ": export failed: " << e.what() << std::endl;
			if(result.error == "")
				result.error = e.what();
		}
	}
	return result;
}

registry::registry()
{
}

registry::~registry() throw()
{
	stop_all();
}

std::shared_ptr<track> registry::start(const std::string& session, const track_options& options)
{
	threads::alock h(mlock);
	auto& tracks = sessions[session];
	auto i = tracks.find(options.track_id);
	if(i != tracks.end())
		return i->second;
	std::shared_ptr<track> t;
	try {
		t.reset(new track(options));
	} catch(...) {
		if(tracks.empty())
			sessions.erase(session);
		throw;
	}
	tracks[options.track_id] = t;
	messages << "Session " << session << ": started track " << options.track_id << std::endl;
	return t;
}

std::shared_ptr<track> registry::find(const std::string& session, const std::string& track_id)
{
	threads::alock h(mlock);
	auto i = sessions.find(session);
	if(i == sessions.end())
		return std::shared_ptr<track>();
	auto j = i->second.find(track_id);
	if(j == i->second.end())
		return std::shared_ptr<track>();
	return j->second;
}

track_result registry::stop(const std::string& session, const std::string& track_id)
{
	std::shared_ptr<track> t;
	{
		threads::alock h(mlock);
		auto i = sessions.find(session);
		if(i == sessions.end() || !i->second.count(track_id))
			(stringfmt() << "No track '" << track_id << "' in session '" << session << "'").throwex();
		t = i->second[track_id];
		i->second.erase(track_id);
		if(i->second.empty())
			sessions.erase(i);
	}
	return t->stop();
}

std::vector<track_result> registry::stop_session(const std::string& session)
{
	std::map<std::string, std::shared_ptr<track>> tracks;
	{
		threads::alock h(mlock);
		auto i = sessions.find(session);
		if(i == sessions.end())
			return std::vector<track_result>();
		tracks.swap(i->second);
		sessions.erase(i);
	}
	std::vector<track_result> ret;
	for(auto& i : tracks)
		ret.push_back(i.second->stop());
	messages << "Session " << session << ": stopped " << ret.size() << " tracks" << std::endl;
	return ret;
}

std::vector<track_result> registry::stop_all()
{
	std::vector<std::string> ids = get_sessions();
	std::vector<track_result> ret;
	for(auto& i : ids) {
		std::vector<track_result> r = stop_session(i);
		ret.insert(ret.end(), r.begin(), r.end());
	}
	return ret;
}

std::vector<std::string> registry::get_sessions()
{
	threads::alock h(mlock);
	std::vector<std::string> ret;
	for(auto& i : sessions)
		ret.push_back(i.first);
	return ret;
}

std::vector<std::string> registry::get_tracks(const std::string& session)
{
	threads::alock h(mlock);
	std::vector<std::string> ret;
	auto i = sessions.find(session);
	if(i == sessions.end())
		return ret;
	for(auto& j : i->second)
		ret.push_back(j.first);
	return ret;
}

size_t registry::get_track_count()
{
	threads::alock h(mlock);
	size_t n = 0;
	for(auto& i : sessions)
		n += i.second.size();
	return n;
}
}
