#ifndef _recording__hpp__included__
#define _recording__hpp__included__

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "core/oggopus-writer.hpp"
#include "core/rawdump-writer.hpp"
#include "library/rawdump.hpp"
#include "library/threads.hpp"

namespace recording
{
/**
 * Settings of a track.
 */
struct track_options
{
	track_options();
/**
 * Directory the track files go to. Created on start.
 */
	std::string directory;
	std::string track_id;
/**
 * Settings for the exported container.
 */
	opus::writer_options container;
/**
 * Export <track_id>.opus from the raw dump on stop.
 */
	bool export_opus;
	size_t max_queued;
};

/**
 * What happened to a track when it was stopped.
 */
struct track_result
{
	track_result();
	std::string track_id;
	std::string raw_path;
	std::string opus_path;
	uint64_t records;
	uint64_t bytes;
	rawdump::validation check;
	bool exported;
	opus::writer_summary summary;
/**
 * Error text from closing or exporting, empty if none.
 */
	std::string error;
};

/**
 * Replay a raw dump into an Ogg Opus file.
 *
 * A record cut short at the end of the dump ends the replay with a warning.
 *
 * Parameter raw_path: The raw dump.
 * Parameter opus_path: The container file to write.
 * Parameter options: The container settings.
 * Returns: The container writer counters.
 * Throws std::runtime_error: Can't read the dump or write the container.
 */
opus::writer_summary export_oggopus(const std::string& raw_path, const std::string& opus_path,
	const opus::writer_options& options = opus::writer_options());

/**
 * A recording track: one speaker writing one raw dump.
 */
class track
{
public:
/**
 * Start the track. Creates the directory and the raw dump.
 *
 * Throws std::runtime_error: Can't create the directory or the file.
 */
	track(const track_options& options);
	~track() throw();
/**
 * Queue a packet.
 */
	threads::future<void> packet(const std::vector<uint8_t>& data, uint64_t timestamp);
/**
 * Queue a packet stamped with current time.
 */
	threads::future<void> packet(const std::vector<uint8_t>& data);
/**
 * Stop the track: close the dump, validate it and export if requested. Later calls return the
 * same result.
 */
	track_result stop();
	const std::string& get_id() const throw() { return options.track_id; }
	const std::string& get_raw_path() const throw() { return raw_path; }
	bool is_stopped();
	rawdump::writer& get_writer() { return *dump; }
private:
	track(const track&);
	track& operator=(const track&);
	track_options options;
	std::string raw_path;
	std::unique_ptr<rawdump::writer> dump;
	threads::lock stop_lock;
	bool stopped;
	track_result result;
};

/**
 * Active recordings by session and track.
 *
 * Note: All methods are thread-safe.
 */
class registry
{
public:
	registry();
	~registry() throw();
/**
 * Start a track in session, or get the track already running under that id.
 *
 * Parameter session: The session id.
 * Parameter options: The track settings.
 * Returns: The track. Stays usable after stop; further packets are refused.
 * Throws std::runtime_error: Can't start the track.
 */
	std::shared_ptr<track> start(const std::string& session, const track_options& options);
/**
 * Look up a running track.
 *
 * Returns: The track, or empty pointer if there is none.
 */
	std::shared_ptr<track> find(const std::string& session, const std::string& track_id);
/**
 * Stop a track and forget it.
 *
 * Throws std::runtime_error: No such track.
 */
	track_result stop(const std::string& session, const std::string& track_id);
/**
 * Stop every track in session and forget the session.
 *
 * Returns: The results, in track id order. Empty if there is no such session.
 */
	std::vector<track_result> stop_session(const std::string& session);
/**
 * Stop everything.
 */
	std::vector<track_result> stop_all();
/**
 * Get ids of sessions with running tracks.
 */
	std::vector<std::string> get_sessions();
/**
 * Get ids of running tracks in session.
 */
	std::vector<std::string> get_tracks(const std::string& session);
/**
 * Get number of running tracks.
 */
	size_t get_track_count();
private:
	registry(const registry&);
	registry& operator=(const registry&);
	threads::lock mlock;
	std::map<std::string, std::map<std::string, std::shared_ptr<track>>> sessions;
};
}

#endif
