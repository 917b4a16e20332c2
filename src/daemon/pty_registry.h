#pragma once

#include "core/error.h"
#include "daemon/protocol.h"
#include "daemon/pty_process.h"
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace kild {

struct PtyEntry {
    std::string session_id;
    // Distinguishes a re-created session from the one it replaced, so late
    // events from the old child are dropped.
    uint64_t generation = 0;
    std::unique_ptr<PtyProcess> process;
    PtyState state = PtyState::Starting;
    pid_t pid = 0;
    std::optional<int> exit_code;
    std::set<uint64_t> attached;
    std::chrono::steady_clock::time_point started_at;
    std::optional<std::chrono::steady_clock::time_point> last_output;
    std::optional<std::chrono::steady_clock::time_point> exited_at;
    std::string command;
    std::string cwd;

    bool live() const { return state != PtyState::Exited; }
    PtySessionInfo info() const;
};

// The daemon's table of managed PTYs, keyed by session id. Only the daemon
// loop touches it; PTY io threads report through the sinks.
class PtyRegistry {
public:
    using OutputSink = std::function<void(const std::string& session_id, uint64_t generation,
                                          const std::string& data)>;
    using ExitSink = std::function<void(const std::string& session_id, uint64_t generation,
                                        pid_t pid, int exit_code)>;

    PtyRegistry(OutputSink on_output, ExitSink on_exit,
                std::chrono::milliseconds idle_after, std::chrono::milliseconds kill_grace,
                std::chrono::milliseconds exited_retention = std::chrono::milliseconds(60000));
    ~PtyRegistry();

    PtyRegistry(const PtyRegistry&) = delete;
    PtyRegistry& operator=(const PtyRegistry&) = delete;

    // AlreadyExists while a live PTY has this id; an exited record is replaced.
    Result<PtySessionInfo> open(const std::string& session_id, const PtyConfig& config);

    Status attach(const std::string& session_id, uint64_t connection_id);
    Status detach(const std::string& session_id, uint64_t connection_id);
    void detach_everywhere(uint64_t connection_id);

    // InvalidInput when `connection_id` is not attached to the session.
    Status write_input(const std::string& session_id, uint64_t connection_id, const std::string& data);
    Status resize(const std::string& session_id, int rows, int cols);
    Status kill(const std::string& session_id);

    // Both return false for events from a replaced or unknown PTY.
    bool record_output(const std::string& session_id, uint64_t generation,
                       std::chrono::steady_clock::time_point now);
    // Also releases the PTY: joins the io thread and closes the master side.
    bool mark_exited(const std::string& session_id, uint64_t generation, int exit_code,
                     std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now());

    std::vector<uint64_t> attached_to(const std::string& session_id) const;

    // An exited record is reported once more and then discarded. Unqueried
    // records expire after the retention period (see refresh_activity).
    std::optional<PtySessionInfo> take_status(const std::string& session_id);
    std::vector<PtySessionInfo> list() const;

    // Moves running PTYs between Idle and Busy based on time since last output,
    // and drops exited records older than the retention period.
    void refresh_activity(std::chrono::steady_clock::time_point now);

    void stop_all();
    size_t live_count() const;
    size_t size() const { return entries_.size(); }

private:
    PtyEntry* find(const std::string& session_id);
    const PtyEntry* find(const std::string& session_id) const;

    std::map<std::string, PtyEntry> entries_;
    OutputSink on_output_;
    ExitSink on_exit_;
    std::chrono::milliseconds idle_after_;
    std::chrono::milliseconds kill_grace_;
    std::chrono::milliseconds exited_retention_;
    uint64_t next_generation_ = 1;
};

}
