#ifndef DRIVEPROF_DOWNLOAD_SESSION_HEADER
#define DRIVEPROF_DOWNLOAD_SESSION_HEADER

#include "remote_peer_tracker.hpp"
#include "milestone_tracker.hpp"
#include "replicated_tree.hpp"
#include "error_code.hpp"
#include "connection.hpp"
#include "workspace.hpp"
#include "settings.hpp"
#include "report.hpp"
#include "swarm.hpp"
#include "store.hpp"
#include "types.hpp"
#include "time.hpp"

#include <functional>
#include <iostream>
#include <memory>
#include <string>

#include <asio/io_context.hpp>

namespace driveprof {

/**
 * Profiles the download of a single drive: it opens the drive in a fresh workspace,
 * joins the swarm as a client, and once the drive's metadata has been found downloads
 * the whole drive while printing a report of every counter at a fixed interval.
 *
 * The session moves through the following states:
 *
 * initializing -> awaiting_metadata -> downloading -> completed -> finished
 *       \________________\_________________\__> cancelling -> finished
 *
 * However it ends (completion, `cancel`, or an error), it prints one final report and
 * tears down the swarm, the store and the workspace, in this order and exactly once,
 * and then invokes the shutdown handler.
 *
 * Everything runs on the thread running `ios`. The session must be managed by a
 * `std::shared_ptr`.
 */
class download_session : public std::enable_shared_from_this<download_session>
{
public:

    enum class state
    {
        initializing,
        awaiting_metadata,
        downloading,
        completed,
        cancelling,
        finished
    };

    /**
     * Invoked once teardown has completed. The error is set if the session could not
     * be set up or the download failed; it is not set if the session completed or was
     * cancelled.
     */
    using shutdown_handler = std::function<void(const error_code&)>;

private:

    asio::io_context& ios_;

    std::shared_ptr<store> store_;
    std::shared_ptr<swarm> swarm_;
    std::unique_ptr<workspace> workspace_;

    // Null until the store has been opened.
    std::shared_ptr<replicated_tree> drive_;

    session_settings settings_;

    // Reports and progress lines go here.
    std::ostream& out_;

    key_type key_;

    milestone_tracker milestones_;
    remote_peer_tracker remote_peers_;

    // Fires every `settings_.report_interval` once the metadata has been found.
    deadline_timer report_timer_;

    state state_ = state::initializing;

    bool is_started_ = false;

    // Set once the download completed. Decides whether the final report is
    // annotated as a cancellation.
    bool exited_ = false;

    // Set on entering `finalize`, which makes it idempotent.
    bool finalizing_ = false;

    // The reason the session ended early, if it did not complete or get cancelled.
    error_code error_;

    shutdown_handler shutdown_handler_;

public:

    download_session(asio::io_context& ios, std::shared_ptr<store> store,
        std::shared_ptr<swarm> swarm, std::unique_ptr<workspace> workspace,
        session_settings settings, std::ostream& out = std::cout);

    /**
     * Starts the session. Failures that occur before anything asynchronous was started
     * are thrown: `std::invalid_argument` for a malformed drive key and
     * `std::system_error` if the workspace cannot be created. Failures after that are
     * reported to `handler`.
     */
    void start(shutdown_handler handler);

    /**
     * Ends the session early: prints the final report with a cancellation notice and
     * tears everything down. A no-op if the session is already finishing.
     */
    void cancel();

    state current_state() const noexcept { return state_; }
    bool is_finished() const noexcept { return state_ == state::finished; }
    const milestone_tracker& milestones() const noexcept { return milestones_; }
    const error_code& error() const noexcept { return error_; }
    const key_type& key() const noexcept { return key_; }
    const workspace& workspace_dir() const noexcept { return *workspace_; }

    /** Renders a report of the current state of the session. */
    std::string make_report();

private:

    void on_store_opened(const error_code& error);
    void on_connection(std::shared_ptr<connection> connection);
    void on_drive_ready(const error_code& error);
    void wait_for_metadata();
    void on_metadata_found();
    void on_downloaded(const error_code& error);

    void start_report_timer();
    void on_report_timer(const error_code& error);
    void print_report();

    /** Ends the session with `error`, used when the session cannot proceed. */
    void fail(const error_code& error);

    /**
     * The single exit path of the session, whether it completed or not. Prints the
     * final report, then destroys the swarm, closes the store and removes the
     * workspace, each step attempted even if the previous one failed.
     */
    void finalize();
    void destroy_swarm();
    void close_store();
    void remove_workspace();

    template<typename... Args>
    void log(const log::priority priority, const char* format, Args&&... args) const;
};

const char* to_string(const download_session::state s) noexcept;

} // namespace driveprof

#endif // DRIVEPROF_DOWNLOAD_SESSION_HEADER
