#include "download_session.hpp"
#include "metrics_snapshot.hpp"
#include "profiler_error.hpp"
#include "string_utils.hpp"
#include "id_encoding.hpp"
#include "log.hpp"

#include <stdexcept>

namespace driveprof {

// `download_session` needs to be kept alive until all async ops complete, so we bind
// a `std::shared_ptr` to the instance to each async op's handler along with `this`.
#define SHARED_THIS this, self(shared_from_this())

static const std::string separator(50, '-');

download_session::download_session(asio::io_context& ios, std::shared_ptr<store> store,
    std::shared_ptr<swarm> swarm, std::unique_ptr<workspace> workspace,
    session_settings settings, std::ostream& out)
    : ios_(ios)
    , store_(std::move(store))
    , swarm_(std::move(swarm))
    , workspace_(std::move(workspace))
    , settings_(std::move(settings))
    , out_(out)
    , remote_peers_(settings_.expected_peers)
    , report_timer_(ios)
{
    if(!store_ || !swarm_ || !workspace_)
    {
        throw std::invalid_argument("download_session needs a store, swarm and workspace");
    }
}

void download_session::start(shutdown_handler handler)
{
    if(is_started_)
    {
        throw system_error(make_error_code(profiler_errc::already_started));
    }
    key_ = id_encoding::decode(settings_.drive_key);
    milestones_.mark_start();

    out_ << "Profiling drive download for " << id_encoding::normalize(key_) << '\n';
    out_ << "Using temporary directory " << workspace_->directory().string() << '\n';
    out_ << "Printing progress every " << to_int<seconds>(settings_.report_interval)
         << " seconds\n";
    if(remote_peers_.is_enabled())
    {
        out_ << "Tracking " << remote_peers_.expected().size() << " remote peers\n";
    }

    // Nothing is running yet, so a failure here is simply thrown to the caller.
    workspace_->create();
    is_started_ = true;
    shutdown_handler_ = std::move(handler);

    log(log::priority::low, "opening store in %s",
        workspace_->directory().string().c_str());
    store_->open(workspace_->directory(),
        [SHARED_THIS](const error_code& error) { on_store_opened(error); });
}

void download_session::cancel()
{
    if(!is_started_ || finalizing_) { return; }
    log(log::priority::normal, "cancelled in state %s", to_string(state_));
    finalize();
}

void download_session::on_store_opened(const error_code& error)
{
    if(finalizing_) { return; }
    if(error)
    {
        fail(error);
        return;
    }

    try
    {
        drive_ = store_->open_drive(key_);
    }
    catch(const system_error& e)
    {
        fail(e.code());
        return;
    }

    // The swarm outlives neither the session nor its handlers, but a strong reference
    // here would form a cycle, so only a weak one is kept.
    std::weak_ptr<download_session> weak_self = shared_from_this();
    swarm_->on_connection([weak_self](std::shared_ptr<connection> connection)
        {
            if(auto self = weak_self.lock())
            {
                self->on_connection(std::move(connection));
            }
            else
            {
                connection->close();
            }
        });

    drive_->ready([SHARED_THIS](const error_code& error) { on_drive_ready(error); });
}

void download_session::on_connection(std::shared_ptr<connection> connection)
{
    if(finalizing_)
    {
        connection->close();
        return;
    }

    log(log::priority::normal, "connection from %s",
        connection->remote_address().c_str());
    std::weak_ptr<download_session> weak_self = shared_from_this();
    connection->on_error([weak_self](const error_code& error)
        {
            // A failed connection must not end the session, so it's only reported.
            if(auto self = weak_self.lock())
            {
                self->out_ << "Connection error: " << error.message() << '\n';
            }
        });
    store_->replicate(std::move(connection));
}

void download_session::on_drive_ready(const error_code& error)
{
    if(finalizing_) { return; }
    if(error)
    {
        fail(error);
        return;
    }

    swarm_->join(drive_->discovery_key(), join_options{false, true});
    state_ = state::awaiting_metadata;
    log(log::priority::normal, "joined swarm, metadata length: %lli",
        static_cast<long long>(drive_->metadata().length()));

    // A metadata stream with at most the header block means that we haven't synced
    // with anyone yet. This can be off if the drive really has no entries, but then
    // the first append is still a good enough signal.
    if(drive_->metadata().length() <= 1)
    {
        wait_for_metadata();
    }
    else
    {
        on_metadata_found();
    }
}

void download_session::wait_for_metadata()
{
    std::weak_ptr<download_session> weak_self = shared_from_this();
    drive_->metadata().on_append([weak_self]
        {
            auto self = weak_self.lock();
            if(!self || self->finalizing_) { return; }
            self->on_metadata_found();
        });
}

void download_session::on_metadata_found()
{
    milestones_.mark_metadata_found();
    state_ = state::downloading;
    start_report_timer();

    out_ << "Downloading drive version " << drive_->version() << '\n';
    out_ << '\n' << separator << "\n\n";
    log(log::priority::normal, "metadata found after %.3fs",
        *milestones_.metadata_found_at());

    drive_->download("/",
        [SHARED_THIS](const error_code& error) { on_downloaded(error); });
}

void download_session::on_downloaded(const error_code& error)
{
    if(finalizing_) { return; }
    if(error)
    {
        fail(error);
        return;
    }
    milestones_.mark_fully_downloaded();
    log(log::priority::normal, "fully downloaded after %.3fs",
        *milestones_.fully_downloaded_at());
    state_ = state::completed;
    // Must be set before finalizing so that the final report is not annotated as a
    // cancellation.
    exited_ = true;
    finalize();
}

void download_session::start_report_timer()
{
    start_timer(report_timer_, settings_.report_interval,
        [SHARED_THIS](const error_code& error) { on_report_timer(error); });
}

void download_session::on_report_timer(const error_code& error)
{
    // A tick that was already queued when the session exited is dropped.
    if(error == asio::error::operation_aborted || exited_ || finalizing_) { return; }
    if(error)
    {
        log(log::priority::high, "report timer error: %s", error.message().c_str());
        return;
    }
    print_report();
    start_report_timer();
}

std::string download_session::make_report()
{
    const metrics_snapshot snapshot = capture_snapshot(*swarm_, *store_);
    const report_input input = collect_report_input(
        drive_.get(), snapshot, milestones_, remote_peers_);
    report_options options;
    options.show_address = settings_.show_address;
    options.show_detail = settings_.show_detail;
    return render_report(input, options);
}

void download_session::print_report()
{
    out_ << make_report() << '\n' << separator << "\n\n";
    out_.flush();
}

void download_session::fail(const error_code& error)
{
    log(log::priority::high, "session failed in state %s: %s", to_string(state_),
        error.message().c_str());
    out_ << "Error: " << error.message() << '\n';
    error_ = error;
    finalize();
}

void download_session::finalize()
{
    if(finalizing_) { return; }
    finalizing_ = true;

    std::error_code ec;
    report_timer_.cancel(ec);

    // A session that could not even be set up has nothing to report.
    if(!(error_ && state_ == state::initializing)) { print_report(); }
    if(!exited_)
    {
        if(!error_) { out_ << "Cancelling before the download is complete...\n"; }
        state_ = state::cancelling;
    }
    destroy_swarm();
}

void download_session::destroy_swarm()
{
    out_ << "Destroying swarm...\n";
    try
    {
        swarm_->destroy([SHARED_THIS](const error_code& error)
            {
                if(error)
                {
                    log(log::priority::high, "could not destroy swarm: %s",
                        error.message().c_str());
                }
                close_store();
            });
    }
    catch(const std::exception& e)
    {
        log(log::priority::high, "could not destroy swarm: %s", e.what());
        close_store();
    }
}

void download_session::close_store()
{
    out_ << "Closing store...\n";
    try
    {
        store_->close([SHARED_THIS](const error_code& error)
            {
                if(error)
                {
                    log(log::priority::high, "could not close store: %s",
                        error.message().c_str());
                }
                remove_workspace();
            });
    }
    catch(const std::exception& e)
    {
        log(log::priority::high, "could not close store: %s", e.what());
        remove_workspace();
    }
}

void download_session::remove_workspace()
{
    out_ << "Cleaning up temporary directory...\n";
    const error_code ec = workspace_->remove();
    if(ec)
    {
        log(log::priority::high, "could not remove %s: %s",
            workspace_->directory().string().c_str(), ec.message().c_str());
    }
    out_ << "fully done...\n";
    out_.flush();

    state_ = state::finished;
    log(log::priority::normal, "finished");
    if(shutdown_handler_)
    {
        auto handler = std::move(shutdown_handler_);
        shutdown_handler_ = nullptr;
        handler(error_);
    }
}

template<typename... Args>
void download_session::log(const log::priority priority, const char* format,
    Args&&... args) const
{
    log::log_session(to_string(state_),
        util::format(format, std::forward<Args>(args)...), priority);
}

const char* to_string(const download_session::state s) noexcept
{
    switch(s)
    {
    case download_session::state::initializing: return "INITIALIZING";
    case download_session::state::awaiting_metadata: return "AWAITING_METADATA";
    case download_session::state::downloading: return "DOWNLOADING";
    case download_session::state::completed: return "COMPLETED";
    case download_session::state::cancelling: return "CANCELLING";
    case download_session::state::finished: return "FINISHED";
    default: return "UNKNOWN";
    }
}

} // namespace driveprof
