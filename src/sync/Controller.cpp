#include "sync/Controller.hpp"
#include "sync/Differ.hpp"
#include "sync/Executor.hpp"
#include "sync/Planner.hpp"
#include "sync/Session.hpp"
#include "sync/Status.hpp"
#include "sync/Watcher.hpp"
#include "storage/Client.hpp"
#include "storage/Resolver.hpp"
#include "concurrency/AdmissionGate.hpp"
#include "concurrency/Channel.hpp"
#include "concurrency/ThreadPool.hpp"
#include "progress/Sink.hpp"
#include "config/Config.hpp"
#include "log/Registry.hpp"

#include <stdexcept>
#include <thread>
#include <utility>

using namespace ms::sync;
using namespace ms::sync::model;
using namespace ms::storage;
using namespace ms::concurrency;
using namespace ms::log;

namespace {

// Producers report their own setup failures as items so that a single bad
// target does not take the others down.
template <typename Fn>
bool guarded(Channel<Message>& status, const size_t targetIndex, Fn&& fn) {
    try {
        fn();
        return true;
    } catch (const StorageError& e) {
        status.push(msg::Failed{WorkItem::failure(e.error(), targetIndex)});
    } catch (const std::exception& e) {
        status.push(msg::Failed{WorkItem::failure(Error{ErrorKind::IO, "", e.what()}, targetIndex)});
    }
    return false;
}

void joinAll(std::vector<std::thread>& threads) {
    for (auto& t : threads) if (t.joinable()) t.join();
    threads.clear();
}

}

Controller::Controller(const config::Config& config, std::atomic<bool>& interrupt, Connector connect)
    : config_(config), interrupt_(interrupt), connect_(std::move(connect)) {}

std::unique_ptr<Session> Controller::openSession(const MirrorRequest& request, progress::Sink& sink) const {
    const auto& dir = config_.mirror.session_dir;
    const auto id = Session::makeId(request.source, request.targets, request.policy);

    if (auto existing = Session::load(dir, id)) {
        if (existing->header().prepared) {
            Registry::session()->info("[Controller] Resuming session {} ({} of {} items done)", id,
                                      existing->completed().size(), existing->header().totalObjects);
            sink.message(fmt::format("Resuming previous session {}", id));
            return existing;
        }
        Registry::session()->info("[Controller] Discarding unprepared session {}", id);
        existing->remove();
    }

    SessionHeader header;
    header.id = id;
    header.source = request.source;
    header.targets = request.targets;
    header.force = request.policy.force;
    header.fake = request.policy.fake;
    header.remove = request.policy.remove;
    return Session::create(dir, std::move(header));
}

int Controller::run(const MirrorRequest& request, progress::Sink& sink) {
    const auto& policy = request.policy;
    policy.validate();
    if (request.targets.empty()) throw std::invalid_argument("at least one target is required");

    const Resolver resolver(config_);
    const auto connect = [&](const Location& loc) { return connect_ ? connect_(loc) : resolver.connect(loc); };

    const auto srcLoc = resolver.resolve(request.source);
    const auto source = connect(srcLoc);

    std::vector<std::shared_ptr<Client>> targets;
    targets.reserve(request.targets.size());
    for (const auto& url : request.targets) {
        const auto loc = resolver.resolve(url);
        if (loc == srcLoc)
            throw std::invalid_argument(fmt::format("source and target are the same location: {}", loc.resolved));
        targets.push_back(connect(loc));
    }

    // the source must be an existing directory before any work is planned
    try {
        if (!source->stat("").isDir)
            throw std::invalid_argument(fmt::format("source is not a directory: {}", srcLoc.resolved));
    } catch (const StorageError& e) {
        if (e.kind() == ErrorKind::NotFound)
            throw std::invalid_argument(fmt::format("source does not exist: {}", srcLoc.resolved));
        throw;
    }

    const bool useSession = config_.mirror.sessions && !policy.watch && !policy.fake;
    std::unique_ptr<Session> session = useSession ? openSession(request, sink) : nullptr;
    const bool resuming = session && session->header().prepared;

    const unsigned int workers = request.workers && *request.workers > 0
        ? *request.workers : config_.mirror.effectiveWorkers();

    Channel<WorkItem> work(config_.mirror.queue_capacity);
    Channel<Message> status;
    Tally tally;

    ThreadPool pool(workers);
    AdmissionGate gate(workers);

    Registry::sync()->info("[Controller] Mirroring {} to {} target(s) with {} workers{}{}",
                           srcLoc.resolved, targets.size(), workers,
                           policy.fake ? " (fake)" : "", policy.watch ? " (watch)" : "");
    sink.setCaption(srcLoc.resolved);

    std::vector<std::thread> planners;
    std::vector<std::thread> watchers;
    // cleared when any target was not fully listed; such a plan is never marked resumable
    std::atomic<bool> planned{true};

    if (resuming) {
        const auto& header = session->header();
        tally.restore(session->maxSeq(), header.totalObjects, header.totalBytes);
        sink.setTotal(header.totalObjects, header.totalBytes);
        planners.emplace_back([&, items = session->items()]() mutable {
            for (auto& item : items)
                if (!work.push(std::move(item), &interrupt_)) {
                    planned = false;
                    return;
                }
        });
    } else {
        for (size_t i = 0; i < targets.size(); ++i) {
            planners.emplace_back([&, i] {
                const bool ok = guarded(status, i, [&] {
                    Differ differ(*source, *targets[i], true);
                    Planner planner(policy, tally, work, interrupt_, session ? &status : nullptr);
                    if (!planner.prepare(differ, srcLoc, targets[i]->location(), i)) planned = false;
                    if (planner.listingErrors() > 0) {
                        Registry::sync()->warn("[Controller] {} subtree(s) of {} could not be listed",
                                               planner.listingErrors(), targets[i]->location().resolved);
                        planned = false;
                    }
                });
                if (!ok) planned = false;
            });
        }
    }

    if (policy.watch) {
        const std::chrono::milliseconds interval(config_.mirror.watch_poll_interval_ms);
        for (size_t i = 0; i < targets.size(); ++i) {
            watchers.emplace_back([&, i, interval] {
                guarded(status, i, [&] {
                    Watcher watcher(*source, *targets[i], i, policy, tally, work, interrupt_, interval);
                    watcher.run();
                });
            });
        }
    }

    std::thread coordinator([&] {
        joinAll(planners);
        if (planned && !interrupt_.load()) status.push(msg::Prepared{tally.count(), tally.bytes()});
        joinAll(watchers);
        work.close();
    });

    std::thread executorThread([&] {
        Executor executor(*source, targets, policy, pool, gate, status, interrupt_);
        executor.run(work);
        status.close();
    });

    Status reducer(sink, session.get());
    std::exception_ptr reducerError;
    try {
        reducer.run(status);
    } catch (...) {
        // keep the pipeline draining so the threads can be joined
        reducerError = std::current_exception();
        interrupt_ = true;
        while (status.pop()) {}
    }

    coordinator.join();
    executorThread.join();
    pool.stop();

    if (reducerError) std::rethrow_exception(reducerError);

    const auto& outcome = reducer.outcome();
    const bool interrupted = interrupt_.load();

    if (session) {
        if (!outcome.prepared) {
            // an incomplete plan cannot be replayed, the next run lists again
            session->remove();
        } else if (interrupted) {
            session->save();
            sink.message(fmt::format("Session {} saved, run the same command again to resume", session->header().id));
        } else if (session->kept()) {
            session->save();
            sink.message(fmt::format("Transient failures occurred, session {} kept for resume", session->header().id));
        } else {
            session->remove();
        }
    }

    const auto summary = sink.finish();
    Registry::sync()->info("[Controller] Finished: {} done, {} failed, {} bytes in {} ms",
                           outcome.done, outcome.failures, summary.bytes, summary.elapsed.count());

    if (interrupted && !policy.watch) return EXIT_INTERRUPTED;
    return outcome.failures > 0 ? EXIT_FAILED : EXIT_OK;
}
