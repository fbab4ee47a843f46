#include "sync/tasks/Copy.hpp"
#include "sync/ProxyReader.hpp"
#include "storage/Client.hpp"
#include "log/Registry.hpp"

using namespace ms::sync::tasks;
using namespace ms::sync::model;
using namespace ms::storage;
using namespace ms::log;

Copy::Copy(const Client& source, const Client& target, WorkItem item,
           concurrency::AdmissionGate::Slot slot, concurrency::Channel<Message>& status)
    : source(source), target(target), item(std::move(item)), slot(std::move(slot)), status(status) {}

void Copy::operator()() {
    const auto& src = item.source->entry;
    const auto& dst = item.target.entry;
    bool opened = false;

    try {
        const auto in = source.get(src.path);
        opened = true;

        ProxyReader proxy(*in, [this](const uint64_t n) {
            status.push(msg::Progress{item.seq, n});
        });
        std::istream stream(&proxy);

        target.put(dst.path, src.size, stream);
        Registry::sync()->debug("[Copy] {} -> {} ({} bytes)", item.source->url(), item.target.url(), proxy.total());
        status.push(msg::Done{item});
    } catch (const StorageError& e) {
        if (!opened && e.kind() == ErrorKind::NotFound) {
            // source went away between listing and transfer
            Registry::sync()->debug("[Copy] Source vanished: {}", item.source->url());
            status.push(msg::Vanished{item});
        } else {
            auto err = e.error();
            err.path = opened ? item.target.url() : item.source->url();
            item.error = std::move(err);
            status.push(msg::Failed{item});
        }
    } catch (const std::exception& e) {
        item.error = Error{ErrorKind::IO, item.source->url(), e.what()};
        status.push(msg::Failed{item});
    }

    slot.reset();
}
