#include "sync/tasks/Delete.hpp"
#include "storage/Client.hpp"
#include "log/Registry.hpp"

using namespace ms::sync::tasks;
using namespace ms::sync::model;
using namespace ms::storage;
using namespace ms::log;

Delete::Delete(const Client& target, WorkItem item,
               concurrency::AdmissionGate::Slot slot, concurrency::Channel<Message>& status)
    : target(target), item(std::move(item)), slot(std::move(slot)), status(status) {}

void Delete::operator()() {
    try {
        target.remove(item.target.entry.path);
        Registry::sync()->debug("[Delete] Removed {}", item.target.url());
        status.push(msg::Done{item});
    } catch (const StorageError& e) {
        if (e.kind() == ErrorKind::NotFound) {
            Registry::sync()->debug("[Delete] {} already gone", item.target.url());
            status.push(msg::Done{item});
        } else {
            auto err = e.error();
            err.path = item.target.url();
            item.error = std::move(err);
            status.push(msg::Failed{item});
        }
    } catch (const std::exception& e) {
        item.error = Error{ErrorKind::IO, item.target.url(), e.what()};
        status.push(msg::Failed{item});
    }

    slot.reset();
}
