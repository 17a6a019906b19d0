#include "wsbridge/bridge.hpp"
#include "wsbridge/core/log.hpp"
#include "wsbridge/path_util.hpp"
#include "wsbridge/transfer_plan.hpp"

#include <fstream>
#include <stdexcept>

namespace wsbridge {

namespace {

void set_error(Outcome& outcome, ErrorKind kind, const std::string& message) {
    outcome.success = false;
    outcome.error_kind = kind;
    outcome.error_message = message;
}

// Runs `fn`, turning thrown errors into a classified outcome.
template <typename Result, typename Fn>
Result guarded(const char* operation, Fn&& fn) {
    Result result;
    try {
        fn(result);
        result.success = result.error_kind == ErrorKind::None;
    } catch (const BridgeError& e) {
        set_error(result, e.kind(), e.what());
    } catch (const std::invalid_argument& e) {
        set_error(result, ErrorKind::Validation, e.what());
    } catch (const std::exception& e) {
        set_error(result, ErrorKind::Io, e.what());
    }
    if (!result.success) {
        log_debug("%s failed (%s): %s", operation, error_kind_name(result.error_kind),
                  result.error_message.c_str());
    }
    return result;
}

bool is_storage_side(LocationSide side) {
    return side == LocationSide::Storage || side == LocationSide::Shared;
}

WorkspaceEntry to_entry(const StorageEntry& entry) {
    WorkspaceEntry we;
    we.name = entry.name;
    we.path = entry.path;
    we.is_directory = entry.is_directory;
    we.size = entry.size;
    we.last_modified = entry.last_modified;
    return we;
}

}  // namespace

StorageBridge::StorageBridge(const ConfigResolver& resolver,
                             const WorkspaceBridge& workspace,
                             TaskRegistry& registry,
                             TransferExecutor& executor,
                             uint64_t zip_stream_threshold)
    : resolver_(resolver)
    , workspace_(workspace)
    , registry_(registry)
    , executor_(executor)
    , zip_stream_threshold_(zip_stream_threshold) {}

std::unique_ptr<StorageClient> StorageBridge::client_for(const std::string& tenant,
                                                         LocationSide side) const {
    validate_tenant(tenant);
    return executor_.open_client(executor_.config_for(tenant, side));
}

// --- Configuration ---

ConfigOutcome StorageBridge::resolve_config(const std::string& tenant) const {
    return guarded<ConfigOutcome>("resolve_config", [&](ConfigOutcome& out) {
        out.config = resolver_.resolve(tenant);
    });
}

ConnectionOutcome StorageBridge::test_connection(const StorageConfig& config) {
    auto outcome = guarded<ConnectionOutcome>("test_connection", [&](ConnectionOutcome& out) {
        out.check = wsbridge::test_connection(config);
        if (!out.check.ok) set_error(out, ErrorKind::Connection, out.check.message);
    });

    std::lock_guard lock(stats_mutex_);
    ++connection_checks_[outcome.check.status];
    return outcome;
}

std::map<ConnectionStatus, uint64_t> StorageBridge::connection_check_counts() const {
    std::lock_guard lock(stats_mutex_);
    return connection_checks_;
}

// --- Browsing ---

ListOutcome StorageBridge::list(const std::string& tenant, const Location& location,
                                bool recursive) const {
    return guarded<ListOutcome>("list", [&](ListOutcome& out) {
        if (location.side == LocationSide::Workspace) {
            if (!recursive) {
                out.entries = workspace_.list_local(tenant, location.path);
                return;
            }
            auto base = normalize_relative_path(location.path);
            for (auto& entry : workspace_.walk(tenant, base)) {
                entry.path = join_path(base, entry.path);
                out.entries.push_back(std::move(entry));
            }
            return;
        }
        if (!is_storage_side(location.side)) {
            throw ValidationError("Cannot list an archive location");
        }

        auto client = client_for(tenant, location.side);
        auto listing = client->list(location.path, recursive);
        if (!listing.success) {
            set_error(out, ErrorKind::Connection, listing.error_message);
            return;
        }
        if (listing.entries.empty() && !client->is_folder(location.path)) {
            if (client->head(location.path)) {
                throw ValidationError("Not a folder: '" + location.path + "'");
            }
            throw BridgeError(ErrorKind::NotFound, "Folder not found: '" + location.path + "'");
        }
        for (const auto& entry : listing.entries) {
            out.entries.push_back(to_entry(entry));
        }
    });
}

TextOutcome StorageBridge::read_text(const std::string& tenant, const Location& location) const {
    return guarded<TextOutcome>("read_text", [&](TextOutcome& out) {
        if (location.side == LocationSide::Workspace) {
            out.text = workspace_.read_text(tenant, location.path, constants::MAX_TEXT_READ_SIZE);
            return;
        }
        if (!is_storage_side(location.side)) {
            throw ValidationError("Cannot read an archive location");
        }

        auto client = client_for(tenant, location.side);
        auto read = client->read(location.path, constants::MAX_TEXT_READ_SIZE);
        if (read.success) {
            out.text.assign(read.data.begin(), read.data.end());
        } else if (read.not_found) {
            set_error(out, ErrorKind::NotFound, read.error_message);
        } else if (read.too_large) {
            set_error(out, ErrorKind::Validation, read.error_message);
        } else {
            set_error(out, ErrorKind::Connection, read.error_message);
        }
    });
}

StreamOutcome StorageBridge::stream_object(const std::string& tenant, const Location& location,
                                           const ObjectSink& sink) const {
    return guarded<StreamOutcome>("stream_object", [&](StreamOutcome& out) {
        StreamResult streamed;
        if (location.side == LocationSide::Workspace) {
            streamed = workspace_.stream_file(tenant, location.path, sink, executor_.config().chunk_size);
        } else if (is_storage_side(location.side)) {
            if (normalize_relative_path(location.path).empty()) {
                throw ValidationError("No object named");
            }
            streamed = client_for(tenant, location.side)->stream(location.path, sink);
        } else {
            throw ValidationError("Cannot stream an archive location");
        }

        out.bytes = streamed.bytes;
        if (streamed.success) return;
        if (streamed.not_found) {
            set_error(out, ErrorKind::NotFound, streamed.error_message);
        } else if (streamed.aborted || location.side == LocationSide::Workspace) {
            set_error(out, ErrorKind::Io, streamed.error_message);
        } else {
            set_error(out, ErrorKind::Connection, streamed.error_message);
        }
    });
}

// --- Transfers ---

StartOutcome StorageBridge::start_transfer(const TransferRequest& request) {
    return guarded<StartOutcome>("start_transfer", [&](StartOutcome& out) {
        out.token = executor_.submit(request);
    });
}

TaskOutcome StorageBridge::get_transfer_status(const std::string& token) const {
    TaskOutcome out;
    auto task = registry_.get(token);
    if (!task) {
        set_error(out, ErrorKind::NotFound, "Unknown transfer: " + token);
        return out;
    }
    out.success = true;
    out.task = std::move(*task);
    return out;
}

TaskListOutcome StorageBridge::list_transfers(const std::string& tenant) const {
    return guarded<TaskListOutcome>("list_transfers", [&](TaskListOutcome& out) {
        validate_tenant(tenant);
        out.tasks = registry_.list(tenant);
    });
}

Outcome StorageBridge::cancel_transfer(const std::string& token) {
    Outcome out;
    switch (registry_.cancel(token)) {
        case CancelOutcome::Cancelled:
            out.success = true;
            log_info("Transfer %s cancelled", token.c_str());
            break;
        case CancelOutcome::NotFound:
            set_error(out, ErrorKind::NotFound, "Unknown transfer: " + token);
            break;
        case CancelOutcome::AlreadyTerminal:
            set_error(out, ErrorKind::AlreadyTerminal, "Transfer already finished: " + token);
            break;
    }
    return out;
}

// --- Zip export ---

ZipOutcome StorageBridge::stream_folder_as_zip(const std::string& tenant, const Location& location,
                                               const ObjectSink& sink) {
    return guarded<ZipOutcome>("stream_folder_as_zip", [&](ZipOutcome& out) {
        if (!is_storage_side(location.side)) {
            throw ValidationError("Only storage folders can be exported");
        }

        auto client = client_for(tenant, location.side);
        Location archive{LocationSide::Archive, ""};
        auto plan = plan_from_storage(*client, plan_roots(location, archive, {}));
        out.total_bytes = plan.total_bytes;

        auto max_size = executor_.config().max_zip_size;
        if (plan.total_bytes > max_size) {
            throw ValidationError("Folder too large to export (" + std::to_string(plan.total_bytes) +
                                  " bytes, limit " + std::to_string(max_size) + ")");
        }

        if (plan.total_bytes > zip_stream_threshold_) {
            TransferRequest request;
            request.kind = TransferKind::ZipExport;
            request.tenant = tenant;
            request.source = location;
            request.destination = archive;
            out.token = executor_.submit(request);
            log_info("Folder %s is %llu bytes; exporting in background as %s",
                     location.to_string().c_str(),
                     static_cast<unsigned long long>(plan.total_bytes), out.token.c_str());
            return;
        }

        auto built = write_zip_archive(*client, plan, sink);
        out.streamed = true;
        out.bytes = built.bytes;
        if (built.success) return;
        if (!built.failed_item.empty()) {
            set_error(out, ErrorKind::PartialFailure,
                      "failed after " + std::to_string(built.items_done) + " of " +
                      std::to_string(plan.items.size()) + " items: " + built.failed_item + ": " +
                      built.error_message);
        } else {
            set_error(out, ErrorKind::Io, built.error_message);
        }
    });
}

StreamOutcome StorageBridge::fetch_export(const std::string& token, const ObjectSink& sink) const {
    return guarded<StreamOutcome>("fetch_export", [&](StreamOutcome& out) {
        auto task = registry_.get(token);
        if (!task) {
            throw BridgeError(ErrorKind::NotFound, "Unknown transfer: " + token);
        }
        if (task->kind != TransferKind::ZipExport) {
            throw ValidationError("Transfer " + token + " is not a zip export");
        }
        if (task->status != TaskStatus::Succeeded || task->artifact.empty()) {
            throw ValidationError(std::string("Export is not ready (") +
                                  task_status_name(task->status) + ")");
        }

        std::ifstream in(task->artifact, std::ios::binary);
        if (!in) {
            throw BridgeError(ErrorKind::NotFound, "Export archive is gone: " + task->artifact);
        }

        std::vector<char> buffer(executor_.config().chunk_size);
        while (in) {
            in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            auto got = static_cast<size_t>(in.gcount());
            if (got == 0) break;
            if (!sink(buffer.data(), got)) {
                set_error(out, ErrorKind::Io, "Read aborted");
                return;
            }
            out.bytes += got;
        }
        if (in.bad()) set_error(out, ErrorKind::Io, "Read error on " + task->artifact);
    });
}

// --- Mutations ---

Outcome StorageBridge::make_directory(const std::string& tenant, const Location& location) {
    return guarded<Outcome>("make_directory", [&](Outcome& out) {
        if (location.side == LocationSide::Workspace) {
            workspace_.make_directory(tenant, location.path);
            return;
        }
        if (!is_storage_side(location.side)) {
            throw ValidationError("Cannot create a folder in an archive location");
        }
        if (normalize_relative_path(location.path).empty()) {
            throw ValidationError("Folder name is empty");
        }
        auto put = client_for(tenant, location.side)->make_folder(location.path);
        if (!put.success) set_error(out, ErrorKind::Connection, put.error_message);
    });
}

RemoveOutcome StorageBridge::remove(const std::string& tenant, const Location& location) {
    return guarded<RemoveOutcome>("remove", [&](RemoveOutcome& out) {
        if (location.side == LocationSide::Workspace) {
            out.removed = workspace_.remove(tenant, location.path);
            return;
        }
        if (location.side != LocationSide::Storage) {
            throw ValidationError(std::string("Cannot delete from ") + location_side_name(location.side));
        }
        if (normalize_relative_path(location.path).empty()) {
            throw ValidationError("Refusing to delete the storage root");
        }

        auto client = client_for(tenant, location.side);
        if (client->head(location.path)) {
            if (!client->remove(location.path)) {
                set_error(out, ErrorKind::Connection, "Failed to delete '" + location.path + "'");
                return;
            }
            out.removed = 1;
            return;
        }
        if (!client->is_folder(location.path)) {
            throw BridgeError(ErrorKind::NotFound, "Not found: '" + location.path + "'");
        }

        auto result = client->remove_recursive(location.path);
        out.removed = result.removed;
        if (!result.success) {
            set_error(out, ErrorKind::PartialFailure, result.error_message);
        }
    });
}

Outcome StorageBridge::put_object(const std::string& tenant, const Location& location,
                                  std::span<const uint8_t> data) {
    return guarded<Outcome>("put_object", [&](Outcome& out) {
        if (location.side == LocationSide::Workspace) {
            workspace_.write_bytes(tenant, location.path, data);
            return;
        }
        if (!is_storage_side(location.side)) {
            throw ValidationError("Cannot write to an archive location");
        }
        if (normalize_relative_path(location.path).empty()) {
            throw ValidationError("Object name is empty");
        }
        auto put = client_for(tenant, location.side)->write(location.path, data);
        if (!put.success) set_error(out, ErrorKind::Connection, put.error_message);
    });
}

}  // namespace wsbridge
