#include "wsbridge/transfer_plan.hpp"
#include "wsbridge/errors.hpp"
#include "wsbridge/path_util.hpp"

namespace wsbridge {

namespace {

std::string strip_root(const std::string& root, const std::string& path) {
    return root.empty() ? path : path.substr(root.size() + 1);
}

}  // namespace

// --- Roots ---

std::vector<TransferRoot> plan_roots(const Location& source,
                                     const Location& destination,
                                     const std::vector<std::string>& items) {
    auto src = normalize_relative_path(source.path);
    auto dst = normalize_relative_path(destination.path);

    std::vector<TransferRoot> roots;
    if (items.empty()) {
        roots.push_back({src, src.empty() ? dst : join_path(dst, base_name(src))});
    } else {
        for (const auto& item : items) {
            auto name = normalize_relative_path(item);
            if (name.empty()) throw ValidationError("Empty item name");
            roots.push_back({join_path(src, name), join_path(dst, base_name(name))});
        }
    }

    if (source.side == destination.side) {
        for (const auto& root : roots) {
            if (root.src == root.dst) {
                throw ValidationError("Source and destination are the same: '" + root.src + "'");
            }
            if (root.src.empty() || root.dst.starts_with(root.src + "/")) {
                throw ValidationError("Cannot place folder '" + root.src + "' inside itself");
            }
        }
    }
    return roots;
}

// --- Enumeration ---

TransferPlan plan_from_storage(const StorageClient& client,
                               const std::vector<TransferRoot>& roots) {
    TransferPlan plan;

    for (const auto& root : roots) {
        if (!root.src.empty()) {
            if (auto meta = client.head(root.src)) {
                WorkItem item;
                item.src = root.src;
                item.dst = root.dst;
                item.size = meta->size;
                item.last_modified = meta->last_modified;
                plan.total_bytes += item.size;
                plan.items.push_back(std::move(item));
                continue;
            }
        }

        auto listing = client.list(root.src, true);
        if (!listing.success) {
            throw BridgeError(ErrorKind::Connection,
                              "Cannot list '" + root.src + "': " + listing.error_message);
        }
        if (listing.entries.empty() && !client.is_folder(root.src)) {
            throw BridgeError(ErrorKind::NotFound, "Source not found: '" + root.src + "'");
        }

        plan.folder_roots.push_back(root.src);
        if (!root.dst.empty()) {
            WorkItem folder;
            folder.src = root.src;
            folder.dst = root.dst;
            folder.is_directory = true;
            plan.items.push_back(std::move(folder));
        }

        for (const auto& entry : listing.entries) {
            auto rel = strip_root(root.src, entry.path);
            WorkItem item;
            item.src = join_path(root.src, rel);
            item.dst = join_path(root.dst, rel);
            item.is_directory = entry.is_directory;
            item.size = entry.size;
            item.last_modified = entry.last_modified;
            plan.total_bytes += item.size;
            plan.items.push_back(std::move(item));
        }
    }
    return plan;
}

TransferPlan plan_from_workspace(const WorkspaceBridge& workspace,
                                 const std::string& tenant,
                                 const std::vector<TransferRoot>& roots) {
    namespace fs = std::filesystem;
    TransferPlan plan;

    for (const auto& root : roots) {
        auto path = workspace.resolve(tenant, root.src);

        std::error_code ec;
        auto st = fs::status(path, ec);
        if (ec || !fs::exists(st)) {
            throw BridgeError(ErrorKind::NotFound, "Source not found: '" + root.src + "'");
        }

        if (fs::is_regular_file(st)) {
            WorkItem item;
            item.src = root.src;
            item.dst = root.dst;
            item.size = fs::file_size(path, ec);
            if (ec) throw BridgeError(ErrorKind::Io, "Cannot stat '" + root.src + "': " + ec.message());
            plan.total_bytes += item.size;
            plan.items.push_back(std::move(item));
            continue;
        }

        plan.folder_roots.push_back(root.src);
        if (!root.dst.empty()) {
            WorkItem folder;
            folder.src = root.src;
            folder.dst = root.dst;
            folder.is_directory = true;
            plan.items.push_back(std::move(folder));
        }

        for (const auto& entry : workspace.walk(tenant, root.src)) {
            WorkItem item;
            item.src = join_path(root.src, entry.path);
            item.dst = join_path(root.dst, entry.path);
            item.is_directory = entry.is_directory;
            item.size = entry.size;
            item.last_modified = entry.last_modified;
            plan.total_bytes += item.size;
            plan.items.push_back(std::move(item));
        }
    }
    return plan;
}

// --- Zip ---

ZipBuildResult write_zip_archive(const StorageClient& client,
                                 const TransferPlan& plan,
                                 const ZipSink& sink,
                                 const ZipHooks& hooks) {
    ZipBuildResult result;
    ZipWriter zip(sink);

    for (const auto& item : plan.items) {
        if (hooks.on_item_start && !hooks.on_item_start(item)) {
            result.aborted = true;
            result.error_message = "Archive aborted";
            return result;
        }

        std::string err;
        if (item.is_directory) {
            err = zip.add_directory(item.dst, item.last_modified);
        } else {
            err = zip.begin_file(item.dst, item.last_modified);
            if (err.empty()) {
                bool hook_aborted = false;
                auto streamed = client.stream(item.src, [&](const char* data, size_t size) {
                    auto write_err = zip.write(data, size);
                    if (!write_err.empty()) return false;
                    result.bytes += size;
                    if (hooks.on_bytes && !hooks.on_bytes(result.bytes)) {
                        hook_aborted = true;
                        return false;
                    }
                    return true;
                });
                if (hook_aborted) {
                    result.aborted = true;
                    result.error_message = "Archive aborted";
                    return result;
                }
                if (!zip.error().empty()) {
                    err = zip.error();
                } else if (!streamed.success) {
                    err = streamed.error_message;
                } else {
                    err = zip.end_file();
                }
            }
        }

        if (!err.empty()) {
            result.failed_item = item.src;
            result.error_message = err;
            return result;
        }

        ++result.items_done;
        if (hooks.on_item_done) hooks.on_item_done(item);
    }

    auto err = zip.finish();
    if (!err.empty()) {
        result.error_message = err;
        return result;
    }
    result.success = true;
    return result;
}

}  // namespace wsbridge
