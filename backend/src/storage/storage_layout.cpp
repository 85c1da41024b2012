/**
 * StorageLayout - inbox/outbox directories and the single-slot outbox.
 */

#include "storage/storage_layout.h"

#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

StorageLayout::StorageLayout(fs::path base_dir, std::string peer_name)
    : base_dir_(std::move(base_dir))
    , peer_name_(std::move(peer_name))
    , inbox_dir_(base_dir_ / ("from_" + peer_name_))
    , outbox_dir_(base_dir_ / ("to_" + peer_name_)) {}

void StorageLayout::ensure_inbox() const {
    fs::create_directories(inbox_dir_);
}

bool StorageLayout::stage(const fs::path& source) {
    std::error_code ec;
    if (!fs::is_regular_file(source, ec)) {
        spdlog::error("Cannot stage {}: not a regular file", source.string());
        return false;
    }

    std::lock_guard<std::mutex> lock(outbox_mutex_);

    fs::create_directories(outbox_dir_, ec);
    if (ec) {
        spdlog::error("Cannot create outbox {}: {}", outbox_dir_.string(), ec.message());
        return false;
    }

    const auto target = outbox_dir_ / source.filename();
    std::error_code same_ec;
    const bool source_in_outbox = fs::equivalent(source, target, same_ec);

    std::vector<fs::path> existing;
    for (auto it = fs::directory_iterator(outbox_dir_, ec); !ec && it != fs::directory_iterator();
         it.increment(ec)) {
        existing.push_back(it->path());
    }
    if (ec) {
        spdlog::error("Cannot list outbox {}: {}", outbox_dir_.string(), ec.message());
        return false;
    }

    for (const auto& entry : existing) {
        if (source_in_outbox && entry.filename() == target.filename()) {
            continue;
        }
        fs::remove_all(entry, ec);
        if (ec) {
            spdlog::error("Cannot clear outbox entry {}: {}", entry.string(), ec.message());
            staged_.reset();
            return false;
        }
    }

    if (!source_in_outbox) {
        fs::copy_file(source, target, fs::copy_options::overwrite_existing, ec);
        if (ec) {
            spdlog::error("Cannot copy {} to outbox: {}", source.string(), ec.message());
            staged_.reset();
            return false;
        }
    }

    staged_ = target;
    spdlog::info("Staged for download: {}", target.filename().string());
    return true;
}

std::string StorageLayout::inspect() const {
    std::error_code ec;
    fs::directory_iterator it(inbox_dir_, ec);
    if (ec || it == fs::directory_iterator()) {
        return "No files received";
    }
    return "Received: " + it->path().filename().string();
}

std::optional<fs::path> StorageLayout::find_staged_locked() const {
    std::error_code ec;
    if (staged_ && fs::is_regular_file(*staged_, ec)) {
        return staged_;
    }
    ec.clear();

    // Nothing staged through this process: fall back to whatever sits in the
    // outbox. Iteration order is filesystem-defined.
    for (auto it = fs::directory_iterator(outbox_dir_, ec); !ec && it != fs::directory_iterator();
         it.increment(ec)) {
        if (it->is_regular_file(ec)) {
            return it->path();
        }
    }
    return std::nullopt;
}

std::optional<StagedFile> StorageLayout::take_staged() {
    std::lock_guard<std::mutex> lock(outbox_mutex_);

    const auto path = find_staged_locked();
    if (!path) {
        staged_.reset();
        return std::nullopt;
    }

    std::ifstream in(*path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("cannot open " + path->string());
    }
    StagedFile file;
    file.name = path->filename().string();
    file.bytes.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw std::runtime_error("read failed for " + path->string());
    }
    in.close();

    fs::remove(*path);
    staged_.reset();
    return file;
}

std::size_t StorageLayout::inbox_count() const {
    std::error_code ec;
    std::size_t count = 0;
    for (auto it = fs::directory_iterator(inbox_dir_, ec); !ec && it != fs::directory_iterator();
         it.increment(ec)) {
        ++count;
    }
    return count;
}

std::optional<std::string> StorageLayout::staged_name() const {
    std::lock_guard<std::mutex> lock(outbox_mutex_);
    const auto path = find_staged_locked();
    if (!path) {
        return std::nullopt;
    }
    return path->filename().string();
}

std::optional<std::string> sanitize_filename(const std::string& filename) {
    const auto slash = filename.find_last_of("/\\");
    auto name = slash == std::string::npos ? filename : filename.substr(slash + 1);
    if (name.empty() || name == "." || name == "..") {
        return std::nullopt;
    }
    return name;
}
