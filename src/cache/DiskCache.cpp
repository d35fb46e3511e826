#include "cache/DiskCache.hpp"
#include "crypto/util/encrypt.hpp"
#include "errors/Error.hpp"
#include "log/Registry.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <iterator>
#include <unistd.h>
#include <sodium.h>
#include <fmt/core.h>

namespace fs = std::filesystem;

namespace lsm::cache {

static std::string ioMessage(const std::string& what, const fs::path& path, const std::error_code& ec) {
    return fmt::format("{} {}: {}", what, path.string(), ec.message());
}

DiskCache::DiskCache(const fs::path& root, std::vector<uint8_t> masterKey) : masterKey_(std::move(masterKey)) {
    if (masterKey_.size() != crypto::util::KEY_SIZE) {
        const auto size = masterKey_.size();
        sodium_memzero(masterKey_.data(), masterKey_.size());
        throw KeyUnavailableError(fmt::format("Invalid master key length: expected {} bytes, got {}",
                                              crypto::util::KEY_SIZE, size));
    }

    std::error_code ec;
    fs::create_directories(root, ec);
    if (ec) throw IOFailureError(ioMessage("Failed to create cache directory", root, ec));

    fs::permissions(root, fs::perms::owner_all, fs::perm_options::replace, ec);
    if (ec) throw IOFailureError(ioMessage("Failed to restrict cache directory", root, ec));

    root_ = fs::canonical(root, ec);
    if (ec) throw IOFailureError(ioMessage("Failed to canonicalize cache directory", root, ec));
}

DiskCache::~DiskCache() {
    if (!masterKey_.empty()) sodium_memzero(masterKey_.data(), masterKey_.size());
}

[[noreturn]] static void rejectKey(const char* reason) {
    log::Registry::cache()->warn("[DiskCache] Rejected cache key ({}): path traversal attempt", reason);
    throw TraversalAttemptError("security: path traversal attempt detected");
}

fs::path DiskCache::resolvePath(const std::string& key) const {
    if (key.empty()) rejectKey("empty key");

    // Only the exact spelling of a key may name its file: "./svc", "svc/."
    // or "a//b" would otherwise alias another key's entry.
    const fs::path rel(key);
    if (rel.is_absolute()) rejectKey("absolute key");
    for (const auto& part : rel) {
        if (part == "..") rejectKey("parent reference");
        if (part.empty() || part == ".") rejectKey("non-canonical key");
    }
    if (rel.lexically_normal().native() != key) rejectKey("non-canonical key");

    std::error_code ec;
    const auto resolved = fs::weakly_canonical(root_ / rel, ec);
    if (ec) rejectKey("cannot canonicalize");

    const auto rootPrefix = root_.string() + '/';
    const auto candidate = resolved.string();
    if (candidate.size() <= rootPrefix.size() || candidate.compare(0, rootPrefix.size(), rootPrefix) != 0)
        rejectKey("escapes cache root");

    // a symlink anywhere below the root redirects the entry
    if (resolved.native() != (root_ / rel).native()) rejectKey("redirected by symlink");

    return resolved;
}

void DiskCache::set(const std::string& key, const types::Secret& secret) const {
    const auto path = resolvePath(key);

    auto plaintext = secret.serialize();
    const auto sealed = crypto::util::seal(plaintext, masterKey_);
    sodium_memzero(plaintext.data(), plaintext.size());

    writeAtomically(path, sealed);
    log::Registry::cache()->debug("[DiskCache] Cached '{}'", key);
}

std::optional<types::Secret> DiskCache::get(const std::string& key) const {
    const auto path = resolvePath(key);

    std::error_code ec;
    const auto st = fs::status(path, ec);
    if (st.type() == fs::file_type::not_found) return std::nullopt;
    if (ec) throw IOFailureError(ioMessage("Failed to stat cache entry", path, ec));
    if (!fs::is_regular_file(st)) {
        log::Registry::cache()->debug("[DiskCache] '{}' names a directory, treating as uncached", key);
        return std::nullopt;
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) throw IOFailureError("Failed to open cache entry " + path.string());
    const std::vector<uint8_t> sealed{std::istreambuf_iterator<char>(in), {}};
    if (in.bad()) throw IOFailureError("Failed to read cache entry " + path.string());

    auto plaintext = crypto::util::open(sealed, masterKey_);
    try {
        auto secret = types::Secret::deserialize(plaintext);
        sodium_memzero(plaintext.data(), plaintext.size());
        return secret;
    } catch (const InvalidArgumentError& e) {
        sodium_memzero(plaintext.data(), plaintext.size());
        throw DecryptionFailureError(std::string("Corrupt cache entry: ") + e.what());
    }
}

void DiskCache::remove(const std::string& key) const {
    const auto path = resolvePath(key);

    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) return;

    fs::remove(path, ec);
    if (ec && ec != std::errc::no_such_file_or_directory)
        throw IOFailureError(ioMessage("Failed to remove cache entry", path, ec));
}

bool DiskCache::isExpired(const std::string& key, const std::chrono::seconds ttl) const {
    fs::path path;
    try {
        path = resolvePath(key);
    } catch (const TraversalAttemptError&) {
        return true;
    }

    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) return true;

    const auto mtime = fs::last_write_time(path, ec);
    if (ec) return true;

    return fs::file_time_type::clock::now() - mtime > ttl;
}

void DiskCache::writeAtomically(const fs::path& path, const std::vector<uint8_t>& data) const {
    std::error_code ec;
    if (const auto parent = path.parent_path(); parent != root_) {
        fs::create_directories(parent, ec);
        if (ec) throw IOFailureError(ioMessage("Failed to create cache directory", parent, ec));
        fs::permissions(parent, fs::perms::owner_all, fs::perm_options::replace, ec);
        if (ec) throw IOFailureError(ioMessage("Failed to restrict cache directory", parent, ec));
    }

    const auto suffix = crypto::util::random_bytes(6);
    std::string tag;
    for (const auto b : suffix) tag += fmt::format("{:02x}", b);
    const auto tmp = path.parent_path() / ("." + path.filename().string() + ".tmp-" + tag);

    const int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600);
    if (fd < 0) throw IOFailureError(fmt::format("Failed to create {}: {}", tmp.string(), std::strerror(errno)));

    const auto fail = [&](const char* what) {
        const int err = errno;
        ::close(fd);
        ::unlink(tmp.c_str());
        throw IOFailureError(fmt::format("{} {}: {}", what, tmp.string(), std::strerror(err)));
    };

    const auto* p = data.data();
    size_t n = data.size();
    while (n) {
        const ssize_t w = ::write(fd, p, n);
        if (w < 0 && errno == EINTR) continue;
        if (w <= 0) fail("Failed to write");
        p += w;
        n -= static_cast<size_t>(w);
    }

    if (::fsync(fd) != 0) fail("Failed to sync");
    if (::close(fd) != 0) {
        const int err = errno;
        ::unlink(tmp.c_str());
        throw IOFailureError(fmt::format("Failed to close {}: {}", tmp.string(), std::strerror(err)));
    }

    if (::rename(tmp.c_str(), path.c_str()) != 0) {
        const int err = errno;
        ::unlink(tmp.c_str());
        throw IOFailureError(fmt::format("Failed to move cache entry into place {}: {}",
                                         path.string(), std::strerror(err)));
    }
}

}
