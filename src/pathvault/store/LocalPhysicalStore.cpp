#include "store/LocalPhysicalStore.hpp"
#include "log/TaggedLogger.hpp"
#include "path/PathUtils.hpp"

#include <cerrno>
#include <system_error>

#if defined(__linux__)
#include <cstdio>
#include <fcntl.h>
#endif

namespace PV {

namespace fs = std::filesystem;

namespace {

auto fromErrorCode(std::error_code const& ec, std::string const& what) -> Error {
    if (ec == std::errc::no_such_file_or_directory)
        return Error{Error::Code::NotFound, what + ": " + ec.message()};
    if (ec == std::errc::file_exists || ec == std::errc::directory_not_empty)
        return Error{Error::Code::AlreadyExists, what + ": " + ec.message()};
    return Error{Error::Code::IOError, what + ": " + ec.message()};
}

} // namespace

LocalPhysicalStore::LocalPhysicalStore(fs::path root)
    : root_(std::move(root)) {}

auto LocalPhysicalStore::hostPath(std::string_view path) const -> Expected<fs::path> {
    if (auto invalid = validate_absolute_path(path))
        return std::unexpected(*invalid);
    if (path == "/")
        return root_;
    return root_ / fs::path(std::string(path.substr(1)));
}

auto LocalPhysicalStore::mkdir(std::string_view path) -> std::optional<Error> {
    auto host = hostPath(path);
    if (!host)
        return host.error();

    std::error_code ec;
    if (fs::exists(fs::symlink_status(*host, ec)))
        return Error{Error::Code::AlreadyExists, "entry exists: " + std::string(path)};
    if (!fs::is_directory(host->parent_path(), ec))
        return Error{Error::Code::NotFound, "parent directory missing: " + dir_name(path)};

    bool const created = fs::create_directory(*host, ec);
    if (ec)
        return fromErrorCode(ec, "mkdir " + std::string(path));
    if (!created)
        return Error{Error::Code::AlreadyExists, "entry exists: " + std::string(path)};
    return std::nullopt;
}

auto LocalPhysicalStore::stat(std::string_view path) -> Expected<bool> {
    auto host = hostPath(path);
    if (!host)
        return std::unexpected(host.error());
    std::error_code ec;
    auto const      status = fs::symlink_status(*host, ec);
    if (ec && ec != std::errc::no_such_file_or_directory)
        return std::unexpected(fromErrorCode(ec, "stat " + std::string(path)));
    return fs::exists(status);
}

auto LocalPhysicalStore::remove(std::string_view path) -> std::optional<Error> {
    if (path == "/")
        return Error{Error::Code::InvalidPath, "cannot remove the root"};
    auto host = hostPath(path);
    if (!host)
        return host.error();
    std::error_code ec;
    bool const      removed = fs::remove(*host, ec);
    if (ec)
        return fromErrorCode(ec, "remove " + std::string(path));
    if (!removed)
        return Error{Error::Code::NotFound, "no such entry: " + std::string(path)};
    return std::nullopt;
}

auto LocalPhysicalStore::rename(std::string_view from, std::string_view to) -> std::optional<Error> {
    auto source = hostPath(from);
    if (!source)
        return source.error();
    auto target = hostPath(to);
    if (!target)
        return target.error();
    if (from == "/" || is_strict_descendant(to, from))
        return Error{Error::Code::InvalidPath, "cannot move " + std::string(from) + " below itself"};

    std::error_code ec;
    if (!fs::exists(fs::symlink_status(*source, ec)))
        return Error{Error::Code::NotFound, "no such entry: " + std::string(from)};

#if defined(__linux__) && defined(RENAME_NOREPLACE)
    // The kernel refuses an existing destination atomically, so a directory
    // created at the target concurrently is never replaced.
    if (::renameat2(AT_FDCWD, source->c_str(), AT_FDCWD, target->c_str(), RENAME_NOREPLACE) == 0) {
        pv_log("LocalPhysicalStore::rename " + source->string() + " -> " + target->string(), "PhysicalStore");
        return std::nullopt;
    }
    if (int const err = errno; err != EINVAL && err != ENOSYS)
        return fromErrorCode(std::error_code(err, std::generic_category()), "rename " + std::string(from) + " -> " + std::string(to));
    pv_log("LocalPhysicalStore::rename RENAME_NOREPLACE unsupported below " + root_.string(), "PhysicalStore");
#endif

    // Without RENAME_NOREPLACE, std::filesystem::rename replaces an empty
    // destination directory on POSIX; the check below narrows but does not
    // close that window against concurrent writers.
    if (fs::exists(fs::symlink_status(*target, ec)))
        return Error{Error::Code::AlreadyExists, "entry exists: " + std::string(to)};
    if (!fs::is_directory(target->parent_path(), ec))
        return Error{Error::Code::NotFound, "parent directory missing: " + dir_name(to)};

    fs::rename(*source, *target, ec);
    if (ec)
        return fromErrorCode(ec, "rename " + std::string(from) + " -> " + std::string(to));
    pv_log("LocalPhysicalStore::rename " + source->string() + " -> " + target->string(), "PhysicalStore");
    return std::nullopt;
}

} // namespace PV
