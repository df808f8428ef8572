#include <tatar/archive.hxx>
#include <tatar/detail/tar-writer.hxx>
#include <tatar/error.hxx>
#include <tatar/logging.hxx>

#include <algorithm>
#include <array>
#include <cerrno>
#include <fstream>
#include <map>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <grp.h>
#include <pwd.h>
#include <sys/stat.h>
#include <sys/sysmacros.h>

namespace fs = std::filesystem;

namespace tatar {
namespace {

/**
 * @brief Caches uid/gid to name lookups for the duration of one walk.
 */
class OwnerNames {
public:
  const std::string &user(uid_t uid) {
    auto it = users_.find(uid);
    if (it == users_.end()) {
      std::array<char, 4096> buffer;
      struct passwd pwd;
      struct passwd *result = nullptr;
      std::string name;
      if (::getpwuid_r(uid, &pwd, buffer.data(), buffer.size(), &result) == 0 &&
          result)
        name = pwd.pw_name;
      it = users_.emplace(uid, std::move(name)).first;
    }
    return it->second;
  }

  const std::string &group(gid_t gid) {
    auto it = groups_.find(gid);
    if (it == groups_.end()) {
      std::array<char, 4096> buffer;
      struct group grp;
      struct group *result = nullptr;
      std::string name;
      if (::getgrgid_r(gid, &grp, buffer.data(), buffer.size(), &result) == 0 &&
          result)
        name = grp.gr_name;
      it = groups_.emplace(gid, std::move(name)).first;
    }
    return it->second;
  }

private:
  std::map<uid_t, std::string> users_;
  std::map<gid_t, std::string> groups_;
};

Entry make_entry(const fs::path &path, std::string name, const struct ::stat &st,
                 OwnerNames &owners) {
  Entry entry;
  entry.name = std::move(name);
  entry.mode = static_cast<std::uint32_t>(st.st_mode & 07777);
  entry.uid = st.st_uid;
  entry.gid = st.st_gid;
  entry.mtime = st.st_mtime;
  entry.user_name = owners.user(st.st_uid);
  entry.group_name = owners.group(st.st_gid);

  switch (st.st_mode & S_IFMT) {
  case S_IFREG:
    entry.type = EntryType::Regular;
    entry.size = static_cast<std::uint64_t>(st.st_size);
    break;
  case S_IFDIR:
    entry.type = EntryType::Directory;
    break;
  case S_IFLNK:
    entry.type = EntryType::Symlink;
    entry.link_name = fs::read_symlink(path).string();
    break;
  case S_IFIFO:
    entry.type = EntryType::Fifo;
    break;
  case S_IFCHR:
  case S_IFBLK:
    entry.type = S_ISCHR(st.st_mode) ? EntryType::CharDevice
                                     : EntryType::BlockDevice;
    entry.dev_major = major(st.st_rdev);
    entry.dev_minor = minor(st.st_rdev);
    break;
  default:
    throw FormatError("cannot archive '" + path.string() +
                      "': sockets and unknown file types are not supported");
  }
  return entry;
}

void walk_directory(const fs::path &directory, const std::string &relative,
                    detail::TarWriter &writer, OwnerNames &owners) {
  std::vector<fs::path> children;
  for (const auto &child : fs::directory_iterator(directory))
    children.push_back(child.path());
  std::sort(children.begin(), children.end());

  for (const auto &child : children) {
    struct ::stat st;
    if (::lstat(child.c_str(), &st) != 0)
      throw fs::filesystem_error("cannot stat", child,
                                 std::error_code(errno, std::system_category()));

    const auto file_name = child.filename().string();
    auto name = relative.empty() ? file_name : relative + "/" + file_name;
    const auto entry = make_entry(child, name, st, owners);
    logger()->trace("adding '{}'", entry.name);

    writer.write_header(entry);
    if (entry.is_regular_file())
      writer.write_file_data(child);
    writer.finish_member();

    if (entry.is_directory())
      walk_directory(child, entry.name, writer, owners);
  }
}

/**
 * @brief Map a member name onto a path below @p root.
 *
 * @throws FormatError for absolute names and names that leave @p root.
 */
fs::path resolve_member_path(const fs::path &root, const std::string &name) {
  const auto relative = fs::path(name).lexically_normal();
  if (relative.empty() || relative.is_absolute() || relative.has_root_name() ||
      *relative.begin() == "..")
    throw FormatError("refusing to extract unsafe member path '" + name + "'");
  if (relative == ".")
    return root;
  return root / relative;
}

/**
 * @brief Reject @p path when it, or one of its ancestors below @p root, is a
 * symlink.
 *
 * Writing through such a link would land outside @p root. Checking stops at
 * the first component that does not exist yet.
 *
 * @throws FormatError naming @p member and the offending link.
 */
void reject_symlink_components(const fs::path &root, const fs::path &path,
                               const std::string &member) {
  auto current = root;
  for (const auto &component : path.lexically_relative(root)) {
    current /= component;
    const auto status = fs::symlink_status(current);
    if (!fs::exists(status))
      return;
    if (fs::is_symlink(status))
      throw FormatError("refusing to extract '" + member +
                        "' through symlink '" + current.string() + "'");
  }
}

void extract_file(const fs::path &target, const Entry &entry,
                  std::span<const char> content) {
  fs::create_directories(target.parent_path());
  // Replace a symlink at the member path instead of writing through it.
  if (fs::is_symlink(fs::symlink_status(target)))
    fs::remove(target);

  std::ofstream out(target, std::ios::binary | std::ios::trunc);
  if (!out)
    throw fs::filesystem_error("cannot create file", target,
                               std::error_code(errno, std::generic_category()));
  out.write(content.data(), static_cast<std::streamsize>(content.size()));
  out.close();
  if (!out)
    throw fs::filesystem_error("failed to write file", target,
                               std::make_error_code(std::errc::io_error));

  fs::permissions(target, static_cast<fs::perms>(entry.mode),
                  fs::perm_options::replace);
}

void extract_symlink(const fs::path &target, const Entry &entry) {
  std::error_code ec;
  fs::create_directories(target.parent_path(), ec);
  if (!ec)
    fs::create_symlink(entry.link_name, target, ec);
  if (ec)
    logger()->warn("could not create symlink '{}' -> '{}': {}", entry.name,
                   entry.link_name, ec.message());
}

} // unnamed namespace

Archive Archive::from_directory(const fs::path &directory) {
  const auto root = fs::absolute(directory);
  if (!fs::is_directory(root))
    throw fs::filesystem_error("cannot archive", root,
                               std::make_error_code(std::errc::not_a_directory));

  std::vector<char> data;
  detail::TarWriter writer(data);
  OwnerNames owners;
  walk_directory(root, "", writer, owners);
  writer.close();

  logger()->debug("archived '{}' into {} bytes", root.string(), data.size());
  return Archive(std::move(data));
}

void Archive::to_directory(const fs::path &directory) const {
  const auto root = fs::absolute(directory).lexically_normal();
  fs::create_directories(root);
  logger()->debug("extracting {} bytes into '{}'", data_.size(), root.string());

  // Applied once everything is extracted so read-only directories can still
  // receive their children.
  std::vector<std::pair<fs::path, std::uint32_t>> directory_modes;

  auto tar = reader();
  while (auto entry = tar.next()) {
    const auto target = resolve_member_path(root, entry->name);
    logger()->trace("extracting '{}'", entry->name);

    switch (entry->type) {
    case EntryType::Directory:
      reject_symlink_components(root, target, entry->name);
      fs::create_directories(target);
      directory_modes.emplace_back(target, entry->mode);
      break;
    case EntryType::Symlink:
      reject_symlink_components(root, target.parent_path(), entry->name);
      extract_symlink(target, *entry);
      break;
    case EntryType::HardLink: {
      const auto source = resolve_member_path(root, entry->link_name);
      reject_symlink_components(root, source.parent_path(), entry->name);
      reject_symlink_components(root, target.parent_path(), entry->name);
      fs::create_directories(target.parent_path());
      fs::create_hard_link(source, target);
      break;
    }
    case EntryType::Regular:
      reject_symlink_components(root, target.parent_path(), entry->name);
      extract_file(target, *entry, tar.content());
      break;
    default:
      logger()->warn("skipping special file '{}'", entry->name);
      break;
    }
  }

  for (auto it = directory_modes.rbegin(); it != directory_modes.rend(); ++it)
    fs::permissions(it->first, static_cast<fs::perms>(it->second),
                    fs::perm_options::replace);
}

} // namespace tatar
