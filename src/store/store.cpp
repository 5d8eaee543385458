#include "store/store.hpp"
#include "protocol/payloads.hpp"
#include <openssl/rand.h>
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace lbft {
namespace store {

namespace {

// Random hex suffix so concurrent uploads never share a temporary file
std::string random_suffix() {
  unsigned char bytes[8];
  if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
    throw StoreError("Store: Failed to generate temporary file name");
  }
  std::stringstream ss;
  for (unsigned char byte : bytes) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
  }
  return ss.str();
}

int64_t to_unix_seconds(std::filesystem::file_time_type file_time) {
  // file_time_type has no portable epoch in C++17, shift through the system clock
  auto system_time = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
    file_time - std::filesystem::file_time_type::clock::now() + std::chrono::system_clock::now());
  return std::chrono::duration_cast<std::chrono::seconds>(system_time.time_since_epoch()).count();
}

} // namespace

//==============================================
// TEMPORARY FILES
//==============================================

TempFile::TempFile(const std::filesystem::path& path)
  : path_(path)
  , stream_(path, std::ios::binary | std::ios::trunc) {
  if (!stream_) {
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to create temporary file: " << path_.string();
    throw StoreError("Store: Failed to create temporary file: " + path_.string());
  }
  BOOST_LOG_TRIVIAL(debug) << "Store: Created temporary file: " << path_.string();
}

TempFile::TempFile(TempFile&& other) noexcept
  : path_(std::move(other.path_))
  , stream_(std::move(other.stream_))
  , bytes_written_(other.bytes_written_)
  , committed_(other.committed_)
  , discarded_(other.discarded_) {
  // The moved-from object must not remove the file
  other.discarded_ = true;
}

TempFile::~TempFile() {
  if (committed_ || discarded_) {
    return;
  }
  try {
    discard();
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to discard temporary file: " << e.what();
  }
}

TempFile TempFile::create_in(const std::filesystem::path& directory, const std::string& prefix) {
  return TempFile(directory / (prefix + random_suffix() + ".part"));
}

void TempFile::write(const uint8_t* data, std::size_t size) {
  if (committed_ || discarded_) {
    throw StoreError("Store: Write to closed temporary file");
  }
  if (!stream_.write(reinterpret_cast<const char*>(data), size)) {
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to write " << size << " bytes to " << path_.string();
    throw StoreError("Store: Failed to write temporary file: " + path_.string());
  }
  bytes_written_ += size;
}

void TempFile::commit_to(const std::filesystem::path& destination) {
  if (committed_ || discarded_) {
    throw StoreError("Store: Temporary file already closed");
  }

  stream_.flush();
  stream_.close();
  if (stream_.fail()) {
    throw StoreError("Store: Failed to flush temporary file: " + path_.string());
  }

  std::error_code ec;
  std::filesystem::rename(path_, destination, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to rename " << path_.string() << " to "
                             << destination.string() << ": " << ec.message();
    throw StoreError("Store: Failed to commit file: " + ec.message());
  }

  committed_ = true;
  BOOST_LOG_TRIVIAL(info) << "Store: Committed " << bytes_written_ << " bytes to " << destination.string();
}

void TempFile::discard() {
  if (committed_ || discarded_) {
    return;
  }
  discarded_ = true;
  stream_.close();

  std::error_code ec;
  std::filesystem::remove(path_, ec);
  if (ec) {
    throw StoreError("Store: Failed to remove temporary file: " + ec.message());
  }
  BOOST_LOG_TRIVIAL(debug) << "Store: Discarded temporary file: " << path_.string();
}


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

// Initialize store with base directory path and ensure it exists
Store::Store(const std::string& base_path) : base_path_(base_path) {
  BOOST_LOG_TRIVIAL(info) << "Store: Initializing Store with base path: " << base_path;
  check_directory_exists(base_path_);
  check_directory_exists(base_path_ / PARTIAL_DIR);
  BOOST_LOG_TRIVIAL(debug) << "Store: Store directory created/verified at: " << base_path;
}


//==============================================
// CORE STORAGE OPERATIONS
//==============================================

std::unique_ptr<std::ifstream> Store::open_for_read(const std::string& name) const {
  BOOST_LOG_TRIVIAL(info) << "Store: Opening file for read: " << name;

  std::filesystem::path file_path = resolve_path(name);
  verify_file_exists(file_path, name);

  auto file = std::make_unique<std::ifstream>(file_path, std::ios::binary);
  if (!*file) {
    throw StoreError("Store: Failed to open file: " + file_path.string());
  }
  return file;
}

TempFile Store::open_for_write_temp() {
  // Recreated on demand in case the directory was removed underneath the server
  check_directory_exists(base_path_ / PARTIAL_DIR);
  return TempFile::create_in(base_path_ / PARTIAL_DIR, "upload-");
}

void Store::commit(TempFile& temp, const std::string& final_name) {
  BOOST_LOG_TRIVIAL(info) << "Store: Committing upload as: " << final_name;
  std::filesystem::path destination = resolve_path(final_name);
  temp.commit_to(destination);
}

void Store::remove(const std::string& name) {
  BOOST_LOG_TRIVIAL(info) << "Store: Removing file: " << name;

  std::filesystem::path file_path = resolve_path(name);
  if (std::filesystem::remove(file_path)) {
    BOOST_LOG_TRIVIAL(info) << "Store: Successfully removed file: " << name;
  } else {
    BOOST_LOG_TRIVIAL(error) << "Store: Failed to remove file: " << name;
    throw FileNotFoundError(name);
  }
}


//==============================================
// QUERY OPERATIONS
//==============================================

std::vector<FileInfo> Store::list() const {
  BOOST_LOG_TRIVIAL(info) << "Store: Listing contents";

  std::vector<FileInfo> files;
  for (const auto& entry : std::filesystem::directory_iterator(base_path_)) {
    std::string name = entry.path().filename().string();
    // Skips the partial directory and anything a client could not request
    if (!entry.is_regular_file() || !protocol::is_valid_filename(name)) {
      continue;
    }

    std::error_code ec;
    FileInfo info;
    info.name = name;
    info.size = entry.file_size(ec);
    if (ec) {
      continue;  // removed or replaced while listing
    }
    info.modified_time = to_unix_seconds(entry.last_write_time(ec));
    if (ec) {
      continue;
    }
    files.push_back(std::move(info));
  }

  std::sort(files.begin(), files.end(), [](const FileInfo& a, const FileInfo& b) {
    return a.name < b.name;
  });

  BOOST_LOG_TRIVIAL(debug) << "Store: Listed " << files.size() << " files";
  return files;
}

bool Store::has(const std::string& name) const {
  BOOST_LOG_TRIVIAL(debug) << "Store: Checking existence of: " << name;
  if (!protocol::is_valid_filename(name)) {
    return false;
  }
  return std::filesystem::is_regular_file(base_path_ / name);
}

std::uintmax_t Store::get_file_size(const std::string& name) const {
  std::filesystem::path file_path = resolve_path(name);
  verify_file_exists(file_path, name);

  std::uintmax_t size = std::filesystem::file_size(file_path);
  BOOST_LOG_TRIVIAL(debug) << "Store: File size for " << name << ": " << size << " bytes";
  return size;
}


//==============================================
// UTILITY METHODS
//==============================================

void Store::check_directory_exists(const std::filesystem::path& path) const {
  if (!std::filesystem::exists(path)) {
    std::filesystem::create_directories(path);
  }
}

std::filesystem::path Store::resolve_path(const std::string& name) const {
  if (!protocol::is_valid_filename(name)) {
    BOOST_LOG_TRIVIAL(error) << "Store: Rejected file name: " << name;
    throw StoreError("Store: Invalid file name: " + name);
  }
  return base_path_ / name;
}

void Store::verify_file_exists(const std::filesystem::path& file_path, const std::string& name) const {
  if (!std::filesystem::is_regular_file(file_path)) {
    BOOST_LOG_TRIVIAL(warning) << "Store: File not found: " << file_path.string();
    throw FileNotFoundError(name);
  }
}

} // namespace store
} // namespace lbft
