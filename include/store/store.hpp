#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace lbft {
namespace store {

class StoreError : public std::runtime_error {
public:
  explicit StoreError(const std::string& message) : std::runtime_error(message) {}
};

class FileNotFoundError : public StoreError {
public:
  explicit FileNotFoundError(const std::string& name)
    : StoreError("Store: File not found: " + name) {}
};

// A committed file as reported by list()
struct FileInfo {
  std::string name;
  std::uintmax_t size = 0;
  int64_t modified_time = 0;  // seconds since the unix epoch
};

// Private file that receives data before being atomically renamed into place.
// Removed on destruction unless committed.
class TempFile {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit TempFile(const std::filesystem::path& path);
  ~TempFile();

  TempFile(const TempFile&) = delete;
  TempFile& operator=(const TempFile&) = delete;
  TempFile(TempFile&& other) noexcept;
  TempFile& operator=(TempFile&& other) = delete;

  // Creates a uniquely named temporary file inside directory
  static TempFile create_in(const std::filesystem::path& directory, const std::string& prefix);


  // ---- WRITE OPERATIONS ----
  void write(const uint8_t* data, std::size_t size);
  void write(const std::vector<uint8_t>& data) { write(data.data(), data.size()); }
  // Flushes, closes and renames over destination
  void commit_to(const std::filesystem::path& destination);
  // Closes and removes the file
  void discard();


  // ---- GETTERS ----
  const std::filesystem::path& path() const { return path_; }
  uint64_t bytes_written() const { return bytes_written_; }
  bool committed() const { return committed_; }

private:
  std::filesystem::path path_;
  std::ofstream stream_;
  uint64_t bytes_written_ = 0;
  bool committed_ = false;
  bool discarded_ = false;
};

class Store {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit Store(const std::string& base_path);


  // ---- CORE STORAGE OPERATIONS ----
  // Opens a committed file for reading, throws FileNotFoundError
  std::unique_ptr<std::ifstream> open_for_read(const std::string& name) const;
  // Creates a private temporary file under the partial directory
  TempFile open_for_write_temp();
  // Atomically renames a temporary file to its final name
  void commit(TempFile& temp, const std::string& final_name);
  // Removes a committed file
  void remove(const std::string& name);


  // ---- QUERY OPERATIONS ----
  // Committed files ordered by name
  std::vector<FileInfo> list() const;
  bool has(const std::string& name) const;
  std::uintmax_t get_file_size(const std::string& name) const;
  const std::filesystem::path& base_path() const { return base_path_; }

  // Hidden directory holding uploads in progress
  static constexpr const char* PARTIAL_DIR = ".partial";

private:
  // ---- PARAMETERS ----
  std::filesystem::path base_path_;


  // ---- UTILITY METHODS ----
  void check_directory_exists(const std::filesystem::path& path) const;
  // Validates name and maps it under the base path
  std::filesystem::path resolve_path(const std::string& name) const;
  void verify_file_exists(const std::filesystem::path& file_path, const std::string& name) const;
};

} // namespace store
} // namespace lbft
