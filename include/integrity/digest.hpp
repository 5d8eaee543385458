#ifndef LBFT_INTEGRITY_DIGEST_HPP
#define LBFT_INTEGRITY_DIGEST_HPP

#include <array>
#include <cstdint>
#include <istream>
#include <memory>
#include <string>
#include <vector>

namespace lbft {
namespace integrity {

constexpr std::size_t DIGEST_SIZE = 32;  // SHA-256

using DigestValue = std::array<uint8_t, DIGEST_SIZE>;

// Forward declaration for the OpenSSL message digest context
struct DigestContext;

// Incremental SHA-256 over bytes fed in order
class Digest {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  Digest();
  ~Digest();

  Digest(const Digest&) = delete;
  Digest& operator=(const Digest&) = delete;
  Digest(Digest&&) noexcept;
  Digest& operator=(Digest&&) noexcept;


  // ---- HASHING OPERATIONS ----
  void update(const uint8_t* data, std::size_t size);
  void update(const std::vector<uint8_t>& data) { update(data.data(), data.size()); }
  // Produces the digest, the object may not be updated afterwards
  DigestValue finalize();

private:
  std::unique_ptr<DigestContext> context_;
  bool finalized_ = false;
};

// One-shot digest of a byte sequence
DigestValue digest(const std::vector<uint8_t>& bytes);
// Digest of everything remaining in a stream, read in bounded blocks
DigestValue digest_stream(std::istream& input);
// Lowercase hex rendering for logs and the client output
std::string to_hex(const DigestValue& value);

} // namespace integrity
} // namespace lbft

#endif // LBFT_INTEGRITY_DIGEST_HPP
