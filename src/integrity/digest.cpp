#include "integrity/digest.hpp"
#include <openssl/evp.h>
#include <boost/log/trivial.hpp>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace lbft {
namespace integrity {

//=================================================
// RAII WRAPPER TO MANAGE DIGEST CONTEXT LIFECYCLE
//=================================================

struct DigestContext {
  EVP_MD_CTX* ctx = nullptr;

  DigestContext() {
    ctx = EVP_MD_CTX_new();
    if (!ctx) {
      throw std::runtime_error("Digest: Failed to create hash context");
    }
    if (!EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr)) {
      EVP_MD_CTX_free(ctx);
      throw std::runtime_error("Digest: Failed to initialize hash context");
    }
  }

  ~DigestContext() {
    if (ctx) {
      EVP_MD_CTX_free(ctx);
    }
  }

  EVP_MD_CTX* get() { return ctx; }
};


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Digest::Digest() : context_(std::make_unique<DigestContext>()) {}

Digest::~Digest() = default;

Digest::Digest(Digest&&) noexcept = default;

Digest& Digest::operator=(Digest&&) noexcept = default;


//==============================================
// HASHING OPERATIONS
//==============================================

void Digest::update(const uint8_t* data, std::size_t size) {
  if (finalized_) {
    throw std::logic_error("Digest: update after finalize");
  }
  if (size == 0) {
    return;
  }
  if (!EVP_DigestUpdate(context_->get(), data, size)) {
    throw std::runtime_error("Digest: Failed to update hash");
  }
}

DigestValue Digest::finalize() {
  if (finalized_) {
    throw std::logic_error("Digest: finalize called twice");
  }

  DigestValue value{};
  unsigned int length = 0;
  if (!EVP_DigestFinal_ex(context_->get(), value.data(), &length) || length != DIGEST_SIZE) {
    throw std::runtime_error("Digest: Failed to finalize hash");
  }
  finalized_ = true;
  return value;
}


//==============================================
// CONVENIENCE FUNCTIONS
//==============================================

DigestValue digest(const std::vector<uint8_t>& bytes) {
  Digest hasher;
  hasher.update(bytes);
  return hasher.finalize();
}

DigestValue digest_stream(std::istream& input) {
  Digest hasher;
  char buffer[8192];
  std::size_t total_bytes = 0;

  while (input.read(buffer, sizeof(buffer))) {
    hasher.update(reinterpret_cast<const uint8_t*>(buffer), input.gcount());
    total_bytes += input.gcount();
  }

  // Handle final partial block if present
  if (input.gcount() > 0) {
    hasher.update(reinterpret_cast<const uint8_t*>(buffer), input.gcount());
    total_bytes += input.gcount();
  }

  if (input.bad()) {
    throw std::runtime_error("Digest: Failed to read input stream");
  }

  BOOST_LOG_TRIVIAL(debug) << "Digest: Hashed " << total_bytes << " bytes from stream";
  return hasher.finalize();
}

std::string to_hex(const DigestValue& value) {
  std::stringstream ss;
  for (uint8_t byte : value) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
  }
  return ss.str();
}

} // namespace integrity
} // namespace lbft
