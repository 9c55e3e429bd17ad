/* Encryption and decryption of 64-bit prices for real-time bidding.
 *
 *	Licensed under the Apache License, Version 2.0 (the "License");
 *	you may not use this file except in compliance with the License.
 *	You may obtain a copy of the License at
 *
 *		http://www.apache.org/licenses/LICENSE-2.0
 *
 *	Unless required by applicable law or agreed to in writing, software
 *	distributed under the License is distributed on an "AS IS" BASIS,
 *	WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 *	See the License for the specific language governing permissions and
 *	limitations under the License.
*/


#include "price_crypter.h"

#include <openssl/crypto.h>  // CRYPTO_memcmp()
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <string.h>
#include <cmath>
#include <sstream>

#include "byte_order.h"
#include "websafe_base64.h"

namespace price_crypter {

namespace {

// 2^64, the first scaled price that no longer fits in 8 bytes.
const double kMicrosLimit = 18446744073709551616.0;

void CheckScaleFactor(double scale_factor) {
  if (!(scale_factor > 0)) {
    throw ScaleFactorError("scale factor must be greater than zero");
  }
}

// HMAC-SHA1 of |data| under |key|, truncated to |out_len| bytes.
void HmacSha1Prefix(const std::string& key, const uchar* data, size_t data_len,
                    uchar* out, uint32 out_len) {
  uchar digest[EVP_MAX_MD_SIZE];
  uint32 digest_len = 0;
  if (!HMAC(EVP_sha1(), key.data(), static_cast<int>(key.length()), data, data_len,
            digest, &digest_len)) {
    throw CryptoError("HMAC-SHA1 failed");
  }
  if (digest_len < out_len) {
    throw CryptoError("HMAC-SHA1 output too short");
  }
  memcpy(out, digest, out_len);
}

std::string FormatDouble(double value) {
  std::ostringstream oss;
  oss.precision(17);
  oss << value;
  return oss.str();
}

}  // namespace

void ToMicros(double price, double scale_factor, uchar micros[kCiphertextSize]) {
  CheckScaleFactor(scale_factor);
  if (!(price >= 0)) {
    throw PriceRangeError("price must be a non-negative number");
  }
  double scaled = std::floor(price * scale_factor + 0.5);
  if (!(scaled < kMicrosLimit)) {
    throw PriceRangeError("scaled price does not fit in 8 bytes");
  }
  uint64 value = htonll(static_cast<uint64>(scaled));
  memcpy(micros, &value, kCiphertextSize);
}

double FromMicros(const uchar micros[kCiphertextSize], double scale_factor) {
  CheckScaleFactor(scale_factor);
  uint64 value = 0;
  memcpy(&value, micros, kCiphertextSize);
  return static_cast<double>(ntohll(value)) / scale_factor;
}

void DeriveInitializationVector(const std::string& seed,
                                uchar iv[kInitializationVectorSize]) {
  uchar digest[EVP_MAX_MD_SIZE];
  uint32 digest_len = 0;
  if (EVP_Digest(seed.data(), seed.size(), digest, &digest_len, EVP_md5(), NULL) != 1) {
    throw CryptoError("MD5 of seed failed");
  }
  if (digest_len != kIvDigestSize) {
    throw CryptoError("MD5 output has unexpected size");
  }
  memcpy(iv, digest, kInitializationVectorSize);
}

void ComputeEncryptionPad(const std::string& encryption_key,
                          const uchar iv[kInitializationVectorSize],
                          uchar pad[kCiphertextSize]) {
  HmacSha1Prefix(encryption_key, iv, kInitializationVectorSize, pad, kCiphertextSize);
}

void XorPad(const uchar pad[kCiphertextSize], const uchar in[kCiphertextSize],
            uchar out[kCiphertextSize]) {
  for (int i = 0; i < kCiphertextSize; i++) {
    out[i] = pad[i] ^ in[i];
  }
}

void ComputeSignature(const std::string& integrity_key,
                      const uchar micros[kCiphertextSize],
                      const uchar iv[kInitializationVectorSize],
                      uchar signature[kSignatureSize]) {
  const int32 kMessageSize = kCiphertextSize + kInitializationVectorSize;
  uchar message[kMessageSize];
  memcpy(message, micros, kCiphertextSize);
  memcpy(message + kCiphertextSize, iv, kInitializationVectorSize);
  HmacSha1Prefix(integrity_key, message, kMessageSize, signature, kSignatureSize);
}

std::string PackToken(const uchar iv[kInitializationVectorSize],
                      const uchar ciphertext[kCiphertextSize],
                      const uchar signature[kSignatureSize]) {
  uchar final_msg[kEncryptedValueSize];
  memcpy(final_msg, iv, kInitializationVectorSize);
  memcpy(final_msg + kInitializationVectorSize, ciphertext, kCiphertextSize);
  memcpy(final_msg + kInitializationVectorSize + kCiphertextSize, signature, kSignatureSize);
  return std::string(reinterpret_cast<const char*>(final_msg), kEncryptedValueSize);
}

void UnpackToken(const std::string& token,
                 uchar iv[kInitializationVectorSize],
                 uchar ciphertext[kCiphertextSize],
                 uchar signature[kSignatureSize]) {
  std::string decoded = WebSafeBase64Decode(token);
  if (decoded.size() != static_cast<size_t>(kEncryptedValueSize)) {
    std::ostringstream oss;
    oss << "token decodes to " << decoded.size() << " bytes, expected "
        << kEncryptedValueSize;
    throw MalformedTokenError(oss.str());
  }
  const uchar* raw = reinterpret_cast<const uchar*>(decoded.data());
  memcpy(iv, raw, kInitializationVectorSize);
  memcpy(ciphertext, raw + kInitializationVectorSize, kCiphertextSize);
  memcpy(signature, raw + kInitializationVectorSize + kCiphertextSize, kSignatureSize);
}

PriceCrypter::PriceCrypter(const std::string& encryption_key,
                           const std::string& integrity_key,
                           KeyDecodingMode key_decoding_mode,
                           double scale_factor,
                           bool debug,
                           PriceTracer* tracer)
    : encryption_key_(encryption_key),
      integrity_key_(integrity_key),
      key_decoding_mode_(key_decoding_mode),
      scale_factor_(scale_factor),
      debug_(debug),
      tracer_(tracer) {}

std::string PriceCrypter::Encrypt(const std::string& seed, double price,
                                  bool debug) const {
  TraceKeys(debug);

  uchar micros[kCiphertextSize];
  ToMicros(price, scale_factor_, micros);
  Trace(debug, "Price", FormatDouble(price));
  Trace(debug, "Scale factor", FormatDouble(scale_factor_));
  Trace(debug, "Price micros", HexEncode(micros, kCiphertextSize));

  uchar iv[kInitializationVectorSize];
  DeriveInitializationVector(seed, iv);
  Trace(debug, "Seed", seed);
  Trace(debug, "Initialization vector", HexEncode(iv, kInitializationVectorSize));

  // pad = hmac(e_key, iv), first 8 bytes
  uchar pad[kCiphertextSize];
  ComputeEncryptionPad(encryption_key_, iv, pad);
  Trace(debug, "Pad", HexEncode(pad, kCiphertextSize));

  // enc_price = pad <xor> price
  uchar encoded[kCiphertextSize];
  XorPad(pad, micros, encoded);
  Trace(debug, "Encoded price", HexEncode(encoded, kCiphertextSize));

  // signature = hmac(i_key, price || iv), first 4 bytes
  uchar signature[kSignatureSize];
  ComputeSignature(integrity_key_, micros, iv, signature);
  Trace(debug, "Signature", HexEncode(signature, kSignatureSize));

  std::string token = WebSafeBase64Encode(PackToken(iv, encoded, signature));
  Trace(debug, "Encrypted price", token);
  return token;
}

double PriceCrypter::Decrypt(const std::string& token, bool debug) const {
  TraceKeys(debug);
  Trace(debug, "Encrypted price", token);

  uchar iv[kInitializationVectorSize];
  uchar encoded[kCiphertextSize];
  uchar signature[kSignatureSize];
  UnpackToken(token, iv, encoded, signature);
  Trace(debug, "Initialization vector", HexEncode(iv, kInitializationVectorSize));
  Trace(debug, "Encoded price", HexEncode(encoded, kCiphertextSize));
  Trace(debug, "Signature", HexEncode(signature, kSignatureSize));

  uchar pad[kCiphertextSize];
  ComputeEncryptionPad(encryption_key_, iv, pad);
  Trace(debug, "Pad", HexEncode(pad, kCiphertextSize));

  uchar micros[kCiphertextSize];
  XorPad(pad, encoded, micros);

  uchar expected[kSignatureSize];
  ComputeSignature(integrity_key_, micros, iv, expected);
  if (CRYPTO_memcmp(expected, signature, kSignatureSize) != 0) {
    throw IntegrityError("failed to verify price integrity");
  }

  double price = FromMicros(micros, scale_factor_);
  Trace(debug, "Price", FormatDouble(price));
  return price;
}

void PriceCrypter::Trace(bool debug, const std::string& event,
                         const std::string& value) const {
  if (!(debug || debug_) || tracer_ == NULL) {
    return;
  }
  try {
    tracer_->Trace(event, value);
  } catch (const std::exception&) {
    // Tracing never changes the outcome of an operation.
  }
}

void PriceCrypter::TraceKeys(bool debug) const {
  Trace(debug, "Keys decoding mode", KeyDecodingModeName(key_decoding_mode_));
  Trace(debug, "Encryption key (bytes)", HexEncode(encryption_key_));
  Trace(debug, "Integrity key (bytes)", HexEncode(integrity_key_));
}

PriceCrypter NewCodec(const std::string& encryption_key,
                      const std::string& integrity_key,
                      KeyDecodingMode key_decoding_mode,
                      double scale_factor,
                      bool debug,
                      PriceTracer* tracer) {
  std::string encryption_bytes;
  std::string integrity_bytes;
  try {
    encryption_bytes = DecodeKey(encryption_key, key_decoding_mode);
  } catch (const KeyDecodeError& e) {
    throw KeyDecodeError(std::string("encryption key: ") + e.what());
  }
  try {
    integrity_bytes = DecodeKey(integrity_key, key_decoding_mode);
  } catch (const KeyDecodeError& e) {
    throw KeyDecodeError(std::string("integrity key: ") + e.what());
  }
  return PriceCrypter(encryption_bytes, integrity_bytes, key_decoding_mode,
                      scale_factor, debug, tracer);
}

}  // namespace price_crypter
