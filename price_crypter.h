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


#ifndef PRICE_CRYPTER_PRICE_CRYPTER_H_
#define PRICE_CRYPTER_PRICE_CRYPTER_H_

#include <stddef.h>
#include <string>

#include "crypter_errors.h"
#include "key_decoder.h"
#include "price_tracer.h"
#include "price_types.h"

namespace price_crypter {

// The encrypted value is
//   WebSafeBase64( iv[16] || price[8] xor pad[8] || signature[4] )
// where
//   iv        = MD5(seed)
//   pad       = HMAC-SHA1(encryption_key, iv), first 8 bytes
//   signature = HMAC-SHA1(integrity_key, price || iv), first 4 bytes
// and price is the big-endian count of 1/scale_factor units.

// Writes round(price * scale_factor) as 8 big-endian bytes, halves rounded up.
// Throws ScaleFactorError or PriceRangeError.
void ToMicros(double price, double scale_factor, uchar micros[kCiphertextSize]);

// Inverse of ToMicros() within 1/scale_factor. Throws ScaleFactorError.
double FromMicros(const uchar micros[kCiphertextSize], double scale_factor);

void DeriveInitializationVector(const std::string& seed,
                                uchar iv[kInitializationVectorSize]);

void ComputeEncryptionPad(const std::string& encryption_key,
                          const uchar iv[kInitializationVectorSize],
                          uchar pad[kCiphertextSize]);

// out = pad xor in. Applying it twice with the same pad gives |in| back.
void XorPad(const uchar pad[kCiphertextSize], const uchar in[kCiphertextSize],
            uchar out[kCiphertextSize]);

void ComputeSignature(const std::string& integrity_key,
                      const uchar micros[kCiphertextSize],
                      const uchar iv[kInitializationVectorSize],
                      uchar signature[kSignatureSize]);

// Concatenates the three fields into the kEncryptedValueSize byte record.
std::string PackToken(const uchar iv[kInitializationVectorSize],
                      const uchar ciphertext[kCiphertextSize],
                      const uchar signature[kSignatureSize]);

// Decodes |token| and splits it into its three fields.
// Throws MalformedTokenError unless it decodes to exactly kEncryptedValueSize bytes.
void UnpackToken(const std::string& token,
                 uchar iv[kInitializationVectorSize],
                 uchar ciphertext[kCiphertextSize],
                 uchar signature[kSignatureSize]);

class PriceCrypter {
 public:
  // |encryption_key| and |integrity_key| are key bytes, already decoded.
  // |tracer| is not owned and may be NULL.
  PriceCrypter(const std::string& encryption_key,
               const std::string& integrity_key,
               KeyDecodingMode key_decoding_mode,
               double scale_factor,
               bool debug,
               PriceTracer* tracer);

  // Returns the websafe base64 token for |price|. The same seed and price
  // always give the same token.
  std::string Encrypt(const std::string& seed, double price, bool debug) const;

  // Returns the price carried by |token|.
  // Throws MalformedTokenError or IntegrityError.
  double Decrypt(const std::string& token, bool debug) const;

  double scale_factor() const { return scale_factor_; }
  KeyDecodingMode key_decoding_mode() const { return key_decoding_mode_; }

 private:
  void Trace(bool debug, const std::string& event, const std::string& value) const;
  void TraceKeys(bool debug) const;

  std::string encryption_key_;
  std::string integrity_key_;
  KeyDecodingMode key_decoding_mode_;
  double scale_factor_;
  bool debug_;
  PriceTracer* tracer_;
};

// Decodes both keys under |key_decoding_mode| and builds the crypter.
// Throws KeyDecodeError naming the key that failed.
PriceCrypter NewCodec(const std::string& encryption_key,
                      const std::string& integrity_key,
                      KeyDecodingMode key_decoding_mode,
                      double scale_factor,
                      bool debug,
                      PriceTracer* tracer = NULL);

}  // namespace price_crypter

#endif  // PRICE_CRYPTER_PRICE_CRYPTER_H_
