/* Decoding of raw key strings into key bytes.
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


#include "key_decoder.h"

#include <openssl/crypto.h>  // OPENSSL_hexchar2int()
#include <cctype>

#include "crypter_errors.h"
#include "websafe_base64.h"

namespace price_crypter {

namespace {

std::string DecodeHexKey(const std::string& raw) {
  if (raw.size() % 2 != 0) {
    throw KeyDecodeError("hex key has an odd number of digits");
  }
  std::string key;
  key.reserve(raw.size() / 2);
  for (std::string::size_type i = 0; i < raw.size(); i += 2) {
    int hi = OPENSSL_hexchar2int(static_cast<unsigned char>(raw[i]));
    int lo = OPENSSL_hexchar2int(static_cast<unsigned char>(raw[i + 1]));
    if (hi < 0 || lo < 0) {
      throw KeyDecodeError("hex key contains a non-hex character");
    }
    key.push_back(static_cast<char>((hi << 4) | lo));
  }
  return key;
}

std::string ToLower(std::string s) {
  for (std::string::size_type i = 0; i < s.size(); ++i) {
    s[i] = static_cast<char>(std::tolower(static_cast<unsigned char>(s[i])));
  }
  return s;
}

}  // namespace

std::string DecodeKey(const std::string& raw, KeyDecodingMode mode) {
  if (raw.empty()) {
    throw KeyDecodeError("key is empty");
  }
  switch (mode) {
    case KEY_DECODING_HEX:
      return DecodeHexKey(raw);
    case KEY_DECODING_BASE64: {
      std::string key;
      if (!StandardBase64Decode(raw, &key) || key.empty()) {
        throw KeyDecodeError("key is not valid base64");
      }
      return key;
    }
    case KEY_DECODING_PLAIN:
      return raw;
  }
  throw KeyDecodeError("unknown key decoding mode");
}

KeyDecodingMode ParseKeyDecodingMode(const std::string& name) {
  std::string lower = ToLower(name);
  if (lower == "hex") return KEY_DECODING_HEX;
  if (lower == "base64") return KEY_DECODING_BASE64;
  if (lower == "plain" || lower == "utf-8") return KEY_DECODING_PLAIN;
  throw KeyDecodeError("unknown key decoding mode: " + name);
}

const char* KeyDecodingModeName(KeyDecodingMode mode) {
  switch (mode) {
    case KEY_DECODING_HEX: return "hex";
    case KEY_DECODING_BASE64: return "base64";
    case KEY_DECODING_PLAIN: return "plain";
  }
  return "unknown";
}

}  // namespace price_crypter
