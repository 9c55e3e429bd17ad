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


#ifndef PRICE_CRYPTER_KEY_DECODER_H_
#define PRICE_CRYPTER_KEY_DECODER_H_

#include <string>

namespace price_crypter {

enum KeyDecodingMode {
  KEY_DECODING_HEX,
  KEY_DECODING_BASE64,
  KEY_DECODING_PLAIN
};

// Returns the key bytes held by |raw| under |mode|.
// Throws KeyDecodeError if |raw| is empty or not valid for |mode|.
std::string DecodeKey(const std::string& raw, KeyDecodingMode mode);

// "hex", "base64", "plain" or "utf-8" (same as plain), any letter case.
KeyDecodingMode ParseKeyDecodingMode(const std::string& name);

const char* KeyDecodingModeName(KeyDecodingMode mode);

}  // namespace price_crypter

#endif  // PRICE_CRYPTER_KEY_DECODER_H_
