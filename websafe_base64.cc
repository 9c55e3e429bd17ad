/* Base64 helpers on top of stringencoders' modp_b64 / modp_b64w.
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


#include "websafe_base64.h"

#include <stddef.h>
#include <algorithm>  // std::replace()
#include <vector>

#include "modp_b64.h"   // standard base64 decode
#include "modp_b64w.h"  // websafe base64 encode/decode

#include "crypter_errors.h"

namespace price_crypter {

namespace {

// modp_b64w pads with '.' instead of '='.
const char kModpPadChar = '.';
const char kBase64PadChar = '=';
const size_t kModpError = static_cast<size_t>(-1);

}  // namespace

std::string WebSafeBase64Encode(const std::string& input) {
  std::vector<char> obuf(modp_b64w_encode_len(input.size()));
  size_t len = modp_b64w_encode(&obuf[0], input.data(), input.size());
  if (len == kModpError) {
    throw MalformedTokenError("websafe base64 encoding failed");
  }
  std::string output(&obuf[0], len);
  std::replace(output.begin(), output.end(), kModpPadChar, kBase64PadChar);
  return output;
}

std::string AddBase64Padding(const std::string& input) {
  std::string output(input);
  while (output.size() % 4 != 0) {
    output.push_back(kBase64PadChar);
  }
  return output;
}

std::string WebSafeBase64Decode(const std::string& input) {
  if (input.empty()) {
    throw MalformedTokenError("empty token");
  }
  std::string padded = AddBase64Padding(input);
  // modp_b64w would take '.' as padding; only '=' is valid on the wire.
  if (padded.find(kModpPadChar) != std::string::npos) {
    throw MalformedTokenError("token is not websafe base64");
  }
  std::replace(padded.begin(), padded.end(), kBase64PadChar, kModpPadChar);

  std::vector<char> obuf(modp_b64w_decode_len(padded.size()));
  size_t len = modp_b64w_decode(&obuf[0], padded.data(), padded.size());
  if (len == kModpError) {
    throw MalformedTokenError("token is not websafe base64");
  }
  std::string decoded(&obuf[0], len);
  // Unused low bits of the last character must be zero.
  if (WebSafeBase64Encode(decoded) != AddBase64Padding(input)) {
    throw MalformedTokenError("token is not websafe base64");
  }
  return decoded;
}

bool StandardBase64Decode(const std::string& input, std::string* output) {
  if (input.empty() || input.size() % 4 != 0) {
    return false;
  }
  std::vector<char> obuf(modp_b64_decode_len(input.size()));
  size_t len = modp_b64_decode(&obuf[0], input.data(), input.size());
  if (len == kModpError) {
    return false;
  }
  output->assign(&obuf[0], len);
  return true;
}

}  // namespace price_crypter
