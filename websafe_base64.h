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


#ifndef PRICE_CRYPTER_WEBSAFE_BASE64_H_
#define PRICE_CRYPTER_WEBSAFE_BASE64_H_

#include <string>

namespace price_crypter {

// Websafe ('-', '_') base64 with standard '=' padding.
std::string WebSafeBase64Encode(const std::string& input);

// Appends '=' until the length is a multiple of four.
std::string AddBase64Padding(const std::string& input);

// Decodes canonical websafe base64, padded or not. Throws MalformedTokenError.
std::string WebSafeBase64Decode(const std::string& input);

// Decodes standard ('+', '/') base64. Returns false on invalid input.
bool StandardBase64Decode(const std::string& input, std::string* output);

}  // namespace price_crypter

#endif  // PRICE_CRYPTER_WEBSAFE_BASE64_H_
