/* Fixed-width types and field sizes of the encrypted price record.
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


#ifndef PRICE_CRYPTER_PRICE_TYPES_H_
#define PRICE_CRYPTER_PRICE_TYPES_H_

#include <stdint.h>

namespace price_crypter {

typedef int32_t   int32;
typedef int64_t   int64;
typedef uint32_t  uint32;
typedef uint64_t  uint64;
typedef unsigned char uchar;

// The following sizes are all in bytes.
const int32 kInitializationVectorSize = 16;
const int32 kCiphertextSize = 8;
const int32 kSignatureSize = 4;
const int32 kEncryptedValueSize = kInitializationVectorSize + kCiphertextSize + kSignatureSize;
const int32 kHashOutputSize = 20;  // size of SHA-1 hash output.
const int32 kIvDigestSize = 16;    // size of MD5 hash output.

}  // namespace price_crypter

#endif  // PRICE_CRYPTER_PRICE_TYPES_H_
