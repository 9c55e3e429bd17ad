/* Host/network conversion for 64-bit values.
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


#ifndef PRICE_CRYPTER_BYTE_ORDER_H_
#define PRICE_CRYPTER_BYTE_ORDER_H_

#include <endian.h>
#include <netinet/in.h>

#include "price_types.h"

namespace price_crypter {

inline uint64 ntohll(uint64 net_int) {
#if __BYTE_ORDER == __LITTLE_ENDIAN
  return static_cast<uint64>(ntohl(static_cast<uint32>(net_int >> 32))) |
      (static_cast<uint64>(ntohl(static_cast<uint32>(net_int))) << 32);
#elif __BYTE_ORDER == __BIG_ENDIAN
  return net_int;
#else
#error Could not determine endianness.
#endif
}

// Byte swapping is symmetric.
inline uint64 htonll(uint64 host_int) {
  return ntohll(host_int);
}

}  // namespace price_crypter

#endif  // PRICE_CRYPTER_BYTE_ORDER_H_
