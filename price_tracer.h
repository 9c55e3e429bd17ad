/* Diagnostic tracing of the encryption steps.
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


#ifndef PRICE_CRYPTER_PRICE_TRACER_H_
#define PRICE_CRYPTER_PRICE_TRACER_H_

#include <stddef.h>
#include <iosfwd>
#include <mutex>
#include <string>

namespace price_crypter {

// Receives trace events from PriceCrypter when debug is on.
// Implementations are called from every thread using the crypter and may
// throw only types derived from std::exception; those are dropped by the caller.
class PriceTracer {
 public:
  virtual ~PriceTracer() {}
  virtual void Trace(const std::string& event, const std::string& value) = 0;
};

// Writes "[price_crypter] <event> : <value>" lines to a stream.
class StreamTracer : public PriceTracer {
 public:
  StreamTracer();  // std::cerr
  explicit StreamTracer(std::ostream* out);

  virtual void Trace(const std::string& event, const std::string& value);

 private:
  std::ostream* out_;
  std::mutex mutex_;

  StreamTracer(const StreamTracer&);
  StreamTracer& operator=(const StreamTracer&);
};

// Lowercase hex rendering of |data|, for trace values only.
std::string HexEncode(const std::string& data);
std::string HexEncode(const unsigned char* data, size_t len);

}  // namespace price_crypter

#endif  // PRICE_CRYPTER_PRICE_TRACER_H_
